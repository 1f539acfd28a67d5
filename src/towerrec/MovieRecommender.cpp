#include "towerrec/MovieRecommender.hpp"

#include <stdexcept>
#include <unordered_set>

#include "towerrec/MovieEncoder.hpp"
#include "towerrec/Ranker.hpp"

namespace towerrec {

void MovieRecommender::train(const std::vector<MovieRating>& ratings,
                             const std::vector<MovieInfo>& movies,
                             const MovieConfig& cfg) {
    // build everything locally; readers keep the old snapshot until the swap
    auto snap = std::make_shared<MovieSnapshot>();
    snap->stats = build_rating_stats(ratings);
    for (const auto& m : movies) snap->catalog.add(m);
    snap->table = encode_movies(snap->stats, snap->catalog, cfg.now);
    snap->trained_at = cfg.now;
    snap->rater = cfg.rater;

    std::shared_ptr<const MovieSnapshot> published = std::move(snap);
    std::lock_guard<std::mutex> lock(m_mu);
    m_snap = std::move(published);
}

bool MovieRecommender::trained() const {
    return snapshot() != nullptr;
}

std::shared_ptr<const MovieSnapshot> MovieRecommender::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_snap;
}

std::shared_ptr<const MovieSnapshot> MovieRecommender::require_snapshot() const {
    auto snap = snapshot();
    if (!snap) throw std::runtime_error("MovieRecommender: movie embeddings not trained");
    return snap;
}

std::vector<float> MovieRecommender::user_embedding(const std::string& user_id) const {
    const auto snap = require_snapshot();
    return encode_rater(snap->stats.find_user(user_id), snap->table, snap->catalog, snap->rater);
}

std::vector<Recommendation> MovieRecommender::recommend(const std::string& user_id, size_t limit) const {
    const auto snap = require_snapshot();
    const RaterProfile* profile = snap->stats.find_user(user_id);

    std::unordered_set<std::string> rated;
    if (profile) {
        for (const auto& r : profile->ratings) rated.insert(r.movie_id);
    }

    const std::vector<float> user = encode_rater(profile, snap->table, snap->catalog, snap->rater);
    const auto hits = rank_table(user, snap->table, limit, &rated);

    std::vector<Recommendation> out;
    out.reserve(hits.size());
    for (const auto& h : hits) {
        const MovieInfo* info = snap->catalog.find(h.key);
        const MovieStats* stat = snap->stats.find_movie(h.key);

        Recommendation r;
        r.id = h.key;
        r.title = (info && !info->title.empty()) ? info->title : "Movie " + h.key;
        r.genre = (info && !info->genres.empty()) ? info->genres : "Unknown";
        r.has_year = info && info->has_year;
        r.year = r.has_year ? info->year : 0;
        r.avg_rating = stat ? stat->mean : 0.0;
        r.rating_count = stat ? (int)stat->count : 0;
        r.similarity = h.score;
        r.has_predicted_rating = true;
        r.predicted_rating = predicted_rating(h.score, r.avg_rating);
        out.push_back(std::move(r));
    }
    return out;
}

RatingSummary MovieRecommender::summary() const {
    const auto snap = require_snapshot();

    RatingSummary s;
    s.total_ratings = snap->stats.total_ratings;
    s.unique_users = snap->stats.users.size();
    s.unique_movies = snap->stats.movies.size();
    s.movies_with_metadata = snap->catalog.size();
    if (s.unique_users) s.avg_ratings_per_user = (double)s.total_ratings / s.unique_users;
    if (s.unique_movies) s.avg_ratings_per_movie = (double)s.total_ratings / s.unique_movies;
    return s;
}

}  // namespace towerrec

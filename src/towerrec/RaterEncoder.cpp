#include "towerrec/RaterEncoder.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "emb/VectorMath.hpp"
#include "towerrec/MovieEncoder.hpp"
#include "util/TextUtil.hpp"

namespace towerrec {

static constexpr size_t kAggregateStart = 5;
static constexpr size_t kAntiStart = 32;
static constexpr size_t kAntiEnd = 40;
static constexpr size_t kGenreStart = 48;

namespace {

struct GenreScore {
    double sum = 0.0;
    int count = 0;
};

}  // namespace

std::vector<float> encode_rater(const RaterProfile* profile,
                                const EmbeddingTable& movies,
                                const MovieCatalog& catalog,
                                const RaterEncoderConfig& cfg) {
    if (!movies.empty() && movies.dim() != kMovieDim) {
        throw std::invalid_argument("encode_rater: movie table dim " + std::to_string(movies.dim()) +
                                    ", expected " + std::to_string(kMovieDim));
    }

    std::vector<double> vec(kMovieDim, 0.0);
    if (!profile || profile->ratings.empty()) return std::vector<float>(kMovieDim, 0.0f);

    const auto& ratings = profile->ratings;
    const double count = (double)ratings.size();

    size_t likes = 0, dislikes = 0;
    for (const auto& r : ratings) {
        if (r.rating >= 4) ++likes;
        if (r.rating <= 2) ++dislikes;
    }

    vec[0] = profile->mean / 5.0;
    vec[1] = std::sqrt(profile->variance) / 2.0;
    vec[2] = std::min(count / 500.0, 1.0);
    vec[3] = likes / count;
    vec[4] = dislikes / count;

    // liked: best ratings first, ties keep history order
    std::vector<const MovieRating*> liked;
    for (const auto& r : ratings) {
        if (r.rating >= 4) liked.push_back(&r);
    }
    std::stable_sort(liked.begin(), liked.end(),
                     [](const MovieRating* a, const MovieRating* b) { return a->rating > b->rating; });
    if (liked.size() > cfg.max_liked) liked.resize(cfg.max_liked);

    double total_weight = 0.0;
    for (const MovieRating* r : liked) {
        const float* m = movies.find(r->movie_id);
        if (!m) continue;

        const double w = (r->rating - 3.0) / 2.0;   // 4 stars -> 0.5, 5 stars -> 1.0
        for (size_t i = 0; i < kMovieDim; ++i) vec[i] += m[i] * w;
        total_weight += w;
    }
    // the histogram part stays a weighted sum on top of the profile scalars
    if (total_weight > 0.0) {
        for (size_t i = kAggregateStart; i < kMovieDim; ++i) vec[i] /= total_weight;
    }

    size_t n_disliked = 0;
    for (const auto& r : ratings) {
        if (r.rating > 2) continue;
        if (n_disliked++ >= cfg.max_disliked) break;

        const float* m = movies.find(r.movie_id);
        if (!m) continue;
        for (size_t i = kAntiStart; i < kAntiEnd; ++i) vec[i] -= m[i] * cfg.dislike_scale;
    }

    // genre preferences, in the order genres first show up in the history
    std::vector<std::string> genre_order;
    std::unordered_map<std::string, GenreScore> genre_scores;
    for (const auto& r : ratings) {
        const MovieInfo* info = catalog.find(r.movie_id);
        if (!info || info->genres.empty()) continue;

        for (const auto& g : textutil::split(info->genres, '|')) {
            auto it = genre_scores.find(g);
            if (it == genre_scores.end()) {
                it = genre_scores.emplace(g, GenreScore{}).first;
                genre_order.push_back(g);
            }
            it->second.sum += r.rating;
            it->second.count++;
        }
    }
    const size_t n_genres = std::min({genre_order.size(), cfg.max_genres, kMovieDim - kGenreStart});
    for (size_t i = 0; i < n_genres; ++i) {
        const GenreScore& gs = genre_scores[genre_order[i]];
        vec[kGenreStart + i] = (gs.sum / gs.count) / 5.0;
    }

    std::vector<float> out(kMovieDim);
    for (size_t i = 0; i < kMovieDim; ++i) out[i] = (float)vec[i];
    emb::l2_normalize(out);
    return out;
}

}  // namespace towerrec

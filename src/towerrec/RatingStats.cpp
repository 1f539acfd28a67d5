#include "towerrec/RatingStats.hpp"

#include <algorithm>
#include <cmath>

#include "util/TextUtil.hpp"

namespace towerrec {

const RaterProfile* RatingStats::find_user(const std::string& user_id) const {
    auto it = users.find(textutil::normalize_key(user_id));
    return it == users.end() ? nullptr : &it->second;
}

const MovieStats* RatingStats::find_movie(const std::string& movie_id) const {
    auto it = movies.find(textutil::normalize_key(movie_id));
    return it == movies.end() ? nullptr : &it->second;
}

int star_bucket(double rating) {
    const double f = std::floor(rating);
    if (f < 1.0) return -1;
    return (int)std::min(f - 1.0, 4.0);
}

static void finalize_user(RaterProfile& p) {
    p.count = p.ratings.size();
    if (p.count == 0) return;

    double sum = 0.0;
    for (const auto& r : p.ratings) sum += r.rating;
    p.mean = sum / (double)p.count;

    double sq = 0.0;
    for (const auto& r : p.ratings) sq += (r.rating - p.mean) * (r.rating - p.mean);
    p.variance = sq / (double)p.count;
}

static void finalize_movie(MovieStats& m) {
    m.count = m.ratings.size();
    if (m.count == 0) return;

    double sum = 0.0;
    for (double r : m.ratings) sum += r;
    m.mean = sum / (double)m.count;

    m.min_timestamp = *std::min_element(m.timestamps.begin(), m.timestamps.end());
    m.max_timestamp = *std::max_element(m.timestamps.begin(), m.timestamps.end());
}

RatingStats build_rating_stats(const std::vector<MovieRating>& ratings) {
    RatingStats st;
    st.total_ratings = ratings.size();

    for (const auto& src : ratings) {
        MovieRating r = src;
        r.user_id = textutil::normalize_key(r.user_id);
        r.movie_id = textutil::normalize_key(r.movie_id);

        auto uit = st.users.find(r.user_id);
        if (uit == st.users.end()) {
            uit = st.users.emplace(r.user_id, RaterProfile{}).first;
            st.user_order.push_back(r.user_id);
        }
        uit->second.ratings.push_back(r);

        auto mit = st.movies.find(r.movie_id);
        if (mit == st.movies.end()) {
            mit = st.movies.emplace(r.movie_id, MovieStats{}).first;
            st.movie_order.push_back(r.movie_id);
        }
        MovieStats& m = mit->second;
        m.ratings.push_back(r.rating);
        m.timestamps.push_back(r.timestamp);

        const int b = star_bucket(r.rating);
        if (b >= 0) m.histogram[b]++;

        if (r.rating >= 4) m.high_raters.push_back(r.user_id);
        else if (r.rating <= 2) m.low_raters.push_back(r.user_id);
    }

    for (auto& kv : st.users) finalize_user(kv.second);
    for (auto& kv : st.movies) finalize_movie(kv.second);
    return st;
}

}  // namespace towerrec

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "towerrec/Models.hpp"

namespace towerrec {

struct RaterProfile {
    std::vector<MovieRating> ratings;   // input order
    size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;              // population variance
};

struct MovieStats {
    std::vector<double> ratings;
    std::array<int, 5> histogram{};     // 1..5 star buckets
    size_t count = 0;
    double mean = 0.0;
    std::vector<std::string> high_raters;   // rated >= 4, rating order
    std::vector<std::string> low_raters;    // rated <= 2
    std::vector<int64_t> timestamps;
    int64_t min_timestamp = 0;
    int64_t max_timestamp = 0;
};

// Full-pass aggregates over one rating set. Never patched; rebuild on change.
struct RatingStats {
    std::unordered_map<std::string, RaterProfile> users;
    std::unordered_map<std::string, MovieStats> movies;

    std::vector<std::string> user_order;    // first seen
    std::vector<std::string> movie_order;   // first seen; catalog enumeration order

    size_t total_ratings = 0;

    // nullptr == unknown
    const RaterProfile* find_user(const std::string& user_id) const;
    const MovieStats* find_movie(const std::string& movie_id) const;
};

// min(floor(r) - 1, 4); -1 when the rating is below one star
int star_bucket(double rating);

RatingStats build_rating_stats(const std::vector<MovieRating>& ratings);

}  // namespace towerrec

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/MovieCatalog.hpp"
#include "towerrec/RatingStats.hpp"

namespace towerrec {

constexpr size_t kMovieDim = 64;
constexpr int64_t kSecondsPerYear = 365LL * 24 * 60 * 60;

// Item tower (movies). Layout:
//   [0-4]   star histogram / count
//   [5-9]   mean/5, min(count/1000,1), sqrt(count)/100, like ratio, 1 - dislike ratio
//   [10-29] hash_user_id() of the first 20 users who rated >= 4
//   [30-31] reserved
//   [32-47] genre list hash
//   [48-49] min(span_years/10,1), share of ratings in the 365 days before `now`
//   [50-55] reserved
//   [56-63] movie id hash
// A movie without statistics is the zero vector (cold start).
std::vector<float> encode_movie(const std::string& movie_id,
                                const MovieStats* stats,
                                const MovieInfo* info,
                                int64_t now);

// One row per rated movie, in first-rated order.
EmbeddingTable encode_movies(const RatingStats& stats, const MovieCatalog& catalog, int64_t now);

}  // namespace towerrec

#pragma once

#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/MovieCatalog.hpp"
#include "towerrec/RatingStats.hpp"

namespace towerrec {

struct RaterEncoderConfig {
    size_t max_liked = 30;          // top-rated movies aggregated
    size_t max_disliked = 10;       // movies pushed away from
    double dislike_scale = 0.3;
    size_t max_genres = 8;
};

// User tower (movies). Layout:
//   [0-4]   mean/5, sqrt(variance)/2, min(count/500,1), share >= 4, share <= 2
//   [0-63]  plus liked movie vectors, weight (rating-3)/2; divided by the total
//           weight over [5-63] only
//   [32-39] minus dislike_scale * vector of each disliked movie
//   [48-55] mean rating/5 per genre, first-encountered genres only
// L2-normalized; zero vector for an unknown user or one without ratings.
std::vector<float> encode_rater(const RaterProfile* profile,
                                const EmbeddingTable& movies,
                                const MovieCatalog& catalog,
                                const RaterEncoderConfig& cfg = {});

}  // namespace towerrec

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/MovieCatalog.hpp"
#include "towerrec/Models.hpp"
#include "towerrec/RaterEncoder.hpp"
#include "towerrec/RatingStats.hpp"

namespace towerrec {

struct MovieConfig {
    size_t limit = 20;
    int64_t now = 0;                // evaluation time (unix seconds) for recency features
    RaterEncoderConfig rater;
};

// Immutable once published; statistics, metadata and vectors always belong together.
struct MovieSnapshot {
    RatingStats stats;
    MovieCatalog catalog;
    EmbeddingTable table;           // rated movies only, first-rated order
    int64_t trained_at = 0;
    RaterEncoderConfig rater;
};

class MovieRecommender {
public:
    // Rebuilds statistics and every movie vector, then swaps the new snapshot in.
    void train(const std::vector<MovieRating>& ratings,
               const std::vector<MovieInfo>& movies,
               const MovieConfig& cfg);

    bool trained() const;
    std::shared_ptr<const MovieSnapshot> snapshot() const;

    std::vector<float> user_embedding(const std::string& user_id) const;

    // Movies the user already rated are never returned. Unknown user -> every
    // candidate with score 0 in catalog order.
    // Throws std::runtime_error before the first train().
    std::vector<Recommendation> recommend(const std::string& user_id,
                                          size_t limit = MovieConfig{}.limit) const;

    RatingSummary summary() const;

private:
    std::shared_ptr<const MovieSnapshot> require_snapshot() const;

    mutable std::mutex m_mu;
    std::shared_ptr<const MovieSnapshot> m_snap;
};

}  // namespace towerrec

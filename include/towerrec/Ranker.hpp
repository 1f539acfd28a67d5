#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "emb/EmbeddingTable.hpp"

namespace towerrec {

struct RankedHit {
    size_t row = 0;          // row in the table (catalog position)
    std::string key;
    float score = 0.0f;      // cosine similarity
};

// Scores every table row against `query`, drops keys in `exclude`, orders by
// descending score and keeps at most `limit`. Equal scores keep table order.
// Throws std::invalid_argument if query.size() != table.dim().
std::vector<RankedHit> rank_table(const std::vector<float>& query,
                                  const EmbeddingTable& table,
                                  size_t limit,
                                  const std::unordered_set<std::string>* exclude = nullptr);

// clamp(base + (similarity - 0.5) * 2, 1, 5), base = avg_rating or 3 when avg_rating <= 0.
// Display only; never used for ordering.
double predicted_rating(float similarity, double avg_rating);

}  // namespace towerrec

#include "towerrec/Ranker.hpp"

#include <algorithm>
#include <stdexcept>

#include "emb/VectorMath.hpp"

namespace towerrec {

std::vector<RankedHit> rank_table(const std::vector<float>& query,
                                  const EmbeddingTable& table,
                                  size_t limit,
                                  const std::unordered_set<std::string>* exclude) {
    if (query.size() != table.dim()) {
        throw std::invalid_argument("rank_table: query dim " + std::to_string(query.size()) +
                                    " does not match table dim " + std::to_string(table.dim()));
    }

    std::vector<RankedHit> hits;
    if (limit == 0 || table.empty()) return hits;

    hits.reserve(table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        const std::string& key = table.key(i);
        if (exclude && exclude->count(key)) continue;

        RankedHit h;
        h.row = i;
        h.key = key;
        h.score = emb::cosine(query.data(), table.row(i), table.dim());
        hits.push_back(std::move(h));
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const RankedHit& a, const RankedHit& b) { return a.score > b.score; });

    if (hits.size() > limit) hits.resize(limit);
    return hits;
}

double predicted_rating(float similarity, double avg_rating) {
    const double base = avg_rating > 0.0 ? avg_rating : 3.0;
    const double p = base + ((double)similarity - 0.5) * 2.0;
    return std::max(1.0, std::min(5.0, p));
}

}  // namespace towerrec

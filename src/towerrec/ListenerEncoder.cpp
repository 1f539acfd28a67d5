#include "towerrec/ListenerEncoder.hpp"

#include <algorithm>

#include "emb/VectorMath.hpp"

namespace towerrec {

double engagement_weight(const ListenEvent& e) {
    const double rating = e.rating / 5.0;
    const int repeats = std::min(e.repeat_count, 3);

    double weight = 1.0;
    weight *= (0.5 + e.completion_rate);
    weight *= (0.6 + rating * 0.8);
    weight += e.liked * 0.5;
    weight += repeats * 0.3;
    if (e.skipped) weight *= 0.3;   // penalty, not exclusion
    return weight;
}

std::vector<float> encode_listener(const std::vector<ListenEvent>& history,
                                   const EmbeddingTable& songs) {
    const size_t dim = songs.dim();
    std::vector<double> agg(dim, 0.0);
    double total_weight = 0.0;

    for (const auto& e : history) {
        const float* item = songs.find(song_key(e));
        if (!item) continue;

        const double w = engagement_weight(e);
        for (size_t i = 0; i < dim; ++i) agg[i] += (double)item[i] * w;
        total_weight += w;
    }

    std::vector<float> out(dim, 0.0f);
    if (total_weight == 0.0) return out;

    for (size_t i = 0; i < dim; ++i) out[i] = (float)agg[i];
    emb::l2_normalize(out);
    return out;
}

}  // namespace towerrec

#pragma once

#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/Models.hpp"

namespace towerrec {

// (0.5 + completion) * (0.6 + rating/5 * 0.8) + liked * 0.5 + min(repeat, 3) * 0.3,
// then * 0.3 when the event was skipped
double engagement_weight(const ListenEvent& e);

// User tower (music): engagement-weighted sum of the song vectors the history
// points at, L2-normalized. Events whose song is not in the table are skipped;
// no usable event -> zero vector of songs.dim().
std::vector<float> encode_listener(const std::vector<ListenEvent>& history,
                                   const EmbeddingTable& songs);

}  // namespace towerrec

#pragma once

#include <cstddef>
#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/Models.hpp"

namespace towerrec {

constexpr size_t kSongDim = 128;

// Item tower (music). Layout:
//   [0-15]    title hash      (1.5)
//   [16-31]   artist hash     (1.5)
//   [32-47]   genre hash      (2.0)
//   [48-63]   sub-genre hash  (1.5)
//   [64-79]   language hash   (1.0)
//   [80-95]   mood hash       (1.8)
//   [96-111]  activity hash   (1.5)
//   [112]     release year, 1950..2050 -> 0..1
//   [113]     duration / 600s
//   [114-119] completion, rating/5, liked, min(repeat,5)/5, 1-skipped, playlist
//   [120-122] sin(hour), cos(hour), weekend
//   [123-125] weather hash    (0.8)
//   [126-127] location hash   (0.5)
std::vector<float> encode_song(const Song& song);

// One row per distinct song_key(), in catalog order.
EmbeddingTable encode_catalog(const std::vector<Song>& songs);

}  // namespace towerrec

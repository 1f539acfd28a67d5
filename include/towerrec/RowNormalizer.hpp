#pragma once

#include <cstdint>
#include <vector>

#include "nlohmann/json.hpp"
#include "towerrec/Models.hpp"

namespace towerrec {

// Ingestion boundary: provider rows (JSON objects of strings/numbers, with either of
// the alternate field spellings) become one canonical record shape. Missing or
// unparseable numbers take the documented defaults; nothing here throws on bad data.

Song normalize_song_row(const nlohmann::json& row);
ListenEvent normalize_listen_row(const nlohmann::json& row);

// false when the row has no user id or no movie id; missing timestamp -> now
bool normalize_rating_row(const nlohmann::json& row, int64_t now, MovieRating& out);

// false when the row has no movie id
bool normalize_movie_row(const nlohmann::json& row, MovieInfo& out);

// Batch forms; rows that cannot be keyed are counted in `dropped` (may be null).
std::vector<MovieRating> normalize_rating_rows(const std::vector<nlohmann::json>& rows, int64_t now,
                                               size_t* dropped = nullptr);
std::vector<MovieInfo> normalize_movie_rows(const std::vector<nlohmann::json>& rows,
                                            size_t* dropped = nullptr);

// Collapses songs with the same song_key(), keeping the first seen.
std::vector<Song> dedupe_songs(const std::vector<Song>& songs);

}  // namespace towerrec

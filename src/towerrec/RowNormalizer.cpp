#include "towerrec/RowNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <string>
#include <unordered_set>

#include "util/TextUtil.hpp"

namespace towerrec {

using json = nlohmann::json;
using Names = std::initializer_list<const char*>;

static std::string value_text(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "1" : "0";
    if (v.is_number()) return v.dump();
    return "";
}

// first alternate name that is present and non-empty
static const json* pick(const json& row, Names names) {
    if (!row.is_object()) return nullptr;
    for (const char* n : names) {
        auto it = row.find(n);
        if (it == row.end() || it->is_null()) continue;
        if (textutil::trim_copy(value_text(*it)).empty()) continue;
        return &(*it);
    }
    return nullptr;
}

static std::string text_field(const json& row, Names names) {
    const json* v = pick(row, names);
    return v ? textutil::trim_copy(value_text(*v)) : std::string();
}

static double number_field(const json& row, Names names, double def) {
    const json* v = pick(row, names);
    if (!v) return def;

    if (v->is_number()) {
        const double d = v->get<double>();
        return std::isfinite(d) ? d : def;
    }

    double d = 0.0;
    if (textutil::parse_double(value_text(*v), d)) return d;
    return def;
}

static int64_t int_field(const json& row, Names names, int64_t def) {
    const json* v = pick(row, names);
    if (!v) return def;

    int64_t i = 0;
    if (textutil::parse_int64(value_text(*v), i)) return i;
    return def;
}

static int clamp_int(int64_t v, int64_t lo, int64_t hi) {
    return (int)std::max(lo, std::min(hi, v));
}

static constexpr int64_t kIntMin = std::numeric_limits<int>::min();
static constexpr int64_t kIntMax = std::numeric_limits<int>::max();

// counts and 0/1 flags never go negative
static int count_field(const json& row, Names names) {
    return clamp_int(int_field(row, names, 0), 0, kIntMax);
}

static int small_int_field(const json& row, Names names, int def) {
    return clamp_int(int_field(row, names, def), kIntMin, kIntMax);
}

static std::string source_id_of(const json& row) {
    const std::string id = text_field(row, {"id", "Song_ID", "track_id"});
    if (!id.empty()) return id;
    return row.dump();
}

Song normalize_song_row(const json& row) {
    Song s;
    s.source_id  = source_id_of(row);
    s.title      = text_field(row, {"title", "Song_Title", "track_name"});
    s.artist     = text_field(row, {"artist", "Artist_Name", "artist_name"});
    s.album      = text_field(row, {"album", "Album"});
    s.genre      = text_field(row, {"genre", "Genre"});
    s.sub_genre  = text_field(row, {"subGenre", "Sub_Genre"});
    s.language   = text_field(row, {"language", "Language"});
    s.mood       = text_field(row, {"mood", "Mood"});
    s.activity   = text_field(row, {"activity", "Activity"});

    s.release_year = small_int_field(row, {"releaseYear", "Release_Year"}, 2020);
    s.duration_sec = number_field(row, {"duration", "Duration_sec"}, 200.0);

    s.completion_rate   = number_field(row, {"completionRate", "Completion_Rate"}, 0.5);
    s.rating            = number_field(row, {"rating", "Rating"}, 3.0);
    s.liked             = count_field(row, {"likedFlag", "Liked_Flag"});
    s.repeat_count      = count_field(row, {"repeatCount", "Repeat_Count"});
    s.skipped           = count_field(row, {"skipFlag", "Skip_Flag"});
    s.added_to_playlist = count_field(row, {"addedToPlaylist", "Added_To_Playlist"});

    s.hour_of_day = small_int_field(row, {"hourOfDay", "Hour_of_Day"}, 12);
    s.weekend     = count_field(row, {"weekendFlag", "Weekend_Flag"});
    s.weather     = text_field(row, {"weather", "Weather"});
    s.location    = text_field(row, {"location", "Location"});
    return s;
}

ListenEvent normalize_listen_row(const json& row) {
    ListenEvent e;
    e.source_id = source_id_of(row);
    e.title     = text_field(row, {"title", "Song_Title", "track_name"});
    e.artist    = text_field(row, {"artist", "Artist_Name", "artist_name"});

    e.completion_rate = number_field(row, {"completionRate", "Completion_Rate"}, 0.5);
    e.rating          = number_field(row, {"rating", "Rating"}, 3.0);
    e.liked           = count_field(row, {"likedFlag", "Liked_Flag"});
    e.skipped         = count_field(row, {"skipFlag", "Skip_Flag"});
    e.repeat_count    = count_field(row, {"repeatCount", "Repeat_Count"});
    return e;
}

bool normalize_rating_row(const json& row, int64_t now, MovieRating& out) {
    const std::string user = textutil::normalize_key(text_field(row, {"userId", "user_id", "UserID"}));
    const std::string movie = textutil::normalize_key(text_field(row, {"movieId", "movie_id", "MovieID"}));
    if (user.empty() || movie.empty()) return false;

    out.user_id = user;
    out.movie_id = movie;
    out.rating = number_field(row, {"rating", "Rating"}, 0.0);
    out.timestamp = int_field(row, {"timestamp", "Timestamp"}, now);
    return true;
}

bool normalize_movie_row(const json& row, MovieInfo& out) {
    const std::string movie = textutil::normalize_key(text_field(row, {"movieId", "movie_id", "MovieID"}));
    if (movie.empty()) return false;

    out.movie_id = movie;
    out.title = text_field(row, {"title", "Title"});
    if (out.title.empty()) out.title = "Movie " + movie;
    out.genres = text_field(row, {"genres", "Genres", "genre"});

    int64_t y = 0;
    const json* yv = pick(row, {"year", "Year"});
    out.has_year = yv && textutil::parse_int64(value_text(*yv), y);
    out.year = out.has_year ? clamp_int(y, kIntMin, kIntMax) : 0;
    return true;
}

std::vector<MovieRating> normalize_rating_rows(const std::vector<json>& rows, int64_t now, size_t* dropped) {
    std::vector<MovieRating> out;
    out.reserve(rows.size());
    size_t bad = 0;
    for (const auto& row : rows) {
        MovieRating r;
        if (normalize_rating_row(row, now, r)) out.push_back(std::move(r));
        else ++bad;
    }
    if (dropped) *dropped = bad;
    return out;
}

std::vector<MovieInfo> normalize_movie_rows(const std::vector<json>& rows, size_t* dropped) {
    std::vector<MovieInfo> out;
    out.reserve(rows.size());
    size_t bad = 0;
    for (const auto& row : rows) {
        MovieInfo m;
        if (normalize_movie_row(row, m)) out.push_back(std::move(m));
        else ++bad;
    }
    if (dropped) *dropped = bad;
    return out;
}

std::vector<Song> dedupe_songs(const std::vector<Song>& songs) {
    std::vector<Song> out;
    out.reserve(songs.size());

    std::unordered_set<std::string> seen;
    seen.reserve(songs.size() * 2 + 8);
    for (const auto& s : songs) {
        if (seen.insert(song_key(s)).second) out.push_back(s);
    }
    return out;
}

}  // namespace towerrec

#include "towerrec/SongEncoder.hpp"

#include <algorithm>
#include <cmath>

#include "emb/FeatureHasher.hpp"

namespace towerrec {

namespace {

constexpr size_t kTextBand = 16;
constexpr double kPi = 3.14159265358979323846;

struct TextBand {
    size_t offset;
    size_t width;
    float weight;
};

constexpr TextBand kTitle    {0,   kTextBand, 1.5f};
constexpr TextBand kArtist   {16,  kTextBand, 1.5f};
constexpr TextBand kGenre    {32,  kTextBand, 2.0f};
constexpr TextBand kSubGenre {48,  kTextBand, 1.5f};
constexpr TextBand kLanguage {64,  kTextBand, 1.0f};
constexpr TextBand kMood     {80,  kTextBand, 1.8f};
constexpr TextBand kActivity {96,  kTextBand, 1.5f};
constexpr TextBand kWeather  {123, 3,         0.8f};
constexpr TextBand kLocation {126, 2,         0.5f};

void put(const std::string& text, std::vector<float>& vec, const TextBand& b) {
    emb::hash_into(text, vec, b.offset, b.width, b.weight);
}

}  // namespace

std::vector<float> encode_song(const Song& song) {
    std::vector<float> vec(kSongDim, 0.0f);

    put(song.title, vec, kTitle);
    put(song.artist, vec, kArtist);
    put(song.genre, vec, kGenre);
    put(song.sub_genre, vec, kSubGenre);
    put(song.language, vec, kLanguage);
    put(song.mood, vec, kMood);
    put(song.activity, vec, kActivity);

    vec[112] = (float)((song.release_year - 1950.0) / 100.0);
    vec[113] = (float)(song.duration_sec / 600.0);

    vec[114] = (float)song.completion_rate;
    vec[115] = (float)(song.rating / 5.0);
    vec[116] = (float)song.liked;
    vec[117] = (float)(std::min(song.repeat_count, 5) / 5.0);
    vec[118] = (float)(1 - song.skipped);   // not skipped scores higher
    vec[119] = (float)song.added_to_playlist;

    // cyclical: hour 23 sits next to hour 0
    const double angle = 2.0 * kPi * song.hour_of_day / 24.0;
    vec[120] = (float)std::sin(angle);
    vec[121] = (float)std::cos(angle);
    vec[122] = (float)song.weekend;

    put(song.weather, vec, kWeather);
    put(song.location, vec, kLocation);

    return vec;
}

EmbeddingTable encode_catalog(const std::vector<Song>& songs) {
    EmbeddingTable table(kSongDim);
    for (const auto& s : songs) {
        const std::string key = song_key(s);
        if (table.contains(key)) continue;
        table.add(key, encode_song(s));
    }
    return table;
}

}  // namespace towerrec

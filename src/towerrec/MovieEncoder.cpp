#include "towerrec/MovieEncoder.hpp"

#include <algorithm>
#include <cmath>

#include "emb/FeatureHasher.hpp"

namespace towerrec {

static constexpr size_t kCollabOffset = 10;
static constexpr size_t kCollabWidth = 20;
static constexpr size_t kGenreOffset = 32;
static constexpr size_t kGenreWidth = 16;
static constexpr size_t kIdOffset = 56;
static constexpr size_t kIdWidth = 8;

// Movie text only reaches as far as the end of the vector: the genre band takes
// the first 32 characters (wrapping at 16), the id band the first 8.
static void hash_movie_text(const std::string& text, std::vector<float>& vec,
                            size_t offset, size_t band, float weight) {
    emb::hash_into(text.substr(0, vec.size() - offset), vec, offset, band, weight);
}

std::vector<float> encode_movie(const std::string& movie_id,
                                const MovieStats* stats,
                                const MovieInfo* info,
                                int64_t now) {
    std::vector<float> vec(kMovieDim, 0.0f);
    if (!stats || stats->count == 0) return vec;

    const double total = (double)stats->count;

    for (size_t i = 0; i < 5; ++i) vec[i] = (float)(stats->histogram[i] / total);

    vec[5] = (float)(stats->mean / 5.0);
    vec[6] = (float)std::min(total / 1000.0, 1.0);
    vec[7] = (float)(std::sqrt(total) / 100.0);
    vec[8] = (float)(stats->high_raters.size() / total);
    vec[9] = (float)(1.0 - stats->low_raters.size() / total);

    // stands in for a learned collaborative embedding: who liked this
    const size_t n_collab = std::min(stats->high_raters.size(), kCollabWidth);
    for (size_t i = 0; i < n_collab; ++i) {
        vec[kCollabOffset + i] = emb::hash_user_id(stats->high_raters[i]);
    }

    if (info && !info->genres.empty()) {
        hash_movie_text(info->genres, vec, kGenreOffset, kGenreWidth, 1.0f);
    }

    const double span_years = (double)(stats->max_timestamp - stats->min_timestamp) / (double)kSecondsPerYear;
    vec[48] = (float)std::min(span_years / 10.0, 1.0);

    const int64_t year_ago = now - kSecondsPerYear;
    size_t recent = 0;
    for (int64_t ts : stats->timestamps) {
        if (ts > year_ago) ++recent;
    }
    vec[49] = (float)(recent / total);

    hash_movie_text(movie_id, vec, kIdOffset, kIdWidth, 0.5f);
    return vec;
}

EmbeddingTable encode_movies(const RatingStats& stats, const MovieCatalog& catalog, int64_t now) {
    EmbeddingTable table(kMovieDim);
    for (const auto& id : stats.movie_order) {
        table.add(id, encode_movie(id, stats.find_movie(id), catalog.find(id), now));
    }
    return table;
}

}  // namespace towerrec

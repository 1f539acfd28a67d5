#include <gtest/gtest.h>

#include <cctype>
#include <cmath>

#include "emb/FeatureHasher.hpp"
#include "towerrec/MovieEncoder.hpp"

using namespace towerrec;

namespace {

constexpr int64_t kNow = 10 * kSecondsPerYear;

MovieRating rating(const std::string& u, const std::string& m, double r, int64_t ts) {
    MovieRating x;
    x.user_id = u;
    x.movie_id = m;
    x.rating = r;
    x.timestamp = ts;
    return x;
}

class MovieEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        stats = build_rating_stats({
            rating("u1", "m1", 5, kNow - 100),
            rating("u2", "m1", 4, kNow - 2 * kSecondsPerYear),
            rating("u3", "m1", 1, kNow - 2 * kSecondsPerYear),
            rating("u1", "m2", 3, kNow - 10),
        });

        MovieInfo drama;
        drama.movie_id = "m1";
        drama.title = "Heat";
        drama.genres = "Drama";
        catalog.add(drama);

        MovieInfo unrated;
        unrated.movie_id = "m9";
        unrated.genres = "Comedy";
        catalog.add(unrated);
    }

    RatingStats stats;
    MovieCatalog catalog;
};

TEST_F(MovieEncoderTest, ColdStartIsZeroVector) {
    const auto v = encode_movie("m9", nullptr, catalog.find("m9"), kNow);
    ASSERT_EQ(v.size(), kMovieDim);
    EXPECT_EQ(v, std::vector<float>(kMovieDim, 0.0f));
}

TEST_F(MovieEncoderTest, RatingFeatures) {
    const auto v = encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow);
    ASSERT_EQ(v.size(), kMovieDim);

    EXPECT_FLOAT_EQ(v[0], 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(v[1], 0.0f);
    EXPECT_FLOAT_EQ(v[2], 0.0f);
    EXPECT_FLOAT_EQ(v[3], 1.0f / 3.0f);
    EXPECT_FLOAT_EQ(v[4], 1.0f / 3.0f);

    EXPECT_FLOAT_EQ(v[5], (float)((10.0 / 3.0) / 5.0));
    EXPECT_FLOAT_EQ(v[6], 0.003f);
    EXPECT_FLOAT_EQ(v[7], (float)(std::sqrt(3.0) / 100.0));
    EXPECT_FLOAT_EQ(v[8], 2.0f / 3.0f);
    EXPECT_FLOAT_EQ(v[9], 2.0f / 3.0f);
}

TEST_F(MovieEncoderTest, HighRatersFillCollaborativeBand) {
    const auto v = encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow);
    EXPECT_FLOAT_EQ(v[10], emb::hash_user_id("u1"));
    EXPECT_FLOAT_EQ(v[11], emb::hash_user_id("u2"));
    for (size_t i = 12; i < 30; ++i) EXPECT_EQ(v[i], 0.0f) << i;
}

TEST_F(MovieEncoderTest, CollaborativeBandKeepsFirstTwentyLikers) {
    std::vector<MovieRating> rs;
    for (int i = 0; i < 25; ++i) rs.push_back(rating("u" + std::to_string(i), "m1", 5, kNow));
    const RatingStats st = build_rating_stats(rs);

    const auto v = encode_movie("m1", st.find_movie("m1"), nullptr, kNow);
    EXPECT_FLOAT_EQ(v[10], emb::hash_user_id("u0"));
    EXPECT_FLOAT_EQ(v[29], emb::hash_user_id("u19"));
    EXPECT_EQ(v[30], 0.0f);
}

TEST_F(MovieEncoderTest, GenreAndTemporalFeatures) {
    const auto v = encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow);

    EXPECT_FLOAT_EQ(v[32], 'd' / 255.0f);
    EXPECT_FLOAT_EQ(v[33], 'r' / 255.0f);
    EXPECT_FLOAT_EQ(v[34], 'a' / 255.0f);
    EXPECT_FLOAT_EQ(v[35], 'm' / 255.0f);
    EXPECT_FLOAT_EQ(v[36], 'a' / 255.0f);
    for (size_t i = 37; i < 48; ++i) EXPECT_EQ(v[i], 0.0f) << i;

    const double span_years = (double)(2 * kSecondsPerYear - 100) / (double)kSecondsPerYear;
    EXPECT_FLOAT_EQ(v[48], (float)(span_years / 10.0));
    EXPECT_FLOAT_EQ(v[49], 1.0f / 3.0f);
}

TEST_F(MovieEncoderTest, IdHashAndReservedCoordinates) {
    const auto v = encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow);

    EXPECT_FLOAT_EQ(v[56], ('m' / 255.0f) * 0.5f);
    EXPECT_FLOAT_EQ(v[57], ('1' / 255.0f) * 0.5f);
    for (size_t i = 58; i < 64; ++i) EXPECT_EQ(v[i], 0.0f) << i;

    EXPECT_EQ(v[30], 0.0f);
    EXPECT_EQ(v[31], 0.0f);
    for (size_t i = 50; i < 56; ++i) EXPECT_EQ(v[i], 0.0f) << i;
}

TEST_F(MovieEncoderTest, IdBandHashesOnlyFirstEightCharacters) {
    const RatingStats st = build_rating_stats({rating("u1", "abcdefghij", 3, kNow)});
    const auto v = encode_movie("abcdefghij", st.find_movie("abcdefghij"), nullptr, kNow);

    EXPECT_FLOAT_EQ(v[56], ('a' / 255.0f) * 0.5f);
    EXPECT_FLOAT_EQ(v[57], ('b' / 255.0f) * 0.5f);
    EXPECT_FLOAT_EQ(v[63], ('h' / 255.0f) * 0.5f);
    for (size_t i = 50; i < 56; ++i) EXPECT_EQ(v[i], 0.0f) << i;
}

TEST_F(MovieEncoderTest, GenreBandHashesOnlyFirstThirtyTwoCharacters) {
    const std::string genres = "Adventure|Animation|Children|Comedy|Fantasy";
    MovieInfo info;
    info.movie_id = "m1";
    info.genres = genres;

    const auto v = encode_movie("m1", stats.find_movie("m1"), &info, kNow);
    for (size_t k = 0; k < 16; ++k) {
        const float want = (float)(unsigned char)std::tolower(genres[k]) / 255.0f +
                           (float)(unsigned char)std::tolower(genres[k + 16]) / 255.0f;
        EXPECT_FLOAT_EQ(v[32 + k], want) << k;
    }
    // hashing stops after "Children|Com"
    EXPECT_FLOAT_EQ(v[32], 'a' / 255.0f + 'i' / 255.0f);
}

TEST_F(MovieEncoderTest, TableHoldsRatedMoviesInFirstRatedOrder) {
    const EmbeddingTable table = encode_movies(stats, catalog, kNow);
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(table.dim(), kMovieDim);
    EXPECT_EQ(table.key(0), "m1");
    EXPECT_EQ(table.key(1), "m2");
    EXPECT_FALSE(table.contains("m9"));
}

TEST_F(MovieEncoderTest, IsDeterministic) {
    EXPECT_EQ(encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow),
              encode_movie("m1", stats.find_movie("m1"), catalog.find("m1"), kNow));
}

}  // namespace

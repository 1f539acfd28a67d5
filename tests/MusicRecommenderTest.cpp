#include <gtest/gtest.h>

#include <stdexcept>

#include "towerrec/MusicRecommender.hpp"
#include "towerrec/SongEncoder.hpp"

using namespace towerrec;

namespace {

Song song(const std::string& title, const std::string& artist, const std::string& genre = "") {
    Song s;
    s.title = title;
    s.artist = artist;
    s.genre = genre;
    return s;
}

ListenEvent loved(const std::string& title, const std::string& artist) {
    ListenEvent e;
    e.title = title;
    e.artist = artist;
    e.completion_rate = 1.0;
    e.rating = 5;
    e.liked = 1;
    return e;
}

class MusicRecommenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Song a = song("A", "B", "Pop");
        a.album = "First";
        a.mood = "Happy";
        catalog = {a, song("Clair de Lune", "Debussy", "Classical"), song("Thunderstruck", "AC/DC", "Rock")};
    }

    std::vector<Song> catalog;
    MusicRecommender rec;
};

TEST_F(MusicRecommenderTest, UntrainedRecommenderThrows) {
    EXPECT_FALSE(rec.trained());
    EXPECT_EQ(rec.snapshot(), nullptr);
    EXPECT_THROW(rec.recommend({loved("A", "B")}), std::runtime_error);
    EXPECT_THROW(rec.user_embedding({loved("A", "B")}), std::runtime_error);
}

TEST_F(MusicRecommenderTest, ListenedSongRanksFirst) {
    rec.train({song("A", "B", "Pop")});
    ASSERT_TRUE(rec.trained());

    const auto recs = rec.recommend({loved("A", "B")});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].id, "a::b");
    EXPECT_NEAR(recs[0].similarity, 1.0f, 1e-5);
}

TEST_F(MusicRecommenderTest, CopiesCatalogFieldsIntoResults) {
    rec.train(catalog);
    const auto recs = rec.recommend({loved("a", " b ")}, 3);
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].title, "A");
    EXPECT_EQ(recs[0].artist, "B");
    EXPECT_EQ(recs[0].album, "First");
    EXPECT_EQ(recs[0].genre, "Pop");
    EXPECT_EQ(recs[0].mood, "Happy");
    EXPECT_GE(recs[0].similarity, recs[1].similarity);
    EXPECT_GE(recs[1].similarity, recs[2].similarity);
}

TEST_F(MusicRecommenderTest, EmptyHistoryOrCatalogGivesNoResults) {
    rec.train(catalog);
    EXPECT_TRUE(rec.recommend({}).empty());

    rec.train({});
    EXPECT_TRUE(rec.recommend({loved("A", "B")}).empty());
}

TEST_F(MusicRecommenderTest, UnknownHistoryScoresZeroInCatalogOrder) {
    rec.train(catalog);
    const auto recs = rec.recommend({loved("Nope", "Nobody")});
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].title, "A");
    EXPECT_EQ(recs[1].title, "Clair de Lune");
    EXPECT_EQ(recs[2].title, "Thunderstruck");
    for (const auto& r : recs) EXPECT_EQ(r.similarity, 0.0f);
}

TEST_F(MusicRecommenderTest, DefaultLimitIsTen) {
    std::vector<Song> many;
    for (int i = 0; i < 12; ++i) many.push_back(song("S" + std::to_string(i), "X"));
    rec.train(many);
    EXPECT_EQ(rec.recommend({loved("S0", "X")}).size(), 10u);
    EXPECT_EQ(rec.recommend({loved("S0", "X")}, 3).size(), 3u);
}

TEST_F(MusicRecommenderTest, DuplicateSongsAreRecommendedOnce) {
    rec.train({song("A", "B"), song(" a ", "b"), song("C", "D")});
    EXPECT_EQ(rec.snapshot()->catalog.size(), 2u);
    EXPECT_EQ(rec.recommend({loved("A", "B")}).size(), 2u);
}

TEST_F(MusicRecommenderTest, RetrainLeavesHeldSnapshotIntact) {
    rec.train(catalog);
    const auto old = rec.snapshot();

    rec.train({song("New", "Song")});
    EXPECT_EQ(old->catalog.size(), 3u);
    EXPECT_EQ(old->table.size(), 3u);
    EXPECT_EQ(rec.snapshot()->catalog.size(), 1u);
    EXPECT_NE(rec.snapshot(), old);
}

TEST_F(MusicRecommenderTest, PublishReordersCachedVectorsToCatalogOrder) {
    std::vector<Song> reversed(catalog.rbegin(), catalog.rend());
    rec.publish(catalog, encode_catalog(reversed));

    const auto snap = rec.snapshot();
    ASSERT_EQ(snap->table.size(), 3u);
    for (size_t i = 0; i < snap->catalog.size(); ++i) {
        EXPECT_EQ(snap->table.key(i), song_key(snap->catalog[i]));
    }
    EXPECT_EQ(rec.recommend({loved("Thunderstruck", "AC/DC")}, 1)[0].title, "Thunderstruck");
}

TEST_F(MusicRecommenderTest, PublishRejectsUnusableTables) {
    EmbeddingTable small(3);
    small.add("a::b", {1.0f, 0.0f, 0.0f});
    EXPECT_THROW(rec.publish(catalog, small), std::invalid_argument);

    EXPECT_THROW(rec.publish(catalog, encode_catalog({catalog[0]})), std::runtime_error);
    EXPECT_FALSE(rec.trained());
}

}  // namespace

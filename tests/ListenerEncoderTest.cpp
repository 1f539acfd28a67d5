#include <gtest/gtest.h>

#include "emb/VectorMath.hpp"
#include "towerrec/ListenerEncoder.hpp"
#include "towerrec/SongEncoder.hpp"

using namespace towerrec;

namespace {

ListenEvent event(const std::string& title, const std::string& artist) {
    ListenEvent e;
    e.title = title;
    e.artist = artist;
    return e;
}

class ListenerEncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Song a;
        a.title = "A"; a.artist = "B"; a.genre = "Pop";
        Song c;
        c.title = "Clair"; c.artist = "Debussy"; c.genre = "Classical"; c.mood = "Calm";
        songs = {a, c};
        table = encode_catalog(songs);
    }

    std::vector<Song> songs;
    EmbeddingTable table;
};

TEST(EngagementWeightTest, MatchesFormula) {
    ListenEvent e;
    e.completion_rate = 1.0;
    e.rating = 5;
    e.liked = 1;
    e.skipped = 0;
    e.repeat_count = 0;
    EXPECT_NEAR(engagement_weight(e), 2.6, 1e-12);

    e.repeat_count = 9;  // capped at 3
    EXPECT_NEAR(engagement_weight(e), 2.6 + 0.9, 1e-12);

    e.skipped = 1;
    EXPECT_NEAR(engagement_weight(e), (2.6 + 0.9) * 0.3, 1e-12);
}

TEST(EngagementWeightTest, DefaultsGiveNeutralWeight) {
    // (0.5 + 0.5) * (0.6 + 0.6 * 0.8)
    EXPECT_NEAR(engagement_weight(ListenEvent{}), 1.08, 1e-12);
}

TEST(EngagementWeightTest, IsMonotoneInPositiveSignals) {
    ListenEvent base;
    base.completion_rate = 0.2;
    base.rating = 2;

    for (double c = 0.0; c <= 1.0; c += 0.1) {
        ListenEvent lo = base, hi = base;
        lo.completion_rate = c;
        hi.completion_rate = c + 0.1;
        EXPECT_LE(engagement_weight(lo), engagement_weight(hi));
    }
    for (int r = 1; r < 5; ++r) {
        ListenEvent lo = base, hi = base;
        lo.rating = r;
        hi.rating = r + 1;
        EXPECT_LE(engagement_weight(lo), engagement_weight(hi));
    }

    ListenEvent liked = base;
    liked.liked = 1;
    EXPECT_LE(engagement_weight(base), engagement_weight(liked));

    ListenEvent skipped = base;
    skipped.skipped = 1;
    EXPECT_LT(engagement_weight(skipped), engagement_weight(base));
    EXPECT_NEAR(engagement_weight(skipped), engagement_weight(base) * 0.3, 1e-12);
}

TEST_F(ListenerEncoderTest, EmptyHistoryIsZeroVector) {
    const auto u = encode_listener({}, table);
    ASSERT_EQ(u.size(), kSongDim);
    EXPECT_EQ(u, std::vector<float>(kSongDim, 0.0f));
}

TEST_F(ListenerEncoderTest, UnknownSongsAreSkipped) {
    const auto u = encode_listener({event("Nope", "Nobody"), event("Ghost", "")}, table);
    EXPECT_EQ(u, std::vector<float>(kSongDim, 0.0f));
}

TEST_F(ListenerEncoderTest, SingleSongGivesItsDirection) {
    ListenEvent e = event(" a ", "B");
    e.completion_rate = 1.0;
    e.rating = 5;
    e.liked = 1;

    const auto u = encode_listener({e}, table);
    EXPECT_NEAR(emb::l2_norm(u.data(), u.size()), 1.0, 1e-5);
    EXPECT_NEAR(emb::cosine(u, table.vector_at(0)), 1.0f, 1e-5);
}

TEST_F(ListenerEncoderTest, NonEmptyHistoryIsUnitLength) {
    ListenEvent skipped = event("Clair", "Debussy");
    skipped.skipped = 1;
    const auto u = encode_listener({event("A", "B"), skipped, event("missing", "x")}, table);
    EXPECT_NEAR(emb::l2_norm(u.data(), u.size()), 1.0, 1e-5);
}

TEST_F(ListenerEncoderTest, HeavierWeightPullsTowardThatSong) {
    ListenEvent loved = event("Clair", "Debussy");
    loved.completion_rate = 1.0;
    loved.rating = 5;
    loved.liked = 1;
    loved.repeat_count = 3;
    ListenEvent meh = event("A", "B");
    meh.skipped = 1;

    const auto u = encode_listener({meh, loved}, table);
    EXPECT_GT(emb::cosine(u, table.vector_at(1)), emb::cosine(u, table.vector_at(0)));
}

TEST_F(ListenerEncoderTest, IsDeterministic) {
    const std::vector<ListenEvent> h = {event("A", "B"), event("Clair", "Debussy")};
    EXPECT_EQ(encode_listener(h, table), encode_listener(h, table));
}

}  // namespace

/// @file feature_assembler_test.cpp
/// @brief Unit tests for FeatureAssembler and FeatureVector.

#include <gtest/gtest.h>

#include "tfe/features/feature_assembler.hpp"
#include "tfe/foundation/time_utils.hpp"

using namespace tfe::features;
using namespace tfe::rating;
using tfe::foundation::makeDate;

class FeatureAssemblerTest : public ::testing::Test {
protected:
    FeatureAssemblerTest()
        : rankings_({{makeDate(2023, 1, 2), PlayerId{1}, 12},
                     {makeDate(2023, 1, 2), PlayerId{2}, 40}}),
          players_({{PlayerId{1}, Handedness::Left}, {PlayerId{2}, Handedness::Right}}) {}

    void playSomeMatches() {
        ASSERT_TRUE(elo_.update(a_, b_, Surface::Clay).hasValue());
        ASSERT_TRUE(form_.update(a_, b_, Surface::Clay, makeDate(2023, 1, 3),
                                 {.setsPlayed = 3, .winnerRank = 12, .loserRank = 40})
                        .hasValue());
        ASSERT_TRUE(h2h_.update(a_, b_, Surface::Clay).hasValue());

        ASSERT_TRUE(elo_.update(b_, c_, Surface::Hard).hasValue());
        ASSERT_TRUE(form_.update(b_, c_, Surface::Hard, makeDate(2023, 1, 6),
                                 {.setsPlayed = 2, .winnerRank = 40, .loserRank = 0})
                        .hasValue());
        ASSERT_TRUE(h2h_.update(b_, c_, Surface::Hard).hasValue());
    }

    FeatureAssembler assembler() const {
        return FeatureAssembler(elo_, form_, h2h_, rankings_, players_);
    }

    EloRatingTracker elo_;
    PlayerFormTracker form_;
    HeadToHeadTracker h2h_;
    RankingLookup rankings_;
    PlayerRegistry players_;
    PlayerId a_{1};
    PlayerId b_{2};
    PlayerId c_{3};
};

TEST_F(FeatureAssemblerTest, DefaultsForUnseenPlayers) {
    auto fv = assembler().build(PlayerId{8}, PlayerId{9}, Surface::Grass, makeDate(2023, 2, 1),
                                "m1");

    EXPECT_EQ(fv.matchId, "m1");
    EXPECT_EQ(fv.p1.rank, 500);
    EXPECT_DOUBLE_EQ(fv.p1.elo, 1500.0);
    EXPECT_DOUBLE_EQ(fv.p1.eloMomentum, 0.0);
    EXPECT_DOUBLE_EQ(fv.p1.winPerc, 0.0);
    EXPECT_DOUBLE_EQ(fv.p1.surfaceWinPerc, 0.0);
    EXPECT_DOUBLE_EQ(fv.p1.formLast10, 0.0);
    EXPECT_DOUBLE_EQ(fv.p1.rollingWinPerc50, 0.0);
    EXPECT_EQ(fv.p1.matchesLast7Days, 0);
    EXPECT_EQ(fv.p1.matchesLast14Days, 0);
    EXPECT_EQ(fv.p1.setsLast14Days, 0);
    EXPECT_EQ(fv.p1.restDays, 30);
    EXPECT_DOUBLE_EQ(fv.p1.avgOpponentRankLast10, 500.0);
    EXPECT_EQ(fv.p1.h2hWins, 0u);
    EXPECT_EQ(fv.p1.hand, Handedness::Unknown);
    EXPECT_EQ(fv.rankDiff, 0);
    EXPECT_DOUBLE_EQ(fv.eloDiff, 0.0);
    EXPECT_EQ(fv.restDiff, 0);
}

TEST_F(FeatureAssemblerTest, ReflectsTrackerState) {
    playSomeMatches();
    auto fv = assembler().build(a_, b_, Surface::Clay, makeDate(2023, 1, 9), "m2");

    EXPECT_EQ(fv.p1.rank, 12);
    EXPECT_EQ(fv.p2.rank, 40);
    EXPECT_EQ(fv.rankDiff, -28);
    EXPECT_DOUBLE_EQ(fv.p1.elo, 1516.0);
    EXPECT_DOUBLE_EQ(fv.p2.elo, 1484.0);
    EXPECT_DOUBLE_EQ(fv.eloDiff, 32.0);
    EXPECT_DOUBLE_EQ(fv.p1.winPerc, 1.0);
    EXPECT_DOUBLE_EQ(fv.p2.winPerc, 0.5);
    EXPECT_DOUBLE_EQ(fv.p2.surfaceWinPerc, 0.0);
    EXPECT_EQ(fv.p1.matchesLast7Days, 1);
    EXPECT_EQ(fv.p2.matchesLast7Days, 2);
    EXPECT_EQ(fv.fatigueDiff7Days, -1);
    EXPECT_EQ(fv.p2.setsLast7Days, 5);
    EXPECT_EQ(fv.p1.restDays, 6);
    EXPECT_EQ(fv.p2.restDays, 3);
    EXPECT_EQ(fv.restDiff, 3);
    EXPECT_DOUBLE_EQ(fv.p1.avgOpponentRankLast10, 40.0);
    EXPECT_DOUBLE_EQ(fv.p2.avgOpponentRankLast10, 12.0);
    EXPECT_EQ(fv.p1.h2hWins, 1u);
    EXPECT_EQ(fv.p2.h2hWins, 0u);
    EXPECT_EQ(fv.p1.h2hSurfaceWins, 1u);
    EXPECT_EQ(fv.p1.hand, Handedness::Left);
    EXPECT_EQ(fv.p2.hand, Handedness::Right);
}

TEST_F(FeatureAssemblerTest, SwappingPlayersMirrorsVector) {
    playSomeMatches();
    auto date = makeDate(2023, 1, 9);
    auto forward = assembler().build(a_, b_, Surface::Clay, date, "m3");
    auto backward = assembler().build(b_, a_, Surface::Clay, date, "m3");

    EXPECT_EQ(backward, forward.mirrored());
    EXPECT_EQ(backward.mirrored(), forward);
}

TEST_F(FeatureAssemblerTest, BuildDoesNotMutateState) {
    playSomeMatches();
    auto date = makeDate(2023, 1, 9);
    auto first = assembler().build(a_, c_, Surface::Grass, date);
    for (int i = 0; i < 3; ++i) {
        (void)assembler().build(PlayerId{50 + i}, c_, Surface::Unknown, date);
    }
    auto second = assembler().build(a_, c_, Surface::Grass, date);

    EXPECT_EQ(first, second);
    EXPECT_EQ(elo_.entryCount(), 4u);
    EXPECT_EQ(form_.playerCount(), 3u);
    EXPECT_EQ(h2h_.pairCount(), 2u);
}

TEST(FeatureVectorTest, MirroredNegatesDiffs) {
    FeatureVector fv;
    fv.p1Id = PlayerId{1};
    fv.p2Id = PlayerId{2};
    fv.p1.rank = 5;
    fv.p2.rank = 9;
    fv.rankDiff = -4;
    fv.eloDiff = 12.5;
    fv.restDiff = 7;

    auto m = fv.mirrored();
    EXPECT_EQ(m.p1Id, PlayerId{2});
    EXPECT_EQ(m.p1.rank, 9);
    EXPECT_EQ(m.p2.rank, 5);
    EXPECT_EQ(m.rankDiff, 4);
    EXPECT_DOUBLE_EQ(m.eloDiff, -12.5);
    EXPECT_EQ(m.restDiff, -7);
}

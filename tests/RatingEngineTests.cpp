#include "TestSupport.h"

#include "localelo/core/rating/RatingEngine.h"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>

using localelo::core::Error;
using localelo::core::ErrorCode;
using localelo::core::rating::ApplyResult;
using localelo::core::rating::RatingEngine;
using localelo::core::rating::WinProbability;
using localelo::core::store::BoutResult;
using localelo::core::store::EntrantStore;

TEST(RatingEngineTest, WinProbabilitiesOfBothSidesSumToOne) {
    const double ratings[] = {0.0, 612.5, 1000.0, 1016.0, 1400.0, 2850.0};
    for (double a : ratings) {
        for (double b : ratings) {
            EXPECT_NEAR(WinProbability(a, b) + WinProbability(b, a), 1.0, 1e-12);
        }
    }
    EXPECT_DOUBLE_EQ(WinProbability(1000.0, 1000.0), 0.5);
    EXPECT_NEAR(WinProbability(1400.0, 1000.0), 1.0 / 1.1, 1e-12);
}

TEST(RatingEngineTest, UpdatesAreZeroSum) {
    const double ratings[] = {400.0, 987.25, 1000.0, 1733.0};
    for (double a : ratings) {
        for (double b : ratings) {
            for (BoutResult result : {BoutResult::A, BoutResult::B, BoutResult::Tie}) {
                const auto updated = ApplyResult(a, b, result);
                EXPECT_LT(std::abs((updated.first - a) + (updated.second - b)), 1e-9);
            }
        }
    }
}

TEST(RatingEngineTest, TieBetweenEqualRatingsChangesNothing) {
    const auto updated = ApplyResult(1234.0, 1234.0, BoutResult::Tie);
    EXPECT_DOUBLE_EQ(updated.first, 1234.0);
    EXPECT_DOUBLE_EQ(updated.second, 1234.0);
}

TEST(RatingEngineTest, WinBetweenFreshEntrants) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"x.txt", "y.txt"});
    RatingEngine engine(store, {}, [] { return std::string("2026-01-01T00:00:00.000Z"); });

    Error error;
    ASSERT_TRUE(engine.RecordResult(ids[0], ids[1], BoutResult::A, &error));

    const auto x = store.GetEntrant(ids[0]);
    const auto y = store.GetEntrant(ids[1]);
    EXPECT_DOUBLE_EQ(x->elo, 1016.0);
    EXPECT_DOUBLE_EQ(y->elo, 984.0);
    EXPECT_EQ(x->wins, 1);
    EXPECT_EQ(x->losses, 0);
    EXPECT_EQ(x->ties, 0);
    EXPECT_EQ(y->wins, 0);
    EXPECT_EQ(y->losses, 1);
    EXPECT_EQ(y->ties, 0);

    ASSERT_EQ(store.games().size(), 1u);
    EXPECT_EQ(store.games().front().entrant_a, ids[0]);
    EXPECT_EQ(store.games().front().result, BoutResult::A);
    EXPECT_EQ(store.games().front().timestamp, "2026-01-01T00:00:00.000Z");
}

TEST(RatingEngineTest, RecordCountersMatchBoutCount) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"a", "b", "c"});
    RatingEngine engine(store);
    Error error;
    ASSERT_TRUE(engine.RecordResult(ids[0], ids[1], BoutResult::A, &error));
    ASSERT_TRUE(engine.RecordResult(ids[1], ids[2], BoutResult::Tie, &error));
    ASSERT_TRUE(engine.RecordResult(ids[2], ids[0], BoutResult::B, &error));

    for (int id : ids) {
        int bouts = 0;
        for (const auto& game : store.games()) {
            bouts += (game.entrant_a == id || game.entrant_b == id) ? 1 : 0;
        }
        EXPECT_EQ(store.GetEntrant(id)->games_played(), bouts);
    }
}

TEST(RatingEngineTest, UnknownEntrantLeavesStoreUntouched) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"a", "b"});
    RatingEngine engine(store);

    Error error;
    EXPECT_FALSE(engine.RecordResult(ids[0], 999, BoutResult::A, &error));
    EXPECT_EQ(error.code, ErrorCode::UnknownEntrant);
    EXPECT_TRUE(store.games().empty());
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[0])->elo, 1000.0);
    EXPECT_EQ(store.GetEntrant(ids[0])->wins, 0);

    EXPECT_FALSE(engine.RecordResult(ids[0], ids[0], BoutResult::Tie, &error));
    EXPECT_TRUE(store.games().empty());
}

TEST(RatingEngineTest, RemovalSpreadsDeviationOverSurvivors) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"gone", "a", "b", "c", "d"}, {1100.0, 1000.0, 950.0, 1040.0, 910.0});
    RatingEngine engine(store);

    Error error;
    ASSERT_TRUE(engine.RemoveEntrant(ids[0], &error));

    EXPECT_FALSE(store.GetEntrant(ids[0]).has_value());
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[1])->elo, 1025.0);
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[2])->elo, 975.0);
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[3])->elo, 1065.0);
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[4])->elo, 935.0);
}

TEST(RatingEngineTest, RedistributionPreservesPairwiseGaps) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"a", "b", "c"}, {1200.0, 1010.0, 870.0});
    RatingEngine engine(store);

    Error error;
    ASSERT_TRUE(engine.Redistribute(-45.0, -1, &error));
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[0])->elo, 1185.0);
    EXPECT_NEAR(store.GetEntrant(ids[0])->elo - store.GetEntrant(ids[1])->elo, 190.0, 1e-9);
    EXPECT_NEAR(store.GetEntrant(ids[1])->elo - store.GetEntrant(ids[2])->elo, 140.0, 1e-9);
}

TEST(RatingEngineTest, RedistributionWithNothingToDoSucceeds) {
    EntrantStore store;
    const auto ids = localelo::test::Seed(store, {"only"}, {1300.0});
    std::vector<std::string> lines;
    RatingEngine engine(store, [&lines](const std::string& line) { lines.push_back(line); });

    Error error;
    EXPECT_TRUE(engine.Redistribute(0.001, -1, &error));
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[0])->elo, 1300.0);
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("negligible delta"), std::string::npos);

    ASSERT_TRUE(engine.RemoveEntrant(ids[0], &error));
    EXPECT_EQ(store.entrant_count(), 0u);
    EXPECT_NE(lines.back().find("no remaining entrants"), std::string::npos);
}

TEST(RatingEngineTest, RecordedResultsSurviveReload) {
    localelo::test::TempDir dir;
    const std::string path = dir.file("local_elo.json");
    int a_id = -1;
    {
        EntrantStore store(path);
        Error error;
        ASSERT_TRUE(store.Open(&error));
        const auto ids = localelo::test::Seed(store, {"a", "b"});
        a_id = ids[0];
        RatingEngine engine(store);
        ASSERT_TRUE(engine.RecordResult(ids[0], ids[1], BoutResult::B, &error));
    }
    EntrantStore reopened(path);
    Error error;
    ASSERT_TRUE(reopened.Open(&error));
    EXPECT_DOUBLE_EQ(reopened.GetEntrant(a_id)->elo, 984.0);
    EXPECT_EQ(reopened.GetEntrant(a_id)->losses, 1);
    EXPECT_EQ(reopened.games().size(), 1u);
}

TEST(RatingEngineTest, FailedRemovalKeepsEntrantAndRatings) {
    localelo::test::TempDir dir;
    const std::string path = dir.file("local_elo.json");
    EntrantStore store(path);
    Error error;
    ASSERT_TRUE(store.Open(&error));
    const auto ids = localelo::test::Seed(store, {"gone", "a", "b"}, {1090.0, 1000.0, 950.0});

    // A non-empty directory at the store path makes the final rename fail.
    std::filesystem::remove(path);
    std::filesystem::create_directories(path);
    std::ofstream(std::filesystem::path(path) / "keep") << "x";

    RatingEngine engine(store);
    EXPECT_FALSE(engine.RemoveEntrant(ids[0], &error));
    EXPECT_EQ(error.code, ErrorCode::Storage);
    ASSERT_TRUE(store.GetEntrant(ids[0]).has_value());
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[0])->elo, 1090.0);
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[1])->elo, 1000.0);
    EXPECT_DOUBLE_EQ(store.GetEntrant(ids[2])->elo, 950.0);
}

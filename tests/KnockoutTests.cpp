#include "TestSupport.h"

#include "localelo/core/knockout/KnockoutCommand.h"
#include "localelo/core/knockout/PoolCuration.h"
#include "localelo/core/knockout/TournamentController.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using localelo::core::Error;
using localelo::core::ErrorCode;
using localelo::core::knockout::CuratePool;
using localelo::core::knockout::EntrantState;
using localelo::core::knockout::KnockoutCommand;
using localelo::core::knockout::KnockoutOptions;
using localelo::core::knockout::KnockoutTransition;
using localelo::core::knockout::OrderForWinnerScreen;
using localelo::core::knockout::OutcomeFor;
using localelo::core::knockout::ParseKnockoutCommand;
using localelo::core::knockout::TournamentController;
using localelo::core::match::MatchSelector;
using localelo::core::rating::RatingEngine;
using localelo::core::store::BoutResult;
using localelo::core::store::EliminationMark;
using localelo::core::store::Entrant;
using localelo::core::store::EntrantStore;

namespace {

// Hands out strictly increasing timestamps.
struct FakeClock {
    int tick = 0;
    std::string operator()() {
        ++tick;
        return "2024-01-01T00:00:" + std::string(tick < 10 ? "0" : "") + std::to_string(tick) + ".000Z";
    }
};

struct Fixture {
    EntrantStore store;
    RatingEngine ratings{store};
    MatchSelector selector{42};
    FakeClock clock;
    TournamentController controller{store, ratings, selector, {}, [this] { return clock(); }};
};

}  // namespace

TEST(KnockoutCommandTest, ParsesCaseInsensitively) {
    EXPECT_TRUE(ParseKnockoutCommand("a") == KnockoutCommand::A);
    EXPECT_TRUE(ParseKnockoutCommand("B") == KnockoutCommand::B);
    EXPECT_TRUE(ParseKnockoutCommand("tie") == KnockoutCommand::Tie);
    EXPECT_TRUE(ParseKnockoutCommand("T") == KnockoutCommand::Tie);
    EXPECT_TRUE(ParseKnockoutCommand("A+") == KnockoutCommand::APlus);
    EXPECT_TRUE(ParseKnockoutCommand("tb-") == KnockoutCommand::TieBMinus);
    EXPECT_TRUE(ParseKnockoutCommand("t-") == KnockoutCommand::TieMinus);
    EXPECT_FALSE(ParseKnockoutCommand("c").has_value());
    EXPECT_FALSE(ParseKnockoutCommand("").has_value());
}

TEST(KnockoutCommandTest, TableMapsToResultAndEliminations) {
    struct Row {
        KnockoutCommand command;
        BoutResult result;
        bool eliminate_a;
        bool eliminate_b;
    };
    const std::vector<Row> table = {
        {KnockoutCommand::A, BoutResult::A, false, true},
        {KnockoutCommand::B, BoutResult::B, true, false},
        {KnockoutCommand::Tie, BoutResult::Tie, false, false},
        {KnockoutCommand::AMinus, BoutResult::A, true, false},
        {KnockoutCommand::BMinus, BoutResult::B, false, true},
        {KnockoutCommand::APlus, BoutResult::A, false, false},
        {KnockoutCommand::BPlus, BoutResult::B, false, false},
        {KnockoutCommand::TieAMinus, BoutResult::Tie, true, false},
        {KnockoutCommand::TieBMinus, BoutResult::Tie, false, true},
        {KnockoutCommand::TieMinus, BoutResult::Tie, true, true},
    };

    for (const auto& row : table) {
        Fixture f;
        const auto ids = localelo::test::Seed(f.store, {"a.py", "b.py"});
        Error error;
        KnockoutTransition transition;
        ASSERT_TRUE(f.controller.ApplyCommand(row.command, ids[0], ids[1], &transition, &error));

        EXPECT_EQ(transition.outcome.rating_result, row.result);
        EXPECT_EQ((f.controller.StateOf(ids[0]) == EntrantState::Eliminated), row.eliminate_a);
        EXPECT_EQ((f.controller.StateOf(ids[1]) == EntrantState::Eliminated), row.eliminate_b);

        const auto a = f.store.GetEntrant(ids[0]);
        EXPECT_EQ(a->wins, (row.result == BoutResult::A ? 1 : 0));
        EXPECT_EQ(a->losses, (row.result == BoutResult::B ? 1 : 0));
        EXPECT_EQ(a->ties, (row.result == BoutResult::Tie ? 1 : 0));
        EXPECT_EQ(f.store.games().size(), 1u);
    }
}

TEST(TournamentControllerTest, PoolCompletesAfterDecisiveEliminations) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py", "e.py"});
    const auto available = f.store.ListEntrants();
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{}, available, &error));

    int bouts = 0;
    while (!f.controller.Winner(available)) {
        const auto bout = f.controller.NextBout(available, 1.0, &error);
        ASSERT_TRUE(bout.has_value());
        const auto command = bouts % 2 == 0 ? KnockoutCommand::A : KnockoutCommand::B;
        ASSERT_TRUE(f.controller.ApplyCommand(command, bout->a.id, bout->b.id, nullptr, &error));
        ++bouts;
        ASSERT_LT(bouts, 10);
    }

    EXPECT_EQ(bouts, 4);
    EXPECT_EQ(f.controller.RemainingCount(available), 1);
    EXPECT_EQ(f.store.Eliminations().size(), 4u);

    const auto ordering = f.controller.WinnerOrdering();
    ASSERT_EQ(ordering.size(), 5u);
    EXPECT_FALSE(ordering.front().eliminated_at.has_value());
    EXPECT_EQ(ordering.front().entrant.id, f.controller.Winner(available)->id);
}

TEST(PoolCurationTest, BothPhasesHoldUniqueIds) {
    EntrantStore store;
    localelo::test::Seed(store,
                         {"a.py", "b.py", "c.py", "d.py", "e.py", "f.py", "g.py", "h.py"},
                         {900, 950, 1000, 1050, 1100, 1150, 1200, 1250});
    std::mt19937 rng(17);
    const auto selection = CuratePool(store.ListEntrants(), 5, 2, 1.0, rng);

    EXPECT_EQ(selection.weighted_ids.size(), 3u);
    EXPECT_EQ(selection.top_skew_ids.size(), 2u);
    const auto all = selection.all_ids();
    EXPECT_EQ(all.size(), 5u);
    EXPECT_EQ(std::set<int>(all.begin(), all.end()).size(), 5u);
    for (int id : selection.top_skew_ids) {
        EXPECT_TRUE(std::find(selection.weighted_ids.begin(), selection.weighted_ids.end(), id) ==
                    selection.weighted_ids.end());
    }
}

TEST(PoolCurationTest, TopSkewPhaseIgnoresCallerPower) {
    Entrant fresh;
    fresh.id = 1;
    fresh.identifier = "fresh.py";
    Entrant veteran;
    veteran.id = 2;
    veteran.identifier = "veteran.py";
    veteran.wins = 99;
    const std::vector<Entrant> available = {fresh, veteran};

    // With power 0 play counts are ignored in the weighted phase; the top-skew
    // phase still applies its own exponent.
    std::mt19937 rng(23);
    int weighted_veteran = 0;
    int skewed_veteran = 0;
    for (int i = 0; i < 400; ++i) {
        weighted_veteran += CuratePool(available, 1, 0, 0.0, rng).weighted_ids.front() == 2 ? 1 : 0;
        skewed_veteran += CuratePool(available, 1, 1, 0.0, rng).top_skew_ids.front() == 2 ? 1 : 0;
    }
    EXPECT_GT(weighted_veteran, 120);
    EXPECT_LT(skewed_veteran, 5);
}

TEST(TournamentControllerTest, CuratedPoolIsPersisted) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py", "e.py"});
    const auto available = f.store.ListEntrants();
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{3, 1, 1.0}, available, &error));

    EXPECT_EQ(f.controller.pool().size(), 3u);
    EXPECT_EQ(f.store.LoadPool().size(), 3u);
    EXPECT_EQ(f.controller.RemainingCount(available), 3);
    EXPECT_EQ(f.controller.WinnerOrdering().size(), 3u);
}

TEST(TournamentControllerTest, ResumeWithDifferentPoolSizeConflicts) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py", "e.py"});
    const auto available = f.store.ListEntrants();
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{3, 0, 1.0}, available, &error));

    TournamentController resumed(f.store, f.ratings, f.selector);
    EXPECT_FALSE(resumed.Start(KnockoutOptions{4, 0, 1.0}, available, &error));
    EXPECT_EQ(error.code, ErrorCode::ConfigurationConflict);
    EXPECT_EQ(f.store.LoadPool().size(), 3u);

    Error ok;
    EXPECT_TRUE(resumed.Start(KnockoutOptions{3, 0, 1.0}, available, &ok));
    EXPECT_TRUE(resumed.Start(KnockoutOptions{}, available, &ok));
}

TEST(TournamentControllerTest, RemovingPoolMemberKeepsPoolSize) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py", "e.py"});
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{3, 0, 1.0}, f.store.ListEntrants(), &error));
    const auto pool = f.store.LoadPool();
    ASSERT_EQ(pool.size(), 3u);

    ASSERT_TRUE(f.ratings.RemoveEntrant(pool[0], &error));
    EXPECT_EQ(f.store.LoadPool(), pool);

    TournamentController resumed(f.store, f.ratings, f.selector);
    const auto available = f.store.ListEntrants();
    ASSERT_TRUE(resumed.Start(KnockoutOptions{3, 0, 1.0}, available, &error));
    EXPECT_EQ(resumed.RemainingCount(available), 2);
    EXPECT_EQ(resumed.WinnerOrdering().size(), 2u);
}

TEST(TournamentControllerTest, RemovingWholePoolDoesNotWidenScope) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py", "e.py"});
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{2, 0, 1.0}, f.store.ListEntrants(), &error));
    for (int id : f.store.LoadPool()) {
        ASSERT_TRUE(f.ratings.RemoveEntrant(id, &error));
    }
    f.controller.Sync();

    const auto available = f.store.ListEntrants();
    EXPECT_EQ(available.size(), 3u);
    EXPECT_TRUE(f.controller.has_pool());
    EXPECT_TRUE(f.controller.Eligible(available).empty());
    EXPECT_FALSE(f.controller.Winner(available).has_value());
}

TEST(TournamentControllerTest, PoolLargerThanFieldIsRejected) {
    Fixture f;
    localelo::test::Seed(f.store, {"a.py", "b.py", "c.py"});
    Error error;
    EXPECT_FALSE(f.controller.Start(KnockoutOptions{5, 0, 1.0}, f.store.ListEntrants(), &error));
    EXPECT_EQ(error.code, ErrorCode::InsufficientEntrants);
    EXPECT_TRUE(f.store.LoadPool().empty());

    EXPECT_FALSE(f.controller.Start(KnockoutOptions{3, 4, 1.0}, f.store.ListEntrants(), &error));
    EXPECT_EQ(error.code, ErrorCode::InvalidConfig);
}

TEST(TournamentControllerTest, ResetClearsEliminationsAndPool) {
    Fixture f;
    const auto ids = localelo::test::Seed(f.store, {"a.py", "b.py", "c.py", "d.py"});
    const auto available = f.store.ListEntrants();
    Error error;
    ASSERT_TRUE(f.controller.Start(KnockoutOptions{3, 0, 1.0}, available, &error));
    const std::vector<int> pool(f.store.LoadPool());
    ASSERT_TRUE(f.controller.ApplyCommand(KnockoutCommand::A, pool[0], pool[1], nullptr, &error));
    ASSERT_EQ(f.controller.RemainingCount(available), 2);

    ASSERT_TRUE(f.controller.Reset(&error));
    EXPECT_TRUE(f.store.Eliminations().empty());
    EXPECT_TRUE(f.store.LoadPool().empty());
    EXPECT_FALSE(f.controller.has_pool());
    EXPECT_EQ(f.controller.RemainingCount(available), static_cast<int>(ids.size()));
    EXPECT_EQ(f.store.games().size(), 1u);
}

TEST(TournamentControllerTest, DoubleEliminationOfLastPairLeavesNoWinner) {
    Fixture f;
    const auto ids = localelo::test::Seed(f.store, {"a.py", "b.py"});
    const auto available = f.store.ListEntrants();
    Error error;
    ASSERT_TRUE(f.controller.ApplyCommand(KnockoutCommand::TieMinus, ids[0], ids[1], nullptr, &error));
    EXPECT_EQ(f.controller.RemainingCount(available), 0);
    EXPECT_FALSE(f.controller.Winner(available).has_value());
}

TEST(TournamentControllerTest, WinnerScreenOrdering) {
    auto make = [](int id, double elo) {
        Entrant entrant;
        entrant.id = id;
        entrant.identifier = "e" + std::to_string(id);
        entrant.elo = elo;
        return entrant;
    };
    const std::vector<Entrant> entrants = {make(1, 1100), make(2, 1200), make(3, 900), make(4, 1000), make(5, 1000)};
    const std::vector<EliminationMark> marks = {
        {2, "2024-01-01T00:00:01.000Z"},
        {3, "2024-01-01T00:00:02.000Z"},
        {4, "2024-01-01T00:00:02.000Z"},
        {5, "2024-01-01T00:00:02.000Z"},
    };

    const auto ordering = OrderForWinnerScreen(entrants, marks);
    std::vector<int> ids;
    for (const auto& row : ordering) {
        ids.push_back(row.entrant.id);
    }
    EXPECT_EQ(ids, (std::vector<int>{1, 4, 5, 3, 2}));
    EXPECT_FALSE(ordering.front().eliminated_at.has_value());
}

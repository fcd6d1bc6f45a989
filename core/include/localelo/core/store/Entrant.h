#pragma once

#include <string>

namespace localelo::core::store {

constexpr double kDefaultElo = 1000.0;

struct Entrant {
    int id = -1;
    std::string identifier;
    double elo = kDefaultElo;
    int wins = 0;
    int losses = 0;
    int ties = 0;

    int games_played() const { return wins + losses + ties; }
};

// Result of a bout from side A's point of view.
enum class BoutResult {
    A,
    B,
    Tie,
};

struct GameRecord {
    int entrant_a = -1;
    int entrant_b = -1;
    BoutResult result = BoutResult::Tie;
    std::string timestamp;
};

struct EliminationMark {
    int entrant_id = -1;
    std::string eliminated_at;
};

std::string BoutResultToString(BoutResult result);
bool ParseBoutResult(const std::string& text, BoutResult& result);

}  // namespace localelo::core::store

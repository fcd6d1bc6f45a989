#pragma once

#include "localelo/core/knockout/TournamentController.h"
#include "localelo/core/match/MatchSelector.h"
#include "localelo/core/store/Entrant.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace localelo::core::present {

struct PresentationConfig {
    bool color = false;
    bool hyperlinks = false;
    std::string target_dir = ".";
    int histogram_width = 80;
};

std::string FormatRecord(int wins, int losses, int ties);
std::string FormatRecord(const store::Entrant& entrant);
// Full blocks for floor(min(elo / max_elo, 1) * width), space padded to width.
std::string EloHistogram(double elo, double max_elo, int width);
// "52% A" or "73% B": the favourite's chance, never below 50%.
std::string FavouriteLabel(double prob_a);

// Renders core data for the terminal. Holds no ranking or elimination logic.
class Presenter {
public:
    explicit Presenter(PresentationConfig config);

    std::string Leaderboard(const std::vector<store::Entrant>& ranked, int limit) const;
    std::string KnockoutResults(const std::vector<knockout::KnockoutStanding>& ordering) const;
    std::string Matchup(const match::Bout& bout, const std::unordered_map<int, int>& ranks) const;
    std::string RankingChanges(const std::unordered_map<int, int>& old_ranks,
                               const std::unordered_map<int, int>& new_ranks,
                               const std::vector<store::Entrant>& entrants) const;
    std::string KnockoutOutcome(const knockout::KnockoutTransition& transition,
                                const store::Entrant& a,
                                const store::Entrant& b) const;

    std::string Red(const std::string& text) const { return Apply("\033[31m", text); }
    std::string Green(const std::string& text) const { return Apply("\033[32m", text); }
    std::string Yellow(const std::string& text) const { return Apply("\033[33m", text); }
    std::string Cyan(const std::string& text) const { return Apply("\033[36m", text); }
    std::string Dim(const std::string& text) const { return Apply("\033[2m", text); }
    std::string Bold(const std::string& text) const { return Apply("\033[1m", text); }

    std::string DisplayPath(const std::string& identifier) const;

private:
    std::string Apply(const char* code, const std::string& text) const;
    std::string Row(int position, const store::Entrant& entrant, double max_elo) const;

    PresentationConfig config_;
};

}  // namespace localelo::core::present

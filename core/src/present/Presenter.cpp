#include "localelo/core/present/Presenter.h"

#include "localelo/core/discovery/EntrantFiles.h"
#include "localelo/core/rating/RatingEngine.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace localelo::core::present {

namespace {

constexpr const char* kBlock = "█";

std::string PadRight(const std::string& text, size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), ' ');
}

}  // namespace

std::string FormatRecord(int wins, int losses, int ties) {
    std::ostringstream out;
    out << wins << "W-" << losses << "L-" << ties << "T";
    return out.str();
}

std::string FormatRecord(const store::Entrant& entrant) {
    return FormatRecord(entrant.wins, entrant.losses, entrant.ties);
}

std::string EloHistogram(double elo, double max_elo, int width) {
    if (width <= 0) {
        return {};
    }
    if (max_elo <= 0.0) {
        return std::string(static_cast<size_t>(width), ' ');
    }
    const double ratio = std::clamp(elo / max_elo, 0.0, 1.0);
    const int filled = static_cast<int>(ratio * width);
    std::string bar;
    for (int i = 0; i < filled; ++i) {
        bar += kBlock;
    }
    bar.append(static_cast<size_t>(width - filled), ' ');
    return bar;
}

std::string FavouriteLabel(double prob_a) {
    std::ostringstream out;
    if (prob_a >= 0.5) {
        out << std::lround(prob_a * 100.0) << "% A";
    } else {
        out << std::lround((1.0 - prob_a) * 100.0) << "% B";
    }
    return out.str();
}

Presenter::Presenter(PresentationConfig config) : config_(std::move(config)) {}

std::string Presenter::Apply(const char* code, const std::string& text) const {
    if (!config_.color) {
        return text;
    }
    return std::string(code) + text + "\033[0m";
}

std::string Presenter::DisplayPath(const std::string& identifier) const {
    const std::string shown = config_.target_dir == "." || config_.target_dir.empty()
                                  ? identifier
                                  : (std::filesystem::path(config_.target_dir) / identifier).string();
    if (!config_.hyperlinks) {
        return shown;
    }
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(std::filesystem::path(config_.target_dir) / identifier, ec);
    if (ec) {
        return shown;
    }
    // OSC 8 terminal hyperlink.
    return "\033]8;;file://" + absolute.string() + "\033\\" + shown + "\033]8;;\033\\";
}

std::string Presenter::Row(int position, const store::Entrant& entrant, double max_elo) const {
    std::ostringstream out;
    const double ratio = max_elo > 0.0 ? entrant.elo / max_elo : 0.0;
    std::string bar = EloHistogram(entrant.elo, max_elo, config_.histogram_width);
    if (ratio >= 0.7) {
        bar = Green(bar);
    } else if (ratio >= 0.5) {
        bar = Cyan(bar);
    } else {
        bar = Dim(bar);
    }
    out << bar << ' ' << std::setw(2) << position << ". " << std::setw(4) << static_cast<int>(entrant.elo) << " ("
        << PadRight(FormatRecord(entrant), 12) << ") " << DisplayPath(entrant.identifier);
    return out.str();
}

std::string Presenter::Leaderboard(const std::vector<store::Entrant>& ranked, int limit) const {
    std::ostringstream out;
    out << '\n' << Bold(Cyan("Top " + std::to_string(limit) + " Entrants:")) << '\n';
    if (ranked.empty()) {
        out << "No entrants found.\n";
        return out.str();
    }
    const double max_elo = ranked.front().elo;
    const size_t count = std::min(ranked.size(), static_cast<size_t>(std::max(0, limit)));
    for (size_t i = 0; i < count; ++i) {
        out << Row(static_cast<int>(i + 1), ranked[i], max_elo) << '\n';
    }
    return out.str();
}

std::string Presenter::KnockoutResults(const std::vector<knockout::KnockoutStanding>& ordering) const {
    std::ostringstream out;
    out << '\n' << Bold(Cyan("Knockout Tournament Results:")) << '\n';
    if (ordering.empty()) {
        out << "No entrants found.\n";
        return out.str();
    }
    double max_elo = 0.0;
    for (const auto& row : ordering) {
        max_elo = std::max(max_elo, row.entrant.elo);
    }
    int position = 1;
    for (const auto& row : ordering) {
        out << Row(position++, row.entrant, max_elo);
        if (!row.eliminated_at) {
            out << ' ' << Bold(Green("Winner"));
        }
        out << '\n';
    }
    return out.str();
}

std::string Presenter::Matchup(const match::Bout& bout, const std::unordered_map<int, int>& ranks) const {
    const auto rank_of = [&ranks](int id) {
        auto it = ranks.find(id);
        return it == ranks.end() ? std::string("?") : std::to_string(it->second);
    };
    const double prob_a = rating::WinProbability(bout.a.elo, bout.b.elo);

    std::ostringstream out;
    out << '\n'
        << Bold("A: ") << discovery::DisplayName(bout.a.identifier) << "  (#" << rank_of(bout.a.id) << ", "
        << static_cast<int>(bout.a.elo) << ", " << FormatRecord(bout.a) << ")\n"
        << Bold("B: ") << discovery::DisplayName(bout.b.identifier) << "  (#" << rank_of(bout.b.id) << ", "
        << static_cast<int>(bout.b.elo) << ", " << FormatRecord(bout.b) << ")\n";
    const double favourite = std::max(prob_a, 1.0 - prob_a);
    const std::string label = FavouriteLabel(prob_a);
    out << "Favourite: " << (favourite >= 0.7 ? Green(label) : favourite >= 0.55 ? Yellow(label) : Dim(label))
        << '\n';
    return out.str();
}

std::string Presenter::RankingChanges(const std::unordered_map<int, int>& old_ranks,
                                      const std::unordered_map<int, int>& new_ranks,
                                      const std::vector<store::Entrant>& entrants) const {
    std::ostringstream out;
    out << "\nRankings:\n";
    for (const auto& entrant : entrants) {
        const auto old_it = old_ranks.find(entrant.id);
        const auto new_it = new_ranks.find(entrant.id);
        std::string movement;
        if (new_it == new_ranks.end()) {
            movement = old_it == old_ranks.end() ? "unranked" : "unranked (was #" + std::to_string(old_it->second) + ")";
        } else if (old_it == old_ranks.end()) {
            movement = "#" + std::to_string(new_it->second) + " (new)";
        } else if (old_it->second == new_it->second) {
            movement = Dim("#" + std::to_string(new_it->second) + " (no change)");
        } else if (new_it->second < old_it->second) {
            movement = Green("#" + std::to_string(new_it->second) + " (up from #" + std::to_string(old_it->second) + ")");
        } else {
            movement =
                Red("#" + std::to_string(new_it->second) + " (down from #" + std::to_string(old_it->second) + ")");
        }
        out << "  " << DisplayPath(entrant.identifier) << ": " << movement
            << " | New Elo: " << static_cast<int>(entrant.elo) << '\n';
    }
    return out.str();
}

std::string Presenter::KnockoutOutcome(const knockout::KnockoutTransition& transition,
                                       const store::Entrant& a,
                                       const store::Entrant& b) const {
    const std::string name_a = DisplayPath(a.identifier);
    const std::string name_b = DisplayPath(b.identifier);
    const auto& outcome = transition.outcome;
    if (outcome.eliminate_a && outcome.eliminate_b) {
        return "  Tie, but " + Bold(Red("BOTH")) + " entrants are REMOVED from the tournament!";
    }
    const bool tie = outcome.rating_result == store::BoutResult::Tie;
    if (!outcome.eliminate_a && !outcome.eliminate_b) {
        if (tie) {
            return "  Tie - no one eliminated.";
        }
        const std::string& winner = outcome.rating_result == store::BoutResult::A ? name_a : name_b;
        return "  " + winner + " wins, but both entrants stay in the tournament!";
    }
    const bool a_out = outcome.eliminate_a;
    const std::string& out_name = a_out ? name_a : name_b;
    if (tie) {
        return "  Tie, but " + out_name + " is REMOVED from the tournament!";
    }
    const bool out_won = (a_out && outcome.rating_result == store::BoutResult::A) ||
                         (!a_out && outcome.rating_result == store::BoutResult::B);
    if (out_won) {
        return "  " + out_name + " wins but is REMOVED from the tournament!";
    }
    return "  " + out_name + " has been " + Bold(Red("ELIMINATED")) + "!";
}

}  // namespace localelo::core::present

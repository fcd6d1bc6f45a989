#include "localelo/core/session/JudgingSession.h"

#include "localelo/core/discovery/EntrantFiles.h"
#include "localelo/core/export/ExportWriter.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <unordered_set>

namespace localelo::core::session {

namespace {

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::mt19937::result_type SeedFor(const api::SessionConfig& config) {
    if (config.selection.seed != 0) {
        return config.selection.seed;
    }
    std::random_device device;
    return device();
}

present::PresentationConfig PresentationFor(const api::SessionConfig& config) {
    present::PresentationConfig presentation;
    presentation.color = config.display.color;
    presentation.hyperlinks = config.display.hyperlinks;
    presentation.target_dir = config.target_dir;
    return presentation;
}

// "top" -> default, "top 25" -> 25; empty when the line is not a top command.
std::optional<int> ParseTopCommand(const std::string& line, int default_limit) {
    std::istringstream stream(line);
    std::string word;
    stream >> word;
    if (Lower(word) != "top") {
        return std::nullopt;
    }
    int limit = 0;
    if (stream >> limit) {
        std::string extra;
        if (stream >> extra || limit < 1) {
            return std::nullopt;
        }
        return limit;
    }
    if (!stream.eof()) {
        return std::nullopt;
    }
    return default_limit;
}

}  // namespace

JudgingSession::JudgingSession(api::SessionConfig config, std::istream& in, std::ostream& out)
    : config_(std::move(config)),
      in_(in),
      out_(out),
      store_(config_.StorePath()),
      selector_(SeedFor(config_)),
      ratings_(store_, [this](const std::string& line) { AppendLogLine(line); }),
      controller_(store_, ratings_, selector_, [this](const std::string& line) { AppendLogLine(line); }),
      presenter_(PresentationFor(config_)) {
    state_.knockout = config_.knockout.enabled;
}

void JudgingSession::AppendLogLine(const std::string& line) {
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
    out_ << presenter_.Dim(line) << '\n';

    if (!config_.output.progress_log.empty()) {
        std::ofstream output(config_.output.progress_log, std::ios::binary | std::ios::app);
        if (!output) {
            std::cerr << "[localelo] Failed to open log: " << config_.output.progress_log << '\n';
            return;
        }
        output << line << "\n";
    }
}

std::string JudgingSession::getLastLogLines(int n) const {
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

JudgingSession::Step JudgingSession::Fail(const Error& error) {
    last_error_ = error;
    out_ << presenter_.Red("Error (" + std::string(ErrorCodeName(error.code)) + "): " + error.message) << '\n';
    AppendLogLine("[localelo] " + error.message);
    return IsFatal(error.code) ? Step::Fatal : Step::Stop;
}

bool JudgingSession::ReadLine(const std::string& prompt, std::string& line) {
    out_ << prompt << std::flush;
    if (!std::getline(in_, line)) {
        out_ << '\n';
        return false;
    }
    line = Trim(line);
    return true;
}

bool JudgingSession::SyncAvailable() {
    Error error;
    if (!store_.Reload(&error)) {
        Fail(error);
        return false;
    }

    discovery::DiscoveryOptions options;
    options.pattern = config_.pattern;
    options.excluded_names = {config_.output.store_file,
                              config_.output.store_file + ".tmp",
                              "elo_start.sh",
                              "elo_start.bat"};
    std::string scan_error;
    const auto discovered = discovery::DiscoverEntrants(config_.target_dir, options, &scan_error);
    if (!scan_error.empty()) {
        AppendLogLine("[localelo] " + scan_error);
    }
    const int added = store_.MergeDiscovered(discovered, &error);
    if (added < 0) {
        Fail(error);
        return false;
    }
    if (added > 0) {
        AppendLogLine("[localelo] Added " + std::to_string(added) + " new entrants");
    }

    available_ = store_.ListEntrants([this](const store::Entrant& entrant) {
        return discovery::MatchesPattern(entrant.identifier, config_.pattern) &&
               discovery::EntrantExists(config_.target_dir, entrant.identifier);
    });
    controller_.Sync();
    return true;
}

bool JudgingSession::Initialize() {
    std::string config_error;
    if (!config_.Validate(&config_error)) {
        Fail({ErrorCode::InvalidConfig, config_error});
        return false;
    }
    Error error;
    if (!store_.Open(&error)) {
        Fail(error);
        return false;
    }
    AppendLogLine("[localelo] Store: " + store_.path());
    if (!SyncAvailable()) {
        return false;
    }

    if (config_.knockout.enabled) {
        knockout::KnockoutOptions options;
        options.pool_size = config_.knockout.pool_size;
        options.top_skew_size = config_.knockout.top_skew_size;
        options.power = config_.selection.power;
        if (!controller_.Start(options, available_, &error)) {
            Fail(error);
            return false;
        }
    }
    return true;
}

void JudgingSession::ShowWelcome() {
    out_ << '\n' << presenter_.Bold(presenter_.Cyan(config_.knockout.enabled ? "Local Elo - Knockout Mode"
                                                                             : "Local Elo - Ladder Mode"))
         << '\n';
    out_ << "Judge each bout: A or B wins, t for a tie.\n";
    if (config_.knockout.enabled) {
        out_ << "Knockout: a-/b- retire that side even if it won, a+/b+ keep both in,\n"
             << "ta-/tb-/t- record a tie and retire one or both sides.\n";
    }
    out_ << "Other commands: top [N], rem a/b/ab";
    if (config_.knockout.enabled) {
        out_ << ", reset";
    }
    out_ << ", q\n";
}

int JudgingSession::Run() {
    if (!Initialize()) {
        return IsFatal(last_error_.code) ? 1 : 0;
    }
    ShowWelcome();

    while (true) {
        const Step step = RunIteration();
        if (step == Step::Continue) {
            continue;
        }
        return step == Step::Fatal ? 1 : 0;
    }
}

JudgingSession::Step JudgingSession::RunIteration() {
    if (!SyncAvailable()) {
        return IsFatal(last_error_.code) ? Step::Fatal : Step::Stop;
    }

    const auto eligible = config_.knockout.enabled ? controller_.Eligible(available_) : available_;
    state_.remaining = static_cast<int>(eligible.size());

    if (eligible.empty()) {
        if (config_.knockout.enabled && !store_.Eliminations().empty()) {
            out_ << presenter_.Yellow("Every entrant has been eliminated; there is no winner.") << '\n';
            out_ << presenter_.KnockoutResults(controller_.WinnerOrdering());
        } else {
            out_ << presenter_.Yellow("No entrants found matching the pattern.") << '\n';
        }
        return Step::Stop;
    }
    if (eligible.size() == 1) {
        if (config_.knockout.enabled) {
            return WinnerScreen();
        }
        out_ << presenter_.Yellow("Only one entrant found. Need at least two entrants for comparison.") << '\n';
        return Step::Stop;
    }

    Error error;
    const auto bout = selector_.PickBout(eligible, config_.selection.power, &error);
    if (!bout) {
        if (error.code == ErrorCode::EmptyCandidateSet) {
            out_ << presenter_.Red("Could not find a second entrant; skipping bout.") << '\n';
            return Step::Continue;
        }
        return Fail(error);
    }
    return JudgeBout(*bout);
}

JudgingSession::Step JudgingSession::WinnerScreen() {
    const auto winner = controller_.Winner(available_);
    state_.winner = winner ? winner->identifier : std::string();

    out_ << '\n' << std::string(60, '=') << '\n'
         << presenter_.Bold(presenter_.Green("KNOCKOUT TOURNAMENT COMPLETE!")) << '\n'
         << std::string(60, '=') << '\n';
    if (winner) {
        out_ << "Winner: " << presenter_.Bold(presenter_.DisplayPath(winner->identifier)) << '\n';
    }
    const auto ordering = controller_.WinnerOrdering();
    out_ << presenter_.KnockoutResults(ordering);
    out_ << "Type 'reset' to export the results to CSV and start a new tournament, or 'q' to quit.\n";

    std::string line;
    while (ReadLine("> ", line)) {
        const std::string command = Lower(line);
        if (command == "reset") {
            const auto path = (std::filesystem::path(config_.ExportDir()) /
                               exporter::KnockoutCsvName(std::chrono::system_clock::now()))
                                  .string();
            std::string export_error;
            if (exporter::WriteKnockoutCsv(path, ordering, &export_error)) {
                out_ << "\nResults exported to: " << path << "\n";
            } else {
                out_ << presenter_.Red("Failed to export results: " + export_error) << '\n';
            }
            Error error;
            if (!controller_.Reset(&error)) {
                return Fail(error);
            }
            out_ << presenter_.Green("Knockout tournament reset! All entrants are back in.") << "\n\n";
            return Step::Continue;
        }
        if (command == "q" || command == "quit") {
            return Step::Stop;
        }
        out_ << presenter_.Yellow("Invalid input. Please type 'reset' or 'q'.") << '\n';
    }
    return Step::Stop;
}

JudgingSession::Step JudgingSession::JudgeBout(const match::Bout& bout) {
    const std::string matchup = presenter_.Matchup(bout, store_.RankMap());
    out_ << matchup;

    const std::string prompt = config_.knockout.enabled
                                   ? "Your choice (A/B/t/a-/b-/a+/b+/ta-/tb-/t-/top [N]/rem a/b/ab/reset/q): "
                                   : "Your choice (A/B/t/top [N]/rem a/b/ab/q): ";
    std::string line;
    while (ReadLine(prompt, line)) {
        if (line.empty()) {
            continue;
        }
        const std::string lowered = Lower(line);
        if (lowered == "q" || lowered == "quit") {
            return Step::Stop;
        }

        if (const auto limit = ParseTopCommand(line, config_.display.leaderboard_size)) {
            std::unordered_set<int> shown;
            for (const auto& entrant : available_) {
                if (!config_.knockout.enabled || controller_.InScope(entrant.id)) {
                    shown.insert(entrant.id);
                }
            }
            auto ranked = store_.Rankings();
            ranked.erase(std::remove_if(ranked.begin(),
                                        ranked.end(),
                                        [&shown](const store::Entrant& e) { return shown.count(e.id) == 0; }),
                         ranked.end());
            out_ << presenter_.Leaderboard(ranked, *limit) << matchup;
            continue;
        }

        if (lowered == "reset") {
            if (!config_.knockout.enabled) {
                out_ << presenter_.Red("Error: reset is only available in knockout mode") << '\n';
                continue;
            }
            std::string confirm;
            if (!ReadLine("Are you sure you want to reset the knockout tournament? All eliminations will be "
                          "cleared. (y/N): ",
                          confirm)) {
                return Step::Stop;
            }
            confirm = Lower(confirm);
            if (confirm == "y" || confirm == "yes") {
                Error error;
                if (!controller_.Reset(&error)) {
                    return Fail(error);
                }
                out_ << presenter_.Green("Knockout tournament has been reset! All entrants are back in.") << "\n\n";
                return Step::Continue;
            }
            out_ << "Reset cancelled.\n" << matchup;
            continue;
        }

        if (lowered.rfind("rem ", 0) == 0) {
            const std::string which = Trim(lowered.substr(4));
            if (which != "a" && which != "b" && which != "ab") {
                out_ << presenter_.Yellow("Usage: rem a, rem b or rem ab") << '\n';
                continue;
            }
            return RemoveEntrants(which, bout);
        }

        const auto command = knockout::ParseKnockoutCommand(line);
        if (!command) {
            out_ << presenter_.Yellow(config_.knockout.enabled
                                          ? "Invalid input. Please enter A, B, t, a-, b-, a+, b+, ta-, tb-, t-, "
                                            "top [N], rem a/b/ab, reset or q"
                                          : "Invalid input. Please enter A, B, t, top [N], rem a/b/ab or q")
                 << '\n';
            continue;
        }
        if (!config_.knockout.enabled && !knockout::IsLadderCommand(*command)) {
            out_ << presenter_.Red("Error: a-/b-/a+/b+/ta-/tb-/t- commands are only available in knockout mode")
                 << '\n';
            continue;
        }
        return RecordVerdict(*command, bout);
    }
    return Step::Stop;
}

JudgingSession::Step JudgingSession::RecordVerdict(knockout::KnockoutCommand command, const match::Bout& bout) {
    const auto old_ranks = store_.RankMap();
    Error error;
    knockout::KnockoutTransition transition;
    if (config_.knockout.enabled) {
        if (!controller_.ApplyCommand(command, bout.a.id, bout.b.id, &transition, &error)) {
            return Fail(error);
        }
    } else if (!ratings_.RecordResult(bout.a.id, bout.b.id, knockout::OutcomeFor(command).rating_result, &error)) {
        return Fail(error);
    }
    state_.bouts_judged += 1;

    const auto new_ranks = store_.RankMap();
    std::vector<store::Entrant> updated;
    for (int id : {bout.a.id, bout.b.id}) {
        if (auto entrant = store_.GetEntrant(id)) {
            updated.push_back(*entrant);
        }
    }
    out_ << presenter_.RankingChanges(old_ranks, new_ranks, updated) << '\n';

    if (config_.knockout.enabled) {
        out_ << presenter_.KnockoutOutcome(transition, bout.a, bout.b) << "\n\n";
        state_.remaining = controller_.RemainingCount(available_);
        out_ << "Entrants remaining: " << state_.remaining << "\n";
    }
    return Step::Continue;
}

JudgingSession::Step JudgingSession::RemoveEntrants(const std::string& which, const match::Bout& bout) {
    std::vector<store::Entrant> targets;
    if (which.find('a') != std::string::npos) {
        targets.push_back(bout.a);
    }
    if (which.find('b') != std::string::npos) {
        targets.push_back(bout.b);
    }

    for (const auto& target : targets) {
        Error error;
        if (!ratings_.RemoveEntrant(target.id, &error)) {
            return Fail(error);
        }
        std::string trash_path;
        std::string trash_error;
        if (discovery::TrashEntrantFile(config_.target_dir, target.identifier, &trash_path, &trash_error)) {
            out_ << "Moved to trash: " << trash_path << '\n';
        } else {
            out_ << presenter_.Yellow("Warning: " + trash_error) << '\n';
        }
        out_ << "Removed " << presenter_.DisplayPath(target.identifier) << " from the rankings.\n";
    }
    return Step::Continue;
}

}  // namespace localelo::core::session

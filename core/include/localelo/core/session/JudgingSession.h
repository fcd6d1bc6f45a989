#pragma once

#include "localelo/core/api/SessionConfig.h"
#include "localelo/core/knockout/TournamentController.h"
#include "localelo/core/match/MatchSelector.h"
#include "localelo/core/present/Presenter.h"
#include "localelo/core/rating/RatingEngine.h"
#include "localelo/core/store/EntrantStore.h"
#include "localelo/core/util/Error.h"

#include <deque>
#include <iosfwd>
#include <string>
#include <vector>

namespace localelo::core::session {

struct SessionState {
    bool knockout = false;
    int bouts_judged = 0;
    int remaining = 0;
    std::string winner;
};

// The interactive judging loop: discover, select a bout, read the verdict,
// record it. One bout is fully persisted before the next is selected.
class JudgingSession {
public:
    JudgingSession(api::SessionConfig config, std::istream& in, std::ostream& out);

    // 0 when the session ends normally, 1 on a fatal error.
    int Run();

    SessionState getStateSnapshot() const { return state_; }
    const Error& lastError() const { return last_error_; }
    std::string getLastLogLines(int n) const;

private:
    enum class Step {
        Continue,
        Stop,
        Fatal,
    };

    bool Initialize();
    bool SyncAvailable();
    Step RunIteration();
    Step WinnerScreen();
    Step JudgeBout(const match::Bout& bout);
    Step RecordVerdict(knockout::KnockoutCommand command, const match::Bout& bout);
    Step RemoveEntrants(const std::string& which, const match::Bout& bout);
    Step Fail(const Error& error);
    bool ReadLine(const std::string& prompt, std::string& line);
    void ShowWelcome();
    void AppendLogLine(const std::string& line);

    api::SessionConfig config_;
    std::istream& in_;
    std::ostream& out_;

    store::EntrantStore store_;
    match::MatchSelector selector_;
    rating::RatingEngine ratings_;
    knockout::TournamentController controller_;
    present::Presenter presenter_;

    std::vector<store::Entrant> available_;
    SessionState state_;
    Error last_error_;

    std::deque<std::string> log_lines_;
    size_t max_log_lines_ = 2000;
};

}  // namespace localelo::core::session

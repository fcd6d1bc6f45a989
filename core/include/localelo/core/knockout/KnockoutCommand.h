#pragma once

#include "localelo/core/store/Entrant.h"

#include <optional>
#include <string>

namespace localelo::core::knockout {

enum class KnockoutCommand {
    A,
    B,
    Tie,
    AMinus,
    BMinus,
    APlus,
    BPlus,
    TieAMinus,
    TieBMinus,
    TieMinus,
};

struct CommandOutcome {
    store::BoutResult rating_result = store::BoutResult::Tie;
    bool eliminate_a = false;
    bool eliminate_b = false;
};

// "-" retires the named side even when it won; "+" on a win spares the loser.
CommandOutcome OutcomeFor(KnockoutCommand command);

// Case-insensitive: a, b, t/tie, a-, b-, a+, b+, ta-, tb-, t-.
std::optional<KnockoutCommand> ParseKnockoutCommand(const std::string& text);
std::string KnockoutCommandName(KnockoutCommand command);

// A, B and tie are the only commands accepted outside knockout mode.
bool IsLadderCommand(KnockoutCommand command);

}  // namespace localelo::core::knockout

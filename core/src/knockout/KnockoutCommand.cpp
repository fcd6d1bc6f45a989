#include "localelo/core/knockout/KnockoutCommand.h"

#include <algorithm>
#include <cctype>

namespace localelo::core::knockout {

CommandOutcome OutcomeFor(KnockoutCommand command) {
    using store::BoutResult;
    switch (command) {
        case KnockoutCommand::A:
            return {BoutResult::A, false, true};
        case KnockoutCommand::B:
            return {BoutResult::B, true, false};
        case KnockoutCommand::Tie:
            return {BoutResult::Tie, false, false};
        case KnockoutCommand::AMinus:
            return {BoutResult::A, true, false};
        case KnockoutCommand::BMinus:
            return {BoutResult::B, false, true};
        case KnockoutCommand::APlus:
            return {BoutResult::A, false, false};
        case KnockoutCommand::BPlus:
            return {BoutResult::B, false, false};
        case KnockoutCommand::TieAMinus:
            return {BoutResult::Tie, true, false};
        case KnockoutCommand::TieBMinus:
            return {BoutResult::Tie, false, true};
        case KnockoutCommand::TieMinus:
            return {BoutResult::Tie, true, true};
    }
    return {};
}

std::optional<KnockoutCommand> ParseKnockoutCommand(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    if (upper == "A") {
        return KnockoutCommand::A;
    }
    if (upper == "B") {
        return KnockoutCommand::B;
    }
    if (upper == "T" || upper == "TIE") {
        return KnockoutCommand::Tie;
    }
    if (upper == "A-") {
        return KnockoutCommand::AMinus;
    }
    if (upper == "B-") {
        return KnockoutCommand::BMinus;
    }
    if (upper == "A+") {
        return KnockoutCommand::APlus;
    }
    if (upper == "B+") {
        return KnockoutCommand::BPlus;
    }
    if (upper == "TA-") {
        return KnockoutCommand::TieAMinus;
    }
    if (upper == "TB-") {
        return KnockoutCommand::TieBMinus;
    }
    if (upper == "T-") {
        return KnockoutCommand::TieMinus;
    }
    return std::nullopt;
}

std::string KnockoutCommandName(KnockoutCommand command) {
    switch (command) {
        case KnockoutCommand::A:
            return "A";
        case KnockoutCommand::B:
            return "B";
        case KnockoutCommand::Tie:
            return "tie";
        case KnockoutCommand::AMinus:
            return "A-";
        case KnockoutCommand::BMinus:
            return "B-";
        case KnockoutCommand::APlus:
            return "A+";
        case KnockoutCommand::BPlus:
            return "B+";
        case KnockoutCommand::TieAMinus:
            return "TA-";
        case KnockoutCommand::TieBMinus:
            return "TB-";
        case KnockoutCommand::TieMinus:
            return "T-";
    }
    return "?";
}

bool IsLadderCommand(KnockoutCommand command) {
    return command == KnockoutCommand::A || command == KnockoutCommand::B || command == KnockoutCommand::Tie;
}

}  // namespace localelo::core::knockout

#include "localelo/core/util/Error.h"

namespace localelo::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::ConfigurationConflict:
            return "configuration conflict";
        case ErrorCode::InsufficientEntrants:
            return "insufficient entrants";
        case ErrorCode::UnknownEntrant:
            return "unknown entrant";
        case ErrorCode::EmptyCandidateSet:
            return "empty candidate set";
        case ErrorCode::InvalidConfig:
            return "invalid config";
        case ErrorCode::Storage:
            return "storage";
    }
    return "unknown";
}

}  // namespace localelo::core

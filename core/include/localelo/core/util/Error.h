#pragma once

#include <string>

namespace localelo::core {

enum class ErrorCode {
    None,
    ConfigurationConflict,
    InsufficientEntrants,
    UnknownEntrant,
    EmptyCandidateSet,
    InvalidConfig,
    Storage,
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

inline void SetError(Error* error, ErrorCode code, std::string message) {
    if (error) {
        error->code = code;
        error->message = std::move(message);
    }
}

// Fatal errors stop the process; the rest end or skip the current step.
inline bool IsFatal(ErrorCode code) {
    return code == ErrorCode::ConfigurationConflict || code == ErrorCode::UnknownEntrant ||
           code == ErrorCode::InvalidConfig || code == ErrorCode::Storage;
}

const char* ErrorCodeName(ErrorCode code);

}  // namespace localelo::core

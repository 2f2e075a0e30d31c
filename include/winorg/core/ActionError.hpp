#pragma once

#include <stdexcept>
#include <string>

namespace worg {

/**
 * @brief Failure categories of a single dispatch
 *
 * SourceUnavailable aborts the whole dispatch. InvalidGrid,
 * DegenerateGeometry and OutOfBounds abort only the offending action.
 * StaleReference is an ordinary race with the window system and is
 * dropped without surfacing to the user.
 */
enum class ErrorKind {
    SourceUnavailable,
    InvalidGrid,
    DegenerateGeometry,
    OutOfBounds,
    StaleReference
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "SourceUnavailable";
        case ErrorKind::InvalidGrid: return "InvalidGrid";
        case ErrorKind::DegenerateGeometry: return "DegenerateGeometry";
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::StaleReference: return "StaleReference";
    }
    return "Unknown";
}

class ActionError : public std::runtime_error {
public:
    ActionError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(errorKindToString(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}

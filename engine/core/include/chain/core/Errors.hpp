#pragma once

#include <stdexcept>
#include <string>

namespace chain::core {

enum class MoveStatus {
    Ok,
    CellOwnedByOpponent,
    NotAwaitingMove,
    OutOfBounds
};

const char* ToString(MoveStatus status) noexcept;

// Raised when the engine detects a state it can never legally reach:
// out-of-bounds access, a stored non-positive charge, or a runaway cascade.
// Not recoverable for the game session that raised it.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace chain::core

#include "chain/core/Errors.hpp"

namespace chain::core {

const char* ToString(MoveStatus status) noexcept {
    switch (status) {
        case MoveStatus::Ok:
            return "ok";
        case MoveStatus::CellOwnedByOpponent:
            return "cell owned by another player";
        case MoveStatus::NotAwaitingMove:
            return "not awaiting a move";
        case MoveStatus::OutOfBounds:
            return "position outside the board";
    }
    return "unknown";
}

}  // namespace chain::core

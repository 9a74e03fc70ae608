#include "chain/core/TurnController.hpp"

#include <algorithm>
#include <utility>

namespace chain::core {

TurnController::TurnController(GameConfig config) : config_(std::move(config)) {
    config_.Validate();
    reset();
}

void TurnController::reset() {
    state_ = GameState{};
    state_.board = Board(config_.rows, config_.cols);
    state_.has_moved.assign(static_cast<std::size_t>(config_.playerCount()), false);
    phase_ = Phase::AwaitingMove;
}

MoveResult TurnController::submitMove(const Position& pos) {
    MoveResult result{};
    result.player = state_.current_player;
    result.position = pos;

    if (phase_ != Phase::AwaitingMove) {
        result.status = MoveStatus::NotAwaitingMove;
        return result;
    }
    if (!state_.board.inBounds(pos)) {
        result.status = MoveStatus::OutOfBounds;
        return result;
    }

    Board working = state_.board.snapshot();
    if (!working.placeOrIncrement(pos, state_.current_player)) {
        result.status = MoveStatus::CellOwnedByOpponent;
        return result;
    }

    phase_ = Phase::Resolving;
    std::vector<bool> has_moved = state_.has_moved;
    has_moved[static_cast<std::size_t>(state_.current_player)] = true;
    const bool everyone_moved =
        std::all_of(has_moved.begin(), has_moved.end(), [](bool moved) { return moved; });

    CascadeOptions options;
    options.max_waves = config_.max_waves;
    options.stop_on_sole_owner = config_.stop_cascade_on_victory && everyone_moved;

    result.placed_board = working;
    CascadeResult cascade;
    try {
        cascade = ResolveCascade(std::move(working), pos, state_.current_player, options);
    } catch (...) {
        phase_ = Phase::Halted;
        throw;
    }

    for (PlayerId player = 0; player < playerCount(); ++player) {
        if (state_.board.cellsOwnedBy(player) > 0 && cascade.board.cellsOwnedBy(player) == 0) {
            result.eliminated.push_back(player);
        }
    }

    state_.board = std::move(cascade.board);
    state_.has_moved = std::move(has_moved);
    state_.move_count += 1;
    result.waves = std::move(cascade.waves);
    result.stopped_on_sole_owner = cascade.stopped_on_sole_owner;

    const auto owners = state_.board.owners();
    if (everyone_moved && owners.size() == 1) {
        state_.is_over = true;
        state_.winner = owners.front();
        phase_ = Phase::GameOver;
        return result;
    }

    state_.current_player = nextPlayer(state_.current_player);
    phase_ = Phase::AwaitingMove;
    return result;
}

bool TurnController::hasMoved(PlayerId player) const noexcept {
    if (player < 0 || player >= playerCount()) {
        return false;
    }
    return state_.has_moved[static_cast<std::size_t>(player)];
}

bool TurnController::allPlayersMoved() const noexcept {
    return std::all_of(state_.has_moved.begin(), state_.has_moved.end(),
                       [](bool moved) { return moved; });
}

bool TurnController::isAlive(PlayerId player) const noexcept {
    if (player < 0 || player >= playerCount()) {
        return false;
    }
    if (!allPlayersMoved()) {
        return true;
    }
    return state_.board.cellsOwnedBy(player) > 0;
}

std::vector<PlayerId> TurnController::alivePlayers() const {
    std::vector<PlayerId> alive;
    for (PlayerId player = 0; player < playerCount(); ++player) {
        if (isAlive(player)) {
            alive.push_back(player);
        }
    }
    return alive;
}

PlayerId TurnController::nextPlayer(PlayerId from) const noexcept {
    const int count = playerCount();
    PlayerId next = (from + 1) % count;
    if (!config_.skip_eliminated_players || !allPlayersMoved()) {
        return next;
    }
    for (int step = 0; step < count && !isAlive(next); ++step) {
        next = (next + 1) % count;
    }
    return next;
}

const char* ToString(TurnController::Phase phase) noexcept {
    switch (phase) {
        case TurnController::Phase::AwaitingMove:
            return "awaiting move";
        case TurnController::Phase::Resolving:
            return "resolving";
        case TurnController::Phase::GameOver:
            return "game over";
        case TurnController::Phase::Halted:
            return "halted";
    }
    return "unknown";
}

}  // namespace chain::core

#pragma once

#include <optional>
#include <vector>

#include "chain/core/Board.hpp"
#include "chain/core/Cascade.hpp"
#include "chain/core/Errors.hpp"
#include "chain/core/GameConfig.hpp"

namespace chain::core {

struct GameState {
    Board board;
    PlayerId current_player = 0;
    std::vector<bool> has_moved;
    bool is_over = false;
    std::optional<PlayerId> winner;
    int move_count = 0;
};

struct MoveResult {
    MoveStatus status = MoveStatus::Ok;
    PlayerId player = kNoOwner;
    Position position{};
    // Board right after the placement, before the first wave fires.
    Board placed_board;
    std::vector<Wave> waves;
    bool stopped_on_sole_owner = false;
    // Players who owned cells before this move and own none after it.
    std::vector<PlayerId> eliminated;

    bool ok() const noexcept { return status == MoveStatus::Ok; }
};

class TurnController {
public:
    enum class Phase { AwaitingMove, Resolving, GameOver, Halted };

    // Throws std::invalid_argument if `config` does not validate.
    explicit TurnController(GameConfig config);

    // Rejected moves leave the game untouched and report why through the
    // status. An InvariantViolation during resolution halts the controller
    // and propagates to the caller.
    MoveResult submitMove(const Position& pos);

    void reset();

    const GameState& state() const noexcept { return state_; }
    const GameConfig& config() const noexcept { return config_; }
    const Board& board() const noexcept { return state_.board; }
    Phase phase() const noexcept { return phase_; }

    PlayerId currentPlayer() const noexcept { return state_.current_player; }
    int playerCount() const noexcept { return config_.playerCount(); }
    bool isOver() const noexcept { return state_.is_over; }
    std::optional<PlayerId> winner() const noexcept { return state_.winner; }

    bool hasMoved(PlayerId player) const noexcept;
    bool allPlayersMoved() const noexcept;
    // Every player counts as alive until all of them have moved once.
    bool isAlive(PlayerId player) const noexcept;
    std::vector<PlayerId> alivePlayers() const;

private:
    PlayerId nextPlayer(PlayerId from) const noexcept;

    GameConfig config_;
    GameState state_;
    Phase phase_ = Phase::AwaitingMove;
};

const char* ToString(TurnController::Phase phase) noexcept;

}  // namespace chain::core

#include <cassert>
#include <cstdint>
#include <iostream>
#include <random>
#include <vector>

#include "chain/core/TurnController.hpp"

using namespace chain::core;

namespace {

GameConfig ThreePlayerConfig() {
    GameConfig config;
    config.players = {{"Red", {{230, 57, 70}}}, {"Blue", {{69, 123, 230}}}, {"Green", {{60, 180, 90}}}};
    return config;
}

void Play(TurnController& controller, const std::vector<Position>& moves) {
    for (const auto& pos : moves) {
        auto result = controller.submitMove(pos);
        assert(result.ok());
    }
}

void TestInitialState() {
    TurnController controller(GameConfig{});
    assert(controller.phase() == TurnController::Phase::AwaitingMove);
    assert(controller.currentPlayer() == 0);
    assert(controller.playerCount() == 2);
    assert(!controller.hasMoved(0) && !controller.hasMoved(1));
    assert(!controller.isOver());
    assert(!controller.winner().has_value());
    assert(controller.board().rows() == 6 && controller.board().cols() == 9);
    assert(controller.board().owners().empty());
    assert(controller.isAlive(0) && controller.isAlive(1));
}

void TestRejectsInvalidConfig() {
    GameConfig config;
    config.players.resize(1);
    bool threw = false;
    try {
        TurnController controller(config);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void TestWinSuppressedUntilEveryoneMoved() {
    TurnController controller(GameConfig{});
    auto result = controller.submitMove(Position{2, 2});
    assert(result.ok());
    assert(result.player == 0);
    assert(result.waves.empty());
    assert(controller.board().owners().size() == 1);
    assert(!controller.isOver());
    assert(controller.phase() == TurnController::Phase::AwaitingMove);
    assert(controller.hasMoved(0));
    assert(!controller.hasMoved(1));
    assert(controller.currentPlayer() == 1);
    assert(controller.state().move_count == 1);
}

void TestOpponentCellRejected() {
    TurnController controller(GameConfig{});
    Play(controller, {Position{0, 0}});

    const GameState before = controller.state();
    auto result = controller.submitMove(Position{0, 0});
    assert(!result.ok());
    assert(result.status == MoveStatus::CellOwnedByOpponent);
    assert(result.waves.empty());
    assert(controller.board() == before.board);
    assert(controller.currentPlayer() == 1);
    assert(!controller.hasMoved(1));
    assert(controller.state().move_count == before.move_count);

    assert(controller.submitMove(Position{5, 8}).ok());
}

void TestOutOfBoundsRejected() {
    TurnController controller(GameConfig{});
    auto result = controller.submitMove(Position{6, 0});
    assert(result.status == MoveStatus::OutOfBounds);
    assert(controller.currentPlayer() == 0);
    assert(!controller.hasMoved(0));
    assert(controller.board().owners().empty());
}

void TestCornerExplosionThroughController() {
    TurnController controller(GameConfig{});
    Play(controller, {Position{0, 0}, Position{5, 8}});

    auto result = controller.submitMove(Position{0, 0});
    assert(result.ok());
    assert(result.placed_board.get(0, 0) == (CellState{0, 2}));
    assert(result.waves.size() == 1);
    assert(result.waves[0].transfers.size() == 2);

    const Board& board = controller.board();
    assert(board.get(0, 0).empty());
    assert(board.get(0, 1) == (CellState{0, 1}));
    assert(board.get(1, 0) == (CellState{0, 1}));
    assert(board.get(5, 8) == (CellState{1, 1}));
    assert(!controller.isOver());
    assert(controller.currentPlayer() == 1);
}

void TestEliminationEndsGame() {
    TurnController controller(GameConfig{});
    Play(controller, {Position{0, 0}, Position{0, 1}});

    auto result = controller.submitMove(Position{0, 0});
    assert(result.ok());
    assert(result.eliminated.size() == 1 && result.eliminated[0] == 1);
    assert(controller.isOver());
    assert(controller.phase() == TurnController::Phase::GameOver);
    assert(controller.winner().has_value() && *controller.winner() == 0);
    assert(controller.state().is_over);
    assert(!controller.isAlive(1));
    assert(controller.isAlive(0));

    const Board settled = controller.board();
    auto late = controller.submitMove(Position{3, 3});
    assert(late.status == MoveStatus::NotAwaitingMove);
    assert(controller.board() == settled);
}

void TestInvariantViolationHaltsSession() {
    GameConfig config;
    config.max_waves = 1;
    TurnController controller(config);
    Play(controller, {Position{0, 0}, Position{5, 8}, Position{0, 1}, Position{5, 7},
                      Position{0, 1}, Position{5, 6}});

    const GameState before = controller.state();
    bool threw = false;
    try {
        controller.submitMove(Position{0, 0});
    } catch (const InvariantViolation&) {
        threw = true;
    }
    assert(threw);
    assert(controller.phase() == TurnController::Phase::Halted);
    assert(controller.board() == before.board);
    assert(controller.currentPlayer() == before.current_player);
    assert(controller.state().move_count == before.move_count);

    auto after = controller.submitMove(Position{3, 3});
    assert(after.status == MoveStatus::NotAwaitingMove);

    controller.reset();
    assert(controller.phase() == TurnController::Phase::AwaitingMove);
    assert(controller.board().owners().empty());
}

void TestRotationKeepsEliminatedPlayersByDefault() {
    TurnController controller(ThreePlayerConfig());
    Play(controller, {Position{0, 0}, Position{0, 1}, Position{5, 8}});

    auto result = controller.submitMove(Position{0, 0});
    assert(result.ok());
    assert(result.eliminated.size() == 1 && result.eliminated[0] == 1);
    assert(!controller.isOver());
    assert(!controller.isAlive(1));
    assert(controller.currentPlayer() == 1);
    assert(controller.alivePlayers() == (std::vector<PlayerId>{0, 2}));
}

void TestRotationSkipsEliminatedPlayers() {
    GameConfig config = ThreePlayerConfig();
    config.skip_eliminated_players = true;
    TurnController controller(config);
    Play(controller, {Position{0, 0}, Position{0, 1}, Position{5, 8}});

    assert(controller.submitMove(Position{0, 0}).ok());
    assert(!controller.isOver());
    assert(controller.currentPlayer() == 2);
    assert(controller.submitMove(Position{5, 8}).ok());
    assert(controller.currentPlayer() == 0);
}

void TestPlayersAliveUntilEveryoneMoved() {
    TurnController controller(ThreePlayerConfig());
    Play(controller, {Position{0, 0}, Position{0, 1}});
    assert(!controller.allPlayersMoved());
    assert(controller.board().cellsOwnedBy(2) == 0);
    assert(controller.isAlive(2));

    Play(controller, {Position{5, 8}});
    assert(controller.allPlayersMoved());
    assert(controller.alivePlayers().size() == 3);
}

void TestStopCascadeOnVictory() {
    const std::vector<Position> opening{Position{0, 0}, Position{0, 1}, Position{5, 8},
                                        Position{0, 1}};

    GameConfig full_config;
    full_config.stop_cascade_on_victory = false;
    TurnController full(full_config);
    Play(full, opening);
    auto full_result = full.submitMove(Position{0, 0});
    assert(full_result.waves.size() == 2);
    assert(!full_result.stopped_on_sole_owner);
    assert(full.isOver() && *full.winner() == 0);

    TurnController stopped(GameConfig{});
    Play(stopped, opening);
    auto stopped_result = stopped.submitMove(Position{0, 0});
    assert(stopped_result.waves.size() == 1);
    assert(stopped_result.stopped_on_sole_owner);
    assert(stopped.isOver() && *stopped.winner() == 0);
    assert(stopped.board().get(0, 1) == (CellState{0, 3}));
}

void TestIdenticalMovesIdenticalGames() {
    const std::vector<Position> moves{Position{0, 0}, Position{5, 8}, Position{0, 0},
                                      Position{5, 8}, Position{1, 1}, Position{4, 7},
                                      Position{1, 1}, Position{4, 7}, Position{1, 1}};
    TurnController a(GameConfig{});
    TurnController b(GameConfig{});
    for (const auto& pos : moves) {
        auto ra = a.submitMove(pos);
        auto rb = b.submitMove(pos);
        assert(ra.status == rb.status);
        assert(ra.waves.size() == rb.waves.size());
        for (std::size_t w = 0; w < ra.waves.size(); ++w) {
            assert(ra.waves[w].sources == rb.waves[w].sources);
            assert(ra.waves[w].transfers.size() == rb.waves[w].transfers.size());
        }
    }
    assert(a.board() == b.board());
    assert(a.currentPlayer() == b.currentPlayer());
    assert(a.isOver() == b.isOver());
}

void TestRandomGamesEndWithWinner() {
    for (std::uint32_t seed = 1; seed <= 10; ++seed) {
        std::mt19937 rng(seed);
        TurnController controller(GameConfig{});
        int moves = 0;
        while (!controller.isOver()) {
            assert(moves < 5000);
            const Board& board = controller.board();
            std::vector<Position> open;
            for (int r = 0; r < board.rows(); ++r) {
                for (int c = 0; c < board.cols(); ++c) {
                    const auto& cell = board.get(r, c);
                    if (cell.empty() || cell.owner == controller.currentPlayer()) {
                        open.push_back(Position{r, c});
                    }
                }
            }
            assert(!open.empty());
            std::uniform_int_distribution<std::size_t> pick(0, open.size() - 1);
            assert(controller.submitMove(open[pick(rng)]).ok());
            ++moves;
        }
        assert(controller.phase() == TurnController::Phase::GameOver);
        assert(controller.winner().has_value());
        assert(controller.board().owners() == (std::vector<PlayerId>{*controller.winner()}));
    }
}

}  // namespace

int main() {
    TestInitialState();
    TestRejectsInvalidConfig();
    TestWinSuppressedUntilEveryoneMoved();
    TestOpponentCellRejected();
    TestOutOfBoundsRejected();
    TestCornerExplosionThroughController();
    TestEliminationEndsGame();
    TestInvariantViolationHaltsSession();
    TestRotationKeepsEliminatedPlayersByDefault();
    TestRotationSkipsEliminatedPlayers();
    TestPlayersAliveUntilEveryoneMoved();
    TestStopCascadeOnVictory();
    TestIdenticalMovesIdenticalGames();
    TestRandomGamesEndWithWinner();
    std::cout << "All turn controller tests passed.\n";
    return 0;
}

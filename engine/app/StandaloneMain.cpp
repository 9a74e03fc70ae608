#define SDL_MAIN_HANDLED

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <SDL2/SDL.h>
#include <SDL2/SDL_main.h>

#include "chain/app/AssetFS.hpp"
#include "chain/core/Cascade.hpp"
#include "chain/core/GameConfig.hpp"
#include "chain/core/TurnController.hpp"
#include "chain/platform/SdlInput.hpp"
#include "chain/render/SceneRenderer.hpp"

using chain::app::AssetPath;
using chain::app::FileExists;
using chain::app::ReadTextFile;
using chain::core::Board;
using chain::core::GameConfig;
using chain::core::InvariantViolation;
using chain::core::PlayerId;
using chain::core::Position;
using chain::core::TurnController;
using chain::core::Wave;
using chain::platform::ControllerButton;
using chain::platform::InputEventType;
using chain::platform::KeyCode;
using chain::platform::MouseButton;
using chain::platform::SdlInput;
using chain::render::Animation;
using chain::render::BoardRenderData;
using chain::render::ComputeLayout;
using chain::render::DrawAnimations;
using chain::render::DrawBoard;
using chain::render::DrawStatus;
using chain::render::MakePopAnimation;
using chain::render::MakeTransferAnimation;
using chain::render::PlayerColor;
using chain::render::RenderScale;
using chain::render::StatusInfo;
using chain::render::UpdateAnimations;
using chain::render::kPopDurationMs;
using Layout = chain::render::Layout;

namespace {

constexpr const char* kConfigFile = "chain.json";

struct PlaybackState {
    bool active = false;
    std::vector<Wave> waves;
    std::size_t wave_index = 0;
    Board working_board;
    PlayerId mover = 0;
};

struct BoardState {
    Board board;
    std::optional<Position> hover;
    std::optional<Position> controller_cursor;
    std::vector<Animation> animations;
    std::set<Position> hidden_cells;
    PlaybackState playback;
    Layout layout{};
};

struct GameContext {
    TurnController* controller = nullptr;
    SdlInput* input = nullptr;
    SDL_Window* window = nullptr;
    float pulse_ms = 0.0f;
};

GameConfig LoadConfig(int argc, char* argv[]) {
    std::filesystem::path path = argc > 1 ? std::filesystem::path(argv[1]) : AssetPath(kConfigFile);
    if (!FileExists(path)) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "No %s found, using defaults", kConfigFile);
        return GameConfig{};
    }
    auto text = ReadTextFile(path);
    if (!text) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot read %s, using defaults",
                    path.string().c_str());
        return GameConfig{};
    }
    try {
        GameConfig config = GameConfig::Deserialize(*text);
        config.Validate();
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Loaded %s: %dx%d board, %d players",
                    path.string().c_str(), config.rows, config.cols, config.playerCount());
        return config;
    } catch (const chain::core::Json::exception& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Malformed %s (%s), using defaults",
                    path.string().c_str(), e.what());
    } catch (const std::invalid_argument& e) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Invalid %s (%s), using defaults",
                    path.string().c_str(), e.what());
    }
    return GameConfig{};
}

std::string PlayerName(const GameContext& ctx, PlayerId player) {
    const auto& players = ctx.controller->config().players;
    if (player >= 0 && player < static_cast<PlayerId>(players.size())) {
        return players[static_cast<std::size_t>(player)].name;
    }
    return "Player " + std::to_string(player + 1);
}

void UpdateWindowTitle(const GameContext& ctx) {
    const auto& controller = *ctx.controller;
    std::string title = "Chain Reaction - ";
    switch (controller.phase()) {
        case TurnController::Phase::GameOver:
            title += PlayerName(ctx, controller.winner().value_or(0)) + " wins! (R to restart)";
            break;
        case TurnController::Phase::Halted:
            title += "engine fault, press R to restart";
            break;
        default:
            title += PlayerName(ctx, controller.currentPlayer()) + " to move";
            break;
    }
    SDL_SetWindowTitle(ctx.window, title.c_str());
}

void ResetBoardState(BoardState& state, const GameContext& ctx) {
    state.board = ctx.controller->board();
    state.animations.clear();
    state.hidden_cells.clear();
    state.playback = PlaybackState{};
}

void StartWave(BoardState& state, GameContext& ctx) {
    auto& playback = state.playback;
    const Wave& wave = playback.waves[playback.wave_index];
    const auto color = PlayerColor(ctx.controller->config(), playback.mover);
    const float duration = static_cast<float>(ctx.controller->config().wave_duration_ms);

    state.animations.clear();
    state.hidden_cells.clear();
    for (const auto& source : wave.sources) {
        state.hidden_cells.insert(source);
        state.animations.push_back(MakePopAnimation(state.layout, source, color, kPopDurationMs));
    }
    for (const auto& transfer : wave.transfers) {
        state.animations.push_back(MakeTransferAnimation(state.layout, transfer, color, duration));
    }
    if (ctx.input) {
        const float strength = std::min(1.0f, 0.3f + 0.1f * static_cast<float>(wave.sources.size()));
        ctx.input->RumbleControllers(strength, 120);
    }
}

void FinishPlayback(BoardState& state, GameContext& ctx) {
    state.playback.active = false;
    state.hidden_cells.clear();
    state.board = ctx.controller->board();
    UpdateWindowTitle(ctx);
    if (ctx.controller->isOver()) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "%s wins after %d moves",
                    PlayerName(ctx, ctx.controller->winner().value_or(0)).c_str(),
                    ctx.controller->state().move_count);
    }
}

void AdvancePlayback(BoardState& state, GameContext& ctx) {
    auto& playback = state.playback;
    if (!playback.active || !state.animations.empty()) {
        return;
    }
    chain::core::ApplyWave(playback.working_board, playback.waves[playback.wave_index]);
    state.board = playback.working_board;
    state.hidden_cells.clear();
    playback.wave_index++;
    if (playback.wave_index < playback.waves.size()) {
        StartWave(state, ctx);
    } else {
        FinishPlayback(state, ctx);
    }
}

bool BeginPlayerMove(BoardState& state, GameContext& ctx, const Position& pos) {
    if (state.playback.active) {
        return false;
    }
    auto& controller = *ctx.controller;
    const PlayerId mover = controller.currentPlayer();

    chain::core::MoveResult result;
    try {
        result = controller.submitMove(pos);
    } catch (const InvariantViolation& e) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Engine fault on move (%d, %d): %s", pos.row,
                        pos.col, e.what());
        UpdateWindowTitle(ctx);
        return false;
    }

    if (!result.ok()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Rejected move by %s at (%d, %d): %s",
                    PlayerName(ctx, mover).c_str(), pos.row, pos.col,
                    chain::core::ToString(result.status));
        return false;
    }

    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "%s placed at (%d, %d): %zu waves",
                PlayerName(ctx, mover).c_str(), pos.row, pos.col, result.waves.size());
    for (PlayerId eliminated : result.eliminated) {
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "%s has no cells left",
                    PlayerName(ctx, eliminated).c_str());
    }

    auto& playback = state.playback;
    playback.working_board = result.placed_board;
    playback.waves = std::move(result.waves);
    playback.wave_index = 0;
    playback.mover = mover;
    state.board = playback.working_board;

    if (playback.waves.empty()) {
        FinishPlayback(state, ctx);
        return true;
    }
    playback.active = true;
    StartWave(state, ctx);
    return true;
}

void MoveCursor(BoardState& state, int d_row, int d_col) {
    Position cursor = state.controller_cursor.value_or(Position{0, 0});
    cursor.row = std::clamp(cursor.row + d_row, 0, state.board.rows() - 1);
    cursor.col = std::clamp(cursor.col + d_col, 0, state.board.cols() - 1);
    state.controller_cursor = cursor;
}

void RestartGame(BoardState& state, GameContext& ctx) {
    ctx.controller->reset();
    ResetBoardState(state, ctx);
    UpdateWindowTitle(ctx);
    SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "New game");
}

void RefreshLayout(BoardState& state, SDL_Window* window, SDL_Renderer* renderer) {
    int window_w = 0;
    int window_h = 0;
    SDL_GetWindowSize(window, &window_w, &window_h);
    if (window_w <= 0 || window_h <= 0) {
        return;
    }
    int output_w = window_w;
    int output_h = window_h;
    if (SDL_GetRendererOutputSize(renderer, &output_w, &output_h) != 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "SDL_GetRendererOutputSize failed: %s", SDL_GetError());
        output_w = window_w;
        output_h = window_h;
    }
    const SDL_FPoint scale = RenderScale(window_w, window_h, output_w, output_h);
    if (SDL_RenderSetScale(renderer, scale.x, scale.y) != 0) {
        SDL_LogWarn(SDL_LOG_CATEGORY_RENDER, "SDL_RenderSetScale failed: %s", SDL_GetError());
    }
    state.layout = ComputeLayout(window_w, window_h, state.board.cols(), state.board.rows());
}

}  // namespace

int main(int argc, char* argv[]) {
    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER | SDL_INIT_HAPTIC) != 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    const GameConfig config = LoadConfig(argc, argv);
    TurnController controller(config);

    SDL_Window* window = SDL_CreateWindow("Chain Reaction", SDL_WINDOWPOS_CENTERED,
                                          SDL_WINDOWPOS_CENTERED, config.resolution[0],
                                          config.resolution[1],
                                          SDL_WINDOW_SHOWN | SDL_WINDOW_ALLOW_HIGHDPI |
                                              SDL_WINDOW_RESIZABLE);
    if (!window) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateWindow failed: %s", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer =
        SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (!renderer) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "SDL_CreateRenderer failed: %s", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);

    SdlInput input;
    if (!input.Initialize()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "SdlInput initialization failed: %s", SDL_GetError());
    }

    GameContext game_ctx;
    game_ctx.controller = &controller;
    game_ctx.input = &input;
    game_ctx.window = window;

    BoardState board_state;
    ResetBoardState(board_state, game_ctx);
    RefreshLayout(board_state, window, renderer);
    UpdateWindowTitle(game_ctx);

    bool running = true;
    Uint64 last_counter = SDL_GetPerformanceCounter();
    const double frequency = static_cast<double>(SDL_GetPerformanceFrequency());

    while (running) {
        for (const auto& evt : input.Poll()) {
            switch (evt.type) {
                case InputEventType::Quit:
                    running = false;
                    break;
                case InputEventType::WindowResized:
                    RefreshLayout(board_state, window, renderer);
                    break;
                case InputEventType::MouseMove: {
                    Position cell;
                    if (chain::render::CellFromPoint(board_state.layout, board_state.board.rows(),
                                                     board_state.board.cols(), evt.x, evt.y, cell)) {
                        board_state.hover = cell;
                    } else {
                        board_state.hover.reset();
                    }
                    break;
                }
                case InputEventType::MouseButtonDown: {
                    if (evt.mouse_button != MouseButton::Left) {
                        break;
                    }
                    Position cell;
                    if (chain::render::CellFromPoint(board_state.layout, board_state.board.rows(),
                                                     board_state.board.cols(), evt.x, evt.y, cell)) {
                        board_state.controller_cursor.reset();
                        BeginPlayerMove(board_state, game_ctx, cell);
                    }
                    break;
                }
                case InputEventType::KeyDown:
                    switch (evt.key) {
                        case KeyCode::Escape:
                            running = false;
                            break;
                        case KeyCode::R:
                            RestartGame(board_state, game_ctx);
                            break;
                        case KeyCode::Up:
                            MoveCursor(board_state, -1, 0);
                            break;
                        case KeyCode::Down:
                            MoveCursor(board_state, 1, 0);
                            break;
                        case KeyCode::Left:
                            MoveCursor(board_state, 0, -1);
                            break;
                        case KeyCode::Right:
                            MoveCursor(board_state, 0, 1);
                            break;
                        case KeyCode::Enter:
                        case KeyCode::Space:
                            if (board_state.controller_cursor) {
                                BeginPlayerMove(board_state, game_ctx, *board_state.controller_cursor);
                            }
                            break;
                        default:
                            break;
                    }
                    break;
                case InputEventType::ControllerButtonDown:
                    switch (evt.controller_button) {
                        case ControllerButton::DPadUp:
                            MoveCursor(board_state, -1, 0);
                            break;
                        case ControllerButton::DPadDown:
                            MoveCursor(board_state, 1, 0);
                            break;
                        case ControllerButton::DPadLeft:
                            MoveCursor(board_state, 0, -1);
                            break;
                        case ControllerButton::DPadRight:
                            MoveCursor(board_state, 0, 1);
                            break;
                        case ControllerButton::A:
                            MoveCursor(board_state, 0, 0);
                            BeginPlayerMove(board_state, game_ctx, *board_state.controller_cursor);
                            break;
                        case ControllerButton::Menu:
                            RestartGame(board_state, game_ctx);
                            break;
                        default:
                            break;
                    }
                    break;
            }
        }

        if (!running) {
            break;
        }

        Uint64 now = SDL_GetPerformanceCounter();
        const float delta_ms = static_cast<float>((now - last_counter) * 1000.0 / frequency);
        last_counter = now;
        game_ctx.pulse_ms += delta_ms;

        UpdateAnimations(board_state.animations, delta_ms);
        AdvancePlayback(board_state, game_ctx);

        SDL_SetRenderDrawColor(renderer, 18, 18, 24, 255);
        SDL_RenderClear(renderer);

        const PlayerId shown_player = board_state.playback.active ? board_state.playback.mover
                                                                  : controller.currentPlayer();
        StatusInfo status;
        status.color = PlayerColor(controller.config(),
                                   controller.isOver() ? controller.winner().value_or(0) : shown_player);
        status.game_over = controller.isOver() && !board_state.playback.active;
        status.halted = controller.phase() == TurnController::Phase::Halted;
        status.pulse_ms = game_ctx.pulse_ms;
        DrawStatus(renderer, board_state.layout, status);

        BoardRenderData render_data{board_state.board, controller.config(), board_state.hidden_cells,
                                    shown_player, board_state.hover, board_state.controller_cursor};
        DrawBoard(renderer, render_data, board_state.layout);
        DrawAnimations(renderer, board_state.animations, board_state.layout);
        SDL_RenderPresent(renderer);
    }

    input.Shutdown();
    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}

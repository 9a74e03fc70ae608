#pragma once

#include <SDL2/SDL.h>

#include <optional>
#include <set>
#include <vector>

#include "chain/core/Board.hpp"
#include "chain/core/Cascade.hpp"
#include "chain/core/GameConfig.hpp"

namespace chain::render {

struct Layout {
    float board_left{};
    float board_top{};
    float cell_size{};
    float cell_inset{};
    float grid_line_alpha{};
    float status_top{};
    float status_height{};
    float view_width{};
};

struct Color {
    Uint8 r{255};
    Uint8 g{255};
    Uint8 b{255};
    Uint8 a{255};
};

struct Animation {
    enum class Type { Transfer, Pop };

    Type type = Type::Pop;
    float duration_ms = 0.0f;
    float delay_ms = 0.0f;
    float elapsed_ms = 0.0f;
    float size_start = 1.0f;
    float size_end = 1.0f;
    float alpha_start = 255.0f;
    float alpha_end = 255.0f;
    float start_x = 0.0f;
    float start_y = 0.0f;
    float end_x = 0.0f;
    float end_y = 0.0f;
    Color color{};

    bool started() const;
    bool finished() const;
    float progress() const;
    float ease() const;
};

struct BoardRenderData {
    const chain::core::Board& board;
    const chain::core::GameConfig& config;
    const std::set<chain::core::Position>& hidden_cells;
    chain::core::PlayerId active_player = 0;
    std::optional<chain::core::Position> hover;
    std::optional<chain::core::Position> controller_cursor;
};

struct StatusInfo {
    Color color{};
    bool game_over = false;
    bool halted = false;
    float pulse_ms = 0.0f;
};

inline constexpr float kPopDurationMs = 160.0f;

Layout ComputeLayout(int window_w,
                     int window_h,
                     int cols,
                     int rows,
                     int margin_px = 40,
                     int status_height_px = 36);

// Ratio of renderer output pixels to window points. Layouts are computed in
// window points so that mouse coordinates hit-test directly.
SDL_FPoint RenderScale(int window_w, int window_h, int output_w, int output_h);

Color PlayerColor(const chain::core::GameConfig& config, chain::core::PlayerId player);

bool CellFromPoint(const Layout& layout,
                   int rows,
                   int cols,
                   int x,
                   int y,
                   chain::core::Position& out);

Animation MakeTransferAnimation(const Layout& layout,
                                const chain::core::Transfer& transfer,
                                Color color,
                                float duration_ms);
Animation MakePopAnimation(const Layout& layout,
                           const chain::core::Position& cell,
                           Color color,
                           float duration_ms);

void UpdateAnimations(std::vector<Animation>& animations, float delta_ms);

void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout);
void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout);
void DrawStatus(SDL_Renderer* renderer, const Layout& layout, const StatusInfo& status);

}  // namespace chain::render

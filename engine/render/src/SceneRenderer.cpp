#include "chain/render/SceneRenderer.hpp"

#include <algorithm>
#include <cmath>

namespace chain::render {

namespace {

constexpr float kOrbOffsets[4][4][2] = {
    {{0.0f, 0.0f}},
    {{-0.5f, 0.0f}, {0.5f, 0.0f}},
    {{0.0f, -0.45f}, {-0.5f, 0.35f}, {0.5f, 0.35f}},
    {{-0.5f, -0.5f}, {0.5f, -0.5f}, {-0.5f, 0.5f}, {0.5f, 0.5f}},
};

SDL_FPoint CellCenter(const Layout& layout, const chain::core::Position& cell) {
    SDL_FPoint point;
    point.x = layout.board_left + (cell.col + 0.5f) * layout.cell_size;
    point.y = layout.board_top + (cell.row + 0.5f) * layout.cell_size;
    return point;
}

void FillCircle(SDL_Renderer* renderer, float cx, float cy, float radius) {
    if (radius <= 0.0f) {
        return;
    }
    const int extent = static_cast<int>(std::ceil(radius));
    for (int dy = -extent; dy <= extent; ++dy) {
        const float fy = static_cast<float>(dy);
        const float span = radius * radius - fy * fy;
        if (span < 0.0f) {
            continue;
        }
        const float half = std::sqrt(span);
        SDL_RenderDrawLineF(renderer, cx - half, cy + fy, cx + half, cy + fy);
    }
}

void DrawOrbs(SDL_Renderer* renderer,
              SDL_FPoint center,
              float cell_size,
              int charge,
              Color color,
              float scale) {
    const int shown = std::clamp(charge, 1, 4);
    const float radius = cell_size * 0.14f * scale;
    const float spread = cell_size * 0.36f;
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
    for (int i = 0; i < shown; ++i) {
        const float* offset = kOrbOffsets[shown - 1][i];
        FillCircle(renderer, center.x + offset[0] * spread, center.y + offset[1] * spread, radius);
    }
}

Color Scale(Color color, float factor) {
    auto channel = [factor](Uint8 value) {
        return static_cast<Uint8>(std::clamp(value * factor, 0.0f, 255.0f));
    };
    return Color{channel(color.r), channel(color.g), channel(color.b), color.a};
}

}  // namespace

bool Animation::started() const {
    return elapsed_ms >= delay_ms;
}

bool Animation::finished() const {
    return elapsed_ms >= delay_ms + duration_ms;
}

float Animation::progress() const {
    if (!started()) {
        return 0.0f;
    }
    if (duration_ms <= 0.0f) {
        return 1.0f;
    }
    const float t = (elapsed_ms - delay_ms) / duration_ms;
    return std::clamp(t, 0.0f, 1.0f);
}

float Animation::ease() const {
    const float t = progress();
    return 1.0f - (1.0f - t) * (1.0f - t);
}

Layout ComputeLayout(int window_w,
                     int window_h,
                     int cols,
                     int rows,
                     int margin_px,
                     int status_height_px) {
    const float width = static_cast<float>(window_w);
    const float height = static_cast<float>(window_h);
    const float margin = static_cast<float>(margin_px);
    const float status_height = static_cast<float>(status_height_px);

    const float available_width = std::max(0.0f, width - margin * 2.0f);
    const float available_height = std::max(0.0f, height - margin * 3.0f - status_height);
    const float cell_size = std::min(available_width / cols, available_height / rows);
    const float board_width = cell_size * cols;

    Layout layout{};
    layout.board_left = (width - board_width) * 0.5f;
    layout.board_top = margin * 2.0f + status_height;
    layout.cell_size = cell_size;
    layout.cell_inset = std::max(1.0f, cell_size * 0.04f);
    layout.grid_line_alpha = 140.0f;
    layout.status_top = margin;
    layout.status_height = status_height;
    layout.view_width = width;
    return layout;
}

SDL_FPoint RenderScale(int window_w, int window_h, int output_w, int output_h) {
    SDL_FPoint scale{1.0f, 1.0f};
    if (window_w > 0 && output_w > 0) {
        scale.x = static_cast<float>(output_w) / static_cast<float>(window_w);
    }
    if (window_h > 0 && output_h > 0) {
        scale.y = static_cast<float>(output_h) / static_cast<float>(window_h);
    }
    return scale;
}

Color PlayerColor(const chain::core::GameConfig& config, chain::core::PlayerId player) {
    if (player < 0 || player >= config.playerCount()) {
        return Color{128, 128, 128, 255};
    }
    const auto& rgb = config.players[static_cast<std::size_t>(player)].color;
    return Color{rgb[0], rgb[1], rgb[2], 255};
}

bool CellFromPoint(const Layout& layout,
                   int rows,
                   int cols,
                   int x,
                   int y,
                   chain::core::Position& out) {
    const float rel_x = static_cast<float>(x) - layout.board_left;
    const float rel_y = static_cast<float>(y) - layout.board_top;
    if (rel_x < 0.0f || rel_y < 0.0f || layout.cell_size <= 0.0f) {
        return false;
    }
    int col = static_cast<int>(rel_x / layout.cell_size);
    int row = static_cast<int>(rel_y / layout.cell_size);
    if (col < 0 || col >= cols || row < 0 || row >= rows) {
        return false;
    }
    out = chain::core::Position{row, col};
    return true;
}

Animation MakeTransferAnimation(const Layout& layout,
                                const chain::core::Transfer& transfer,
                                Color color,
                                float duration_ms) {
    Animation anim;
    anim.type = Animation::Type::Transfer;
    anim.duration_ms = duration_ms;
    SDL_FPoint from_pt = CellCenter(layout, transfer.from);
    SDL_FPoint to_pt = CellCenter(layout, transfer.to);
    anim.start_x = from_pt.x;
    anim.start_y = from_pt.y;
    anim.end_x = to_pt.x;
    anim.end_y = to_pt.y;
    anim.color = color;
    return anim;
}

Animation MakePopAnimation(const Layout& layout,
                           const chain::core::Position& cell,
                           Color color,
                           float duration_ms) {
    Animation anim;
    anim.type = Animation::Type::Pop;
    anim.duration_ms = duration_ms;
    SDL_FPoint pos = CellCenter(layout, cell);
    anim.start_x = anim.end_x = pos.x;
    anim.start_y = anim.end_y = pos.y;
    anim.size_start = 1.0f;
    anim.size_end = 2.2f;
    anim.alpha_start = 220.0f;
    anim.alpha_end = 0.0f;
    anim.color = color;
    return anim;
}

void UpdateAnimations(std::vector<Animation>& animations, float delta_ms) {
    for (auto& anim : animations) {
        anim.elapsed_ms += delta_ms;
    }
    animations.erase(std::remove_if(animations.begin(), animations.end(),
                                    [](const Animation& anim) { return anim.finished(); }),
                     animations.end());
}

void DrawBoard(SDL_Renderer* renderer,
               const BoardRenderData& board_data,
               const Layout& layout) {
    const int cols = board_data.board.cols();
    const int rows = board_data.board.rows();
    const Color grid = PlayerColor(board_data.config, board_data.active_player);

    SDL_SetRenderDrawColor(renderer, grid.r, grid.g, grid.b,
                           static_cast<Uint8>(layout.grid_line_alpha));
    for (int c = 0; c <= cols; ++c) {
        const float x = layout.board_left + c * layout.cell_size;
        SDL_RenderDrawLineF(renderer, x, layout.board_top, x, layout.board_top + layout.cell_size * rows);
    }
    for (int r = 0; r <= rows; ++r) {
        const float y = layout.board_top + r * layout.cell_size;
        SDL_RenderDrawLineF(renderer, layout.board_left, y, layout.board_left + layout.cell_size * cols, y);
    }

    auto outline = [&](const chain::core::Position& cell, Uint8 alpha) {
        SDL_FRect rect{layout.board_left + cell.col * layout.cell_size + layout.cell_inset,
                       layout.board_top + cell.row * layout.cell_size + layout.cell_inset,
                       layout.cell_size - 2.0f * layout.cell_inset,
                       layout.cell_size - 2.0f * layout.cell_inset};
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, alpha);
        SDL_RenderDrawRectF(renderer, &rect);
    };
    if (board_data.hover) {
        outline(*board_data.hover, 60);
    }
    if (board_data.controller_cursor) {
        outline(*board_data.controller_cursor, 200);
    }

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            chain::core::Position cell{r, c};
            if (board_data.hidden_cells.find(cell) != board_data.hidden_cells.end()) {
                continue;
            }
            const auto& state = board_data.board.get(cell);
            if (state.empty()) {
                continue;
            }
            // Cells one charge short of exploding are drawn hotter.
            const bool critical = state.charge + 1 >= chain::core::Capacity(board_data.board, cell);
            Color color = PlayerColor(board_data.config, state.owner);
            if (critical) {
                color = Scale(color, 1.25f);
            }
            DrawOrbs(renderer, CellCenter(layout, cell), layout.cell_size, state.charge, color,
                     critical ? 1.1f : 1.0f);
        }
    }
}

void DrawAnimations(SDL_Renderer* renderer,
                    const std::vector<Animation>& animations,
                    const Layout& layout) {
    for (const auto& anim : animations) {
        if (!anim.started()) {
            continue;
        }
        const float t = anim.ease();
        const float x = anim.start_x + (anim.end_x - anim.start_x) * t;
        const float y = anim.start_y + (anim.end_y - anim.start_y) * t;
        const float size = anim.size_start + (anim.size_end - anim.size_start) * t;
        const float alpha = anim.alpha_start + (anim.alpha_end - anim.alpha_start) * t;
        SDL_SetRenderDrawColor(renderer, anim.color.r, anim.color.g, anim.color.b,
                               static_cast<Uint8>(std::clamp(alpha, 0.0f, 255.0f)));
        const float radius = layout.cell_size * (anim.type == Animation::Type::Pop ? 0.18f : 0.12f);
        FillCircle(renderer, x, y, radius * size);
    }
}

void DrawStatus(SDL_Renderer* renderer, const Layout& layout, const StatusInfo& status) {
    Color color = status.color;
    if (status.halted) {
        color = Color{90, 90, 90, 255};
    } else if (status.game_over) {
        const float wave = 0.5f + 0.5f * std::sin(status.pulse_ms * 0.006f);
        color = Scale(color, 0.6f + 0.6f * wave);
    }
    SDL_FRect bar{layout.board_left, layout.status_top,
                  layout.view_width - 2.0f * layout.board_left, layout.status_height};
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, 255);
    SDL_RenderFillRectF(renderer, &bar);
}

}  // namespace chain::render

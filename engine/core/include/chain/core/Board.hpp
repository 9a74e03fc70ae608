#pragma once

#include <vector>

#include "chain/core/Types.hpp"

namespace chain::core {

struct CellState {
    PlayerId owner = kNoOwner;
    int charge = 0;

    bool empty() const noexcept { return charge == 0; }

    bool operator==(const CellState& other) const noexcept {
        return owner == other.owner && charge == other.charge;
    }
    bool operator!=(const CellState& other) const noexcept { return !(*this == other); }
};

inline constexpr CellState kEmptyCell{};

class Board {
public:
    Board() = default;
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    bool inBounds(int row, int col) const noexcept;
    bool inBounds(const Position& pos) const noexcept { return inBounds(pos.row, pos.col); }

    const CellState& get(int row, int col) const noexcept;
    const CellState& get(const Position& pos) const noexcept { return get(pos.row, pos.col); }

    // Bounds-checked read; throws InvariantViolation outside the grid.
    const CellState& at(const Position& pos) const;

    // Stores an occupied cell. Throws InvariantViolation for a non-positive
    // charge, a missing owner or an out-of-bounds position.
    void set(const Position& pos, const CellState& cell);
    void clear(const Position& pos);

    // A move: adds one charge to an empty cell or a cell already owned by
    // `player`. Returns false without touching the board if another player
    // owns the cell.
    bool placeOrIncrement(const Position& pos, PlayerId player);

    // A transfer: adds one charge regardless of the current owner and hands
    // the cell to `player`.
    void addCharge(const Position& pos, PlayerId player);

    Board snapshot() const { return *this; }

    void fill(const CellState& cell);

    std::vector<PlayerId> owners() const;
    int cellsOwnedBy(PlayerId player) const noexcept;
    int totalCharge() const noexcept;
    int totalCharge(PlayerId player) const noexcept;

    bool operator==(const Board& other) const noexcept {
        return rows_ == other.rows_ && cols_ == other.cols_ && cells_ == other.cells_;
    }
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int index(int row, int col) const noexcept;
    void requireInBounds(const Position& pos) const;

    int rows_{0};
    int cols_{0};
    std::vector<CellState> cells_;
};

int Capacity(int rows, int cols, const Position& pos) noexcept;
int Capacity(const Board& board, const Position& pos) noexcept;

bool IsUnstable(const Board& board, const Position& pos) noexcept;

// In-bounds orthogonal neighbours, ordered up, down, left, right.
std::vector<Position> Neighbors(const Board& board, const Position& pos);

}  // namespace chain::core

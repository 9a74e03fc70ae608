#include "chain/core/Board.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "chain/core/Errors.hpp"

namespace chain::core {

namespace {

constexpr int kDirections[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

std::string Describe(const Position& pos) {
    return "(" + std::to_string(pos.row) + ", " + std::to_string(pos.col) + ")";
}

}  // namespace

Board::Board(int rows, int cols)
    : rows_(std::max(0, rows)),
      cols_(std::max(0, cols)),
      cells_(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), kEmptyCell) {}

bool Board::inBounds(int row, int col) const noexcept {
    return row >= 0 && row < rows_ && col >= 0 && col < cols_;
}

const CellState& Board::get(int row, int col) const noexcept {
    return cells_[index(row, col)];
}

const CellState& Board::at(const Position& pos) const {
    requireInBounds(pos);
    return get(pos);
}

void Board::set(const Position& pos, const CellState& cell) {
    requireInBounds(pos);
    if (cell.charge <= 0) {
        throw InvariantViolation("non-positive charge " + std::to_string(cell.charge) +
                                 " stored at " + Describe(pos));
    }
    if (cell.owner < 0) {
        throw InvariantViolation("occupied cell without owner at " + Describe(pos));
    }
    cells_[index(pos.row, pos.col)] = cell;
}

void Board::clear(const Position& pos) {
    requireInBounds(pos);
    cells_[index(pos.row, pos.col)] = kEmptyCell;
}

bool Board::placeOrIncrement(const Position& pos, PlayerId player) {
    const CellState& current = at(pos);
    if (!current.empty() && current.owner != player) {
        return false;
    }
    addCharge(pos, player);
    return true;
}

void Board::addCharge(const Position& pos, PlayerId player) {
    const CellState& current = at(pos);
    if (current.empty()) {
        set(pos, CellState{player, 1});
    } else {
        set(pos, CellState{player, current.charge + 1});
    }
}

void Board::fill(const CellState& cell) {
    std::fill(cells_.begin(), cells_.end(), cell);
}

std::vector<PlayerId> Board::owners() const {
    std::set<PlayerId> distinct;
    for (const auto& cell : cells_) {
        if (!cell.empty()) {
            distinct.insert(cell.owner);
        }
    }
    return std::vector<PlayerId>(distinct.begin(), distinct.end());
}

int Board::cellsOwnedBy(PlayerId player) const noexcept {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(), [&](const CellState& cell) {
        return !cell.empty() && cell.owner == player;
    }));
}

int Board::totalCharge() const noexcept {
    int total = 0;
    for (const auto& cell : cells_) {
        total += cell.charge;
    }
    return total;
}

int Board::totalCharge(PlayerId player) const noexcept {
    int total = 0;
    for (const auto& cell : cells_) {
        if (!cell.empty() && cell.owner == player) {
            total += cell.charge;
        }
    }
    return total;
}

int Board::index(int row, int col) const noexcept {
    return row * cols_ + col;
}

void Board::requireInBounds(const Position& pos) const {
    if (!inBounds(pos)) {
        throw InvariantViolation("position " + Describe(pos) + " outside " +
                                 std::to_string(rows_) + "x" + std::to_string(cols_) + " board");
    }
}

int Capacity(int rows, int cols, const Position& pos) noexcept {
    int count = 0;
    for (const auto& dir : kDirections) {
        const int r = pos.row + dir[0];
        const int c = pos.col + dir[1];
        if (r >= 0 && r < rows && c >= 0 && c < cols) {
            ++count;
        }
    }
    return count;
}

int Capacity(const Board& board, const Position& pos) noexcept {
    return Capacity(board.rows(), board.cols(), pos);
}

bool IsUnstable(const Board& board, const Position& pos) noexcept {
    if (!board.inBounds(pos)) {
        return false;
    }
    const CellState& cell = board.get(pos);
    return !cell.empty() && cell.charge >= Capacity(board, pos);
}

std::vector<Position> Neighbors(const Board& board, const Position& pos) {
    std::vector<Position> result;
    result.reserve(4);
    for (const auto& dir : kDirections) {
        Position neighbor{pos.row + dir[0], pos.col + dir[1]};
        if (board.inBounds(neighbor)) {
            result.push_back(neighbor);
        }
    }
    return result;
}

}  // namespace chain::core

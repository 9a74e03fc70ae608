#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace chain::core {

using PlayerId = std::int32_t;

inline constexpr PlayerId kNoOwner = -1;

struct Position {
    std::int32_t row{};
    std::int32_t col{};

    constexpr bool operator==(const Position& other) const noexcept {
        return row == other.row && col == other.col;
    }

    constexpr bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }

    constexpr bool operator<(const Position& other) const noexcept {
        return row < other.row || (row == other.row && col < other.col);
    }
};

struct PositionHash {
    std::size_t operator()(const Position& pos) const noexcept {
        auto key = static_cast<std::uint64_t>(
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(pos.row)) << 32) |
            static_cast<std::uint32_t>(pos.col));
        return std::hash<std::uint64_t>{}(key);
    }
};

}  // namespace chain::core

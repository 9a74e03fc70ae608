#pragma once

#include <cstdint>
#include <vector>

#include "chain/core/Board.hpp"

namespace chain::core {

inline constexpr int kDefaultMaxWaves = 10000;

struct Transfer {
    std::uint32_t id = 0;
    Position from{};
    Position to{};
    PlayerId player = kNoOwner;
};

// One batch of explosions resolved against a single pre-wave board.
struct Wave {
    std::uint32_t index = 0;
    std::vector<Position> sources;
    std::vector<Transfer> transfers;
};

struct CascadeOptions {
    int max_waves = kDefaultMaxWaves;
    // Stop as soon as an applied wave leaves a single owner on the board.
    bool stop_on_sole_owner = false;
};

struct CascadeResult {
    Board board;
    std::vector<Wave> waves;
    bool stopped_on_sole_owner = false;
};

// Resolves the chain reaction started at `trigger`, which must already hold
// the placed charge. Pure: the caller's board is taken by value.
// Throws InvariantViolation if more than `options.max_waves` waves fire.
CascadeResult ResolveCascade(Board board,
                             const Position& trigger,
                             PlayerId player,
                             const CascadeOptions& options = {});

// Clears every source of `wave`, then applies its transfers. Rebuilds the
// board after a wave from the board before it.
void ApplyWave(Board& board, const Wave& wave);

}  // namespace chain::core

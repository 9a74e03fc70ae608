#include "chain/core/Cascade.hpp"

#include <string>
#include <unordered_set>
#include <utility>

#include "chain/core/Errors.hpp"

namespace chain::core {

namespace {

using PositionSet = std::unordered_set<Position, PositionHash>;

std::vector<Position> DistinctDestinations(const Wave& wave) {
    std::vector<Position> out;
    out.reserve(wave.transfers.size());
    PositionSet seen;
    for (const auto& transfer : wave.transfers) {
        if (seen.insert(transfer.to).second) {
            out.push_back(transfer.to);
        }
    }
    return out;
}

}  // namespace

CascadeResult ResolveCascade(Board board,
                             const Position& trigger,
                             PlayerId player,
                             const CascadeOptions& options) {
    if (!board.inBounds(trigger)) {
        throw InvariantViolation("cascade trigger (" + std::to_string(trigger.row) + ", " +
                                 std::to_string(trigger.col) + ") is outside the board");
    }
    CascadeResult result{};

    std::vector<Position> pending{trigger};
    std::uint32_t next_transfer_id = 0;

    while (!pending.empty()) {
        Wave wave;
        wave.index = static_cast<std::uint32_t>(result.waves.size());

        // Every check reads the pre-wave board; nothing is applied until the
        // whole pending set has been examined.
        for (const auto& pos : pending) {
            if (!IsUnstable(board, pos)) {
                continue;
            }
            wave.sources.push_back(pos);
            for (const auto& neighbor : Neighbors(board, pos)) {
                Transfer transfer;
                transfer.id = next_transfer_id++;
                transfer.from = pos;
                transfer.to = neighbor;
                transfer.player = player;
                wave.transfers.push_back(transfer);
            }
        }

        if (wave.sources.empty()) {
            break;
        }
        if (static_cast<int>(result.waves.size()) >= options.max_waves) {
            throw InvariantViolation("cascade from (" + std::to_string(trigger.row) + ", " +
                                     std::to_string(trigger.col) + ") exceeded " +
                                     std::to_string(options.max_waves) + " waves");
        }

        ApplyWave(board, wave);
        pending = DistinctDestinations(wave);
        result.waves.push_back(std::move(wave));

        if (options.stop_on_sole_owner && board.owners().size() == 1) {
            result.stopped_on_sole_owner = true;
            break;
        }
    }

    result.board = std::move(board);
    return result;
}

void ApplyWave(Board& board, const Wave& wave) {
    for (const auto& source : wave.sources) {
        board.clear(source);
    }
    for (const auto& transfer : wave.transfers) {
        board.addCharge(transfer.to, transfer.player);
    }
}

}  // namespace chain::core

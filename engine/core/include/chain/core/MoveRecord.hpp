#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "chain/core/Json.hpp"
#include "chain/core/TurnController.hpp"

namespace chain::core {

Json PositionToJson(const Position& pos);
Position PositionFromJson(const Json& json);

// {"rows", "cols", "cells"}: cells is row-major, each entry null or
// [owner, charge]. Decoding throws std::invalid_argument on malformed input.
Json BoardToJson(const Board& board);
Board BoardFromJson(const Json& json);

Json WaveToJson(const Wave& wave);
Wave WaveFromJson(const Json& json);

Json GameStateToJson(const GameState& state);
GameState GameStateFromJson(const Json& json);

// Everything a consumer needs to animate one resolved move and then show the
// settled game: the placement, the ordered waves and the resulting state.
struct MoveRecord {
    int version = 1;
    PlayerId player = kNoOwner;
    Position position{};
    Board placed_board;
    std::vector<Wave> waves;
    GameState state;

    Json ToJson() const;
    static MoveRecord FromJson(const Json& json);

    std::string Serialize() const;
    static MoveRecord Deserialize(const std::string& json_string);

    std::vector<std::uint8_t> SerializeBinary() const;
    static MoveRecord DeserializeBinary(const std::vector<std::uint8_t>& bytes);
};

MoveRecord MakeMoveRecord(const MoveResult& result, const GameState& state);

}  // namespace chain::core

#include <cassert>
#include <iostream>
#include <stdexcept>

#include "chain/core/GameConfig.hpp"
#include "chain/core/MoveRecord.hpp"
#include "chain/core/TurnController.hpp"

using namespace chain::core;

namespace {

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestDefaults() {
    GameConfig config;
    config.Validate();
    assert(config.rows == 6);
    assert(config.cols == 9);
    assert(config.playerCount() == 2);
    assert(config.max_waves == kDefaultMaxWaves);
    assert(config.stop_cascade_on_victory);
    assert(!config.skip_eliminated_players);
}

void TestFromJsonReadsKnownFields() {
    auto config = GameConfig::Deserialize(R"({
        "rows": 8,
        "cols": 8,
        "players": ["Alice", {"name": "Bob", "color": [10, 20, 30]}, {"color": [1, 2, 999]}],
        "max_waves": 500,
        "stop_cascade_on_victory": false,
        "wave_duration_ms": 120,
        "unknown": "ignored"
    })");
    config.Validate();
    assert(config.rows == 8 && config.cols == 8);
    assert(config.playerCount() == 3);
    assert(config.players[0].name == "Alice");
    assert(config.players[1].name == "Bob");
    assert(config.players[1].color[0] == 10 && config.players[1].color[2] == 30);
    assert(config.players[2].name == "Player 3");
    assert(config.players[2].color[0] == 255);
    assert(config.max_waves == 500);
    assert(!config.stop_cascade_on_victory);
    assert(!config.skip_eliminated_players);
    assert(config.wave_duration_ms == 120);
}

void TestWrongTypesKeepDefaults() {
    auto config = GameConfig::Deserialize(R"({"rows": "ten", "cols": 4.5, "max_waves": null})");
    assert(config.rows == 6);
    assert(config.cols == 9);
    assert(config.max_waves == kDefaultMaxWaves);
}

void TestValidateRejectsBadValues() {
    GameConfig narrow;
    narrow.rows = 1;
    assert(ThrowsInvalidArgument([&] { narrow.Validate(); }));

    GameConfig solo;
    solo.players.resize(1);
    assert(ThrowsInvalidArgument([&] { solo.Validate(); }));

    GameConfig no_waves;
    no_waves.max_waves = 0;
    assert(ThrowsInvalidArgument([&] { no_waves.Validate(); }));
}

void TestMalformedJsonThrows() {
    bool threw = false;
    try {
        GameConfig::Deserialize("{\"rows\": ");
    } catch (const Json::parse_error&) {
        threw = true;
    }
    assert(threw);
}

void TestSerializeKeepsSettings() {
    GameConfig config;
    config.rows = 7;
    config.skip_eliminated_players = true;
    config.players.push_back({"Green", {{60, 180, 90}}});

    auto restored = GameConfig::Deserialize(config.Serialize());
    assert(restored.rows == 7);
    assert(restored.skip_eliminated_players);
    assert(restored.playerCount() == 3);
    assert(restored.players[2].name == "Green");
    assert(restored.players[2].color[1] == 180);
}

void TestMoveRecordCarriesCascade() {
    TurnController controller(GameConfig{});
    assert(controller.submitMove(Position{0, 0}).ok());
    assert(controller.submitMove(Position{5, 8}).ok());
    auto result = controller.submitMove(Position{0, 0});
    assert(result.ok());

    auto record = MakeMoveRecord(result, controller.state());
    auto json = record.ToJson();
    assert(json["player"] == 0);
    assert(json["waves"].size() == 1);
    assert(json["waves"][0]["transfers"].size() == 2);
    assert(json["waves"][0]["transfers"][1]["to"] == Json::array({0, 1}));
    assert(json["placed_board"]["cells"][0][0] == Json::array({0, 2}));
    assert(json["state"]["board"]["cells"][0][0].is_null());
    assert(json["state"]["current_player"] == 1);
    assert(json["state"]["winner"].is_null());

    auto text = MoveRecord::Deserialize(record.Serialize());
    assert(text.placed_board == result.placed_board);
    assert(text.state.board == controller.board());
    assert(text.waves.size() == 1);
    assert(text.waves[0].sources == result.waves[0].sources);
    assert(text.waves[0].transfers[1].to == (Position{0, 1}));

    auto binary = MoveRecord::DeserializeBinary(record.SerializeBinary());
    assert(binary.state.board == controller.board());
    assert(binary.state.has_moved == controller.state().has_moved);
    assert(binary.position == (Position{0, 0}));
}

void TestBoardFromJsonRejectsZeroCharge() {
    Board board(2, 2);
    board.set(Position{1, 1}, CellState{1, 1});
    auto json = BoardToJson(board);
    assert(BoardFromJson(json) == board);

    json["cells"][1][1] = Json::array({1, 0});
    assert(ThrowsInvalidArgument([&] { BoardFromJson(json); }));

    json["cells"][1] = Json::array({nullptr});
    assert(ThrowsInvalidArgument([&] { BoardFromJson(json); }));
}

void TestMoveRecordRejectsBadCounters() {
    Wave wave;
    wave.index = 0;
    wave.sources.push_back(Position{0, 0});
    Transfer transfer;
    transfer.id = 0;
    transfer.from = Position{0, 0};
    transfer.to = Position{0, 1};
    transfer.player = 0;
    wave.transfers.push_back(transfer);

    auto json = WaveToJson(wave);
    assert(WaveFromJson(json).transfers.size() == 1);

    json["index"] = -1;
    assert(ThrowsInvalidArgument([&] { WaveFromJson(json); }));
    json["index"] = 0;
    json["transfers"][0]["id"] = -3;
    assert(ThrowsInvalidArgument([&] { WaveFromJson(json); }));

    TurnController controller(GameConfig{});
    auto result = controller.submitMove(Position{2, 2});
    auto record_json = MakeMoveRecord(result, controller.state()).ToJson();
    assert(MoveRecord::FromJson(record_json).version == 1);
    record_json["version"] = "two";
    assert(ThrowsInvalidArgument([&] { MoveRecord::FromJson(record_json); }));
}

}  // namespace

int main() {
    TestDefaults();
    TestFromJsonReadsKnownFields();
    TestWrongTypesKeepDefaults();
    TestValidateRejectsBadValues();
    TestMalformedJsonThrows();
    TestSerializeKeepsSettings();
    TestMoveRecordCarriesCascade();
    TestBoardFromJsonRejectsZeroCharge();
    TestMoveRecordRejectsBadCounters();
    std::cout << "All config and record tests passed.\n";
    return 0;
}

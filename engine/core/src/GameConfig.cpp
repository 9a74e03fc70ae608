#include "chain/core/GameConfig.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace chain::core {

namespace {

std::optional<std::array<std::uint8_t, 3>> ReadColor(const Json& json) {
    if (!json.is_array() || json.size() != 3) {
        return std::nullopt;
    }
    std::array<std::uint8_t, 3> parsed{};
    for (std::size_t i = 0; i < 3; ++i) {
        if (!json[i].is_number_integer()) {
            return std::nullopt;
        }
        const int channel = json[i].get<int>();
        if (channel < 0 || channel > 255) {
            return std::nullopt;
        }
        parsed[i] = static_cast<std::uint8_t>(channel);
    }
    return parsed;
}

}  // namespace

void GameConfig::Validate() const {
    if (rows < 2 || cols < 2) {
        throw std::invalid_argument("board must be at least 2x2, got " + std::to_string(rows) +
                                    "x" + std::to_string(cols));
    }
    if (players.size() < 2) {
        throw std::invalid_argument("at least two players are required");
    }
    if (max_waves <= 0) {
        throw std::invalid_argument("max_waves must be positive");
    }
    if (wave_duration_ms < 0) {
        throw std::invalid_argument("wave_duration_ms must not be negative");
    }
    if (resolution[0] <= 0 || resolution[1] <= 0) {
        throw std::invalid_argument("resolution must be positive");
    }
}

Json GameConfig::ToJson() const {
    Json json;
    json["rows"] = rows;
    json["cols"] = cols;
    Json player_list = Json::array();
    for (const auto& player : players) {
        Json entry;
        entry["name"] = player.name;
        entry["color"] = {player.color[0], player.color[1], player.color[2]};
        player_list.push_back(entry);
    }
    json["players"] = player_list;
    json["max_waves"] = max_waves;
    json["stop_cascade_on_victory"] = stop_cascade_on_victory;
    json["skip_eliminated_players"] = skip_eliminated_players;
    json["wave_duration_ms"] = wave_duration_ms;
    json["resolution"] = {resolution[0], resolution[1]};
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (json.contains("rows") && json["rows"].is_number_integer()) {
        config.rows = json["rows"].get<int>();
    }
    if (json.contains("cols") && json["cols"].is_number_integer()) {
        config.cols = json["cols"].get<int>();
    }
    if (json.contains("players") && json["players"].is_array()) {
        std::vector<PlayerConfig> players;
        for (const auto& entry : json["players"]) {
            PlayerConfig player;
            if (entry.is_string()) {
                player.name = entry.get<std::string>();
            } else if (entry.is_object()) {
                player.name = entry.value("name", std::string{});
                if (entry.contains("color")) {
                    if (auto color = ReadColor(entry["color"])) {
                        player.color = *color;
                    }
                }
            } else {
                continue;
            }
            if (player.name.empty()) {
                player.name = "Player " + std::to_string(players.size() + 1);
            }
            players.push_back(player);
        }
        config.players = std::move(players);
    }
    if (json.contains("max_waves") && json["max_waves"].is_number_integer()) {
        config.max_waves = json["max_waves"].get<int>();
    }
    if (json.contains("stop_cascade_on_victory") && json["stop_cascade_on_victory"].is_boolean()) {
        config.stop_cascade_on_victory = json["stop_cascade_on_victory"].get<bool>();
    }
    if (json.contains("skip_eliminated_players") && json["skip_eliminated_players"].is_boolean()) {
        config.skip_eliminated_players = json["skip_eliminated_players"].get<bool>();
    }
    if (json.contains("wave_duration_ms") && json["wave_duration_ms"].is_number_integer()) {
        config.wave_duration_ms = json["wave_duration_ms"].get<int>();
    }
    if (json.contains("resolution") && json["resolution"].is_array() &&
        json["resolution"].size() == 2 && json["resolution"][0].is_number_integer() &&
        json["resolution"][1].is_number_integer()) {
        config.resolution[0] = json["resolution"][0].get<int>();
        config.resolution[1] = json["resolution"][1].get<int>();
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump();
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace chain::core

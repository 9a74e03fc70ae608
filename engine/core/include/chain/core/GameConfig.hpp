#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "chain/core/Cascade.hpp"
#include "chain/core/Json.hpp"

namespace chain::core {

struct PlayerConfig {
    std::string name;
    std::array<std::uint8_t, 3> color{{255, 255, 255}};
};

struct GameConfig {
    int rows = 6;
    int cols = 9;
    std::vector<PlayerConfig> players{{"Red", {{230, 57, 70}}}, {"Blue", {{69, 123, 230}}}};
    int max_waves = kDefaultMaxWaves;
    bool stop_cascade_on_victory = true;
    bool skip_eliminated_players = false;

    // Presentation only; the engine never reads these.
    int wave_duration_ms = 300;
    std::array<int, 2> resolution{{960, 720}};

    int playerCount() const noexcept { return static_cast<int>(players.size()); }

    // Throws std::invalid_argument describing the first bad field.
    void Validate() const;

    Json ToJson() const;
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace chain::core

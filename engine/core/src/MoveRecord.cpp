#include "chain/core/MoveRecord.hpp"

#include <stdexcept>

namespace chain::core {

namespace {

int RequireInt(const Json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_number_integer()) {
        throw std::invalid_argument(std::string("missing integer field '") + key + "'");
    }
    return json[key].get<int>();
}

std::uint32_t RequireIndex(const Json& json, const char* key) {
    const int value = RequireInt(json, key);
    if (value < 0) {
        throw std::invalid_argument(std::string("field '") + key + "' must not be negative");
    }
    return static_cast<std::uint32_t>(value);
}

}  // namespace

Json PositionToJson(const Position& pos) {
    return Json::array({pos.row, pos.col});
}

Position PositionFromJson(const Json& json) {
    if (!json.is_array() || json.size() != 2 || !json[0].is_number_integer() ||
        !json[1].is_number_integer()) {
        throw std::invalid_argument("position must be [row, col]");
    }
    return Position{json[0].get<std::int32_t>(), json[1].get<std::int32_t>()};
}

Json BoardToJson(const Board& board) {
    Json json;
    json["rows"] = board.rows();
    json["cols"] = board.cols();
    Json cells = Json::array();
    for (int r = 0; r < board.rows(); ++r) {
        Json row = Json::array();
        for (int c = 0; c < board.cols(); ++c) {
            const CellState& cell = board.get(r, c);
            if (cell.empty()) {
                row.push_back(nullptr);
            } else {
                row.push_back(Json::array({cell.owner, cell.charge}));
            }
        }
        cells.push_back(row);
    }
    json["cells"] = cells;
    return json;
}

Board BoardFromJson(const Json& json) {
    const int rows = RequireInt(json, "rows");
    const int cols = RequireInt(json, "cols");
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("board dimensions must be positive");
    }
    Board board(rows, cols);
    if (!json.contains("cells") || !json["cells"].is_array() ||
        json["cells"].size() != static_cast<std::size_t>(rows)) {
        throw std::invalid_argument("cells must hold one array per row");
    }
    const Json& cells = json["cells"];
    for (int r = 0; r < rows; ++r) {
        const Json& row = cells[static_cast<std::size_t>(r)];
        if (!row.is_array() || row.size() != static_cast<std::size_t>(cols)) {
            throw std::invalid_argument("row " + std::to_string(r) + " has wrong width");
        }
        for (int c = 0; c < cols; ++c) {
            const Json& entry = row[static_cast<std::size_t>(c)];
            if (entry.is_null()) {
                continue;
            }
            if (!entry.is_array() || entry.size() != 2 || !entry[0].is_number_integer() ||
                !entry[1].is_number_integer()) {
                throw std::invalid_argument("cell must be null or [owner, charge]");
            }
            CellState cell{entry[0].get<PlayerId>(), entry[1].get<int>()};
            if (cell.owner < 0 || cell.charge <= 0) {
                throw std::invalid_argument("cell (" + std::to_string(r) + ", " +
                                            std::to_string(c) + ") has invalid owner or charge");
            }
            board.set(Position{r, c}, cell);
        }
    }
    return board;
}

Json WaveToJson(const Wave& wave) {
    Json json;
    json["index"] = wave.index;
    Json sources = Json::array();
    for (const auto& source : wave.sources) {
        sources.push_back(PositionToJson(source));
    }
    json["sources"] = sources;
    Json transfers = Json::array();
    for (const auto& transfer : wave.transfers) {
        Json entry;
        entry["id"] = transfer.id;
        entry["from"] = PositionToJson(transfer.from);
        entry["to"] = PositionToJson(transfer.to);
        entry["player"] = transfer.player;
        transfers.push_back(entry);
    }
    json["transfers"] = transfers;
    return json;
}

Wave WaveFromJson(const Json& json) {
    Wave wave;
    wave.index = RequireIndex(json, "index");
    if (json.contains("sources") && json["sources"].is_array()) {
        for (const auto& source : json["sources"]) {
            wave.sources.push_back(PositionFromJson(source));
        }
    }
    if (json.contains("transfers") && json["transfers"].is_array()) {
        for (const auto& entry : json["transfers"]) {
            Transfer transfer;
            transfer.id = RequireIndex(entry, "id");
            transfer.from = PositionFromJson(entry.at("from"));
            transfer.to = PositionFromJson(entry.at("to"));
            transfer.player = RequireInt(entry, "player");
            wave.transfers.push_back(transfer);
        }
    }
    return wave;
}

Json GameStateToJson(const GameState& state) {
    Json json;
    json["board"] = BoardToJson(state.board);
    json["current_player"] = state.current_player;
    json["has_moved"] = state.has_moved;
    json["is_over"] = state.is_over;
    json["winner"] = state.winner ? Json(*state.winner) : Json(nullptr);
    json["move_count"] = state.move_count;
    return json;
}

GameState GameStateFromJson(const Json& json) {
    GameState state;
    state.board = BoardFromJson(json.at("board"));
    state.current_player = RequireInt(json, "current_player");
    if (json.contains("has_moved") && json["has_moved"].is_array()) {
        state.has_moved = json["has_moved"].get<std::vector<bool>>();
    }
    if (json.contains("is_over") && json["is_over"].is_boolean()) {
        state.is_over = json["is_over"].get<bool>();
    }
    if (json.contains("winner") && json["winner"].is_number_integer()) {
        state.winner = json["winner"].get<PlayerId>();
    }
    if (json.contains("move_count") && json["move_count"].is_number_integer()) {
        state.move_count = json["move_count"].get<int>();
    }
    return state;
}

Json MoveRecord::ToJson() const {
    Json json;
    json["version"] = version;
    json["player"] = player;
    json["position"] = PositionToJson(position);
    json["placed_board"] = BoardToJson(placed_board);
    Json wave_list = Json::array();
    for (const auto& wave : waves) {
        wave_list.push_back(WaveToJson(wave));
    }
    json["waves"] = wave_list;
    json["state"] = GameStateToJson(state);
    return json;
}

MoveRecord MoveRecord::FromJson(const Json& json) {
    MoveRecord record;
    if (json.contains("version")) {
        record.version = RequireInt(json, "version");
    }
    record.player = RequireInt(json, "player");
    record.position = PositionFromJson(json.at("position"));
    record.placed_board = BoardFromJson(json.at("placed_board"));
    if (json.contains("waves") && json["waves"].is_array()) {
        for (const auto& wave : json["waves"]) {
            record.waves.push_back(WaveFromJson(wave));
        }
    }
    record.state = GameStateFromJson(json.at("state"));
    return record;
}

std::string MoveRecord::Serialize() const {
    return ToJson().dump();
}

MoveRecord MoveRecord::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

std::vector<std::uint8_t> MoveRecord::SerializeBinary() const {
    return Json::to_msgpack(ToJson());
}

MoveRecord MoveRecord::DeserializeBinary(const std::vector<std::uint8_t>& bytes) {
    auto json = Json::from_msgpack(bytes);
    return FromJson(json);
}

MoveRecord MakeMoveRecord(const MoveResult& result, const GameState& state) {
    MoveRecord record;
    record.player = result.player;
    record.position = result.position;
    record.placed_board = result.placed_board;
    record.waves = result.waves;
    record.state = state;
    return record;
}

}  // namespace chain::core

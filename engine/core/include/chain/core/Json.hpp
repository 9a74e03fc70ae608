#pragma once

#include <nlohmann/json.hpp>

namespace chain::core {

using Json = nlohmann::json;

}  // namespace chain::core

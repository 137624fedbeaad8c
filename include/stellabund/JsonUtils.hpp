#pragma once
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace stellabund {
nlohmann::json load_json(const std::string& path);
void expand_env(nlohmann::json& j);

// {"C": 8.0, "Fe": [7.0, 6.5]}  ->  element -> Vector (keys left as given)
AbundanceTable abundances_from_json(const nlohmann::json& j);
} // namespace stellabund

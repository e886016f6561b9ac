#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace iam_explorer {

bool json_config_load(const std::string& filename, nlohmann::json& config);

} // namespace

#include "json_config.hpp"

#include <fstream>

namespace iam_explorer {

bool json_config_load(const std::string& filename, nlohmann::json& config)
{
    std::ifstream configFile(filename);
    if (!configFile.is_open()) {
        return false;
    }
    nlohmann::json j;
    try {
        configFile >> j;
    } catch (const nlohmann::json::exception&) {
        return false;
    }
    config = j;
    return true;
}

} // namespace

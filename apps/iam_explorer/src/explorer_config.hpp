#pragma once

#include "json_config.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>

namespace iam_explorer {

/**
 * Optional config file of the command line tool. Every key is
 * optional, command line options take precedence.
 */
class ExplorerConfig
{
 public:
    ExplorerConfig() : config_(nlohmann::json::object()) {}
    ExplorerConfig(const std::string& filename)
        : filename_(filename), config_(nlohmann::json::object())
    {
    }

    bool load()
    {
        return json_config_load(filename_, config_);
    }

    void setJson(const nlohmann::json& config)
    {
        config_ = config;
    }

    bool isValid() const
    {
        if (!config_.is_object()) {
            return false;
        }
        for (auto key : { "GraphFile", "SnapshotFile", "LogLevel", "Format" }) {
            auto it = config_.find(key);
            if (it != config_.end() && !it->is_string()) {
                return false;
            }
        }
        auto format = config_.find("Format");
        if (format != config_.end()) {
            std::string f = format->get<std::string>();
            if (f != "table" && f != "json") {
                return false;
            }
        }
        return true;
    }

    std::string getGraphFile() const { return getString("GraphFile"); }
    std::string getSnapshotFile() const { return getString("SnapshotFile"); }
    std::string getLogLevel() const { return getString("LogLevel"); }
    std::string getFormat() const { return getString("Format"); }

    static std::string example()
    {
        std::string exampleConfig = R"(
{
  "GraphFile": "graph.cbor",
  "SnapshotFile": "snapshot.json",
  "LogLevel": "error",
  "Format": "table"
}
)";
        return exampleConfig;
    }

 private:
    std::string getString(const std::string& key) const
    {
        auto it = config_.find(key);
        if (it == config_.end() || !it->is_string()) {
            return "";
        }
        return it->get<std::string>();
    }

    std::string filename_;
    nlohmann::json config_;
};

} // namespace

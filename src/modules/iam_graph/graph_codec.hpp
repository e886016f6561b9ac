#pragma once

#include "graph.hpp"

#include <iam_explorer/iam_explorer_error.hpp>
#include <modules/logging/logger.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace iam_explorer {

/**
 * Persisted form of a built graph. The bytes are CBOR encoded
 * { "Version": 1, "Snapshot": <snapshot json> }, deserialize rebuilds
 * the graph from the embedded snapshot.
 */
class GraphCodec {
 public:
    static const int VERSION = 1;

    static std::vector<uint8_t> serialize(const Graph& graph);

    /**
     * ec is invalid_format for undecodable bytes or another version,
     * otherwise the GraphBuilder error if the content does not build.
     */
    static std::unique_ptr<Graph> deserialize(const std::vector<uint8_t>& bytes, lib::error_code& ec, std::shared_ptr<Logger> logger = nullptr);

    static bool saveFile(const std::string& filename, const Graph& graph);
    static std::unique_ptr<Graph> loadFile(const std::string& filename, lib::error_code& ec, std::shared_ptr<Logger> logger = nullptr);
};

} // namespace

#include "graph_codec.hpp"
#include "graph_builder.hpp"
#include "snapshot_json.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>

namespace iam_explorer {

static const char* LOG_MODULE = "codec";

const int GraphCodec::VERSION;

std::vector<uint8_t> GraphCodec::serialize(const Graph& graph)
{
    nlohmann::json root;
    root["Version"] = VERSION;
    root["Snapshot"] = SnapshotJson::snapshotToJson(graph.toSnapshot());
    return nlohmann::json::to_cbor(root);
}

std::unique_ptr<Graph> GraphCodec::deserialize(const std::vector<uint8_t>& bytes, lib::error_code& ec, std::shared_ptr<Logger> logger)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::from_cbor(bytes);
    } catch (const nlohmann::json::exception& e) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Cannot decode the graph: " << e.what());
        ec = make_error_code(IamExplorerError::invalid_format);
        return nullptr;
    }

    auto version = root.find("Version");
    if (!root.is_object() || version == root.end() || !version->is_number_integer() || version->get<int>() != VERSION) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Unsupported graph format version");
        ec = make_error_code(IamExplorerError::invalid_format);
        return nullptr;
    }

    auto snapshotJson = root.find("Snapshot");
    Snapshot snapshot;
    std::string errorRecord;
    if (snapshotJson == root.end() || !SnapshotJson::snapshotFromJson(*snapshotJson, snapshot, errorRecord)) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Invalid snapshot in the graph, record: " << errorRecord);
        ec = make_error_code(IamExplorerError::invalid_format);
        return nullptr;
    }

    GraphBuilder builder(logger);
    return builder.build(snapshot, ec);
}

bool GraphCodec::saveFile(const std::string& filename, const Graph& graph)
{
    std::vector<uint8_t> bytes = serialize(graph);
    std::string tmpFile = filename + ".tmp";
    std::remove(tmpFile.c_str());
    {
        std::ofstream out(tmpFile, std::ios::binary);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            std::remove(tmpFile.c_str());
            return false;
        }
    }
    if (std::rename(tmpFile.c_str(), filename.c_str()) != 0) {
        std::remove(tmpFile.c_str());
        return false;
    }
    return true;
}

std::unique_ptr<Graph> GraphCodec::loadFile(const std::string& filename, lib::error_code& ec, std::shared_ptr<Logger> logger)
{
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        IAM_EXPLORER_LOG_ERROR(logger, LOG_MODULE, "Cannot open the graph file " << filename);
        ec = make_error_code(IamExplorerError::invalid_format);
        return nullptr;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return deserialize(bytes, ec, logger);
}

} // namespace

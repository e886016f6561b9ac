#pragma once

#include "graph.hpp"

#include <iam_explorer/iam_explorer_error.hpp>
#include <modules/iam_model/iam_builder.hpp>
#include <modules/logging/logger.hpp>

#include <map>
#include <memory>
#include <string>

namespace iam_explorer {

/**
 * Builds a fully linked Graph from a Snapshot.
 *
 * Construction is all or nothing. On failure build returns nullptr,
 * ec is malformed_entity or inconsistent_snapshot and getErrorRecord
 * names the offending record.
 */
class GraphBuilder {
 public:
    GraphBuilder() {}
    GraphBuilder(std::shared_ptr<Logger> logger) : logger_(logger) {}

    std::unique_ptr<Graph> build(const Snapshot& snapshot, lib::error_code& ec);

    std::string getErrorRecord() const { return errorRecord_; }
    std::string getErrorMessage() const { return errorMessage_; }

 private:
    bool fail(lib::error_code& ec, IamExplorerError::ErrorCodes code, const std::string& record, const std::string& message);
    bool validatePolicy(const PolicyBuilder& policy, lib::error_code& ec);
    bool validateIdentity(const IdentityBuilder& identity, const std::string& recordName, lib::error_code& ec);
    bool resolveGroup(const Graph& graph, const std::string& userId, const std::string& ref, std::string& groupId, lib::error_code& ec);

    std::shared_ptr<Logger> logger_;
    std::string errorRecord_;
    std::string errorMessage_;
};

} // namespace

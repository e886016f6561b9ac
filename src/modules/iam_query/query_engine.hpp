#pragma once

#include "query_result.hpp"

#include <iam_explorer/iam_explorer_error.hpp>
#include <modules/iam_graph/graph.hpp>
#include <modules/logging/logger.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace iam_explorer {

/**
 * Answers "who can do X" and "what can Y do" against a built graph.
 *
 * Queries only read the graph. All traversal state is local to the
 * query, so one engine can serve concurrent queries from several
 * threads.
 */
class QueryEngine {
 public:
    QueryEngine(const Graph& graph) : graph_(graph) {}
    QueryEngine(const Graph& graph, std::shared_ptr<Logger> logger) : graph_(graph), logger_(logger) {}

    /**
     * Find the identities with an Allow for some (action, resource)
     * pair overlapping the patterns which is not cancelled by a
     * broader Deny. Identities reaching such a grant only by assuming
     * roles are reported with the role chain in via.
     *
     * @param cancelled  optional flag checked before each identity.
     * @return invalid_pattern, cancelled or ok.
     */
    lib::error_code whoCanDo(const std::string& actionPattern, const std::string& resourcePattern, WhoCanDoResult& result,
                             const std::atomic<bool>* cancelled = nullptr) const;

    lib::error_code whoCanDo(const std::string& actionPattern, WhoCanDoResult& result) const
    {
        return whoCanDo(actionPattern, "*", result);
    }

    /**
     * List every statement tuple reachable from the identity through
     * its own policies, its groups and the roles it can assume,
     * transitively.
     *
     * @param identity  identity id, or a display name unique in the graph.
     * @return unknown_identity or ok.
     */
    lib::error_code whatCanDo(const std::string& identity, WhatCanDoResult& result) const;

    const Graph& getGraph() const { return graph_; }

 private:
    const Graph& graph_;
    std::shared_ptr<Logger> logger_;
};

} // namespace

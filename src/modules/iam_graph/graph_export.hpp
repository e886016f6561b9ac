#pragma once

#include "graph.hpp"

#include <string>
#include <vector>

namespace iam_explorer {

struct ExportNode {
    std::string id;
    std::string label;
    /**
     * User, Group, Role, Policy or Principal. Principal nodes are trust
     * principals which are not identities of the graph, e.g. services.
     */
    std::string variant;
};

struct ExportEdge {
    std::string kind;
    std::string source;
    std::string target;
};

struct GraphStats {
    size_t totalNodes;
    size_t totalEdges;
    size_t users;
    size_t groups;
    size_t roles;
    size_t policies;
};

/**
 * Nodes and edges for a rendering collaborator. Layout and drawing is
 * not done here.
 */
class GraphExport {
 public:
    GraphExport(const Graph& graph);

    const std::vector<ExportNode>& getNodes() const { return nodes_; }
    const std::vector<ExportEdge>& getEdges() const { return edges_; }

    GraphStats getStats() const { return stats_; }

    /**
     * Keep the nodes whose id or label equals one of the filters and
     * their direct neighbours, and the edges between kept nodes.
     */
    GraphExport filter(const std::vector<std::string>& filters) const;

    GraphExport withoutPolicies() const;

 private:
    GraphExport() {}
    std::vector<ExportNode> nodes_;
    std::vector<ExportEdge> edges_;
    GraphStats stats_;
};

} // namespace

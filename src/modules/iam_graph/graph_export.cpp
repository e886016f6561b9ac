#include "graph_export.hpp"

#include <set>

namespace iam_explorer {

GraphExport::GraphExport(const Graph& graph)
{
    std::set<std::string> ids;
    for (const auto& identity : graph.allIdentities()) {
        nodes_.push_back(ExportNode{ identity->getId(), identity->getName(), identityTypeToString(identity->getType()) });
        ids.insert(identity->getId());
    }
    size_t policies = 0;
    for (const auto& p : graph.getPolicies()) {
        nodes_.push_back(ExportNode{ p->getId(), p->getName(), "Policy" });
        ids.insert(p->getId());
        policies++;
    }
    for (const auto& e : graph.getEdges()) {
        if (e.kind == EdgeKind::TRUSTS && ids.insert(e.source).second) {
            nodes_.push_back(ExportNode{ e.source, e.source, "Principal" });
        }
        edges_.push_back(ExportEdge{ edgeKindToString(e.kind), e.source, e.target });
    }
    // trust policies hang off their role
    for (const auto& identity : graph.allIdentities()) {
        auto trust = identity->getTrustPolicy();
        if (trust) {
            edges_.push_back(ExportEdge{ edgeKindToString(EdgeKind::ATTACHED), identity->getId(), trust->getId() });
        }
    }

    stats_.totalNodes = nodes_.size();
    stats_.totalEdges = edges_.size();
    stats_.users = graph.userCount();
    stats_.groups = graph.groupCount();
    stats_.roles = graph.roleCount();
    stats_.policies = policies;
}

static GraphStats countStats(const std::vector<ExportNode>& nodes, const std::vector<ExportEdge>& edges)
{
    GraphStats stats = { nodes.size(), edges.size(), 0, 0, 0, 0 };
    for (const auto& n : nodes) {
        if (n.variant == "User") {
            stats.users++;
        } else if (n.variant == "Group") {
            stats.groups++;
        } else if (n.variant == "Role") {
            stats.roles++;
        } else if (n.variant == "Policy") {
            stats.policies++;
        }
    }
    return stats;
}

GraphExport GraphExport::filter(const std::vector<std::string>& filters) const
{
    std::set<std::string> wanted(filters.begin(), filters.end());
    std::set<std::string> seeds;
    for (const auto& n : nodes_) {
        if (wanted.count(n.id) || wanted.count(n.label)) {
            seeds.insert(n.id);
        }
    }
    std::set<std::string> keep(seeds);
    for (const auto& e : edges_) {
        if (seeds.count(e.source)) {
            keep.insert(e.target);
        }
        if (seeds.count(e.target)) {
            keep.insert(e.source);
        }
    }

    GraphExport out;
    for (const auto& n : nodes_) {
        if (keep.count(n.id)) {
            out.nodes_.push_back(n);
        }
    }
    for (const auto& e : edges_) {
        if (keep.count(e.source) && keep.count(e.target)) {
            out.edges_.push_back(e);
        }
    }
    out.stats_ = countStats(out.nodes_, out.edges_);
    return out;
}

GraphExport GraphExport::withoutPolicies() const
{
    std::set<std::string> policyIds;
    GraphExport out;
    for (const auto& n : nodes_) {
        if (n.variant == "Policy") {
            policyIds.insert(n.id);
        } else {
            out.nodes_.push_back(n);
        }
    }
    for (const auto& e : edges_) {
        if (!policyIds.count(e.source) && !policyIds.count(e.target)) {
            out.edges_.push_back(e);
        }
    }
    out.stats_ = countStats(out.nodes_, out.edges_);
    return out;
}

} // namespace

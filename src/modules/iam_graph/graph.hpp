#pragma once

#include "edge.hpp"

#include <modules/iam_model/identity.hpp>
#include <modules/iam_model/iam_builder.hpp>
#include <modules/iam_model/policy.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace iam_explorer {

/**
 * A policy reached from an identity. group is the group the policy is
 * inherited through, nullptr for policies attached to the identity.
 */
struct PolicyAttachment {
    std::shared_ptr<const Policy> policy;
    std::shared_ptr<const Identity> group;
};

/**
 * Restartable view of the identities of a graph in snapshot order,
 * users then groups then roles.
 */
class IdentityRange {
 public:
    typedef std::vector<std::shared_ptr<const Identity> >::const_iterator const_iterator;

    IdentityRange(const_iterator begin, const_iterator end) : begin_(begin), end_(end) {}

    const_iterator begin() const { return begin_; }
    const_iterator end() const { return end_; }
    size_t size() const { return static_cast<size_t>(end_ - begin_); }
 private:
    const_iterator begin_;
    const_iterator end_;
};

/**
 * The permission graph of one snapshot. Only the GraphBuilder creates
 * graphs and a graph is never modified after it has been built, so a
 * graph can be shared by concurrent queries without locking.
 */
class Graph {
 public:
    std::shared_ptr<const Identity> getIdentity(const std::string& id) const;

    /**
     * Lookup by id, falling back to a display name which is unique in
     * the graph.
     */
    std::shared_ptr<const Identity> findIdentity(const std::string& idOrName) const;

    std::shared_ptr<const Policy> getPolicy(const std::string& id) const;

    IdentityRange allIdentities() const
    {
        return IdentityRange(identities_.begin(), identities_.end());
    }

    /**
     * Managed policies in snapshot order followed by the inline and
     * trust policies of each identity.
     */
    const std::vector<std::shared_ptr<const Policy> >& getPolicies() const { return policies_; }

    const std::vector<Edge>& getEdges() const { return edges_; }

    /**
     * Directly attached policies (managed then inline) followed by the
     * policies of each group the identity is member of, in snapshot
     * order. Groups do not nest.
     */
    std::vector<PolicyAttachment> effectivePolicies(const Identity& identity) const;

    /**
     * effectivePolicies without the attribution.
     */
    std::vector<std::shared_ptr<const Policy> > effectivePolicyDocuments(const Identity& identity) const;

    std::vector<std::shared_ptr<const Identity> > getGroups(const Identity& identity) const;

    /**
     * Roles whose trust policy lets the principal assume them, in
     * snapshot order. A role never lists itself.
     */
    std::vector<std::shared_ptr<const Identity> > assumableRoles(const Identity& principal) const;

    size_t userCount() const { return userCount_; }
    size_t groupCount() const { return groupCount_; }
    size_t roleCount() const { return roleCount_; }
    size_t managedPolicyCount() const { return managedPolicyCount_; }

    /**
     * Recreate a snapshot which builds an identical graph.
     */
    Snapshot toSnapshot() const;

 private:
    friend class GraphBuilder;
    Graph() : userCount_(0), groupCount_(0), roleCount_(0), managedPolicyCount_(0) {}

    std::vector<std::shared_ptr<const Identity> > identities_;
    std::map<std::string, std::shared_ptr<const Identity> > identityIndex_;
    std::vector<std::shared_ptr<const Policy> > policies_;
    std::map<std::string, std::shared_ptr<const Policy> > policyIndex_;
    std::vector<Edge> edges_;

    size_t userCount_;
    size_t groupCount_;
    size_t roleCount_;
    size_t managedPolicyCount_;
};

} // namespace

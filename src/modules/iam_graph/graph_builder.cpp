#include "graph_builder.hpp"

#include <set>
#include <sstream>

namespace iam_explorer {

static const char* LOG_MODULE = "graph";

bool GraphBuilder::fail(lib::error_code& ec, IamExplorerError::ErrorCodes code, const std::string& record, const std::string& message)
{
    ec = make_error_code(code);
    errorRecord_ = record;
    errorMessage_ = message;
    IAM_EXPLORER_LOG_ERROR(logger_, LOG_MODULE, ec.message() << ": " << message << " (record: " << record << ")");
    return false;
}

static bool validStatement(const Statement& statement)
{
    if (statement.getActions().empty() || statement.getResources().empty()) {
        return false;
    }
    for (const auto& a : statement.getActions()) {
        if (a.empty()) {
            return false;
        }
    }
    for (const auto& r : statement.getResources()) {
        if (r.empty()) {
            return false;
        }
    }
    return true;
}

bool GraphBuilder::validatePolicy(const PolicyBuilder& policy, lib::error_code& ec)
{
    if (policy.getId().empty()) {
        return fail(ec, IamExplorerError::malformed_entity, policy.getName(), "policy without identifier");
    }
    if (policy.getName().empty()) {
        return fail(ec, IamExplorerError::malformed_entity, policy.getId(), "policy without name");
    }
    int index = 0;
    for (const auto& s : policy.getStatements()) {
        if (!validStatement(s)) {
            std::stringstream ss;
            ss << "statement " << index << " needs at least one non empty action and resource";
            return fail(ec, IamExplorerError::malformed_entity, policy.getId(), ss.str());
        }
        index++;
    }
    return true;
}

bool GraphBuilder::validateIdentity(const IdentityBuilder& identity, const std::string& recordName, lib::error_code& ec)
{
    if (identity.getId().empty()) {
        return fail(ec, IamExplorerError::malformed_entity, recordName, "identity without identifier");
    }
    if (identity.getName().empty()) {
        return fail(ec, IamExplorerError::malformed_entity, identity.getId(), "identity without name");
    }
    if (identity.getType() == IdentityType::ROLE && !identity.hasTrustPolicy()) {
        return fail(ec, IamExplorerError::malformed_entity, identity.getId(), "role without trust policy");
    }
    if (identity.getType() != IdentityType::ROLE && identity.hasTrustPolicy()) {
        return fail(ec, IamExplorerError::malformed_entity, identity.getId(), "only roles have a trust policy");
    }
    if (identity.getType() != IdentityType::USER && !identity.getGroups().empty()) {
        return fail(ec, IamExplorerError::malformed_entity, identity.getId(), "only users can be group members");
    }
    for (const auto& p : identity.getInlinePolicies()) {
        if (!validatePolicy(p, ec)) {
            return false;
        }
    }
    if (identity.hasTrustPolicy() && !validatePolicy(identity.getTrustPolicy(), ec)) {
        return false;
    }
    return true;
}

bool GraphBuilder::resolveGroup(const Graph& graph, const std::string& userId, const std::string& ref, std::string& groupId, lib::error_code& ec)
{
    auto byId = graph.getIdentity(ref);
    if (byId) {
        if (!byId->isGroup()) {
            return fail(ec, IamExplorerError::inconsistent_snapshot, userId, "member of " + ref + " which is not a group");
        }
        groupId = byId->getId();
        return true;
    }
    std::shared_ptr<const Identity> found;
    for (const auto& i : graph.identities_) {
        if (i->isGroup() && i->getName() == ref) {
            if (found) {
                return fail(ec, IamExplorerError::inconsistent_snapshot, userId, "group name " + ref + " is ambiguous");
            }
            found = i;
        }
    }
    if (!found) {
        return fail(ec, IamExplorerError::inconsistent_snapshot, userId, "member of unknown group " + ref);
    }
    groupId = found->getId();
    return true;
}

std::unique_ptr<Graph> GraphBuilder::build(const Snapshot& snapshot, lib::error_code& ec)
{
    ec = make_error_code(IamExplorerError::ok);
    errorRecord_.clear();
    errorMessage_.clear();

    std::unique_ptr<Graph> graph(new Graph());

    // identity records in snapshot order
    std::vector<IdentityBuilder> records;
    records.insert(records.end(), snapshot.users.begin(), snapshot.users.end());
    records.insert(records.end(), snapshot.groups.begin(), snapshot.groups.end());
    records.insert(records.end(), snapshot.roles.begin(), snapshot.roles.end());

    std::map<std::string, size_t> recordIndex;
    for (size_t i = 0; i < records.size(); i++) {
        const IdentityBuilder& r = records[i];
        std::stringstream recordName;
        recordName << identityTypeToString(r.getType()) << " record " << i;
        if (!validateIdentity(r, recordName.str(), ec)) {
            return nullptr;
        }
        if (!recordIndex.insert(std::make_pair(r.getId(), i)).second) {
            fail(ec, IamExplorerError::malformed_entity, r.getId(), "duplicate identifier");
            return nullptr;
        }
    }

    // managed policies, and inline policies listed on their own
    std::map<std::string, std::vector<PolicyBuilder> > separateInline;
    for (const auto& p : snapshot.policies) {
        if (!validatePolicy(p, ec)) {
            return nullptr;
        }
        if (!p.getOwner().empty()) {
            if (recordIndex.find(p.getOwner()) == recordIndex.end()) {
                fail(ec, IamExplorerError::malformed_entity, p.getId(), "inline policy of undeclared identity " + p.getOwner());
                return nullptr;
            }
            separateInline[p.getOwner()].push_back(p);
            continue;
        }
        if (graph->policyIndex_.find(p.getId()) != graph->policyIndex_.end()) {
            fail(ec, IamExplorerError::malformed_entity, p.getId(), "duplicate policy identifier");
            return nullptr;
        }
        auto policy = std::make_shared<const Policy>(p.build());
        graph->policies_.push_back(policy);
        graph->policyIndex_[policy->getId()] = policy;
        graph->managedPolicyCount_++;
    }

    for (const auto& r : records) {
        std::vector<std::shared_ptr<const Policy> > policies;
        for (const auto& policyId : r.getPolicies()) {
            auto it = graph->policyIndex_.find(policyId);
            if (it == graph->policyIndex_.end() || it->second->isInline()) {
                fail(ec, IamExplorerError::inconsistent_snapshot, r.getId(), "attached to unknown policy " + policyId);
                return nullptr;
            }
            policies.push_back(it->second);
        }

        std::vector<PolicyBuilder> inlinePolicies = r.getInlinePolicies();
        auto sep = separateInline.find(r.getId());
        if (sep != separateInline.end()) {
            inlinePolicies.insert(inlinePolicies.end(), sep->second.begin(), sep->second.end());
        }
        for (const auto& pb : inlinePolicies) {
            auto policy = std::make_shared<const Policy>(pb.build());
            if (graph->policyIndex_.find(policy->getId()) != graph->policyIndex_.end()) {
                fail(ec, IamExplorerError::malformed_entity, policy->getId(), "duplicate inline policy");
                return nullptr;
            }
            graph->policies_.push_back(policy);
            graph->policyIndex_[policy->getId()] = policy;
            policies.push_back(policy);
        }

        std::shared_ptr<const Policy> trust;
        if (r.hasTrustPolicy()) {
            trust = std::make_shared<const Policy>(r.getTrustPolicy().build());
            if (graph->policyIndex_.find(trust->getId()) != graph->policyIndex_.end()) {
                fail(ec, IamExplorerError::malformed_entity, trust->getId(), "trust policy id collides with another policy");
                return nullptr;
            }
            graph->policies_.push_back(trust);
            graph->policyIndex_[trust->getId()] = trust;
        }

        auto identity = std::make_shared<const Identity>(r.getId(), r.getName(), r.getType(), policies, r.getGroups(), trust);
        graph->identities_.push_back(identity);
        graph->identityIndex_[identity->getId()] = identity;
        switch (identity->getType()) {
            case IdentityType::USER: graph->userCount_++; break;
            case IdentityType::GROUP: graph->groupCount_++; break;
            case IdentityType::ROLE: graph->roleCount_++; break;
        }
    }

    // Group references may be names, replace them with group ids now
    // that every group exists.
    for (auto& identity : graph->identities_) {
        if (identity->getGroups().empty()) {
            continue;
        }
        std::vector<std::string> groupIds;
        for (const auto& ref : identity->getGroups()) {
            std::string groupId;
            if (!resolveGroup(*graph, identity->getId(), ref, groupId, ec)) {
                return nullptr;
            }
            groupIds.push_back(groupId);
        }
        auto resolved = std::make_shared<const Identity>(identity->getId(), identity->getName(), identity->getType(),
                                                         identity->getPolicies(), groupIds, identity->getTrustPolicy());
        identity = resolved;
        graph->identityIndex_[resolved->getId()] = resolved;
    }

    for (const auto& identity : graph->identities_) {
        for (const auto& groupId : identity->getGroups()) {
            graph->edges_.push_back(Edge{ EdgeKind::MEMBER_OF, identity->getId(), groupId });
        }
        for (const auto& p : identity->getPolicies()) {
            graph->edges_.push_back(Edge{ EdgeKind::ATTACHED, identity->getId(), p->getId() });
        }
        auto trust = identity->getTrustPolicy();
        if (!trust) {
            continue;
        }
        std::set<std::string> principals;
        for (const auto& stmt : trust->getStatements()) {
            if (stmt.getEffect() != Effect::ALLOW) {
                continue;
            }
            for (const auto& kind : stmt.getPrincipals().getMap()) {
                for (const auto& value : kind.second) {
                    if (principals.insert(value).second) {
                        graph->edges_.push_back(Edge{ EdgeKind::TRUSTS, value, identity->getId() });
                    }
                }
            }
        }
    }

    IAM_EXPLORER_LOG_INFO(logger_, LOG_MODULE, "Built graph with " << graph->identities_.size() << " identities ("
                          << graph->userCount_ << " users, " << graph->groupCount_ << " groups, " << graph->roleCount_ << " roles), "
                          << graph->policies_.size() << " policies and " << graph->edges_.size() << " edges");
    return graph;
}

} // namespace

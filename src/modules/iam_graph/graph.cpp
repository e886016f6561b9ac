#include "graph.hpp"

#include <modules/policy_eval/policy_evaluator.hpp>

namespace iam_explorer {

std::shared_ptr<const Identity> Graph::getIdentity(const std::string& id) const
{
    auto it = identityIndex_.find(id);
    if (it == identityIndex_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<const Identity> Graph::findIdentity(const std::string& idOrName) const
{
    auto identity = getIdentity(idOrName);
    if (identity) {
        return identity;
    }
    std::shared_ptr<const Identity> found;
    for (const auto& i : identities_) {
        if (i->getName() == idOrName) {
            if (found) {
                // ambiguous name
                return nullptr;
            }
            found = i;
        }
    }
    return found;
}

std::shared_ptr<const Policy> Graph::getPolicy(const std::string& id) const
{
    auto it = policyIndex_.find(id);
    if (it == policyIndex_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<const Identity> > Graph::getGroups(const Identity& identity) const
{
    std::vector<std::shared_ptr<const Identity> > groups;
    for (const auto& groupId : identity.getGroups()) {
        auto group = getIdentity(groupId);
        if (group) {
            groups.push_back(group);
        }
    }
    return groups;
}

std::vector<PolicyAttachment> Graph::effectivePolicies(const Identity& identity) const
{
    std::vector<PolicyAttachment> out;
    for (const auto& p : identity.getPolicies()) {
        out.push_back(PolicyAttachment{ p, nullptr });
    }
    for (const auto& group : getGroups(identity)) {
        for (const auto& p : group->getPolicies()) {
            out.push_back(PolicyAttachment{ p, group });
        }
    }
    return out;
}

std::vector<std::shared_ptr<const Policy> > Graph::effectivePolicyDocuments(const Identity& identity) const
{
    std::vector<std::shared_ptr<const Policy> > out;
    for (const auto& a : effectivePolicies(identity)) {
        out.push_back(a.policy);
    }
    return out;
}

std::vector<std::shared_ptr<const Identity> > Graph::assumableRoles(const Identity& principal) const
{
    std::vector<std::shared_ptr<const Identity> > roles;
    if (principal.isGroup()) {
        return roles;
    }
    for (const auto& identity : identities_) {
        if (!identity->isRole() || identity->getId() == principal.getId()) {
            continue;
        }
        auto trust = identity->getTrustPolicy();
        if (trust && PolicyEvaluator::allowsAssumption(*trust, principal)) {
            roles.push_back(identity);
        }
    }
    return roles;
}

static IdentityBuilder identityToBuilder(const Identity& identity)
{
    IdentityBuilder ib(identity.getType(), identity.getId());
    ib = ib.name(identity.getName());
    for (const auto& p : identity.getManagedPolicies()) {
        ib = ib.addPolicy(p->getId());
    }
    for (const auto& p : identity.getInlinePolicies()) {
        PolicyBuilder pb(p->getName());
        for (const auto& s : p->getStatements()) {
            pb = pb.addStatement(s);
        }
        ib = ib.addInlinePolicy(pb);
    }
    for (const auto& g : identity.getGroups()) {
        ib = ib.addGroup(g);
    }
    auto trust = identity.getTrustPolicy();
    if (trust) {
        PolicyBuilder pb(trust->getName());
        for (const auto& s : trust->getStatements()) {
            pb = pb.addStatement(s);
        }
        ib = ib.trustPolicy(pb);
    }
    return ib;
}

Snapshot Graph::toSnapshot() const
{
    Snapshot snapshot;
    for (const auto& p : policies_) {
        if (p->isInline()) {
            continue;
        }
        PolicyBuilder pb(p->getName());
        pb = pb.id(p->getId());
        for (const auto& s : p->getStatements()) {
            pb = pb.addStatement(s);
        }
        snapshot.policies.push_back(pb);
    }
    for (const auto& identity : identities_) {
        IdentityBuilder ib = identityToBuilder(*identity);
        switch (identity->getType()) {
            case IdentityType::USER: snapshot.users.push_back(ib); break;
            case IdentityType::GROUP: snapshot.groups.push_back(ib); break;
            case IdentityType::ROLE: snapshot.roles.push_back(ib); break;
        }
    }
    return snapshot;
}

} // namespace

#include "query_engine.hpp"

#include <modules/policy_eval/policy_evaluator.hpp>
#include <modules/policy_eval/wildcard.hpp>

#include <deque>
#include <map>
#include <set>
#include <sstream>
#include <tuple>

namespace iam_explorer {

static const char* LOG_MODULE = "query";

std::string WhoCanDoEntry::viaString() const
{
    std::string out;
    for (const auto& role : via) {
        if (!out.empty()) {
            out += "->";
        }
        out += role;
    }
    return out;
}

namespace {

void addUnique(std::vector<std::string>& v, const std::string& s)
{
    for (const auto& e : v) {
        if (e == s) {
            return;
        }
    }
    v.push_back(s);
}

std::string conditionWarning(const Policy& policy, size_t statementIndex, const Statement& statement)
{
    std::stringstream ss;
    ss << "Condition block ignored in policy " << policy.getId() << " statement ";
    if (statement.getSid().empty()) {
        ss << statementIndex;
    } else {
        ss << statement.getSid();
    }
    ss << ", the result assumes the condition holds";
    return ss.str();
}

/**
 * Collects warnings in order of appearance without duplicates.
 */
class Warnings {
 public:
    void add(const std::string& warning)
    {
        if (seen_.insert(warning).second) {
            warnings_.push_back(warning);
        }
    }
    const std::vector<std::string>& get() const { return warnings_; }
 private:
    std::set<std::string> seen_;
    std::vector<std::string> warnings_;
};

struct Grant {
    Grant() : granted(false), conditional(false) {}
    bool granted;
    bool conditional;
    std::vector<std::string> actions;
    std::vector<std::string> resources;
    std::vector<std::string> policies;
};

struct AssumableRole {
    std::shared_ptr<const Identity> role;
    /**
     * Warning for the trust condition the principal is only admitted
     * under, empty if admitted unconditionally.
     */
    std::string condition;
};

/**
 * Per query traversal state. Grants and assumable roles are cached per
 * identity since every principal which can assume a role shares its
 * answer.
 */
class Traversal {
 public:
    Traversal(const Graph& graph, const std::string& actionPattern, const std::string& resourcePattern)
        : graph_(graph), actionPattern_(actionPattern), resourcePattern_(resourcePattern)
    {
    }

    Grant grantFor(const Identity& identity)
    {
        PatternVerdict verdict = PolicyEvaluator::evaluatePattern(graph_.effectivePolicyDocuments(identity), actionPattern_, resourcePattern_);
        for (const auto& c : verdict.conditional) {
            warnings_.add(conditionWarning(*c.policy, c.index, c.statement()));
        }

        Grant grant;
        for (const auto& g : verdict.grants) {
            grant.granted = true;
            addUnique(grant.actions, g.action);
            addUnique(grant.resources, g.resource);
            addUnique(grant.policies, g.source.policy->getId());
            if (g.source.statement().hasConditions()) {
                grant.conditional = true;
            }
        }
        return grant;
    }

    Grant roleGrant(const Identity& role)
    {
        auto it = roleGrants_.find(role.getId());
        if (it != roleGrants_.end()) {
            return it->second;
        }
        Grant grant = grantFor(role);
        roleGrants_[role.getId()] = grant;
        return grant;
    }

    std::vector<AssumableRole> assumableRoles(const Identity& principal)
    {
        auto it = assumable_.find(principal.getId());
        if (it != assumable_.end()) {
            return it->second;
        }
        std::vector<AssumableRole> roles;
        for (const auto& role : graph_.assumableRoles(principal)) {
            auto trust = role->getTrustPolicy();
            Assumption assumption = PolicyEvaluator::evaluateAssumption(*trust, principal);
            std::string condition;
            if (assumption.conditional) {
                condition = conditionWarning(*trust, assumption.statement, trust->getStatements()[assumption.statement]);
            }
            roles.push_back(AssumableRole{ role, condition });
        }
        assumable_[principal.getId()] = roles;
        return roles;
    }

    Warnings& warnings() { return warnings_; }

 private:
    const Graph& graph_;
    std::string actionPattern_;
    std::string resourcePattern_;
    std::map<std::string, Grant> roleGrants_;
    std::map<std::string, std::vector<AssumableRole> > assumable_;
    Warnings warnings_;
};

struct RoleStep {
    std::shared_ptr<const Identity> role;
    std::vector<std::string> chain;
    /**
     * Warnings for the trust conditions along the chain.
     */
    std::vector<std::string> conditions;

    bool conditional() const { return !conditions.empty(); }
};

std::vector<std::string> appendCondition(std::vector<std::string> conditions, const std::string& condition)
{
    if (!condition.empty()) {
        conditions.push_back(condition);
    }
    return conditions;
}

/**
 * Breadth first walk over the roles the principal can assume. A role is
 * expanded at most once, which bounds the walk on cyclic trust.
 */
template<typename Visitor>
void walkAssumableRoles(const Identity& principal, Traversal& traversal, Visitor visit)
{
    std::set<std::string> visited;
    visited.insert(principal.getId());
    std::deque<RoleStep> queue;

    for (const auto& a : traversal.assumableRoles(principal)) {
        if (visited.insert(a.role->getId()).second) {
            queue.push_back(RoleStep{ a.role, std::vector<std::string>(1, a.role->getName()), appendCondition(std::vector<std::string>(), a.condition) });
        }
    }

    while (!queue.empty()) {
        RoleStep step = queue.front();
        queue.pop_front();
        visit(step);
        for (const auto& next : traversal.assumableRoles(*step.role)) {
            if (visited.insert(next.role->getId()).second) {
                std::vector<std::string> chain = step.chain;
                chain.push_back(next.role->getName());
                queue.push_back(RoleStep{ next.role, chain, appendCondition(step.conditions, next.condition) });
            }
        }
    }
}

std::string joinChain(const std::vector<std::string>& chain)
{
    std::string out;
    for (const auto& c : chain) {
        if (!out.empty()) {
            out += "->";
        }
        out += c;
    }
    return out;
}

WhoCanDoEntry makeEntry(const Identity& identity, const Grant& grant, const std::vector<std::string>& via)
{
    WhoCanDoEntry entry;
    entry.identityId = identity.getId();
    entry.identityName = identity.getName();
    entry.identityType = identity.getType();
    entry.actions = grant.actions;
    entry.resources = grant.resources;
    entry.policies = grant.policies;
    entry.via = via;
    entry.conditional = grant.conditional;
    return entry;
}

} // namespace

lib::error_code QueryEngine::whoCanDo(const std::string& actionPattern, const std::string& resourcePattern, WhoCanDoResult& result,
                                      const std::atomic<bool>* cancelled) const
{
    if (!Wildcard::isValidActionPattern(actionPattern)) {
        IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "Invalid action pattern '" << actionPattern << "'");
        return make_error_code(IamExplorerError::invalid_pattern);
    }
    if (!Wildcard::isValidResourcePattern(resourcePattern)) {
        IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "Invalid resource pattern '" << resourcePattern << "'");
        return make_error_code(IamExplorerError::invalid_pattern);
    }

    WhoCanDoResult out;
    Traversal traversal(graph_, actionPattern, resourcePattern);

    for (const auto& identity : graph_.allIdentities()) {
        if (cancelled && cancelled->load()) {
            IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "who-can-do " << actionPattern << " cancelled");
            return make_error_code(IamExplorerError::cancelled);
        }

        Grant direct = identity->isRole() ? traversal.roleGrant(*identity) : traversal.grantFor(*identity);
        if (direct.granted) {
            out.entries.push_back(makeEntry(*identity, direct, std::vector<std::string>()));
        }

        if (identity->isGroup()) {
            continue;
        }
        walkAssumableRoles(*identity, traversal, [&](const RoleStep& step) {
            Grant viaRole = traversal.roleGrant(*step.role);
            if (viaRole.granted) {
                WhoCanDoEntry entry = makeEntry(*identity, viaRole, step.chain);
                entry.conditional = entry.conditional || step.conditional();
                for (const auto& c : step.conditions) {
                    traversal.warnings().add(c);
                }
                out.entries.push_back(entry);
            }
        });
    }

    out.warnings = traversal.warnings().get();
    for (const auto& w : out.warnings) {
        IAM_EXPLORER_LOG_WARN(logger_, LOG_MODULE, w);
    }
    IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "who-can-do " << actionPattern << " on " << resourcePattern << ": " << out.entries.size() << " entries");
    result = out;
    return make_error_code(IamExplorerError::ok);
}

lib::error_code QueryEngine::whatCanDo(const std::string& identityName, WhatCanDoResult& result) const
{
    auto identity = graph_.findIdentity(identityName);
    if (!identity) {
        IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "Unknown identity '" << identityName << "'");
        return make_error_code(IamExplorerError::unknown_identity);
    }

    WhatCanDoResult out;
    out.identityId = identity->getId();
    out.identityName = identity->getName();
    out.identityType = identity->getType();

    Traversal traversal(graph_, "*", "*");
    Warnings& warnings = traversal.warnings();
    std::set<std::tuple<std::string, std::string, int, std::string> > seen;

    auto collect = [&](const std::vector<PolicyAttachment>& attachments, const std::string& roleChain, bool chainConditional) {
        for (const auto& a : attachments) {
            std::string attribution;
            if (!roleChain.empty()) {
                attribution = "via-role:" + roleChain;
            } else if (a.group) {
                attribution = "via-group:" + a.group->getName();
            } else {
                attribution = "direct";
            }
            const auto& statements = a.policy->getStatements();
            for (size_t i = 0; i < statements.size(); i++) {
                const Statement& stmt = statements[i];
                if (stmt.hasConditions()) {
                    warnings.add(conditionWarning(*a.policy, i, stmt));
                }
                bool conditional = stmt.hasConditions() || chainConditional;
                for (const auto& action : stmt.getActions()) {
                    for (const auto& resource : stmt.getResources()) {
                        auto key = std::make_tuple(action, resource, static_cast<int>(stmt.getEffect()), a.policy->getId());
                        if (!seen.insert(key).second) {
                            continue;
                        }
                        out.permissions.push_back(PermissionEntry{ action, resource, stmt.getEffect(), a.policy->getId(), attribution, conditional });
                    }
                }
            }
        }
    };

    collect(graph_.effectivePolicies(*identity), "", false);

    if (!identity->isGroup()) {
        walkAssumableRoles(*identity, traversal, [&](const RoleStep& step) {
            std::string chain = joinChain(step.chain);
            out.assumableRoles.push_back(chain);
            for (const auto& c : step.conditions) {
                warnings.add(c);
            }
            collect(graph_.effectivePolicies(*step.role), chain, step.conditional());
        });
    }

    out.warnings = warnings.get();
    for (const auto& w : out.warnings) {
        IAM_EXPLORER_LOG_WARN(logger_, LOG_MODULE, w);
    }
    IAM_EXPLORER_LOG_TRACE(logger_, LOG_MODULE, "what-can-do " << identity->getId() << ": " << out.permissions.size() << " permissions, "
                           << out.assumableRoles.size() << " assumable roles");
    result = out;
    return make_error_code(IamExplorerError::ok);
}

} // namespace

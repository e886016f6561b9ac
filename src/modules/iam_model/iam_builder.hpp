#pragma once

#include "condition.hpp"
#include "effect.hpp"
#include "identity.hpp"
#include "policy.hpp"
#include "principals.hpp"
#include "statement.hpp"

#include <string>
#include <vector>

namespace iam_explorer {

class StatementBuilder {
 public:
    StatementBuilder(Effect effect) : effect_(effect) {}
    StatementBuilder allow()
    {
        effect_ = Effect::ALLOW;
        return *this;
    }

    StatementBuilder deny()
    {
        effect_ = Effect::DENY;
        return *this;
    }

    StatementBuilder sid(const std::string& sid)
    {
        sid_ = sid;
        return *this;
    }

    StatementBuilder addAction(const std::string& action)
    {
        actions_.push_back(action);
        return *this;
    }

    StatementBuilder addResource(const std::string& resource)
    {
        resources_.push_back(resource);
        return *this;
    }

    StatementBuilder addCondition(const Condition& condition)
    {
        conditions_.push_back(condition);
        return *this;
    }

    StatementBuilder addPrincipal(const std::string& kind, const std::string& value)
    {
        principals_.add(kind, value);
        return *this;
    }

    StatementBuilder principals(const Principals& principals)
    {
        principals_ = principals;
        return *this;
    }

    Statement build() const {
        return Statement(effect_, actions_, resources_, conditions_, principals_, sid_);
    }

 private:
    Effect effect_;
    std::string sid_;
    std::vector<std::string> actions_;
    std::vector<std::string> resources_;
    std::vector<Condition> conditions_;
    Principals principals_;
};

class PolicyBuilder {
 public:
    PolicyBuilder(const std::string& name) : name_(name), trust_(false) {}
    PolicyBuilder name(const std::string& name)
    {
        name_ = name;
        return *this;
    }

    /**
     * The ARN of a managed policy.
     */
    PolicyBuilder id(const std::string& id)
    {
        id_ = id;
        return *this;
    }

    /**
     * Marks the policy as inline policy of the given identity.
     */
    PolicyBuilder owner(const std::string& owner)
    {
        owner_ = owner;
        trust_ = false;
        return *this;
    }

    /**
     * Marks the policy as trust policy of the given role.
     */
    PolicyBuilder trustOf(const std::string& role)
    {
        owner_ = role;
        trust_ = true;
        return *this;
    }

    PolicyBuilder addStatement(const Statement& statement)
    {
        statements_.push_back(statement);
        return *this;
    }

    PolicyBuilder addStatement(const StatementBuilder& statement)
    {
        statements_.push_back(statement.build());
        return *this;
    }

    Policy build() const {
        return Policy(getId(), name_, owner_, statements_);
    }

    std::string getName() const { return name_; }
    std::string getOwner() const { return owner_; }
    std::string getId() const
    {
        if (trust_) {
            return Policy::trustId(owner_);
        }
        if (!owner_.empty()) {
            return Policy::inlineId(owner_, name_);
        }
        return id_;
    }

    std::vector<Statement> getStatements() const { return statements_; }
 private:
    std::string name_;
    std::string id_;
    std::string owner_;
    bool trust_;
    std::vector<Statement> statements_;
};

/**
 * Snapshot record of a user, group or role.
 */
class IdentityBuilder {
 public:
    IdentityBuilder(IdentityType type, const std::string& id) : type_(type), id_(id), hasTrustPolicy_(false), trustPolicy_("") {}

    IdentityBuilder name(const std::string& name)
    {
        name_ = name;
        return *this;
    }

    /**
     * Attach a managed policy by its id.
     */
    IdentityBuilder addPolicy(const std::string& policyId)
    {
        policies_.push_back(policyId);
        return *this;
    }

    IdentityBuilder addInlinePolicy(const PolicyBuilder& policy)
    {
        inlinePolicies_.push_back(PolicyBuilder(policy).owner(id_));
        return *this;
    }

    /**
     * Group membership by group id or group name, users only.
     */
    IdentityBuilder addGroup(const std::string& group)
    {
        groups_.push_back(group);
        return *this;
    }

    IdentityBuilder trustPolicy(const PolicyBuilder& policy)
    {
        hasTrustPolicy_ = true;
        trustPolicy_ = PolicyBuilder(policy).trustOf(id_);
        return *this;
    }

    IdentityType getType() const { return type_; }
    std::string getId() const { return id_; }
    std::string getName() const { return name_; }
    std::vector<std::string> getPolicies() const { return policies_; }
    std::vector<PolicyBuilder> getInlinePolicies() const { return inlinePolicies_; }
    std::vector<std::string> getGroups() const { return groups_; }
    bool hasTrustPolicy() const { return hasTrustPolicy_; }
    PolicyBuilder getTrustPolicy() const { return trustPolicy_; }

 private:
    IdentityType type_;
    std::string id_;
    std::string name_;
    std::vector<std::string> policies_;
    std::vector<PolicyBuilder> inlinePolicies_;
    std::vector<std::string> groups_;
    bool hasTrustPolicy_;
    PolicyBuilder trustPolicy_;
};

/**
 * The normalized input handed over by the fetch collaborator.
 */
struct Snapshot {
    std::vector<IdentityBuilder> users;
    std::vector<IdentityBuilder> groups;
    std::vector<IdentityBuilder> roles;
    std::vector<PolicyBuilder> policies;
};

} // namespace

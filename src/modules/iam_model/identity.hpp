#pragma once

#include "policy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace iam_explorer {

enum class IdentityType {
    USER,
    GROUP,
    ROLE
};

std::string identityTypeToString(IdentityType type);
bool identityTypeFromString(const std::string& str, IdentityType& type);

/**
 * A User, Group or Role node. Identities are created by the
 * GraphBuilder with all policy references resolved and never change
 * afterwards.
 */
class Identity {
 public:
    Identity(const std::string& id, const std::string& name, IdentityType type,
             std::vector<std::shared_ptr<const Policy> > policies,
             std::vector<std::string> groups,
             std::shared_ptr<const Policy> trustPolicy)
        : id_(id), name_(name), type_(type), policies_(policies), groups_(groups), trustPolicy_(trustPolicy)
    {
    }

    std::string getId() const { return id_; }
    std::string getName() const { return name_; }
    IdentityType getType() const { return type_; }

    bool isUser() const { return type_ == IdentityType::USER; }
    bool isGroup() const { return type_ == IdentityType::GROUP; }
    bool isRole() const { return type_ == IdentityType::ROLE; }

    /**
     * Managed policies in attachment order followed by inline policies.
     */
    const std::vector<std::shared_ptr<const Policy> >& getPolicies() const { return policies_; }

    std::vector<std::shared_ptr<const Policy> > getManagedPolicies() const;
    std::vector<std::shared_ptr<const Policy> > getInlinePolicies() const;

    /**
     * Ids of the groups a user is member of, empty for groups and roles.
     */
    const std::vector<std::string>& getGroups() const { return groups_; }

    /**
     * The trust policy of a role, nullptr for users and groups.
     */
    std::shared_ptr<const Policy> getTrustPolicy() const { return trustPolicy_; }

 private:
    std::string id_;
    std::string name_;
    IdentityType type_;
    std::vector<std::shared_ptr<const Policy> > policies_;
    std::vector<std::string> groups_;
    std::shared_ptr<const Policy> trustPolicy_;
};

} // namespace

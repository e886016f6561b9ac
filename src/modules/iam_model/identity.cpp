#include "identity.hpp"

namespace iam_explorer {

std::string identityTypeToString(IdentityType type)
{
    switch (type) {
        case IdentityType::USER: return "User";
        case IdentityType::GROUP: return "Group";
        case IdentityType::ROLE: return "Role";
    }
    return "Unknown";
}

bool identityTypeFromString(const std::string& str, IdentityType& type)
{
    if (str == "User") {
        type = IdentityType::USER;
    } else if (str == "Group") {
        type = IdentityType::GROUP;
    } else if (str == "Role") {
        type = IdentityType::ROLE;
    } else {
        return false;
    }
    return true;
}

std::vector<std::shared_ptr<const Policy> > Identity::getManagedPolicies() const
{
    std::vector<std::shared_ptr<const Policy> > out;
    for (auto p : policies_) {
        if (!p->isInline()) {
            out.push_back(p);
        }
    }
    return out;
}

std::vector<std::shared_ptr<const Policy> > Identity::getInlinePolicies() const
{
    std::vector<std::shared_ptr<const Policy> > out;
    for (auto p : policies_) {
        if (p->isInline()) {
            out.push_back(p);
        }
    }
    return out;
}

} // namespace

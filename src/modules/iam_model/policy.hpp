#pragma once

#include "statement.hpp"

#include <string>
#include <vector>

namespace iam_explorer {

/**
 * A policy document. Managed policies are identified by their ARN,
 * inline policies by "<owner id>#<inline name>" and the trust policy of
 * a role by "<role id>!trust".
 */
class Policy {
 public:
    Policy(const std::string& id, const std::string& name, const std::string& owner, std::vector<Statement> statements)
        : id_(id), name_(name), owner_(owner), statements_(statements)
    {
    }

    static std::string inlineId(const std::string& owner, const std::string& name)
    {
        return owner + "#" + name;
    }

    static std::string trustId(const std::string& role)
    {
        return role + "!trust";
    }

    std::string getId() const
    {
        return id_;
    }

    std::string getName() const
    {
        return name_;
    }

    /**
     * Owning identity for inline policies, empty for managed policies.
     */
    std::string getOwner() const
    {
        return owner_;
    }

    bool isInline() const
    {
        return !owner_.empty();
    }

    const std::vector<Statement>& getStatements() const
    {
        return statements_;
    }

 private:
    std::string id_;
    std::string name_;
    std::string owner_;
    std::vector<Statement> statements_;
};

} // namespace

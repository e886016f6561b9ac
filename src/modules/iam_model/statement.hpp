#pragma once

#include "effect.hpp"
#include "condition.hpp"
#include "principals.hpp"

#include <vector>
#include <string>

namespace iam_explorer {

class Statement {
 public:
    Statement(Effect effect, std::vector<std::string> actions, std::vector<std::string> resources,
              std::vector<Condition> conditions, Principals principals, const std::string& sid)
        : effect_(effect), actions_(actions), resources_(resources),
          conditions_(conditions), principals_(principals), sid_(sid)
    {
    }

    Effect getEffect() const
    {
        return effect_;
    }

    const std::vector<std::string>& getActions() const
    {
        return actions_;
    }

    const std::vector<std::string>& getResources() const
    {
        return resources_;
    }

    const std::vector<Condition>& getConditions() const
    {
        return conditions_;
    }

    bool hasConditions() const
    {
        return !conditions_.empty();
    }

    const Principals& getPrincipals() const
    {
        return principals_;
    }

    std::string getSid() const
    {
        return sid_;
    }

 private:
    Effect effect_;
    /**
     * Action and resource patterns, in document order. A pattern may
     * contain the wildcards * and ?.
     */
    std::vector<std::string> actions_;
    std::vector<std::string> resources_;
    std::vector<Condition> conditions_;
    Principals principals_;
    std::string sid_;
};

} // namespace

#pragma once

#include <string>

namespace iam_explorer {

enum class Effect {
    ALLOW,
    DENY
};

static inline std::string effectToString(Effect effect)
{
    if (effect == Effect::ALLOW) {
        return "Allow";
    }
    return "Deny";
}

static inline bool effectFromString(const std::string& str, Effect& effect)
{
    if (str == "Allow") {
        effect = Effect::ALLOW;
        return true;
    }
    if (str == "Deny") {
        effect = Effect::DENY;
        return true;
    }
    return false;
}

} // namespace

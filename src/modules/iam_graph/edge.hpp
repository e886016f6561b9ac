#pragma once

#include <string>

namespace iam_explorer {

enum class EdgeKind {
    MEMBER_OF,
    ATTACHED,
    TRUSTS
};

static inline std::string edgeKindToString(EdgeKind kind)
{
    switch (kind) {
        case EdgeKind::MEMBER_OF: return "MemberOf";
        case EdgeKind::ATTACHED: return "Attached";
        case EdgeKind::TRUSTS: return "Trusts";
    }
    return "Unknown";
}

/**
 * MEMBER_OF: user id -> group id
 * ATTACHED:  identity id -> policy id
 * TRUSTS:    principal pattern -> role id
 */
struct Edge {
    EdgeKind kind;
    std::string source;
    std::string target;

    bool operator==(const Edge& other) const
    {
        return kind == other.kind && source == other.source && target == other.target;
    }
};

} // namespace

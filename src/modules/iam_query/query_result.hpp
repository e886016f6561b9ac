#pragma once

#include <modules/iam_model/effect.hpp>
#include <modules/iam_model/identity.hpp>

#include <string>
#include <vector>

namespace iam_explorer {

/**
 * An identity which can perform the queried action, either with its
 * own effective policies (via is empty) or by assuming the chain of
 * roles in via.
 */
struct WhoCanDoEntry {
    std::string identityId;
    std::string identityName;
    IdentityType identityType;
    /**
     * Allowed action and resource patterns overlapping the query.
     */
    std::vector<std::string> actions;
    std::vector<std::string> resources;
    std::vector<std::string> policies;
    /**
     * Role names from the first assumed role to the granting role.
     */
    std::vector<std::string> via;
    bool conditional;

    std::string viaString() const;
};

struct WhoCanDoResult {
    std::vector<WhoCanDoEntry> entries;
    std::vector<std::string> warnings;
};

/**
 * One (action, resource, effect, source policy) tuple reachable from an
 * identity. attribution is "direct", "via-group:<group>" or
 * "via-role:<role>-><role>".
 */
struct PermissionEntry {
    std::string action;
    std::string resource;
    Effect effect;
    std::string policyId;
    std::string attribution;
    bool conditional;
};

struct WhatCanDoResult {
    std::string identityId;
    std::string identityName;
    IdentityType identityType;
    std::vector<PermissionEntry> permissions;
    /**
     * Every role chain the identity can assume, e.g. "Deploy" and
     * "Deploy->Admin".
     */
    std::vector<std::string> assumableRoles;
    std::vector<std::string> warnings;
};

} // namespace

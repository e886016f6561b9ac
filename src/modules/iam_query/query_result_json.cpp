#include "query_result_json.hpp"

namespace iam_explorer {

/**
 * Output
{
  "Entries": [
    {
      "Id": "arn:aws:iam::123456789012:user/alice",
      "Name": "alice",
      "Type": "User",
      "Actions": ["s3:*"],
      "Resources": ["*"],
      "Policies": ["arn:aws:iam::123456789012:policy/S3Full"],
      "Via": ["Deploy", "Admin"],
      "Conditional": false
    }
  ],
  "Warnings": []
}
*/
nlohmann::json QueryResultJson::whoCanDoToJson(const WhoCanDoResult& result)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : result.entries) {
        nlohmann::json entry;
        entry["Id"] = e.identityId;
        entry["Name"] = e.identityName;
        entry["Type"] = identityTypeToString(e.identityType);
        entry["Actions"] = e.actions;
        entry["Resources"] = e.resources;
        entry["Policies"] = e.policies;
        entry["Via"] = e.via;
        entry["Conditional"] = e.conditional;
        entries.push_back(entry);
    }
    nlohmann::json json;
    json["Entries"] = entries;
    json["Warnings"] = result.warnings;
    return json;
}

nlohmann::json QueryResultJson::whatCanDoToJson(const WhatCanDoResult& result)
{
    nlohmann::json permissions = nlohmann::json::array();
    for (const auto& p : result.permissions) {
        nlohmann::json permission;
        permission["Action"] = p.action;
        permission["Resource"] = p.resource;
        permission["Effect"] = effectToString(p.effect);
        permission["Policy"] = p.policyId;
        permission["Attribution"] = p.attribution;
        permission["Conditional"] = p.conditional;
        permissions.push_back(permission);
    }
    nlohmann::json json;
    json["Id"] = result.identityId;
    json["Name"] = result.identityName;
    json["Type"] = identityTypeToString(result.identityType);
    json["Permissions"] = permissions;
    json["AssumableRoles"] = result.assumableRoles;
    json["Warnings"] = result.warnings;
    return json;
}

nlohmann::json QueryResultJson::batchToJson(const std::vector<BatchResult>& results)
{
    nlohmann::json json = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json item;
        item["Action"] = r.actionPattern;
        if (r.ec) {
            item["Error"] = r.ec.message();
        } else {
            item["Result"] = whoCanDoToJson(r.result);
        }
        json.push_back(item);
    }
    return json;
}

} // namespace

#pragma once

#include <modules/iam_model/iam_builder.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace iam_explorer {

/**
 * Conversion between the snapshot JSON produced by the fetch
 * collaborator and Snapshot.
 *
 * Input format
{
  "users": [ { "arn": ..., "name": ..., "attached_policies": [...], "inline_policies": { name: document }, "groups": [...] } ],
  "groups": [ { "arn": ..., "name": ..., "attached_policies": [...], "inline_policies": {...} } ],
  "roles": [ { "arn": ..., "name": ..., "assume_role_policy": document, "attached_policies": [...], "inline_policies": {...} } ],
  "policies": [ { "arn": ..., "name": ..., "policy_document": document, "owner": optional identity arn } ]
}
 */
class SnapshotJson {
 public:
    /**
     * Returns false if a record is malformed, errorRecord is then the
     * arn or position of the record.
     */
    static bool snapshotFromJson(const nlohmann::json& json, Snapshot& snapshot, std::string& errorRecord);
    static nlohmann::json snapshotToJson(const Snapshot& snapshot);

    /**
     * Parse { "Version": ..., "Statement": [...] }. Statement may be a
     * single object.
     */
    static std::unique_ptr<PolicyBuilder> policyDocumentFromJson(const std::string& name, const nlohmann::json& document);
    static nlohmann::json policyDocumentToJson(const PolicyBuilder& policy);

    static std::unique_ptr<Statement> statementFromJson(const nlohmann::json& json);
    static nlohmann::json statementToJson(const Statement& statement);
};

} // namespace

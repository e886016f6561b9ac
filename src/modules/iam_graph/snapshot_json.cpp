#include "snapshot_json.hpp"

#include <initializer_list>
#include <sstream>

namespace iam_explorer {

static const std::string policyVersion = "2012-10-17";
static const std::string trustPolicyName = "AssumeRolePolicy";

/**
 * Load a string or an array of strings.
 */
static bool loadStrings(const nlohmann::json& json, std::vector<std::string>& out)
{
    if (json.is_string()) {
        out.push_back(json.get<std::string>());
        return true;
    }
    if (!json.is_array()) {
        return false;
    }
    for (auto item : json) {
        if (!item.is_string()) {
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

static nlohmann::json stringsToJson(const std::vector<std::string>& strings)
{
    if (strings.size() == 1) {
        return strings[0];
    }
    return strings;
}

static bool loadEffect(const nlohmann::json& statement, Effect& effect)
{
    auto it = statement.find("Effect");
    if (it == statement.end() || !it->is_string()) {
        return false;
    }
    return effectFromString(it->get<std::string>(), effect);
}

static bool loadActions(const nlohmann::json& statement, std::vector<std::string>& actions)
{
    auto it = statement.find("Action");
    if (it == statement.end()) {
        return false;
    }
    return loadStrings(*it, actions) && !actions.empty();
}

/**
 * The negated elements match everything except their patterns, which
 * the plain pattern sets of a Statement cannot express.
 */
static bool hasNegatedElements(const nlohmann::json& statement)
{
    for (const auto& key : { "NotAction", "NotResource", "NotPrincipal" }) {
        if (statement.find(key) != statement.end()) {
            return true;
        }
    }
    return false;
}

static bool loadResources(const nlohmann::json& statement, std::vector<std::string>& resources)
{
    auto it = statement.find("Resource");
    if (it == statement.end()) {
        // trust policies have no resource
        resources.push_back("*");
        return true;
    }
    return loadStrings(*it, resources) && !resources.empty();
}

/**
 * "Condition": { "IpAddress": { "aws:SourceIp": ["10.0.0.0/8"] }, "Bool": { "aws:MultiFactorAuthPresent": "true" } }
 */
static bool loadConditions(const nlohmann::json& statement, std::vector<Condition>& conditions)
{
    auto it = statement.find("Condition");
    if (it == statement.end()) {
        // no conditions is valid
        return true;
    }
    if (!it->is_object()) {
        return false;
    }
    for (auto op = it->begin(); op != it->end(); op++) {
        if (!op.value().is_object()) {
            return false;
        }
        for (auto kv = op.value().begin(); kv != op.value().end(); kv++) {
            std::vector<std::string> values;
            const nlohmann::json& v = kv.value();
            if (v.is_array()) {
                for (auto item : v) {
                    values.push_back(item.is_string() ? item.get<std::string>() : item.dump());
                }
            } else {
                values.push_back(v.is_string() ? v.get<std::string>() : v.dump());
            }
            conditions.push_back(Condition(op.key(), kv.key(), values));
        }
    }
    return true;
}

static bool loadPrincipals(const nlohmann::json& statement, Principals& principals)
{
    auto it = statement.find("Principal");
    if (it == statement.end()) {
        return true;
    }
    if (it->is_string()) {
        if (it->get<std::string>() != "*") {
            return false;
        }
        principals = Principals::any();
        return true;
    }
    if (!it->is_object()) {
        return false;
    }
    for (auto kind = it->begin(); kind != it->end(); kind++) {
        std::vector<std::string> values;
        if (!loadStrings(kind.value(), values)) {
            return false;
        }
        for (const auto& v : values) {
            principals.add(kind.key(), v);
        }
    }
    return true;
}

std::unique_ptr<Statement> SnapshotJson::statementFromJson(const nlohmann::json& json)
{
    if (!json.is_object()) {
        return nullptr;
    }
    Effect effect;
    std::vector<std::string> actions;
    std::vector<std::string> resources;
    std::vector<Condition> conditions;
    Principals principals;
    std::string sid;
    if (hasNegatedElements(json)) {
        return nullptr;
    }
    if (!loadEffect(json, effect)) {
        return nullptr;
    }
    if (!loadActions(json, actions)) {
        return nullptr;
    }
    if (!loadResources(json, resources)) {
        return nullptr;
    }
    if (!loadConditions(json, conditions)) {
        return nullptr;
    }
    if (!loadPrincipals(json, principals)) {
        return nullptr;
    }
    auto s = json.find("Sid");
    if (s != json.end() && s->is_string()) {
        sid = s->get<std::string>();
    }
    return std::unique_ptr<Statement>(new Statement(effect, actions, resources, conditions, principals, sid));
}

nlohmann::json SnapshotJson::statementToJson(const Statement& statement)
{
    nlohmann::json root;
    if (!statement.getSid().empty()) {
        root["Sid"] = statement.getSid();
    }
    root["Effect"] = effectToString(statement.getEffect());
    root["Action"] = stringsToJson(statement.getActions());
    root["Resource"] = stringsToJson(statement.getResources());

    if (!statement.getPrincipals().empty()) {
        nlohmann::json principals = nlohmann::json::object();
        for (const auto& kind : statement.getPrincipals().getMap()) {
            principals[kind.first] = stringsToJson(kind.second);
        }
        root["Principal"] = principals;
    }

    if (statement.hasConditions()) {
        nlohmann::json conditions = nlohmann::json::object();
        for (const auto& c : statement.getConditions()) {
            conditions[c.getOperator()][c.getKey()] = c.getValues();
        }
        root["Condition"] = conditions;
    }
    return root;
}

std::unique_ptr<PolicyBuilder> SnapshotJson::policyDocumentFromJson(const std::string& name, const nlohmann::json& document)
{
    if (!document.is_object()) {
        return nullptr;
    }
    auto it = document.find("Statement");
    if (it == document.end()) {
        return nullptr;
    }
    std::unique_ptr<PolicyBuilder> pb(new PolicyBuilder(name));
    if (it->is_object()) {
        auto s = statementFromJson(*it);
        if (!s) {
            return nullptr;
        }
        *pb = pb->addStatement(*s);
        return pb;
    }
    if (!it->is_array()) {
        return nullptr;
    }
    for (auto stmt : *it) {
        auto s = statementFromJson(stmt);
        if (!s) {
            return nullptr;
        }
        *pb = pb->addStatement(*s);
    }
    return pb;
}

nlohmann::json SnapshotJson::policyDocumentToJson(const PolicyBuilder& policy)
{
    nlohmann::json root;
    root["Version"] = policyVersion;
    nlohmann::json statements = nlohmann::json::array();
    for (const auto& s : policy.getStatements()) {
        statements.push_back(statementToJson(s));
    }
    root["Statement"] = statements;
    return root;
}

static bool loadString(const nlohmann::json& record, const std::string& key, std::string& out)
{
    auto it = record.find(key);
    if (it == record.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return !out.empty();
}

static std::string recordName(const std::string& collection, size_t index, const nlohmann::json& record)
{
    if (record.is_object()) {
        auto it = record.find("arn");
        if (it != record.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    std::stringstream ss;
    ss << collection << "[" << index << "]";
    return ss.str();
}

static bool loadIdentity(const nlohmann::json& record, IdentityType type, std::unique_ptr<IdentityBuilder>& out)
{
    if (!record.is_object()) {
        return false;
    }
    std::string arn;
    std::string name;
    if (!loadString(record, "arn", arn) || !loadString(record, "name", name)) {
        return false;
    }
    IdentityBuilder ib(type, arn);
    ib = ib.name(name);

    auto attached = record.find("attached_policies");
    if (attached != record.end()) {
        std::vector<std::string> policies;
        if (!attached->is_array() || !loadStrings(*attached, policies)) {
            return false;
        }
        for (const auto& p : policies) {
            ib = ib.addPolicy(p);
        }
    }

    auto inlinePolicies = record.find("inline_policies");
    if (inlinePolicies != record.end()) {
        if (!inlinePolicies->is_object()) {
            return false;
        }
        for (auto it = inlinePolicies->begin(); it != inlinePolicies->end(); it++) {
            auto pb = SnapshotJson::policyDocumentFromJson(it.key(), it.value());
            if (!pb) {
                return false;
            }
            ib = ib.addInlinePolicy(*pb);
        }
    }

    auto groups = record.find("groups");
    if (groups != record.end()) {
        std::vector<std::string> groupRefs;
        if (type != IdentityType::USER || !groups->is_array() || !loadStrings(*groups, groupRefs)) {
            return false;
        }
        for (const auto& g : groupRefs) {
            ib = ib.addGroup(g);
        }
    }

    auto trust = record.find("assume_role_policy");
    if (trust != record.end()) {
        if (type != IdentityType::ROLE) {
            return false;
        }
        auto pb = SnapshotJson::policyDocumentFromJson(trustPolicyName, *trust);
        if (!pb) {
            return false;
        }
        ib = ib.trustPolicy(*pb);
    } else if (type == IdentityType::ROLE) {
        return false;
    }

    out.reset(new IdentityBuilder(ib));
    return true;
}

static bool loadIdentities(const nlohmann::json& json, const std::string& collection, IdentityType type,
                           std::vector<IdentityBuilder>& out, std::string& errorRecord)
{
    auto it = json.find(collection);
    if (it == json.end()) {
        return true;
    }
    if (!it->is_array()) {
        errorRecord = collection;
        return false;
    }
    for (size_t i = 0; i < it->size(); i++) {
        const nlohmann::json& record = (*it)[i];
        std::unique_ptr<IdentityBuilder> ib;
        if (!loadIdentity(record, type, ib)) {
            errorRecord = recordName(collection, i, record);
            return false;
        }
        out.push_back(*ib);
    }
    return true;
}

static bool loadPolicies(const nlohmann::json& json, std::vector<PolicyBuilder>& out, std::string& errorRecord)
{
    auto it = json.find("policies");
    if (it == json.end()) {
        return true;
    }
    if (!it->is_array()) {
        errorRecord = "policies";
        return false;
    }
    for (size_t i = 0; i < it->size(); i++) {
        const nlohmann::json& record = (*it)[i];
        errorRecord = recordName("policies", i, record);
        if (!record.is_object()) {
            return false;
        }
        std::string name;
        if (!loadString(record, "name", name)) {
            return false;
        }
        auto document = record.find("policy_document");
        if (document == record.end()) {
            return false;
        }
        auto pb = SnapshotJson::policyDocumentFromJson(name, *document);
        if (!pb) {
            return false;
        }
        std::string owner;
        if (record.find("owner") != record.end()) {
            if (!loadString(record, "owner", owner)) {
                return false;
            }
            *pb = pb->owner(owner);
        } else {
            std::string arn;
            if (!loadString(record, "arn", arn)) {
                return false;
            }
            *pb = pb->id(arn);
        }
        out.push_back(*pb);
    }
    errorRecord.clear();
    return true;
}

bool SnapshotJson::snapshotFromJson(const nlohmann::json& json, Snapshot& snapshot, std::string& errorRecord)
{
    if (!json.is_object()) {
        errorRecord = "snapshot";
        return false;
    }
    Snapshot s;
    if (!loadIdentities(json, "users", IdentityType::USER, s.users, errorRecord) ||
        !loadIdentities(json, "groups", IdentityType::GROUP, s.groups, errorRecord) ||
        !loadIdentities(json, "roles", IdentityType::ROLE, s.roles, errorRecord) ||
        !loadPolicies(json, s.policies, errorRecord))
    {
        return false;
    }
    snapshot = s;
    return true;
}

static nlohmann::json policyToJson(const PolicyBuilder& p)
{
    nlohmann::json policy;
    policy["name"] = p.getName();
    if (p.getOwner().empty()) {
        policy["arn"] = p.getId();
    } else {
        policy["owner"] = p.getOwner();
    }
    policy["policy_document"] = SnapshotJson::policyDocumentToJson(p);
    return policy;
}

static nlohmann::json identityToJson(const IdentityBuilder& identity)
{
    nlohmann::json root;
    root["arn"] = identity.getId();
    root["name"] = identity.getName();
    root["attached_policies"] = identity.getPolicies();
    if (identity.getType() == IdentityType::USER) {
        root["groups"] = identity.getGroups();
    }
    if (identity.hasTrustPolicy()) {
        root["assume_role_policy"] = SnapshotJson::policyDocumentToJson(identity.getTrustPolicy());
    }
    return root;
}

nlohmann::json SnapshotJson::snapshotToJson(const Snapshot& snapshot)
{
    nlohmann::json root;
    nlohmann::json users = nlohmann::json::array();
    nlohmann::json groups = nlohmann::json::array();
    nlohmann::json roles = nlohmann::json::array();
    nlohmann::json policies = nlohmann::json::array();
    for (const auto& u : snapshot.users) {
        users.push_back(identityToJson(u));
    }
    for (const auto& g : snapshot.groups) {
        groups.push_back(identityToJson(g));
    }
    for (const auto& r : snapshot.roles) {
        roles.push_back(identityToJson(r));
    }
    for (const auto& p : snapshot.policies) {
        policies.push_back(policyToJson(p));
    }
    // Inline policies are written as owned policy records, json objects
    // do not keep the order of the inline_policies map.
    for (const auto* collection : { &snapshot.users, &snapshot.groups, &snapshot.roles }) {
        for (const auto& identity : *collection) {
            for (const auto& p : identity.getInlinePolicies()) {
                policies.push_back(policyToJson(p));
            }
        }
    }
    root["users"] = users;
    root["groups"] = groups;
    root["roles"] = roles;
    root["policies"] = policies;
    return root;
}

} // namespace

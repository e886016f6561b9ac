#include <boost/test/unit_test.hpp>

#include <modules/iam_query/query_engine.hpp>

#include "../../util/graph_fixture.hpp"

BOOST_TEST_DONT_PRINT_LOG_VALUE(iam_explorer::Effect)
BOOST_TEST_DONT_PRINT_LOG_VALUE(iam_explorer::IdentityType)

namespace iam_explorer {
namespace test {

namespace {

std::string conditionalTrust = R"(
{
  "users": [
    { "arn": "arn:aws:iam::111111111111:user/u", "name": "u" }
  ],
  "roles": [
    {
      "arn": "arn:aws:iam::111111111111:role/R",
      "name": "R",
      "assume_role_policy": {
        "Statement": [
          {
            "Sid": "RequireMfa",
            "Effect": "Allow",
            "Action": "sts:AssumeRole",
            "Principal": { "AWS": "arn:aws:iam::111111111111:user/u" },
            "Condition": { "Bool": { "aws:MultiFactorAuthPresent": "true" } }
          }
        ]
      },
      "inline_policies": {
        "Invoke": { "Statement": [ { "Effect": "Allow", "Action": "lambda:InvokeFunction", "Resource": "*" } ] }
      }
    }
  ]
}
)";

std::string denyOverridesGroupAllow = R"(
{
  "users": [
    {
      "arn": "arn:aws:iam::111122223333:user/U",
      "name": "U",
      "groups": ["G"],
      "inline_policies": {
        "NoBucketDelete": { "Statement": [ { "Effect": "Deny", "Action": "s3:DeleteBucket", "Resource": "*" } ] }
      }
    }
  ],
  "groups": [
    {
      "arn": "arn:aws:iam::111122223333:group/G",
      "name": "G",
      "attached_policies": ["arn:aws:iam::111122223333:policy/S3"]
    }
  ],
  "policies": [
    {
      "arn": "arn:aws:iam::111122223333:policy/S3",
      "name": "S3",
      "policy_document": { "Statement": [ { "Effect": "Allow", "Action": "s3:*", "Resource": "*" } ] }
    }
  ]
}
)";

std::string roleAssumption = R"(
{
  "users": [
    { "arn": "arn:aws:iam::111122223333:user/U", "name": "U" },
    { "arn": "arn:aws:iam::111122223333:user/Blocked", "name": "Blocked" }
  ],
  "roles": [
    {
      "arn": "arn:aws:iam::111122223333:role/R",
      "name": "R",
      "assume_role_policy": {
        "Statement": [
          { "Effect": "Allow", "Action": "sts:AssumeRole", "Principal": { "AWS": "arn:aws:iam::111122223333:user/U" } }
        ]
      },
      "attached_policies": ["arn:aws:iam::111122223333:policy/Invoke"]
    },
    {
      "arn": "arn:aws:iam::111122223333:role/AccountWide",
      "name": "AccountWide",
      "assume_role_policy": {
        "Statement": [
          { "Effect": "Allow", "Action": "sts:AssumeRole", "Principal": { "AWS": "arn:aws:iam::111122223333:root" } },
          { "Effect": "Deny", "Action": "sts:AssumeRole", "Principal": { "AWS": "arn:aws:iam::111122223333:user/Blocked" } }
        ]
      }
    },
    {
      "arn": "arn:aws:iam::111122223333:role/OtherAccount",
      "name": "OtherAccount",
      "assume_role_policy": {
        "Statement": [
          { "Effect": "Allow", "Action": "sts:AssumeRole", "Principal": { "AWS": "444455556666" } }
        ]
      }
    }
  ],
  "policies": [
    {
      "arn": "arn:aws:iam::111122223333:policy/Invoke",
      "name": "Invoke",
      "policy_document": { "Statement": [ { "Effect": "Allow", "Action": "lambda:InvokeFunction", "Resource": "*" } ] }
    }
  ]
}
)";

std::string trustCycle = R"(
{
  "users": [
    { "arn": "arn:aws:iam::111122223333:user/U", "name": "U" }
  ],
  "roles": [
    {
      "arn": "arn:aws:iam::111122223333:role/A",
      "name": "A",
      "assume_role_policy": {
        "Statement": [
          {
            "Effect": "Allow",
            "Action": "sts:AssumeRole",
            "Principal": { "AWS": ["arn:aws:iam::111122223333:user/U", "arn:aws:iam::111122223333:role/B"] }
          }
        ]
      },
      "inline_policies": {
        "ReadData": { "Statement": [ { "Effect": "Allow", "Action": "s3:GetObject", "Resource": "*" } ] }
      }
    },
    {
      "arn": "arn:aws:iam::111122223333:role/B",
      "name": "B",
      "assume_role_policy": {
        "Statement": [
          { "Effect": "Allow", "Action": "sts:AssumeRole", "Principal": { "AWS": "arn:aws:iam::111122223333:role/A" } }
        ]
      },
      "inline_policies": {
        "Start": { "Statement": [ { "Effect": "Allow", "Action": "ec2:StartInstances", "Resource": "*" } ] }
      }
    }
  ]
}
)";

std::string sharedPolicy = R"(
{
  "users": [
    {
      "arn": "arn:aws:iam::111122223333:user/U",
      "name": "U",
      "groups": ["G"],
      "attached_policies": ["arn:aws:iam::111122223333:policy/P"]
    }
  ],
  "groups": [
    {
      "arn": "arn:aws:iam::111122223333:group/G",
      "name": "G",
      "attached_policies": ["arn:aws:iam::111122223333:policy/P"]
    }
  ],
  "policies": [
    {
      "arn": "arn:aws:iam::111122223333:policy/P",
      "name": "P",
      "policy_document": { "Statement": [ { "Effect": "Allow", "Action": "sqs:SendMessage", "Resource": "*" } ] }
    }
  ]
}
)";

const PermissionEntry* findPermission(const WhatCanDoResult& result, const std::string& action)
{
    for (const auto& p : result.permissions) {
        if (p.action == action) {
            return &p;
        }
    }
    return nullptr;
}

} // namespace

BOOST_AUTO_TEST_SUITE(what_can_do)

BOOST_AUTO_TEST_CASE(direct_and_group_permissions)
{
    auto graph = buildGraph(sampleSnapshot);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("alice", result));
    BOOST_TEST(result.identityId == "arn:aws:iam::123456789012:user/alice");
    BOOST_TEST(result.identityName == "alice");
    BOOST_TEST(result.identityType == IdentityType::USER);
    BOOST_REQUIRE(result.permissions.size() == (size_t)3);

    BOOST_TEST(result.permissions[0].action == "s3:Get*");
    BOOST_TEST(result.permissions[0].resource == "*");
    BOOST_TEST(result.permissions[0].effect == Effect::ALLOW);
    BOOST_TEST(result.permissions[0].policyId == "arn:aws:iam::aws:policy/ReadOnlyAccess");
    BOOST_TEST(result.permissions[0].attribution == "direct");
    BOOST_TEST(result.permissions[1].action == "s3:List*");

    BOOST_TEST(result.permissions[2].action == "s3:*");
    BOOST_TEST(result.permissions[2].resource == "arn:aws:s3:::data/*");
    BOOST_TEST(result.permissions[2].attribution == "via-group:Developers");

    BOOST_TEST(result.assumableRoles.empty());
    BOOST_TEST(result.warnings.empty());
}

BOOST_AUTO_TEST_CASE(lookup_by_id)
{
    auto graph = buildGraph(sampleSnapshot);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("arn:aws:iam::123456789012:group/Developers", result));
    BOOST_TEST(result.identityType == IdentityType::GROUP);
    BOOST_REQUIRE(result.permissions.size() == (size_t)1);
    BOOST_TEST(result.permissions[0].attribution == "direct");
}

BOOST_AUTO_TEST_CASE(unknown_identity)
{
    auto graph = buildGraph(sampleSnapshot);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_TEST(engine.whatCanDo("mallory", result) == make_error_code(IamExplorerError::unknown_identity));
    BOOST_TEST(engine.whatCanDo("arn:aws:iam::123456789012:user/mallory", result) == make_error_code(IamExplorerError::unknown_identity));
}

BOOST_AUTO_TEST_CASE(explicit_deny_is_reported)
{
    auto graph = buildGraph(denyOverridesGroupAllow);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("U", result));
    BOOST_REQUIRE(result.permissions.size() == (size_t)2);

    const PermissionEntry* deny = findPermission(result, "s3:DeleteBucket");
    BOOST_REQUIRE(deny);
    BOOST_TEST(deny->effect == Effect::DENY);
    BOOST_TEST(deny->attribution == "direct");
    BOOST_TEST(deny->policyId == "arn:aws:iam::111122223333:user/U#NoBucketDelete");

    const PermissionEntry* allow = findPermission(result, "s3:*");
    BOOST_REQUIRE(allow);
    BOOST_TEST(allow->effect == Effect::ALLOW);
    BOOST_TEST(allow->attribution == "via-group:G");
}

BOOST_AUTO_TEST_CASE(role_assumption)
{
    auto graph = buildGraph(roleAssumption);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("U", result));

    const PermissionEntry* invoke = findPermission(result, "lambda:InvokeFunction");
    BOOST_REQUIRE(invoke);
    BOOST_TEST(invoke->attribution == "via-role:R");
    BOOST_TEST(invoke->policyId == "arn:aws:iam::111122223333:policy/Invoke");

    // R by name, AccountWide through the account root
    std::vector<std::string> roles = { "R", "AccountWide" };
    BOOST_TEST(result.assumableRoles == roles, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(trust_deny_and_other_accounts)
{
    auto graph = buildGraph(roleAssumption);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("Blocked", result));
    BOOST_TEST(result.assumableRoles.empty());
    BOOST_TEST(result.permissions.empty());
}

BOOST_AUTO_TEST_CASE(transitive_roles)
{
    auto graph = buildGraph(sampleSnapshot);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("carol", result));

    std::vector<std::string> roles = { "Deploy", "Deploy->Ops" };
    BOOST_TEST(result.assumableRoles == roles, boost::test_tools::per_element());
    BOOST_REQUIRE(result.permissions.size() == (size_t)2);
    BOOST_TEST(result.permissions[0].action == "lambda:InvokeFunction");
    BOOST_TEST(result.permissions[0].attribution == "via-role:Deploy");
    BOOST_TEST(!result.permissions[0].conditional);
    BOOST_TEST(result.permissions[1].action == "iam:*");
    BOOST_TEST(result.permissions[1].attribution == "via-role:Deploy->Ops");
    BOOST_TEST(result.permissions[1].conditional);
    BOOST_TEST(result.warnings.size() == (size_t)1);
}

BOOST_AUTO_TEST_CASE(trust_cycle_terminates)
{
    auto graph = buildGraph(trustCycle);
    QueryEngine engine(*graph);

    WhatCanDoResult user;
    BOOST_REQUIRE(!engine.whatCanDo("U", user));
    std::vector<std::string> roles = { "A", "A->B" };
    BOOST_TEST(user.assumableRoles == roles, boost::test_tools::per_element());
    BOOST_REQUIRE(user.permissions.size() == (size_t)2);
    BOOST_TEST(user.permissions[0].action == "s3:GetObject");
    BOOST_TEST(user.permissions[0].attribution == "via-role:A");
    BOOST_TEST(user.permissions[1].action == "ec2:StartInstances");
    BOOST_TEST(user.permissions[1].attribution == "via-role:A->B");

    WhatCanDoResult a;
    BOOST_REQUIRE(!engine.whatCanDo("A", a));
    roles = { "B" };
    BOOST_TEST(a.assumableRoles == roles, boost::test_tools::per_element());
    BOOST_REQUIRE(a.permissions.size() == (size_t)2);
    BOOST_TEST(a.permissions[0].attribution == "direct");
    BOOST_TEST(a.permissions[1].attribution == "via-role:B");
}

BOOST_AUTO_TEST_CASE(same_policy_reported_once)
{
    auto graph = buildGraph(sharedPolicy);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("U", result));
    BOOST_REQUIRE(result.permissions.size() == (size_t)1);
    BOOST_TEST(result.permissions[0].attribution == "direct");
}

BOOST_AUTO_TEST_CASE(idempotent)
{
    auto graph = buildGraph(sampleSnapshot);
    QueryEngine engine(*graph);
    for (const auto& identity : graph->allIdentities()) {
        WhatCanDoResult first;
        WhatCanDoResult second;
        BOOST_REQUIRE(!engine.whatCanDo(identity->getId(), first));
        BOOST_REQUIRE(!engine.whatCanDo(identity->getId(), second));
        BOOST_REQUIRE(first.permissions.size() == second.permissions.size());
        for (size_t i = 0; i < first.permissions.size(); i++) {
            BOOST_TEST(first.permissions[i].action == second.permissions[i].action);
            BOOST_TEST(first.permissions[i].resource == second.permissions[i].resource);
            BOOST_TEST(first.permissions[i].policyId == second.permissions[i].policyId);
            BOOST_TEST(first.permissions[i].attribution == second.permissions[i].attribution);
        }
        BOOST_TEST(first.assumableRoles == second.assumableRoles, boost::test_tools::per_element());
    }
}

BOOST_AUTO_TEST_CASE(conditional_trust_marks_role_permissions)
{
    auto graph = buildGraph(conditionalTrust);
    QueryEngine engine(*graph);
    WhatCanDoResult result;
    BOOST_REQUIRE(!engine.whatCanDo("u", result));

    std::vector<std::string> roles = { "R" };
    BOOST_TEST(result.assumableRoles == roles, boost::test_tools::per_element());
    BOOST_REQUIRE(result.permissions.size() == (size_t)1);
    BOOST_TEST(result.permissions[0].action == "lambda:InvokeFunction");
    BOOST_TEST(result.permissions[0].attribution == "via-role:R");
    BOOST_TEST(result.permissions[0].conditional);
    BOOST_REQUIRE(result.warnings.size() == (size_t)1);
    BOOST_TEST(result.warnings[0].find("RequireMfa") != std::string::npos);

    // the role itself holds the permission unconditionally
    WhatCanDoResult role;
    BOOST_REQUIRE(!engine.whatCanDo("R", role));
    BOOST_REQUIRE(role.permissions.size() == (size_t)1);
    BOOST_TEST(!role.permissions[0].conditional);
    BOOST_TEST(role.warnings.empty());
}

BOOST_AUTO_TEST_SUITE_END()

} } // namespace

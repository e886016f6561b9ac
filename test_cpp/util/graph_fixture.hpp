#pragma once

#include <iam_explorer/iam_explorer_error.hpp>
#include <modules/iam_graph/graph_builder.hpp>
#include <modules/iam_graph/snapshot_json.hpp>

#include <boost/test/unit_test.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace iam_explorer {
namespace test {

/**
 * Three users, two groups and two roles in account 123456789012.
 *
 * alice is member of Developers and has the AWS managed read only
 * policy. bob is member of Admins (allow everything) with an inline
 * deny of s3:Delete*. carol can assume Deploy, Deploy can assume Ops.
 */
static const std::string sampleSnapshot = R"(
{
  "users": [
    {
      "arn": "arn:aws:iam::123456789012:user/alice",
      "name": "alice",
      "groups": ["Developers"],
      "attached_policies": ["arn:aws:iam::aws:policy/ReadOnlyAccess"]
    },
    {
      "arn": "arn:aws:iam::123456789012:user/bob",
      "name": "bob",
      "groups": ["arn:aws:iam::123456789012:group/Admins"],
      "inline_policies": {
        "NoDeletes": {
          "Version": "2012-10-17",
          "Statement": { "Effect": "Deny", "Action": "s3:Delete*", "Resource": "*" }
        }
      }
    },
    {
      "arn": "arn:aws:iam::123456789012:user/carol",
      "name": "carol"
    }
  ],
  "groups": [
    {
      "arn": "arn:aws:iam::123456789012:group/Developers",
      "name": "Developers",
      "attached_policies": ["arn:aws:iam::123456789012:policy/S3Data"]
    },
    {
      "arn": "arn:aws:iam::123456789012:group/Admins",
      "name": "Admins",
      "inline_policies": {
        "AdminAccess": {
          "Version": "2012-10-17",
          "Statement": [ { "Effect": "Allow", "Action": "*", "Resource": "*" } ]
        }
      }
    }
  ],
  "roles": [
    {
      "arn": "arn:aws:iam::123456789012:role/Deploy",
      "name": "Deploy",
      "assume_role_policy": {
        "Version": "2012-10-17",
        "Statement": [
          {
            "Effect": "Allow",
            "Action": "sts:AssumeRole",
            "Principal": { "AWS": "arn:aws:iam::123456789012:user/carol" }
          }
        ]
      },
      "attached_policies": ["arn:aws:iam::123456789012:policy/LambdaInvoke"]
    },
    {
      "arn": "arn:aws:iam::123456789012:role/Ops",
      "name": "Ops",
      "assume_role_policy": {
        "Version": "2012-10-17",
        "Statement": [
          {
            "Effect": "Allow",
            "Action": "sts:AssumeRole",
            "Principal": {
              "AWS": ["arn:aws:iam::123456789012:role/Deploy"],
              "Service": "ec2.amazonaws.com"
            }
          }
        ]
      },
      "inline_policies": {
        "OpsIam": {
          "Version": "2012-10-17",
          "Statement": [
            {
              "Sid": "MfaOnly",
              "Effect": "Allow",
              "Action": "iam:*",
              "Resource": "*",
              "Condition": { "Bool": { "aws:MultiFactorAuthPresent": "true" } }
            }
          ]
        }
      }
    }
  ],
  "policies": [
    {
      "arn": "arn:aws:iam::aws:policy/ReadOnlyAccess",
      "name": "ReadOnlyAccess",
      "policy_document": {
        "Version": "2012-10-17",
        "Statement": [ { "Effect": "Allow", "Action": ["s3:Get*", "s3:List*"], "Resource": "*" } ]
      }
    },
    {
      "arn": "arn:aws:iam::123456789012:policy/S3Data",
      "name": "S3Data",
      "policy_document": {
        "Version": "2012-10-17",
        "Statement": [ { "Effect": "Allow", "Action": "s3:*", "Resource": "arn:aws:s3:::data/*" } ]
      }
    },
    {
      "arn": "arn:aws:iam::123456789012:policy/LambdaInvoke",
      "name": "LambdaInvoke",
      "policy_document": {
        "Version": "2012-10-17",
        "Statement": [ { "Effect": "Allow", "Action": "lambda:InvokeFunction", "Resource": "*" } ]
      }
    }
  ]
}
)";

static inline Snapshot loadSnapshot(const std::string& snapshotJson)
{
    Snapshot snapshot;
    std::string errorRecord;
    bool status = SnapshotJson::snapshotFromJson(nlohmann::json::parse(snapshotJson), snapshot, errorRecord);
    BOOST_REQUIRE_MESSAGE(status, "invalid record " << errorRecord);
    return snapshot;
}

static inline std::unique_ptr<Graph> buildGraph(const std::string& snapshotJson)
{
    GraphBuilder builder;
    lib::error_code ec;
    auto graph = builder.build(loadSnapshot(snapshotJson), ec);
    BOOST_REQUIRE_MESSAGE(graph, "cannot build graph " << ec.message() << " " << builder.getErrorRecord());
    return graph;
}

} } // namespace

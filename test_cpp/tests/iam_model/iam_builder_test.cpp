#include <boost/test/unit_test.hpp>

#include <modules/iam_model/iam_builder.hpp>

BOOST_TEST_DONT_PRINT_LOG_VALUE(iam_explorer::Effect)
BOOST_TEST_DONT_PRINT_LOG_VALUE(iam_explorer::IdentityType)

namespace iam_explorer {
namespace test {

BOOST_AUTO_TEST_SUITE(iam_builder)

BOOST_AUTO_TEST_CASE(statement)
{
    Statement s = StatementBuilder(Effect::ALLOW)
        .sid("S1")
        .deny()
        .addAction("s3:GetObject")
        .addResource("arn:aws:s3:::b/*")
        .addCondition(Condition("StringEquals", "aws:PrincipalTag/team", { "infra" }))
        .build();
    BOOST_TEST(s.getEffect() == Effect::DENY);
    BOOST_TEST(s.getSid() == "S1");
    BOOST_TEST(s.hasConditions());
    BOOST_TEST(s.getConditions()[0].getKey() == "aws:PrincipalTag/team");
    BOOST_TEST(s.getPrincipals().empty());
}

BOOST_AUTO_TEST_CASE(managed_and_inline_policy_ids)
{
    PolicyBuilder managed = PolicyBuilder("ReadOnly").id("arn:aws:iam::aws:policy/ReadOnly");
    BOOST_TEST(managed.getId() == "arn:aws:iam::aws:policy/ReadOnly");
    BOOST_TEST(!managed.build().isInline());

    IdentityBuilder user = IdentityBuilder(IdentityType::USER, "arn:aws:iam::1:user/u")
        .addInlinePolicy(PolicyBuilder("Mine").addStatement(StatementBuilder(Effect::ALLOW).addAction("*").addResource("*")));
    BOOST_REQUIRE(user.getInlinePolicies().size() == (size_t)1);
    Policy p = user.getInlinePolicies()[0].build();
    BOOST_TEST(p.getId() == "arn:aws:iam::1:user/u#Mine");
    BOOST_TEST(p.getOwner() == "arn:aws:iam::1:user/u");
    BOOST_TEST(p.isInline());
}

BOOST_AUTO_TEST_CASE(trust_policy)
{
    IdentityBuilder role(IdentityType::ROLE, "arn:aws:iam::1:role/r");
    BOOST_TEST(!role.hasTrustPolicy());
    role = role.trustPolicy(PolicyBuilder("AssumeRolePolicy")
                            .addStatement(StatementBuilder(Effect::ALLOW).addAction("sts:AssumeRole").addPrincipal("AWS", "*")));
    BOOST_TEST(role.hasTrustPolicy());
    BOOST_TEST(role.getTrustPolicy().getId() == "arn:aws:iam::1:role/r!trust");
    BOOST_TEST(role.getTrustPolicy().getStatements()[0].getPrincipals().get("AWS")[0] == "*");
}

BOOST_AUTO_TEST_CASE(trust_policy_id_differs_from_inline_policy_of_same_name)
{
    IdentityBuilder role = IdentityBuilder(IdentityType::ROLE, "arn:aws:iam::1:role/r")
        .addInlinePolicy(PolicyBuilder("AssumeRolePolicy"))
        .trustPolicy(PolicyBuilder("AssumeRolePolicy"));
    BOOST_TEST(role.getInlinePolicies()[0].getId() == "arn:aws:iam::1:role/r#AssumeRolePolicy");
    BOOST_TEST(role.getTrustPolicy().getId() == "arn:aws:iam::1:role/r!trust");
    BOOST_TEST(role.getTrustPolicy().build().getName() == "AssumeRolePolicy");
}

BOOST_AUTO_TEST_CASE(identity_type_names)
{
    IdentityType t;
    BOOST_TEST(identityTypeToString(IdentityType::ROLE) == "Role");
    BOOST_TEST(identityTypeFromString("Group", t));
    BOOST_TEST(t == IdentityType::GROUP);
    BOOST_TEST(!identityTypeFromString("group", t));

    Effect e;
    BOOST_TEST(effectFromString("Deny", e));
    BOOST_TEST(e == Effect::DENY);
    BOOST_TEST(!effectFromString("deny", e));
}

BOOST_AUTO_TEST_SUITE_END()

} } // namespace

#pragma once

#include <modules/iam_model/identity.hpp>
#include <modules/iam_model/policy.hpp>
#include <modules/iam_model/statement.hpp>

#include <memory>
#include <string>
#include <vector>

namespace iam_explorer {

enum class Decision {
    ALLOW,
    DENY,
    IMPLICIT_DENY
};

std::string decisionToString(Decision decision);

/**
 * Outcome of evaluating a set of policy documents against one
 * (action, resource) pair.
 */
struct Verdict {
    Decision decision;
    /**
     * Id of the policy holding the deciding statement. The first
     * matching Deny for DENY, the first matching Allow for ALLOW and
     * empty for IMPLICIT_DENY.
     */
    std::string policyId;
    /**
     * True if a matching statement carried a Condition block which was
     * treated as satisfied.
     */
    bool conditional;
};

/**
 * A statement of a policy, by position.
 */
struct StatementRef {
    std::shared_ptr<const Policy> policy;
    size_t index;

    const Statement& statement() const { return policy->getStatements()[index]; }
};

/**
 * An allowed (action pattern, resource pattern) pair of one Allow
 * statement which is not cancelled by a Deny.
 */
struct PatternGrant {
    std::string action;
    std::string resource;
    StatementRef source;
};

/**
 * Outcome of evaluating a set of policy documents against an (action
 * pattern, resource pattern) query.
 */
struct PatternVerdict {
    std::vector<PatternGrant> grants;
    /**
     * Statements with a Condition block the outcome depends on, either
     * a granting Allow or a cancelling Deny, in scan order. A statement
     * can be listed more than once.
     */
    std::vector<StatementRef> conditional;
};

/**
 * Outcome of checking a trust policy for one principal.
 */
struct Assumption {
    bool allowed;
    /**
     * Set when every Allow statement designating the principal has a
     * Condition block. statement is the first of them.
     */
    bool conditional;
    size_t statement;
};

class PolicyEvaluator {
 public:
    /**
     * True iff the action matches one of the statement actions and the
     * resource matches one of the statement resources. Conditions are
     * ignored.
     */
    static bool matches(const Statement& statement, const std::string& action, const std::string& resource);

    /**
     * Pattern version of matches, true if some concrete (action,
     * resource) pair is matched by both the statement and the
     * patterns.
     */
    static bool overlaps(const Statement& statement, const std::string& actionPattern, const std::string& resourcePattern);

    /**
     * Scan every statement of every policy. Any matching Deny gives
     * DENY, else any matching Allow gives ALLOW, else IMPLICIT_DENY.
     */
    static Verdict evaluate(const std::vector<std::shared_ptr<const Policy> >& policies, const std::string& action, const std::string& resource);

    /**
     * Pattern version of evaluate. Every allowed pair of statement
     * patterns overlapping the query is a grant unless a Deny cancels
     * it. A Deny cancels the pair when one of its actions covers the
     * allowed action or the action pattern and one of its resources
     * covers the allowed resource or the resource pattern. A Deny which
     * only partially overlaps never cancels.
     */
    static PatternVerdict evaluatePattern(const std::vector<std::shared_ptr<const Policy> >& policies,
                                          const std::string& actionPattern, const std::string& resourcePattern);

    /**
     * Decide if the trust policy of a role lets the principal assume
     * the role with sts:AssumeRole.
     */
    static Assumption evaluateAssumption(const Policy& trustPolicy, const Identity& principal);

    static bool allowsAssumption(const Policy& trustPolicy, const Identity& principal)
    {
        return evaluateAssumption(trustPolicy, principal).allowed;
    }

    /**
     * True if an AWS principal pattern designates the principal. The
     * pattern is either a wildcard pattern over the principal ARN, the
     * account root "arn:aws:iam::<account>:root" or a bare account id.
     */
    static bool principalMatches(const std::string& pattern, const std::string& principalArn);

    /**
     * The account field of an ARN, empty if the ARN is not well formed.
     */
    static std::string accountOf(const std::string& arn);
};

} // namespace

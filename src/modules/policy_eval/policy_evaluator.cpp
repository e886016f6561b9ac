#include "policy_evaluator.hpp"
#include "wildcard.hpp"

namespace iam_explorer {

static const std::string assumeRoleAction = "sts:AssumeRole";

std::string decisionToString(Decision decision)
{
    switch (decision) {
        case Decision::ALLOW: return "Allow";
        case Decision::DENY: return "Deny";
        case Decision::IMPLICIT_DENY: return "ImplicitDeny";
    }
    return "Unknown";
}

static bool matchAny(const std::vector<std::string>& patterns, const std::string& value)
{
    for (const auto& p : patterns) {
        if (Wildcard::match(p, value)) {
            return true;
        }
    }
    return false;
}

static bool overlapAny(const std::vector<std::string>& patterns, const std::string& pattern)
{
    for (const auto& p : patterns) {
        if (Wildcard::overlaps(p, pattern)) {
            return true;
        }
    }
    return false;
}

bool PolicyEvaluator::matches(const Statement& statement, const std::string& action, const std::string& resource)
{
    return matchAny(statement.getActions(), action) && matchAny(statement.getResources(), resource);
}

bool PolicyEvaluator::overlaps(const Statement& statement, const std::string& actionPattern, const std::string& resourcePattern)
{
    return overlapAny(statement.getActions(), actionPattern) && overlapAny(statement.getResources(), resourcePattern);
}

Verdict PolicyEvaluator::evaluate(const std::vector<std::shared_ptr<const Policy> >& policies, const std::string& action, const std::string& resource)
{
    std::string denyPolicy;
    std::string allowPolicy;
    bool denied = false;
    bool allowed = false;
    bool denyConditional = false;
    bool allowConditional = false;

    // The whole set is scanned before deciding, a Deny in a later
    // document must still win over an earlier Allow.
    for (const auto& policy : policies) {
        for (const auto& stmt : policy->getStatements()) {
            if (!matches(stmt, action, resource)) {
                continue;
            }
            if (stmt.getEffect() == Effect::DENY) {
                if (!denied) {
                    denyPolicy = policy->getId();
                }
                denied = true;
                denyConditional = denyConditional || stmt.hasConditions();
            } else {
                if (!allowed) {
                    allowPolicy = policy->getId();
                }
                allowed = true;
                allowConditional = allowConditional || stmt.hasConditions();
            }
        }
    }

    if (denied) {
        return Verdict{ Decision::DENY, denyPolicy, denyConditional };
    }
    if (allowed) {
        return Verdict{ Decision::ALLOW, allowPolicy, allowConditional };
    }
    return Verdict{ Decision::IMPLICIT_DENY, "", false };
}

static bool coversAny(const std::vector<std::string>& patterns, const std::string& allowed, const std::string& queried)
{
    for (const auto& p : patterns) {
        if (Wildcard::covers(p, allowed) || Wildcard::covers(p, queried)) {
            return true;
        }
    }
    return false;
}

PatternVerdict PolicyEvaluator::evaluatePattern(const std::vector<std::shared_ptr<const Policy> >& policies,
                                                const std::string& actionPattern, const std::string& resourcePattern)
{
    std::vector<StatementRef> denies;
    for (const auto& policy : policies) {
        const auto& statements = policy->getStatements();
        for (size_t i = 0; i < statements.size(); i++) {
            if (statements[i].getEffect() == Effect::DENY) {
                denies.push_back(StatementRef{ policy, i });
            }
        }
    }

    PatternVerdict verdict;
    for (const auto& policy : policies) {
        const auto& statements = policy->getStatements();
        for (size_t i = 0; i < statements.size(); i++) {
            const Statement& stmt = statements[i];
            if (stmt.getEffect() != Effect::ALLOW || !overlaps(stmt, actionPattern, resourcePattern)) {
                continue;
            }
            for (const auto& action : stmt.getActions()) {
                if (!Wildcard::overlaps(action, actionPattern)) {
                    continue;
                }
                for (const auto& resource : stmt.getResources()) {
                    if (!Wildcard::overlaps(resource, resourcePattern)) {
                        continue;
                    }
                    const StatementRef* cancelledBy = nullptr;
                    for (const auto& d : denies) {
                        if (coversAny(d.statement().getActions(), action, actionPattern) &&
                            coversAny(d.statement().getResources(), resource, resourcePattern))
                        {
                            cancelledBy = &d;
                            break;
                        }
                    }
                    if (cancelledBy) {
                        if (cancelledBy->statement().hasConditions()) {
                            verdict.conditional.push_back(*cancelledBy);
                        }
                        continue;
                    }
                    verdict.grants.push_back(PatternGrant{ action, resource, StatementRef{ policy, i } });
                    if (stmt.hasConditions()) {
                        verdict.conditional.push_back(StatementRef{ policy, i });
                    }
                }
            }
        }
    }
    return verdict;
}

std::string PolicyEvaluator::accountOf(const std::string& arn)
{
    // arn:partition:service:region:account:resource
    size_t pos = 0;
    for (int field = 0; field < 4; field++) {
        pos = arn.find(':', pos);
        if (pos == std::string::npos) {
            return "";
        }
        pos++;
    }
    size_t end = arn.find(':', pos);
    if (end == std::string::npos || arn.compare(0, 4, "arn:") != 0) {
        return "";
    }
    return arn.substr(pos, end - pos);
}

static bool isAccountId(const std::string& s)
{
    if (s.size() != 12) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

bool PolicyEvaluator::principalMatches(const std::string& pattern, const std::string& principalArn)
{
    if (Wildcard::match(pattern, principalArn)) {
        return true;
    }
    std::string account = accountOf(principalArn);
    if (account.empty()) {
        return false;
    }
    if (isAccountId(pattern)) {
        return pattern == account;
    }
    return accountOf(pattern) == account && pattern.size() > 5 && pattern.compare(pattern.size() - 5, 5, ":root") == 0;
}

static bool statementDesignates(const Statement& stmt, const Identity& principal)
{
    if (!matchAny(stmt.getActions(), assumeRoleAction)) {
        return false;
    }
    for (const auto& pattern : stmt.getPrincipals().get("AWS")) {
        if (PolicyEvaluator::principalMatches(pattern, principal.getId())) {
            return true;
        }
    }
    return false;
}

Assumption PolicyEvaluator::evaluateAssumption(const Policy& trustPolicy, const Identity& principal)
{
    Assumption assumption = { false, false, 0 };
    if (principal.isGroup()) {
        return assumption;
    }
    bool unconditional = false;
    bool conditional = false;
    const auto& statements = trustPolicy.getStatements();
    for (size_t i = 0; i < statements.size(); i++) {
        const Statement& stmt = statements[i];
        if (!statementDesignates(stmt, principal)) {
            continue;
        }
        if (stmt.getEffect() == Effect::DENY) {
            return Assumption{ false, false, 0 };
        }
        if (!stmt.hasConditions()) {
            unconditional = true;
        } else if (!conditional) {
            conditional = true;
            assumption.statement = i;
        }
    }
    assumption.allowed = unconditional || conditional;
    assumption.conditional = conditional && !unconditional;
    return assumption;
}

} // namespace

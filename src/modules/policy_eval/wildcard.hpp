#pragma once

#include <string>

namespace iam_explorer {

/**
 * AWS style glob patterns over action names and ARNs. '*' matches any,
 * possibly empty, sequence of characters and '?' matches exactly one
 * character. Matching is case sensitive and patterns are never split
 * into service and action or into ARN fields.
 */
class Wildcard {
 public:
    /**
     * True if the concrete string value is matched by the pattern.
     */
    static bool match(const std::string& pattern, const std::string& value);

    /**
     * True if at least one concrete string is matched by both
     * patterns. E.g. "s3:Get*" overlaps "s3:*Object".
     */
    static bool overlaps(const std::string& lhs, const std::string& rhs);

    /**
     * True if every string matched by inner is also matched by
     * outer. The test is sound but not complete, a false result for
     * exotic pattern pairs means "not proven".
     */
    static bool covers(const std::string& outer, const std::string& inner);

    static bool hasWildcards(const std::string& pattern);

    /**
     * Non empty and only characters from the action alphabet,
     * [A-Za-z0-9:*?_-].
     */
    static bool isValidActionPattern(const std::string& pattern);

    /**
     * Non empty and only characters allowed in ARNs and resource
     * patterns, no whitespace, quotes or control characters.
     */
    static bool isValidResourcePattern(const std::string& pattern);
};

} // namespace

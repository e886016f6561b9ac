#pragma once

#include <vector>
#include <string>

namespace iam_explorer {

/**
 * Generic encapsulation of
 * { "Operator": { "Key" : [ "Value1", "Value2" ] } }
 *
 * Conditions are carried for traceability only, they are never
 * evaluated. A statement with conditions is evaluated as if the
 * conditions were satisfied.
 */
class Condition {
 public:
    Condition(const std::string& op, const std::string& key, const std::vector<std::string>& values)
        : operator_(op), key_(key), values_(values)
    {
    }

    std::string getOperator() const
    {
        return operator_;
    }

    std::string getKey() const
    {
        return key_;
    }

    std::vector<std::string> getValues() const
    {
        return values_;
    }

    bool operator==(const Condition& other) const
    {
        return operator_ == other.operator_ && key_ == other.key_ && values_ == other.values_;
    }

 private:
    std::string operator_;
    std::string key_;
    std::vector<std::string> values_;
};

} // namespace

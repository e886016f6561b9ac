#pragma once

#include <map>
#include <string>
#include <vector>

namespace iam_explorer {

/**
 * The Principal element of a trust policy statement, e.g.
 * { "AWS": ["arn:aws:iam::123456789012:user/alice"], "Service": ["ec2.amazonaws.com"] }
 *
 * The bare "*" principal is stored as { "AWS": ["*"] }.
 */
class Principals {
 public:
    typedef std::map<std::string, std::vector<std::string> > PrincipalMap;

    Principals() {}
    Principals(const PrincipalMap& principals) : principals_(principals) {}

    static Principals any()
    {
        PrincipalMap m;
        m["AWS"].push_back("*");
        return Principals(m);
    }

    void add(const std::string& kind, const std::string& value)
    {
        principals_[kind].push_back(value);
    }

    std::vector<std::string> get(const std::string& kind) const
    {
        auto it = principals_.find(kind);
        if (it == principals_.end()) {
            return std::vector<std::string>();
        }
        return it->second;
    }

    PrincipalMap getMap() const
    {
        return principals_;
    }

    bool empty() const
    {
        return principals_.empty();
    }

    bool operator==(const Principals& other) const
    {
        return principals_ == other.principals_;
    }

 private:
    PrincipalMap principals_;
};

} // namespace

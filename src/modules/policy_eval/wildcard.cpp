#include "wildcard.hpp"

#include <cctype>
#include <utility>
#include <vector>

namespace iam_explorer {

bool Wildcard::match(const std::string& pattern, const std::string& value)
{
    size_t p = 0;
    size_t v = 0;
    size_t starPattern = std::string::npos;
    size_t starValue = 0;

    while (v < value.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            starPattern = p;
            starValue = v;
            p++;
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == value[v])) {
            p++;
            v++;
        } else if (starPattern != std::string::npos) {
            // let the last star swallow one more character
            p = starPattern + 1;
            starValue++;
            v = starValue;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }
    return p == pattern.size();
}

namespace {

/**
 * Depth first search over pairs of pattern positions. The step
 * function pushes the successors of a state.
 */
class PositionSearch {
 public:
    PositionSearch(size_t lhsSize, size_t rhsSize)
        : rhsSize_(rhsSize), seen_((lhsSize + 1) * (rhsSize + 1), false)
    {
    }

    void push(size_t i, size_t j)
    {
        size_t index = i * (rhsSize_ + 1) + j;
        if (!seen_[index]) {
            seen_[index] = true;
            stack_.push_back(std::make_pair(i, j));
        }
    }

    bool empty() const { return stack_.empty(); }

    std::pair<size_t, size_t> pop()
    {
        std::pair<size_t, size_t> top = stack_.back();
        stack_.pop_back();
        return top;
    }

 private:
    size_t rhsSize_;
    std::vector<bool> seen_;
    std::vector<std::pair<size_t, size_t> > stack_;
};

} // namespace

bool Wildcard::overlaps(const std::string& lhs, const std::string& rhs)
{
    if (!hasWildcards(lhs)) {
        return match(rhs, lhs);
    }
    if (!hasWildcards(rhs)) {
        return match(lhs, rhs);
    }

    const size_t n = lhs.size();
    const size_t m = rhs.size();
    PositionSearch search(n, m);
    search.push(0, 0);

    while (!search.empty()) {
        std::pair<size_t, size_t> state = search.pop();
        size_t i = state.first;
        size_t j = state.second;
        if (i == n && j == m) {
            return true;
        }
        bool lhsStar = i < n && lhs[i] == '*';
        bool rhsStar = j < m && rhs[j] == '*';

        // a star may match the empty string
        if (lhsStar) {
            search.push(i + 1, j);
        }
        if (rhsStar) {
            search.push(i, j + 1);
        }

        if (i == n || j == m || (lhsStar && rhsStar)) {
            continue;
        }

        if (lhsStar) {
            search.push(i, j + 1);
        } else if (rhsStar) {
            search.push(i + 1, j);
        } else if (lhs[i] == '?' || rhs[j] == '?' || lhs[i] == rhs[j]) {
            search.push(i + 1, j + 1);
        }
    }
    return false;
}

bool Wildcard::covers(const std::string& outer, const std::string& inner)
{
    const size_t n = outer.size();
    const size_t m = inner.size();
    PositionSearch search(n, m);
    search.push(0, 0);

    while (!search.empty()) {
        std::pair<size_t, size_t> state = search.pop();
        size_t i = state.first;
        size_t j = state.second;
        if (i == n && j == m) {
            return true;
        }
        if (i == n) {
            continue;
        }
        char o = outer[i];
        if (o == '*') {
            search.push(i + 1, j);
            if (j < m) {
                // an outer star absorbs any inner token, including a star
                search.push(i, j + 1);
            }
        } else if (j < m) {
            char in = inner[j];
            if (o == '?') {
                if (in != '*') {
                    search.push(i + 1, j + 1);
                }
            } else if (in == o) {
                search.push(i + 1, j + 1);
            }
        }
    }
    return false;
}

bool Wildcard::hasWildcards(const std::string& pattern)
{
    return pattern.find_first_of("*?") != std::string::npos;
}

bool Wildcard::isValidActionPattern(const std::string& pattern)
{
    if (pattern.empty()) {
        return false;
    }
    for (char c : pattern) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            continue;
        }
        if (c == ':' || c == '*' || c == '?' || c == '_' || c == '-') {
            continue;
        }
        return false;
    }
    return true;
}

bool Wildcard::isValidResourcePattern(const std::string& pattern)
{
    static const std::string extra = ":/*?-_.+=,@$#{}%~!";
    if (pattern.empty()) {
        return false;
    }
    for (char c : pattern) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            continue;
        }
        if (extra.find(c) != std::string::npos) {
            continue;
        }
        return false;
    }
    return true;
}

} // namespace

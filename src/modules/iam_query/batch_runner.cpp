#include "batch_runner.hpp"

#include <algorithm>
#include <future>

namespace iam_explorer {

std::vector<BatchResult> BatchRunner::whoCanDo(const std::vector<std::string>& actionPatterns, const std::string& resourcePattern)
{
    std::vector<BatchResult> results(actionPatterns.size());
    std::atomic<size_t> next(0);

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1);
            if (i >= actionPatterns.size()) {
                return;
            }
            BatchResult& r = results[i];
            r.actionPattern = actionPatterns[i];
            if (cancelled_.load()) {
                r.ec = make_error_code(IamExplorerError::cancelled);
                continue;
            }
            r.ec = engine_.whoCanDo(actionPatterns[i], resourcePattern, r.result, &cancelled_);
        }
    };

    size_t count = std::min(workers_, actionPatterns.size());
    std::vector<std::future<void> > futures;
    for (size_t i = 0; i < count; i++) {
        futures.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : futures) {
        f.get();
    }
    return results;
}

} // namespace

#pragma once

#include "query_engine.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace iam_explorer {

struct BatchResult {
    std::string actionPattern;
    lib::error_code ec;
    WhoCanDoResult result;
};

/**
 * Runs a list of whoCanDo queries on a pool of workers sharing one
 * engine. Results are returned in the order of the patterns, a failing
 * query only affects its own result.
 */
class BatchRunner {
 public:
    BatchRunner(const QueryEngine& engine, size_t workers) : engine_(engine), workers_(workers == 0 ? 1 : workers), cancelled_(false) {}

    std::vector<BatchResult> whoCanDo(const std::vector<std::string>& actionPatterns, const std::string& resourcePattern = "*");

    /**
     * Queries still running or not yet started complete with
     * cancelled. May be called from any thread.
     */
    void cancel() { cancelled_ = true; }
    bool isCancelled() const { return cancelled_.load(); }

 private:
    const QueryEngine& engine_;
    size_t workers_;
    std::atomic<bool> cancelled_;
};

} // namespace

#pragma once

#include "batch_runner.hpp"
#include "query_result.hpp"

#include <nlohmann/json.hpp>

namespace iam_explorer {

class QueryResultJson {
 public:
    static nlohmann::json whoCanDoToJson(const WhoCanDoResult& result);
    static nlohmann::json whatCanDoToJson(const WhatCanDoResult& result);
    static nlohmann::json batchToJson(const std::vector<BatchResult>& results);
};

} // namespace

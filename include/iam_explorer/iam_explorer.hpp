#pragma once

#define IAM_EXPLORER_VERSION "1.0.0"

#include <iam_explorer/iam_explorer_error.hpp>

#include <modules/iam_graph/graph.hpp>
#include <modules/iam_graph/graph_builder.hpp>
#include <modules/iam_graph/graph_codec.hpp>
#include <modules/iam_graph/graph_export.hpp>
#include <modules/iam_graph/snapshot_json.hpp>
#include <modules/iam_query/batch_runner.hpp>
#include <modules/iam_query/query_engine.hpp>
#include <modules/iam_query/query_result_json.hpp>
#include <modules/logging/logger.hpp>

#pragma once

#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/rule.hpp"
#include "tributary/planner/window_oracle.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tributary::planner {

class PlannerContext;

inline constexpr const char* kStreamingJoinRuleName = "StreamingJoinRewrite";

// Classifies a join by the windowing of its inputs: true for an instant (windowed)
// join, false for an updating one. Rejected shapes yield UnsupportedJoinShape.
[[nodiscard]] PlanResult<bool> check_join_windowing(const LogicalJoin& join, const WindowOracle& oracle);

[[nodiscard]] std::optional<PlanDiagnostic> check_updating_inputs(const LogicalSchema& left,
                                                                  const LogicalSchema& right);

// Projects `_arroyo._key_i` for every key expression ahead of the input columns and
// wraps the projection in a trimmed key-calculation extension.
[[nodiscard]] PlanResult<LogicalOperatorPtr> build_keyed_input(LogicalOperatorPtr input,
                                                               const std::vector<ExpressionPtr>& key_expressions,
                                                               std::string side);

// Collapses the two `_timestamp` columns of a joined schema into one holding their maximum.
[[nodiscard]] PlanResult<LogicalOperatorPtr> merge_join_timestamps(LogicalOperatorPtr joined);

// Rewrites `node` into a streaming-join extension when it is a join not yet rewritten.
RuleOutcome rewrite_join(const PlannerContext& context, LogicalOperatorPtr& node);

std::shared_ptr<Rule> make_streaming_join_rule();

}  // namespace tributary::planner

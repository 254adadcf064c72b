#pragma once

#include "tributary/planner/data_type.hpp"
#include "tributary/planner/logical_expression.hpp"
#include "tributary/planner/logical_schema.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <vector>

namespace tributary::planner {

struct LogicalProjection;

// One value per field of the schema the row is evaluated against.
using Row = std::vector<ScalarValue>;

// Row-wise scalar evaluation with SQL NULL semantics. Aggregate calls are rejected.
[[nodiscard]] PlanResult<ScalarValue> evaluate(const Expression& expression,
                                               const LogicalSchema& schema,
                                               const Row& row);

// Evaluates every projection expression against a row of the projection's input.
[[nodiscard]] PlanResult<Row> evaluate_projection(const LogicalProjection& projection, const Row& row);

}  // namespace tributary::planner

#pragma once

#include "tributary/planner/logical_plan.hpp"

#include <string>

namespace tributary::planner {

struct DescribeOptions final {
    bool include_schema = true;
    // Prints the key-prefixed schema of key calculations instead of the trimmed one.
    bool show_materialized_keys = false;
};

[[nodiscard]] std::string describe_schema(const LogicalSchema& schema);
[[nodiscard]] std::string describe_plan(const LogicalOperator& root, DescribeOptions options = {});

}  // namespace tributary::planner

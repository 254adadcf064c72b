#pragma once

#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/plan_errors.hpp"
#include "tributary/planner/planner_context.hpp"
#include "tributary/planner/rule.hpp"

#include <cstddef>
#include <vector>

namespace tributary::planner {

struct RewriteResult final {
    LogicalOperatorPtr plan{};
    std::vector<PlanDiagnostic> diagnostics{};
    RuleTrace trace{};
    std::size_t rules_attempted = 0U;
    std::size_t rules_applied = 0U;

    [[nodiscard]] bool success() const noexcept { return plan != nullptr && diagnostics.empty(); }
};

// Rewrites every join of `plan` into a streaming join. On failure `plan` is
// empty and `diagnostics` holds the rejection.
[[nodiscard]] RewriteResult rewrite_streaming_joins(const PlannerContext& context, LogicalOperatorPtr plan);

}  // namespace tributary::planner

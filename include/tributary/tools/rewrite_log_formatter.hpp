#pragma once

#include "tributary/planner/plan_errors.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace tributary::tools {

struct RewriteLogSummary final {
    std::string source{};
    bool success = false;
    std::chrono::microseconds ttl{0};
    std::size_t input_nodes = 0U;
    std::size_t output_nodes = 0U;
    std::size_t rules_attempted = 0U;
    std::size_t rules_applied = 0U;
    double duration_ms = 0.0;
    std::chrono::system_clock::time_point started_at{};
    std::vector<std::string> trace_lines{};
    std::vector<planner::PlanDiagnostic> diagnostics{};
};

// One JSON object per rewrite run, on a single line.
[[nodiscard]] std::string format_rewrite_log_json(const RewriteLogSummary& summary);

}  // namespace tributary::tools

#pragma once

#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tributary::parser {

struct PlanTextDiagnostic final {
    std::error_code code{};
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::vector<std::string> remediation_hints{};
};

struct PlanTextResult final {
    planner::LogicalOperatorPtr plan{};
    std::vector<PlanTextDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return plan != nullptr && diagnostics.empty(); }
};

// Parses an s-expression plan description:
//   (scan <table> [(as <alias>)] (fields (<name> <type> [nullable]) ...))
//   (filter <expr> <input>)
//   (project (<expr> [as <name>]) ... <input>)
//   (aggregate [(window tumble|sliding|session|instant [<dur> [<dur>]])]
//              (group <expr> ...) (aggs (<fn> <expr> [as <name>]) ...) <input>)
//   (join <type> [(on (<expr> <expr>) ...)] [(filter <expr>)]
//         [(constraint on|using)] [(null-equals-null)] <left> <right>)
//   (alias <name> <input>)
// `;` starts a comment that runs to the end of the line.
[[nodiscard]] PlanTextResult parse_plan_text(std::string_view text);

// `<n>ns|us|ms|s|m|h|d`; nanoseconds must be whole microseconds.
[[nodiscard]] std::optional<std::chrono::microseconds> parse_duration(std::string_view text);

}  // namespace tributary::parser

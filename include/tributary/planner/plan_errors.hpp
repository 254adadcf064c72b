#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tributary::planner {

enum class PlanErrc {
    Success = 0,
    UnsupportedJoinShape,
    UnsupportedUpdatingInput,
    MissingEquijoin,
    MalformedTimestamps,
    UpstreamConstruction,
    EvaluationFailed,
    InvalidPlanText
};

const std::error_category& plan_error_category() noexcept;
std::error_code make_error_code(PlanErrc value) noexcept;

struct PlanDiagnostic final {
    std::error_code code{};
    std::string message{};
    std::vector<std::string> remediation_hints{};
};

[[nodiscard]] PlanDiagnostic make_plan_diagnostic(PlanErrc code,
                                                  std::string message,
                                                  std::vector<std::string> remediation_hints = {});

template <typename T>
struct PlanResult final {
    std::optional<T> value{};
    std::vector<PlanDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return value.has_value() && diagnostics.empty(); }

    static PlanResult ok(T result)
    {
        PlanResult outcome{};
        outcome.value.emplace(std::move(result));
        return outcome;
    }

    static PlanResult failure(PlanDiagnostic diagnostic)
    {
        PlanResult outcome{};
        outcome.diagnostics.push_back(std::move(diagnostic));
        return outcome;
    }

    static PlanResult failure(std::vector<PlanDiagnostic> diagnostics)
    {
        PlanResult outcome{};
        outcome.diagnostics = std::move(diagnostics);
        return outcome;
    }
};

}  // namespace tributary::planner

namespace std {

template <>
struct is_error_code_enum<tributary::planner::PlanErrc> : true_type {
};

}  // namespace std

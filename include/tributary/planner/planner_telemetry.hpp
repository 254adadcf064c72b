#pragma once

#include "tributary/planner/plan_errors.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace tributary::planner {

struct PlannerTelemetrySnapshot final {
    std::uint64_t passes_attempted = 0U;
    std::uint64_t passes_succeeded = 0U;
    std::uint64_t passes_failed = 0U;
    std::uint64_t joins_rewritten = 0U;
    std::uint64_t instant_joins = 0U;
    std::uint64_t updating_joins = 0U;
    std::uint64_t unsupported_join_shapes = 0U;
    std::uint64_t unsupported_updating_inputs = 0U;
    std::uint64_t missing_equijoins = 0U;
    std::uint64_t construction_failures = 0U;
    std::uint64_t rules_attempted = 0U;
    std::uint64_t rules_applied = 0U;
};

class PlannerTelemetry final {
public:
    void record_pass_attempt() noexcept;
    void record_pass_success(std::size_t rules_attempted, std::size_t rules_applied) noexcept;
    void record_pass_failure(const std::vector<PlanDiagnostic>& diagnostics) noexcept;
    void record_join_rewrite(bool is_instant) noexcept;

    [[nodiscard]] PlannerTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    std::atomic<std::uint64_t> passes_attempted_{0U};
    std::atomic<std::uint64_t> passes_succeeded_{0U};
    std::atomic<std::uint64_t> passes_failed_{0U};
    std::atomic<std::uint64_t> joins_rewritten_{0U};
    std::atomic<std::uint64_t> instant_joins_{0U};
    std::atomic<std::uint64_t> updating_joins_{0U};
    std::atomic<std::uint64_t> unsupported_join_shapes_{0U};
    std::atomic<std::uint64_t> unsupported_updating_inputs_{0U};
    std::atomic<std::uint64_t> missing_equijoins_{0U};
    std::atomic<std::uint64_t> construction_failures_{0U};
    std::atomic<std::uint64_t> rules_attempted_{0U};
    std::atomic<std::uint64_t> rules_applied_{0U};
};

}  // namespace tributary::planner

#include "tributary/planner/planner_telemetry.hpp"

namespace tributary::planner {

void PlannerTelemetry::record_pass_attempt() noexcept
{
    passes_attempted_.fetch_add(1U, std::memory_order_relaxed);
}

void PlannerTelemetry::record_pass_success(std::size_t rules_attempted, std::size_t rules_applied) noexcept
{
    passes_succeeded_.fetch_add(1U, std::memory_order_relaxed);
    rules_attempted_.fetch_add(static_cast<std::uint64_t>(rules_attempted), std::memory_order_relaxed);
    rules_applied_.fetch_add(static_cast<std::uint64_t>(rules_applied), std::memory_order_relaxed);
}

void PlannerTelemetry::record_pass_failure(const std::vector<PlanDiagnostic>& diagnostics) noexcept
{
    passes_failed_.fetch_add(1U, std::memory_order_relaxed);
    for (const auto& diagnostic : diagnostics) {
        if (diagnostic.code == PlanErrc::UnsupportedJoinShape) {
            unsupported_join_shapes_.fetch_add(1U, std::memory_order_relaxed);
        } else if (diagnostic.code == PlanErrc::UnsupportedUpdatingInput) {
            unsupported_updating_inputs_.fetch_add(1U, std::memory_order_relaxed);
        } else if (diagnostic.code == PlanErrc::MissingEquijoin) {
            missing_equijoins_.fetch_add(1U, std::memory_order_relaxed);
        } else {
            construction_failures_.fetch_add(1U, std::memory_order_relaxed);
        }
    }
}

void PlannerTelemetry::record_join_rewrite(bool is_instant) noexcept
{
    joins_rewritten_.fetch_add(1U, std::memory_order_relaxed);
    if (is_instant) {
        instant_joins_.fetch_add(1U, std::memory_order_relaxed);
    } else {
        updating_joins_.fetch_add(1U, std::memory_order_relaxed);
    }
}

PlannerTelemetrySnapshot PlannerTelemetry::snapshot() const noexcept
{
    PlannerTelemetrySnapshot snapshot{};
    snapshot.passes_attempted = passes_attempted_.load(std::memory_order_relaxed);
    snapshot.passes_succeeded = passes_succeeded_.load(std::memory_order_relaxed);
    snapshot.passes_failed = passes_failed_.load(std::memory_order_relaxed);
    snapshot.joins_rewritten = joins_rewritten_.load(std::memory_order_relaxed);
    snapshot.instant_joins = instant_joins_.load(std::memory_order_relaxed);
    snapshot.updating_joins = updating_joins_.load(std::memory_order_relaxed);
    snapshot.unsupported_join_shapes = unsupported_join_shapes_.load(std::memory_order_relaxed);
    snapshot.unsupported_updating_inputs = unsupported_updating_inputs_.load(std::memory_order_relaxed);
    snapshot.missing_equijoins = missing_equijoins_.load(std::memory_order_relaxed);
    snapshot.construction_failures = construction_failures_.load(std::memory_order_relaxed);
    snapshot.rules_attempted = rules_attempted_.load(std::memory_order_relaxed);
    snapshot.rules_applied = rules_applied_.load(std::memory_order_relaxed);
    return snapshot;
}

void PlannerTelemetry::reset() noexcept
{
    passes_attempted_.store(0U, std::memory_order_relaxed);
    passes_succeeded_.store(0U, std::memory_order_relaxed);
    passes_failed_.store(0U, std::memory_order_relaxed);
    joins_rewritten_.store(0U, std::memory_order_relaxed);
    instant_joins_.store(0U, std::memory_order_relaxed);
    updating_joins_.store(0U, std::memory_order_relaxed);
    unsupported_join_shapes_.store(0U, std::memory_order_relaxed);
    unsupported_updating_inputs_.store(0U, std::memory_order_relaxed);
    missing_equijoins_.store(0U, std::memory_order_relaxed);
    construction_failures_.store(0U, std::memory_order_relaxed);
    rules_attempted_.store(0U, std::memory_order_relaxed);
    rules_applied_.store(0U, std::memory_order_relaxed);
}

}  // namespace tributary::planner

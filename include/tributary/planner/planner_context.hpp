#pragma once

#include "tributary/planner/rule.hpp"

#include <chrono>

namespace tributary::planner {

class PlannerTelemetry;
class WindowOracle;

struct PlanningOptions final {
    // How long an updating join keeps buffered state.
    std::chrono::microseconds ttl = std::chrono::hours{24};
};

struct PlannerOptions final {
    bool enable_rule_tracing = false;
    PlanningOptions planning{};
    PlannerRuleOptions rule_options{};
};

struct PlannerContextConfig final {
    const WindowOracle* window_oracle = nullptr;
    PlannerOptions options{};
    PlannerTelemetry* telemetry = nullptr;
};

class PlannerContext final {
public:
    PlannerContext() = default;
    explicit PlannerContext(PlannerContextConfig config);

    // Falls back to the structural WindowDetector when none was configured.
    [[nodiscard]] const WindowOracle& window_oracle() const noexcept;
    [[nodiscard]] const PlannerOptions& options() const noexcept;
    [[nodiscard]] const PlanningOptions& planning_options() const noexcept;
    [[nodiscard]] PlannerTelemetry* telemetry() const noexcept;

private:
    PlannerContextConfig config_{};
};

}  // namespace tributary::planner

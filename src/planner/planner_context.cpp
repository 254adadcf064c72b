#include "tributary/planner/planner_context.hpp"

#include "tributary/planner/window_oracle.hpp"

#include <utility>

namespace tributary::planner {

PlannerContext::PlannerContext(PlannerContextConfig config)
    : config_{std::move(config)}
{
}

const WindowOracle& PlannerContext::window_oracle() const noexcept
{
    if (config_.window_oracle != nullptr) {
        return *config_.window_oracle;
    }
    return default_window_oracle();
}

const PlannerOptions& PlannerContext::options() const noexcept
{
    return config_.options;
}

const PlanningOptions& PlannerContext::planning_options() const noexcept
{
    return config_.options.planning;
}

PlannerTelemetry* PlannerContext::telemetry() const noexcept
{
    return config_.telemetry;
}

}  // namespace tributary::planner

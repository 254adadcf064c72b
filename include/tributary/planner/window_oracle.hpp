#pragma once

#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/window_type.hpp"

#include <optional>

namespace tributary::planner {

// Answers which window, if any, a plan's output rows are grouped by.
class WindowOracle {
public:
    virtual ~WindowOracle() = default;

    [[nodiscard]] virtual std::optional<WindowType> find_window(const LogicalOperator& plan) const = 0;
};

// Derives the window structurally: aggregates introduce one and row-preserving
// operators pass their input's window through.
class WindowDetector final : public WindowOracle {
public:
    [[nodiscard]] std::optional<WindowType> find_window(const LogicalOperator& plan) const override;
};

[[nodiscard]] const WindowOracle& default_window_oracle() noexcept;

}  // namespace tributary::planner

#pragma once

#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tributary::planner {

class PlannerContext;

enum class RuleCategory {
    Generic,
    StreamingJoin,
};

class RuleContext;

struct RuleOutcome final {
    bool transformed = false;
    std::vector<PlanDiagnostic> diagnostics{};

    [[nodiscard]] bool failed() const noexcept { return !diagnostics.empty(); }
};

// Replaces `root` in place when it transforms it. A failing transform may leave
// `root` consumed; the pass is aborted in that case.
using RuleTransform = std::function<RuleOutcome(const RuleContext&, LogicalOperatorPtr&)>;

class Rule final {
public:
    Rule(std::string name,
         std::vector<LogicalOperatorKind> pattern,
         RuleCategory category = RuleCategory::Generic,
         RuleTransform transform = {},
         int priority = 0);

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const std::vector<LogicalOperatorKind>& pattern() const noexcept;
    [[nodiscard]] RuleCategory category() const noexcept;
    [[nodiscard]] int priority() const noexcept;

    [[nodiscard]] bool matches(const LogicalOperator& root) const noexcept;
    RuleOutcome apply(const RuleContext& context, LogicalOperatorPtr& root) const;

private:
    std::string name_{};
    std::vector<LogicalOperatorKind> pattern_{};
    RuleCategory category_ = RuleCategory::Generic;
    int priority_ = 0;
    RuleTransform transform_{};
};

class RuleContext final {
public:
    explicit RuleContext(const PlannerContext* planner_context) noexcept;

    [[nodiscard]] const PlannerContext* planner_context() const noexcept;

private:
    const PlannerContext* planner_context_;
};

class RuleRegistry final {
public:
    void register_rule(std::shared_ptr<Rule> rule);

    [[nodiscard]] const std::vector<std::shared_ptr<Rule>>& rules() const noexcept;

private:
    std::vector<std::shared_ptr<Rule>> rules_{};
};

struct RuleApplication final {
    std::string rule_name;
    std::string node_kind;
    bool success = false;
};

struct RuleTrace final {
    std::vector<RuleApplication> applications{};
};

struct RuleEngineStats final {
    std::size_t rules_attempted = 0U;
    std::size_t rules_applied = 0U;
};

struct PlannerRuleOptions final {
    bool enable_streaming_join_rewrite = true;
};

class RuleEngine final {
public:
    RuleEngine(const RuleRegistry* registry,
               PlannerRuleOptions options = {});

    // Applies every enabled rule to `root` in priority order, stopping at the first failure.
    RuleOutcome apply_rules(const RuleContext& context,
                            LogicalOperatorPtr& root,
                            RuleTrace* trace = nullptr,
                            RuleEngineStats* stats = nullptr) const;

    // Post-order rewrite: children (extension inputs included) first, then the
    // node rebuilt over them, then the rules.
    [[nodiscard]] PlanResult<LogicalOperatorPtr> rewrite_bottom_up(const RuleContext& context,
                                                                   LogicalOperatorPtr root,
                                                                   RuleTrace* trace = nullptr,
                                                                   RuleEngineStats* stats = nullptr) const;

private:
    const RuleRegistry* registry_;
    PlannerRuleOptions options_{};

    [[nodiscard]] bool rule_enabled(const Rule& rule) const noexcept;
};

}  // namespace tributary::planner

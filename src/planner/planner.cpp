#include "tributary/planner/planner.hpp"

#include "tributary/planner/planner_telemetry.hpp"
#include "tributary/planner/rules/join_rewrite_rule.hpp"

#include <stdexcept>
#include <utility>

namespace tributary::planner {

namespace {

RuleRegistry make_default_registry()
{
    RuleRegistry registry;
    registry.register_rule(make_streaming_join_rule());
    return registry;
}

const RuleRegistry& default_registry()
{
    static const RuleRegistry registry = make_default_registry();
    return registry;
}

}  // namespace

RewriteResult rewrite_streaming_joins(const PlannerContext& context, LogicalOperatorPtr plan)
{
    if (!plan) {
        throw std::invalid_argument{"plan must not be null"};
    }

    auto* telemetry = context.telemetry();
    if (telemetry != nullptr) {
        telemetry->record_pass_attempt();
    }

    RewriteResult result{};
    RuleEngineStats stats{};
    RuleEngine engine{&default_registry(), context.options().rule_options};
    RuleContext rule_context{&context};
    auto* trace = context.options().enable_rule_tracing ? &result.trace : nullptr;

    auto rewritten = engine.rewrite_bottom_up(rule_context, std::move(plan), trace, &stats);
    result.rules_attempted = stats.rules_attempted;
    result.rules_applied = stats.rules_applied;

    if (!rewritten.success()) {
        result.diagnostics = std::move(rewritten.diagnostics);
        if (telemetry != nullptr) {
            telemetry->record_pass_failure(result.diagnostics);
        }
        return result;
    }

    result.plan = std::move(*rewritten.value);
    if (telemetry != nullptr) {
        telemetry->record_pass_success(stats.rules_attempted, stats.rules_applied);
    }
    return result;
}

}  // namespace tributary::planner

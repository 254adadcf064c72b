#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/planner_context.hpp"
#include "tributary/planner/rule.hpp"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace tributary::planner;

namespace {

LogicalOperatorPtr scan(const std::string& qualifier)
{
    QualifiedField id{};
    id.name = "id";
    id.type = DataType::Int64;
    id.nullable = false;
    auto result = make_table_scan("t_" + qualifier, qualifier, {id});
    REQUIRE(result.success());
    return std::move(*result.value);
}

LogicalOperatorPtr filtered_scan(const std::string& qualifier)
{
    auto filter = make_filter(binary(col(qualifier, "id"), BinaryOperator::Greater, lit(ScalarValue::int64(0))),
                              scan(qualifier));
    REQUIRE(filter.success());
    return std::move(*filter.value);
}

// Replaces a filter with its input.
RuleOutcome drop_filter(const RuleContext&, LogicalOperatorPtr& root)
{
    auto children = take_children(*root);
    root = std::move(children.front());
    RuleOutcome outcome{};
    outcome.transformed = true;
    return outcome;
}

}  // namespace

TEST_CASE("Rule patterns match the operator chain down the first input")
{
    Rule filter_over_scan{"filter_over_scan", {LogicalOperatorKind::Filter, LogicalOperatorKind::TableScan}};
    Rule filter_over_join{"filter_over_join", {LogicalOperatorKind::Filter, LogicalOperatorKind::Join}};

    auto plan = filtered_scan("a");
    REQUIRE(filter_over_scan.matches(*plan));
    REQUIRE_FALSE(filter_over_join.matches(*plan));
    REQUIRE_FALSE(Rule("empty", {}).matches(*plan));
}

TEST_CASE("Rule registry orders rules by descending priority")
{
    RuleRegistry registry;
    registry.register_rule(std::make_shared<Rule>("low", std::vector<LogicalOperatorKind>{}, RuleCategory::Generic,
                                                  RuleTransform{}, 1));
    registry.register_rule(std::make_shared<Rule>("high", std::vector<LogicalOperatorKind>{}, RuleCategory::Generic,
                                                  RuleTransform{}, 10));
    registry.register_rule(std::make_shared<Rule>("also_low", std::vector<LogicalOperatorKind>{},
                                                  RuleCategory::Generic, RuleTransform{}, 1));

    const auto& rules = registry.rules();
    REQUIRE(rules.size() == 3U);
    REQUIRE(rules[0]->name() == "high");
    REQUIRE(rules[1]->name() == "low");
    REQUIRE(rules[2]->name() == "also_low");
    REQUIRE_THROWS(registry.register_rule(nullptr));
}

TEST_CASE("Bottom-up rewrite applies rules to every matching node")
{
    RuleRegistry registry;
    registry.register_rule(
        std::make_shared<Rule>("drop_filter", std::vector<LogicalOperatorKind>{LogicalOperatorKind::Filter},
                               RuleCategory::Generic, drop_filter));

    JoinSpec spec{};
    spec.on.push_back({col(std::string{"a"}, "id"), col(std::string{"b"}, "id")});
    auto join = make_join(filtered_scan("a"), filtered_scan("b"), std::move(spec));
    REQUIRE(join.success());

    RuleEngine engine{&registry};
    PlannerContext context{};
    RuleContext rule_context{&context};
    RuleTrace trace{};
    RuleEngineStats stats{};
    auto rewritten = engine.rewrite_bottom_up(rule_context, std::move(*join.value), &trace, &stats);

    REQUIRE(rewritten.success());
    REQUIRE(count_nodes(**rewritten.value) == 3U);
    REQUIRE(stats.rules_attempted == 2U);
    REQUIRE(stats.rules_applied == 2U);
    REQUIRE(trace.applications.size() == 2U);
    REQUIRE(trace.applications[0].rule_name == "drop_filter");
    REQUIRE(trace.applications[0].node_kind == "Filter");
    REQUIRE(trace.applications[0].success);
}

TEST_CASE("Rule engine skips disabled streaming join rules")
{
    RuleRegistry registry;
    registry.register_rule(
        std::make_shared<Rule>("drop_filter", std::vector<LogicalOperatorKind>{LogicalOperatorKind::Filter},
                               RuleCategory::StreamingJoin, drop_filter));

    PlannerRuleOptions options{};
    options.enable_streaming_join_rewrite = false;
    RuleEngine engine{&registry, options};
    PlannerContext context{};
    RuleEngineStats stats{};
    auto rewritten = engine.rewrite_bottom_up(RuleContext{&context}, filtered_scan("a"), nullptr, &stats);

    REQUIRE(rewritten.success());
    REQUIRE((*rewritten.value)->kind == LogicalOperatorKind::Filter);
    REQUIRE(stats.rules_attempted == 0U);
}

TEST_CASE("Rule engine stops at the first failing rule")
{
    RuleRegistry registry;
    registry.register_rule(std::make_shared<Rule>(
        "reject", std::vector<LogicalOperatorKind>{LogicalOperatorKind::TableScan}, RuleCategory::Generic,
        [](const RuleContext&, LogicalOperatorPtr&) {
            RuleOutcome outcome{};
            outcome.diagnostics.push_back(make_plan_diagnostic(PlanErrc::UnsupportedJoinShape, "rejected"));
            return outcome;
        },
        5));
    registry.register_rule(
        std::make_shared<Rule>("never", std::vector<LogicalOperatorKind>{LogicalOperatorKind::TableScan}));

    RuleEngine engine{&registry};
    PlannerContext context{};
    RuleTrace trace{};
    auto rewritten = engine.rewrite_bottom_up(RuleContext{&context}, filtered_scan("a"), &trace);

    REQUIRE_FALSE(rewritten.success());
    REQUIRE(rewritten.diagnostics.front().message == "rejected");
    REQUIRE(trace.applications.size() == 1U);
    REQUIRE_FALSE(trace.applications.front().success);
}

#include "tributary/planner/logical_plan.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace tributary::planner;

namespace {

QualifiedField make_field(std::string name, DataType type, bool nullable = false)
{
    QualifiedField field{};
    field.name = std::move(name);
    field.type = type;
    field.nullable = nullable;
    return field;
}

LogicalOperatorPtr scan(const std::string& table, const std::string& qualifier)
{
    auto result = make_table_scan(table,
                                  qualifier,
                                  {make_field("id", DataType::Int64),
                                   make_field("region", DataType::Utf8, true),
                                   make_field("_timestamp", DataType::Timestamp)});
    REQUIRE(result.success());
    return std::move(*result.value);
}

}  // namespace

TEST_CASE("Table scans qualify every field with the relation name")
{
    auto orders = scan("orders", "o");
    const auto& schema = orders->schema();
    REQUIRE(schema.size() == 3U);
    for (const auto& field : schema.fields()) {
        REQUIRE(field.qualifier == std::optional<std::string>{"o"});
    }
    REQUIRE(orders->children().empty());
    REQUIRE(count_nodes(*orders) == 1U);
}

TEST_CASE("Join schema marks the outer side nullable")
{
    auto left = scan("orders", "o");
    auto right = scan("customers", "c");

    auto inner = build_join_schema(left->schema(), right->schema(), JoinType::Inner);
    REQUIRE(inner.success());
    REQUIRE(inner.value->size() == 6U);
    REQUIRE_FALSE(inner.value->field(3).nullable);

    auto left_outer = build_join_schema(left->schema(), right->schema(), JoinType::LeftOuter);
    REQUIRE(left_outer.success());
    REQUIRE_FALSE(left_outer.value->field(0).nullable);
    REQUIRE(left_outer.value->field(3).nullable);

    auto full = build_join_schema(left->schema(), right->schema(), JoinType::FullOuter);
    REQUIRE(full.success());
    REQUIRE(full.value->field(0).nullable);
    REQUIRE(full.value->field(5).nullable);

    auto semi = build_join_schema(left->schema(), right->schema(), JoinType::RightSemi);
    REQUIRE(semi.success());
    REQUIRE(semi.value->size() == 3U);
    REQUIRE(semi.value->field(0).qualifier == std::optional<std::string>{"c"});
}

TEST_CASE("Join schema prefers left metadata on conflicting keys")
{
    auto left_result = LogicalSchema::try_new({}, {{"origin", "left"}, {"only_left", "1"}});
    auto right_result = LogicalSchema::try_new({}, {{"origin", "right"}, {"only_right", "1"}});
    REQUIRE(left_result.success());
    REQUIRE(right_result.success());

    auto merged = build_join_schema(*left_result.value, *right_result.value, JoinType::Inner);
    REQUIRE(merged.success());
    REQUIRE(merged.value->metadata().at("origin") == "left");
    REQUIRE(merged.value->metadata().size() == 3U);
}

TEST_CASE("make_join validates key expressions against each side")
{
    JoinSpec spec{};
    spec.on.push_back({col(std::string{"c"}, "id"), col(std::string{"o"}, "id")});
    auto join = make_join(scan("orders", "o"), scan("customers", "c"), std::move(spec));
    REQUIRE_FALSE(join.success());
    REQUIRE(join.diagnostics.front().code == PlanErrc::UpstreamConstruction);

    JoinSpec filtered{};
    filtered.join_type = JoinType::LeftSemi;
    filtered.filter = binary(col(std::string{"o"}, "region"), BinaryOperator::Equal, col(std::string{"c"}, "region"));
    auto semi = make_join(scan("orders", "o"), scan("customers", "c"), std::move(filtered));
    REQUIRE(semi.success());
    REQUIRE((*semi.value)->schema().size() == 3U);
}

TEST_CASE("make_filter requires a Boolean predicate")
{
    auto rejected = make_filter(col(std::string{"o"}, "id"), scan("orders", "o"));
    REQUIRE_FALSE(rejected.success());
    REQUIRE(rejected.diagnostics.front().message == "Filter predicate 'o.id' is INT64, expected Boolean");

    auto accepted = make_filter(binary(col(std::string{"o"}, "id"), BinaryOperator::Greater, lit(ScalarValue::int64(0))),
                                scan("orders", "o"));
    REQUIRE(accepted.success());
    REQUIRE((*accepted.value)->schema() == (*accepted.value)->children().front()->schema());
}

TEST_CASE("Aggregates append the window timestamp or updating meta column")
{
    auto windowed = make_aggregate(WindowType::tumbling(std::chrono::minutes{1}),
                                   {col(std::string{"o"}, "region")},
                                   {alias_qualified(call("count", {col(std::string{"o"}, "id")}), std::nullopt, "orders")},
                                   scan("orders", "o"));
    REQUIRE(windowed.success());
    const auto& windowed_schema = (*windowed.value)->schema();
    REQUIRE(windowed_schema.size() == 3U);
    REQUIRE(windowed_schema.field(0).qualified_name() == "o.region");
    REQUIRE(windowed_schema.field(1).qualified_name() == "orders");
    REQUIRE(windowed_schema.field(2).qualified_name() == "_timestamp");
    REQUIRE(windowed_schema.field(2).type == DataType::Timestamp);
    REQUIRE_FALSE(windowed_schema.field(2).nullable);

    auto updating = make_aggregate(std::nullopt, {col(std::string{"o"}, "region")}, {}, scan("orders", "o"));
    REQUIRE(updating.success());
    const auto& updating_schema = (*updating.value)->schema();
    REQUIRE(updating_schema.field(updating_schema.size() - 1U).name == std::string{kUpdatingMetaField});
    REQUIRE(updating_schema.field(updating_schema.size() - 1U).type == DataType::Struct);
}

TEST_CASE("Subquery alias re-qualifies every column")
{
    auto aggregate = make_aggregate(WindowType::tumbling(std::chrono::minutes{1}),
                                    {col(std::string{"o"}, "region")},
                                    {},
                                    scan("orders", "o"));
    REQUIRE(aggregate.success());
    auto aliased = make_subquery_alias(std::move(*aggregate.value), "w");
    REQUIRE(aliased.success());
    const auto& schema = (*aliased.value)->schema();
    REQUIRE(schema.field(0).qualified_name() == "w.region");
    REQUIRE(schema.field(1).qualified_name() == "w._timestamp");
    REQUIRE((*aliased.value)->kind == LogicalOperatorKind::Projection);
}

TEST_CASE("Projection with an explicit schema must match the expression count")
{
    auto input = scan("orders", "o");
    auto schema = input->schema();
    auto mismatch = make_projection_with_schema({col(std::string{"o"}, "id")}, std::move(input), schema);
    REQUIRE_FALSE(mismatch.success());
    REQUIRE(mismatch.diagnostics.front().code == PlanErrc::UpstreamConstruction);
}

TEST_CASE("take_children and with_new_children rebuild a join over new inputs")
{
    JoinSpec spec{};
    spec.on.push_back({col(std::string{"o"}, "id"), col(std::string{"c"}, "id")});
    auto joined = make_join(scan("orders", "o"), scan("customers", "c"), std::move(spec));
    REQUIRE(joined.success());
    auto node = std::move(*joined.value);

    auto children = take_children(*node);
    REQUIRE(children.size() == 2U);

    auto projected = make_projection({col(std::string{"c"}, "id"), col(std::string{"c"}, "_timestamp")},
                                     std::move(children[1]));
    REQUIRE(projected.success());
    children[1] = std::move(*projected.value);

    auto rebuilt = with_new_children(std::move(node), std::move(children));
    REQUIRE(rebuilt.success());
    REQUIRE((*rebuilt.value)->schema().size() == 5U);
    REQUIRE(count_nodes(**rebuilt.value) == 4U);

    std::vector<LogicalOperatorPtr> too_few;
    too_few.push_back(scan("orders", "o"));
    auto shell = std::move(*rebuilt.value);
    (void)take_children(*shell);
    auto wrong = with_new_children(std::move(shell), std::move(too_few));
    REQUIRE_FALSE(wrong.success());
    REQUIRE(wrong.diagnostics.front().message == "Join expects 2 input(s) but was given 1");
}

TEST_CASE("with_new_children re-resolves a projection against its new input")
{
    auto projected = make_projection({col(std::string{"o"}, "id"), col(std::string{"o"}, "region")},
                                     scan("orders", "o"));
    REQUIRE(projected.success());
    auto node = std::move(*projected.value);
    REQUIRE_FALSE(node->schema().field(0).nullable);

    auto widened = make_table_scan("orders",
                                   "o",
                                   {make_field("id", DataType::Int64, true), make_field("region", DataType::Utf8, true)});
    REQUIRE(widened.success());
    (void)take_children(*node);
    std::vector<LogicalOperatorPtr> inputs;
    inputs.push_back(std::move(*widened.value));
    auto rebuilt = with_new_children(std::move(node), std::move(inputs));
    REQUIRE(rebuilt.success());
    REQUIRE((*rebuilt.value)->schema().field(0).qualified_name() == "o.id");
    REQUIRE((*rebuilt.value)->schema().field(0).nullable);

    auto narrowed = make_table_scan("orders", "o", {make_field("id", DataType::Int64)});
    REQUIRE(narrowed.success());
    auto shell = std::move(*rebuilt.value);
    (void)take_children(*shell);
    std::vector<LogicalOperatorPtr> missing;
    missing.push_back(std::move(*narrowed.value));
    auto failed = with_new_children(std::move(shell), std::move(missing));
    REQUIRE_FALSE(failed.success());
    REQUIRE(failed.diagnostics.front().code == PlanErrc::UpstreamConstruction);
    REQUIRE(failed.diagnostics.front().message == "No field named o.region");
}

TEST_CASE("Plan factories reject null inputs")
{
    REQUIRE_THROWS_AS(make_projection({}, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(make_filter(nullptr, scan("orders", "o")), std::invalid_argument);
    REQUIRE_THROWS_AS(make_extension(nullptr), std::invalid_argument);
    REQUIRE(join_type_name(JoinType::FullOuter) == "Full");
    REQUIRE(logical_operator_kind_name(LogicalOperatorKind::Extension) == "Extension");
}

#include "tributary/planner/plan_printer.hpp"
#include "tributary/planner/planner.hpp"
#include "tributary/planner/planner_context.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace tributary::planner;

namespace {

LogicalOperatorPtr orders_scan(const std::string& qualifier)
{
    std::vector<QualifiedField> fields(3U);
    fields[0].name = "id";
    fields[0].type = DataType::Int64;
    fields[0].nullable = false;
    fields[1].name = "note";
    fields[1].type = DataType::Utf8;
    fields[2].name = "_timestamp";
    fields[2].type = DataType::Timestamp;
    fields[2].nullable = false;
    auto result = make_table_scan("orders", qualifier, std::move(fields));
    REQUIRE(result.success());
    return std::move(*result.value);
}

std::string line_containing(const std::string& text, const std::string& needle)
{
    std::istringstream stream{text};
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find(needle) != std::string::npos) {
            return line;
        }
    }
    return {};
}

}  // namespace

TEST_CASE("Schemas print qualified names, types and nullability")
{
    auto scan = orders_scan("o");
    REQUIRE(describe_schema(scan->schema()) == "{o.id:INT64, o.note:UTF8?, o._timestamp:TIMESTAMP}");
    REQUIRE(describe_schema(LogicalSchema{}) == "{}");
}

TEST_CASE("Plans print one indented line per operator")
{
    auto filter = make_filter(binary(col(std::string{"o"}, "id"), BinaryOperator::Greater, lit(ScalarValue::int64(1))),
                              orders_scan("o"));
    REQUIRE(filter.success());

    const auto text = describe_plan(**filter.value, DescribeOptions{false, false});
    REQUIRE(text == "Filter [predicate=(o.id > 1)]\n  - TableScan [table=orders]");
}

TEST_CASE("Rewritten joins print extensions with their key schema on request")
{
    JoinSpec spec{};
    spec.on.push_back({col(std::string{"a"}, "id"), col(std::string{"b"}, "id")});
    auto joined = make_join(orders_scan("a"), orders_scan("b"), std::move(spec));
    REQUIRE(joined.success());

    auto result = rewrite_streaming_joins(PlannerContext{}, std::move(*joined.value));
    REQUIRE(result.success());

    const auto trimmed = describe_plan(*result.plan);
    REQUIRE(trimmed.rfind("Extension [StreamingJoin: updating ttl=1d]", 0U) == 0U);
    REQUIRE(line_containing(trimmed, "Join [type=Inner, on=[a.id = b.id]]").find("    - ") == 0U);

    const auto left_line = line_containing(trimmed, "KeyCalculation: side=left keys=[0] trimmed");
    REQUIRE_FALSE(left_line.empty());
    REQUIRE(left_line.find("_arroyo._key_0") == std::string::npos);

    const auto materialized = describe_plan(*result.plan, DescribeOptions{true, true});
    const auto keyed_line = line_containing(materialized, "KeyCalculation: side=right keys=[0] trimmed");
    REQUIRE(keyed_line.find("{_arroyo._key_0:INT64, b.id:INT64") != std::string::npos);
}

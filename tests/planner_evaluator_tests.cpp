#include "tributary/planner/expression_evaluator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <string>

using namespace tributary::planner;

namespace {

LogicalSchema make_pair_schema()
{
    QualifiedField left{std::string{"l"}, "_timestamp", DataType::Timestamp, true, {}};
    QualifiedField right{std::string{"r"}, "_timestamp", DataType::Timestamp, true, {}};
    QualifiedField flag{std::string{"l"}, "flag", DataType::Boolean, true, {}};
    auto schema = LogicalSchema::try_new({left, right, flag});
    REQUIRE(schema.success());
    return *schema.value;
}

ScalarValue eval(const ExpressionPtr& expression, const Row& row)
{
    const auto schema = make_pair_schema();
    auto value = evaluate(*expression, schema, row);
    REQUIRE(value.success());
    return *value.value;
}

ExpressionPtr latest_timestamp()
{
    const auto left = col(std::string{"l"}, "_timestamp");
    const auto right = col(std::string{"r"}, "_timestamp");
    return case_when(binary(left, BinaryOperator::GreaterOrEqual, right),
                     {{lit(ScalarValue::boolean(true)), left}, {lit(ScalarValue::boolean(false)), right}},
                     coalesce({left, right}));
}

const ScalarValue kNullTimestamp = ScalarValue::null(DataType::Timestamp);
const ScalarValue kNullBoolean = ScalarValue::null(DataType::Boolean);

}  // namespace

TEST_CASE("Timestamp merge picks the later of two present values")
{
    const auto merged = latest_timestamp();
    REQUIRE(eval(merged, {ScalarValue::timestamp(500), ScalarValue::timestamp(200), kNullBoolean}) ==
            ScalarValue::timestamp(500));
    REQUIRE(eval(merged, {ScalarValue::timestamp(200), ScalarValue::timestamp(500), kNullBoolean}) ==
            ScalarValue::timestamp(500));
    REQUIRE(eval(merged, {ScalarValue::timestamp(300), ScalarValue::timestamp(300), kNullBoolean}) ==
            ScalarValue::timestamp(300));
}

TEST_CASE("Timestamp merge falls back to whichever side is present")
{
    const auto merged = latest_timestamp();
    REQUIRE(eval(merged, {kNullTimestamp, ScalarValue::timestamp(200), kNullBoolean}) == ScalarValue::timestamp(200));
    REQUIRE(eval(merged, {ScalarValue::timestamp(700), kNullTimestamp, kNullBoolean}) == ScalarValue::timestamp(700));
    REQUIRE(eval(merged, {kNullTimestamp, kNullTimestamp, kNullBoolean}).is_null());
}

TEST_CASE("Boolean connectives use three-valued logic")
{
    const auto flag = col(std::string{"l"}, "flag");
    const auto falsy = lit(ScalarValue::boolean(false));
    const auto truthy = lit(ScalarValue::boolean(true));
    const Row unknown{kNullTimestamp, kNullTimestamp, kNullBoolean};

    REQUIRE(eval(binary(flag, BinaryOperator::And, falsy), unknown) == ScalarValue::boolean(false));
    REQUIRE(eval(binary(flag, BinaryOperator::And, truthy), unknown).is_null());
    REQUIRE(eval(binary(flag, BinaryOperator::Or, truthy), unknown) == ScalarValue::boolean(true));
    REQUIRE(eval(binary(flag, BinaryOperator::Or, falsy), unknown).is_null());
}

TEST_CASE("Comparisons with NULL yield NULL")
{
    const auto comparison = binary(col(std::string{"l"}, "_timestamp"),
                                   BinaryOperator::Less,
                                   col(std::string{"r"}, "_timestamp"));
    const auto value = eval(comparison, {kNullTimestamp, ScalarValue::timestamp(1), kNullBoolean});
    REQUIRE(value.is_null());
    REQUIRE(value.type() == DataType::Boolean);
}

TEST_CASE("Timestamp arithmetic works in nanoseconds and intervals")
{
    const auto shifted = binary(col(std::string{"l"}, "_timestamp"),
                                BinaryOperator::Add,
                                lit(ScalarValue::duration(std::chrono::microseconds{3})));
    REQUIRE(eval(shifted, {ScalarValue::timestamp(1'000), kNullTimestamp, kNullBoolean}) ==
            ScalarValue::timestamp(4'000));

    const auto gap = binary(col(std::string{"l"}, "_timestamp"),
                            BinaryOperator::Subtract,
                            col(std::string{"r"}, "_timestamp"));
    REQUIRE(eval(gap, {ScalarValue::timestamp(9'000), ScalarValue::timestamp(4'000), kNullBoolean}) ==
            ScalarValue::duration(std::chrono::microseconds{5}));

    const auto sum = binary(lit(ScalarValue::int64(2)), BinaryOperator::Add, lit(ScalarValue::float64(0.5)));
    REQUIRE(eval(sum, {kNullTimestamp, kNullTimestamp, kNullBoolean}) == ScalarValue::float64(2.5));
}

TEST_CASE("Evaluation errors are reported, not thrown")
{
    const auto schema = make_pair_schema();
    const Row row{kNullTimestamp, kNullTimestamp, kNullBoolean};

    auto short_row = evaluate(*lit(ScalarValue::int64(1)), schema, Row{});
    REQUIRE_FALSE(short_row.success());
    REQUIRE(short_row.diagnostics.front().code == PlanErrc::EvaluationFailed);

    auto mismatch = evaluate(*binary(lit(ScalarValue::utf8("a")), BinaryOperator::Equal, lit(ScalarValue::int64(1))),
                             schema,
                             row);
    REQUIRE_FALSE(mismatch.success());
    REQUIRE(mismatch.diagnostics.front().message == "Cannot compare UTF8 with INT64");

    auto aggregate = evaluate(*call("sum", {lit(ScalarValue::int64(1))}), schema, row);
    REQUIRE_FALSE(aggregate.success());
    REQUIRE(aggregate.diagnostics.front().code == PlanErrc::EvaluationFailed);
}

TEST_CASE("Integer arithmetic reports overflow instead of wrapping")
{
    const auto schema = make_pair_schema();
    const Row row{kNullTimestamp, kNullTimestamp, kNullBoolean};
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();

    auto past_max = evaluate(*binary(lit(ScalarValue::int64(max)), BinaryOperator::Add, lit(ScalarValue::int64(1))),
                             schema,
                             row);
    REQUIRE_FALSE(past_max.success());
    REQUIRE(past_max.diagnostics.front().code == PlanErrc::EvaluationFailed);
    REQUIRE(past_max.diagnostics.front().message == "Operator + overflows INT64");

    auto past_min =
        evaluate(*binary(lit(ScalarValue::int64(min)), BinaryOperator::Subtract, lit(ScalarValue::int64(1))),
                 schema,
                 row);
    REQUIRE_FALSE(past_min.success());
    REQUIRE(past_min.diagnostics.front().message == "Operator - overflows INT64");

    REQUIRE(eval(binary(lit(ScalarValue::int64(max)), BinaryOperator::Subtract, lit(ScalarValue::int64(1))), row) ==
            ScalarValue::int64(max - 1));
    REQUIRE(eval(binary(lit(ScalarValue::int64(min)), BinaryOperator::Add, lit(ScalarValue::int64(0))), row) ==
            ScalarValue::int64(min));

    auto wide_unsigned =
        evaluate(*binary(lit(ScalarValue::uint64(std::numeric_limits<std::uint64_t>::max())),
                         BinaryOperator::Add,
                         lit(ScalarValue::int64(0))),
                 schema,
                 row);
    REQUIRE_FALSE(wide_unsigned.success());
    REQUIRE(wide_unsigned.diagnostics.front().code == PlanErrc::EvaluationFailed);

    auto unsigned_sum = evaluate(*binary(lit(ScalarValue::uint64(std::numeric_limits<std::uint64_t>::max())),
                                         BinaryOperator::Add,
                                         lit(ScalarValue::uint64(1))),
                                 schema,
                                 row);
    REQUIRE_FALSE(unsigned_sum.success());
    REQUIRE(unsigned_sum.diagnostics.front().message == "Operator + overflows UINT64");
}

TEST_CASE("Timestamp and interval arithmetic reports overflow")
{
    const auto schema = make_pair_schema();
    constexpr auto max = std::numeric_limits<std::int64_t>::max();

    const auto shifted = binary(col(std::string{"l"}, "_timestamp"),
                                BinaryOperator::Add,
                                lit(ScalarValue::duration(std::chrono::microseconds{1})));
    auto late = evaluate(*shifted, schema, Row{ScalarValue::timestamp(max - 10), kNullTimestamp, kNullBoolean});
    REQUIRE_FALSE(late.success());
    REQUIRE(late.diagnostics.front().message == "Operator + overflows TIMESTAMP");

    const auto huge_interval = binary(col(std::string{"l"}, "_timestamp"),
                                      BinaryOperator::Subtract,
                                      lit(ScalarValue::duration(std::chrono::microseconds{max})));
    auto early = evaluate(*huge_interval, schema, Row{ScalarValue::timestamp(0), kNullTimestamp, kNullBoolean});
    REQUIRE_FALSE(early.success());
    REQUIRE(early.diagnostics.front().code == PlanErrc::EvaluationFailed);

    const auto gap = binary(col(std::string{"l"}, "_timestamp"),
                            BinaryOperator::Subtract,
                            col(std::string{"r"}, "_timestamp"));
    auto wide_gap = evaluate(
        *gap, schema, Row{ScalarValue::timestamp(max), ScalarValue::timestamp(-1), kNullBoolean});
    REQUIRE_FALSE(wide_gap.success());
    REQUIRE(wide_gap.diagnostics.front().message == "Operator - overflows DURATION");

    auto intervals = evaluate(*binary(lit(ScalarValue::duration(std::chrono::microseconds{max})),
                                      BinaryOperator::Add,
                                      lit(ScalarValue::duration(std::chrono::microseconds{1}))),
                              schema,
                              Row{kNullTimestamp, kNullTimestamp, kNullBoolean});
    REQUIRE_FALSE(intervals.success());
    REQUIRE(intervals.diagnostics.front().message == "Operator + overflows DURATION");
}

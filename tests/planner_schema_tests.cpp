#include "tributary/planner/data_type.hpp"
#include "tributary/planner/logical_schema.hpp"
#include "tributary/planner/plan_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using tributary::planner::DataType;
using tributary::planner::LogicalSchema;
using tributary::planner::PlanErrc;
using tributary::planner::QualifiedField;
using tributary::planner::ScalarValue;

namespace {

QualifiedField make_field(std::optional<std::string> qualifier, std::string name, DataType type = DataType::Int64)
{
    QualifiedField field{};
    field.qualifier = std::move(qualifier);
    field.name = std::move(name);
    field.type = type;
    field.nullable = false;
    return field;
}

}  // namespace

TEST_CASE("LogicalSchema accepts the same name under distinct qualifiers")
{
    auto schema = LogicalSchema::try_new({make_field("a", "id"), make_field("b", "id"), make_field("a", "name")});
    REQUIRE(schema.success());
    REQUIRE(schema.value->size() == 3U);
    REQUIRE(schema.value->indices_with_unqualified_name("id") == std::vector<std::size_t>{0U, 1U});
    REQUIRE(schema.value->has_column_with_unqualified_name("name"));
    REQUIRE_FALSE(schema.value->has_column_with_unqualified_name("missing"));
}

TEST_CASE("LogicalSchema rejects duplicate and ambiguous names")
{
    SECTION("duplicate qualified")
    {
        auto schema = LogicalSchema::try_new({make_field("a", "id"), make_field("a", "id")});
        REQUIRE_FALSE(schema.success());
        REQUIRE(schema.diagnostics.front().code == PlanErrc::UpstreamConstruction);
        REQUIRE(schema.diagnostics.front().message.find("a.id") != std::string::npos);
    }

    SECTION("duplicate unqualified")
    {
        auto schema = LogicalSchema::try_new({make_field(std::nullopt, "_timestamp", DataType::Timestamp),
                                              make_field(std::nullopt, "_timestamp", DataType::Timestamp)});
        REQUIRE_FALSE(schema.success());
        REQUIRE(schema.diagnostics.front().message.find("duplicate unqualified") != std::string::npos);
    }

    SECTION("qualified shadowed by unqualified")
    {
        auto schema = LogicalSchema::try_new({make_field("a", "id"), make_field(std::nullopt, "id")});
        REQUIRE_FALSE(schema.success());
        REQUIRE(schema.diagnostics.front().message.find("ambiguous") != std::string::npos);
    }
}

TEST_CASE("LogicalSchema index_of resolves qualified and unqualified references")
{
    auto schema = LogicalSchema::try_new({make_field("a", "id"), make_field("b", "id"), make_field("b", "region")});
    REQUIRE(schema.success());

    auto qualified = schema.value->index_of(std::string{"b"}, "id");
    REQUIRE(qualified.success());
    REQUIRE(*qualified.value == 1U);

    auto unique = schema.value->index_of(std::nullopt, "region");
    REQUIRE(unique.success());
    REQUIRE(*unique.value == 2U);

    auto ambiguous = schema.value->index_of(std::nullopt, "id");
    REQUIRE_FALSE(ambiguous.success());
    REQUIRE(ambiguous.diagnostics.front().message == "Ambiguous reference to field id");

    auto missing = schema.value->index_of(std::string{"c"}, "id");
    REQUIRE_FALSE(missing.success());
    REQUIRE(missing.diagnostics.front().message == "No field named c.id");
}

TEST_CASE("LogicalSchema keeps metadata")
{
    auto schema = LogicalSchema::try_new({make_field("a", "id")}, {{"source", "kafka"}});
    REQUIRE(schema.success());
    REQUIRE(schema.value->metadata().at("source") == "kafka");
    REQUIRE(tributary::planner::key_field_name(3U) == "_key_3");
}

TEST_CASE("ScalarValue comparison follows SQL semantics")
{
    REQUIRE(ScalarValue::int64(3).compare(ScalarValue::int64(5)) == -1);
    REQUIRE(ScalarValue::int64(5).compare(ScalarValue::float64(5.0)) == 0);
    REQUIRE(ScalarValue::utf8("b").compare(ScalarValue::utf8("a")) == 1);
    REQUIRE(ScalarValue::timestamp(10).compare(ScalarValue::timestamp(10)) == 0);
    REQUIRE_FALSE(ScalarValue::null(DataType::Int64).compare(ScalarValue::int64(1)).has_value());
    REQUIRE_FALSE(ScalarValue::timestamp(1).compare(ScalarValue::int64(1)).has_value());
    REQUIRE_FALSE(ScalarValue::utf8("1").compare(ScalarValue::int64(1)).has_value());
}

TEST_CASE("ScalarValue renders literals")
{
    REQUIRE(ScalarValue::null().to_string() == "NULL");
    REQUIRE(ScalarValue::boolean(true).to_string() == "true");
    REQUIRE(ScalarValue::utf8("eu").to_string() == "'eu'");
    REQUIRE(ScalarValue::timestamp(42).to_string() == "TIMESTAMP 42ns");
    REQUIRE(ScalarValue::duration(std::chrono::minutes{5}).to_string() == "INTERVAL 5m");
    REQUIRE(ScalarValue::null(DataType::Timestamp).type() == DataType::Timestamp);
    REQUIRE(ScalarValue::null(DataType::Timestamp).is_null());
}

TEST_CASE("format_duration picks the largest exact unit")
{
    using tributary::planner::format_duration;
    REQUIRE(format_duration(std::chrono::hours{24}) == "1d");
    REQUIRE(format_duration(std::chrono::minutes{90}) == "90m");
    REQUIRE(format_duration(std::chrono::milliseconds{1500}) == "1500ms");
    REQUIRE(format_duration(std::chrono::microseconds{7}) == "7us");
    REQUIRE(format_duration(std::chrono::microseconds{0}) == "0s");
}

TEST_CASE("Plan error codes map to the planner category")
{
    const std::error_code code = PlanErrc::MissingEquijoin;
    REQUIRE(code.category() == tributary::planner::plan_error_category());
    REQUIRE(code.message() == "missing equijoin condition");
    REQUIRE(std::string{code.category().name()} == "tributary.planner");

    const auto diagnostic = tributary::planner::make_plan_diagnostic(
        PlanErrc::UnsupportedJoinShape, "can't handle session windows in joins", {"hint"});
    REQUIRE(diagnostic.code == PlanErrc::UnsupportedJoinShape);
    REQUIRE(diagnostic.remediation_hints.size() == 1U);
}

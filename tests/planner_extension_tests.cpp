#include "tributary/planner/extensions/key_calculation.hpp"
#include "tributary/planner/extensions/streaming_join.hpp"
#include "tributary/planner/logical_plan.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace tributary::planner;

namespace {

LogicalOperatorPtr keyed_projection()
{
    QualifiedField id{};
    id.name = "id";
    id.type = DataType::Int64;
    id.nullable = false;
    QualifiedField ts{};
    ts.name = "_timestamp";
    ts.type = DataType::Timestamp;
    ts.nullable = false;
    auto events = make_table_scan("events", "e", {id, ts});
    REQUIRE(events.success());

    auto projection = make_projection({alias_qualified(col(std::string{"e"}, "id"), std::string{"_arroyo"}, "_key_0"),
                                       col(std::string{"e"}, "id"),
                                       col(std::string{"e"}, "_timestamp")},
                                      std::move(*events.value));
    REQUIRE(projection.success());
    return std::move(*projection.value);
}

}  // namespace

TEST_CASE("Trimmed key calculation hides its key columns")
{
    auto node = KeyCalculationNode::try_new(keyed_projection(), {0U}, "left", true);
    REQUIRE(node.success());
    const auto& keyed = **node.value;

    REQUIRE(keyed.name() == kKeyCalculationName);
    REQUIRE(keyed.materialized_schema().size() == 3U);
    REQUIRE(keyed.materialized_schema().field(0).qualified_name() == "_arroyo._key_0");
    REQUIRE(keyed.schema().size() == 2U);
    REQUIRE(keyed.schema().field(0).qualified_name() == "e.id");
    REQUIRE(keyed.describe() == "KeyCalculation: side=left keys=[0] trimmed");
    REQUIRE(keyed.inputs().size() == 1U);
}

TEST_CASE("Untrimmed key calculation exposes the input schema")
{
    auto node = KeyCalculationNode::try_new(keyed_projection(), {0U}, "right", false);
    REQUIRE(node.success());
    REQUIRE((*node.value)->schema() == (*node.value)->materialized_schema());
    REQUIRE((*node.value)->describe() == "KeyCalculation: side=right keys=[0]");
}

TEST_CASE("Key calculation rejects out of range keys")
{
    auto node = KeyCalculationNode::try_new(keyed_projection(), {7U}, "left", true);
    REQUIRE_FALSE(node.success());
    REQUIRE(node.diagnostics.front().message == "Key index 7 is out of range for a schema of 3 fields");
    REQUIRE_THROWS_AS(KeyCalculationNode::try_new(nullptr, {0U}, "left", true), std::invalid_argument);
}

TEST_CASE("Key calculation is rebuilt over a new input")
{
    auto node = KeyCalculationNode::try_new(keyed_projection(), {0U}, "left", true);
    REQUIRE(node.success());
    auto extension = make_extension(std::move(*node.value));
    REQUIRE(as_key_calculation(extension.get()) != nullptr);
    REQUIRE(as_streaming_join(extension.get()) == nullptr);

    auto inputs = take_children(*extension);
    REQUIRE(inputs.size() == 1U);
    auto rebuilt = with_new_children(std::move(extension), std::move(inputs));
    REQUIRE(rebuilt.success());
    const auto* keyed = as_key_calculation(rebuilt.value->get());
    REQUIRE(keyed != nullptr);
    REQUIRE(keyed->trimmed());
    REQUIRE(keyed->side() == "left");
    REQUIRE(keyed->schema().size() == 2U);

    auto fresh = KeyCalculationNode::try_new(keyed_projection(), {0U}, "left", true);
    REQUIRE(fresh.success());
    auto empty = (*fresh.value)->with_new_inputs({});
    REQUIRE_FALSE(empty.success());
    REQUIRE(empty.diagnostics.front().message == "KeyCalculation expects 1 input but was given 0");
}

TEST_CASE("Streaming join carries a ttl only when updating")
{
    StreamingJoinNode updating{keyed_projection(), false, std::chrono::hours{24}};
    REQUIRE(updating.describe() == "StreamingJoin: updating ttl=1d");
    REQUIRE(updating.ttl() == std::optional<std::chrono::microseconds>{std::chrono::hours{24}});
    REQUIRE(updating.schema().size() == 3U);

    StreamingJoinNode instant{keyed_projection(), true, std::nullopt};
    REQUIRE(instant.describe() == "StreamingJoin: instant");
    REQUIRE(instant.is_instant());

    REQUIRE_THROWS_AS(StreamingJoinNode(keyed_projection(), true, std::chrono::minutes{1}), std::invalid_argument);
    REQUIRE_THROWS_AS(StreamingJoinNode(keyed_projection(), false, std::nullopt), std::invalid_argument);
    REQUIRE_THROWS_AS(StreamingJoinNode(nullptr, true, std::nullopt), std::invalid_argument);
}

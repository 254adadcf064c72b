#include "tributary/planner/extensions/key_calculation.hpp"
#include "tributary/planner/extensions/streaming_join.hpp"
#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/window_oracle.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace tributary::planner;
using namespace std::chrono_literals;

namespace {

LogicalOperatorPtr scan(const std::string& qualifier)
{
    QualifiedField id{};
    id.name = "id";
    id.type = DataType::Int64;
    id.nullable = false;
    QualifiedField ts{};
    ts.name = "_timestamp";
    ts.type = DataType::Timestamp;
    ts.nullable = false;
    auto result = make_table_scan("events_" + qualifier, qualifier, {id, ts});
    REQUIRE(result.success());
    return std::move(*result.value);
}

LogicalOperatorPtr windowed(const std::string& qualifier, std::optional<WindowType> window)
{
    auto aggregate = make_aggregate(window, {col(qualifier, "id")}, {}, scan(qualifier));
    REQUIRE(aggregate.success());
    auto aliased = make_subquery_alias(std::move(*aggregate.value), "w_" + qualifier);
    REQUIRE(aliased.success());
    return std::move(*aliased.value);
}

}  // namespace

TEST_CASE("WindowType describes itself compactly")
{
    REQUIRE(WindowType::tumbling(1min).describe() == "tumble(1m)");
    REQUIRE(WindowType::sliding(10min, 1min).describe() == "hop(10m, 1m)");
    REQUIRE(WindowType::session(30s).describe() == "session(30s)");
    REQUIRE(WindowType::instant().describe() == "instant");
    REQUIRE(window_kind_name(WindowKind::Sliding) == "sliding");
}

TEST_CASE("WindowType equality includes kind and parameters")
{
    REQUIRE(WindowType::tumbling(1min) == WindowType::tumbling(60s));
    REQUIRE_FALSE(WindowType::tumbling(1min) == WindowType::tumbling(2min));
    REQUIRE_FALSE(WindowType::sliding(1min, 1min) == WindowType::tumbling(1min));
    REQUIRE(WindowType::session(5s).is_session());
}

TEST_CASE("WindowDetector finds no window on raw scans")
{
    const WindowDetector detector;
    auto events = scan("e");
    REQUIRE_FALSE(detector.find_window(*events).has_value());
}

TEST_CASE("WindowDetector sees through projections and filters")
{
    const WindowDetector detector;
    auto side = windowed("a", WindowType::tumbling(1min));
    auto filtered = make_filter(binary(col(std::string{"w_a"}, "id"), BinaryOperator::Greater, lit(ScalarValue::int64(0))),
                                std::move(side));
    REQUIRE(filtered.success());

    const auto window = detector.find_window(**filtered.value);
    REQUIRE(window.has_value());
    REQUIRE(*window == WindowType::tumbling(1min));
}

TEST_CASE("WindowDetector treats an unwindowed aggregate as unwindowed")
{
    const WindowDetector detector;
    auto side = windowed("a", std::nullopt);
    REQUIRE_FALSE(detector.find_window(*side).has_value());
}

TEST_CASE("WindowDetector reports a join window only when both sides agree")
{
    const WindowDetector detector;

    JoinSpec matching{};
    matching.on.push_back({col(std::string{"w_a"}, "id"), col(std::string{"w_b"}, "id")});
    auto agreed = make_join(windowed("a", WindowType::tumbling(1min)),
                            windowed("b", WindowType::tumbling(1min)),
                            std::move(matching));
    REQUIRE(agreed.success());
    REQUIRE(detector.find_window(**agreed.value) == std::optional<WindowType>{WindowType::tumbling(1min)});

    JoinSpec differing{};
    differing.on.push_back({col(std::string{"w_a"}, "id"), col(std::string{"w_b"}, "id")});
    auto disagreed = make_join(windowed("a", WindowType::tumbling(1min)),
                               windowed("b", WindowType::tumbling(2min)),
                               std::move(differing));
    REQUIRE(disagreed.success());
    REQUIRE_FALSE(detector.find_window(**disagreed.value).has_value());
}

TEST_CASE("WindowDetector passes through key calculations and streaming joins")
{
    const WindowDetector detector;
    auto keyed = KeyCalculationNode::try_new(windowed("a", WindowType::sliding(10min, 1min)), {0U}, "left", false);
    REQUIRE(keyed.success());
    auto extension = make_extension(std::move(*keyed.value));
    REQUIRE(detector.find_window(*extension) == std::optional<WindowType>{WindowType::sliding(10min, 1min)});

    auto streaming = make_extension(std::make_unique<StreamingJoinNode>(std::move(extension), true, std::nullopt));
    REQUIRE(detector.find_window(*streaming) == std::optional<WindowType>{WindowType::sliding(10min, 1min)});
    REQUIRE(default_window_oracle().find_window(*streaming).has_value());
}

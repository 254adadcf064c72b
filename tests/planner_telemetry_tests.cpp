#include "tributary/planner/planner.hpp"
#include "tributary/planner/planner_context.hpp"
#include "tributary/planner/planner_telemetry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace tributary::planner;

namespace {

LogicalOperatorPtr scan(const std::string& qualifier, bool nullable_payload = true)
{
    std::vector<QualifiedField> fields(3U);
    fields[0].name = "id";
    fields[0].type = DataType::Int64;
    fields[0].nullable = false;
    fields[1].name = "payload";
    fields[1].type = DataType::Utf8;
    fields[1].nullable = nullable_payload;
    fields[2].name = "_timestamp";
    fields[2].type = DataType::Timestamp;
    fields[2].nullable = false;
    auto result = make_table_scan("events_" + qualifier, qualifier, std::move(fields));
    REQUIRE(result.success());
    return std::move(*result.value);
}

LogicalOperatorPtr join(LogicalOperatorPtr left, LogicalOperatorPtr right, JoinType type, bool with_on = true)
{
    JoinSpec spec{};
    spec.join_type = type;
    if (with_on) {
        spec.on.push_back({col(std::string{"l"}, "id"), col(std::string{"r"}, "id")});
    }
    auto result = make_join(std::move(left), std::move(right), std::move(spec));
    REQUIRE(result.success());
    return std::move(*result.value);
}

}  // namespace

TEST_CASE("Planner telemetry starts empty")
{
    PlannerTelemetry telemetry;
    const auto snapshot = telemetry.snapshot();
    REQUIRE(snapshot.passes_attempted == 0U);
    REQUIRE(snapshot.joins_rewritten == 0U);
    REQUIRE(snapshot.construction_failures == 0U);
}

TEST_CASE("Planner telemetry buckets failures by error code")
{
    PlannerTelemetry telemetry;
    telemetry.record_pass_failure({make_plan_diagnostic(PlanErrc::UnsupportedJoinShape, "shape"),
                                   make_plan_diagnostic(PlanErrc::UnsupportedUpdatingInput, "updating"),
                                   make_plan_diagnostic(PlanErrc::MissingEquijoin, "equijoin"),
                                   make_plan_diagnostic(PlanErrc::MalformedTimestamps, "timestamps"),
                                   make_plan_diagnostic(PlanErrc::UpstreamConstruction, "schema")});

    const auto snapshot = telemetry.snapshot();
    REQUIRE(snapshot.passes_failed == 1U);
    REQUIRE(snapshot.unsupported_join_shapes == 1U);
    REQUIRE(snapshot.unsupported_updating_inputs == 1U);
    REQUIRE(snapshot.missing_equijoins == 1U);
    REQUIRE(snapshot.construction_failures == 2U);
}

TEST_CASE("Planner telemetry separates instant and updating rewrites")
{
    PlannerTelemetry telemetry;
    telemetry.record_join_rewrite(true);
    telemetry.record_join_rewrite(false);
    telemetry.record_join_rewrite(false);
    telemetry.record_pass_success(4U, 3U);

    auto snapshot = telemetry.snapshot();
    REQUIRE(snapshot.joins_rewritten == 3U);
    REQUIRE(snapshot.instant_joins == 1U);
    REQUIRE(snapshot.updating_joins == 2U);
    REQUIRE(snapshot.passes_succeeded == 1U);
    REQUIRE(snapshot.rules_attempted == 4U);
    REQUIRE(snapshot.rules_applied == 3U);

    telemetry.reset();
    snapshot = telemetry.snapshot();
    REQUIRE(snapshot.joins_rewritten == 0U);
    REQUIRE(snapshot.rules_attempted == 0U);
}

TEST_CASE("Rewrite passes report into the configured telemetry")
{
    PlannerTelemetry telemetry;
    PlannerContextConfig config{};
    config.telemetry = &telemetry;
    PlannerContext context{config};

    auto accepted = rewrite_streaming_joins(context, join(scan("l"), scan("r"), JoinType::Inner));
    REQUIRE(accepted.success());

    auto outer = rewrite_streaming_joins(context, join(scan("l"), scan("r"), JoinType::LeftOuter));
    REQUIRE_FALSE(outer.success());

    auto cross = rewrite_streaming_joins(context, join(scan("l"), scan("r"), JoinType::Inner, false));
    REQUIRE_FALSE(cross.success());

    const auto snapshot = telemetry.snapshot();
    REQUIRE(snapshot.passes_attempted == 3U);
    REQUIRE(snapshot.passes_succeeded == 1U);
    REQUIRE(snapshot.passes_failed == 2U);
    REQUIRE(snapshot.updating_joins == 1U);
    REQUIRE(snapshot.unsupported_join_shapes == 1U);
    REQUIRE(snapshot.missing_equijoins == 1U);
    REQUIRE(snapshot.rules_attempted == 1U);
    REQUIRE(snapshot.rules_applied == 1U);
}

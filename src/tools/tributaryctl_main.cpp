#include "tributary/parser/plan_text.hpp"
#include "tributary/planner/plan_printer.hpp"
#include "tributary/planner/planner.hpp"
#include "tributary/planner/planner_context.hpp"
#include "tributary/planner/planner_telemetry.hpp"
#include "tributary/planner/rules/join_rewrite_rule.hpp"
#include "tributary/planner/window_oracle.hpp"
#include "tributary/tools/rewrite_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace planner = tributary::planner;
namespace parser = tributary::parser;

namespace {

std::string read_plan_file(const std::filesystem::path& path)
{
    std::ifstream file{path, std::ios::in | std::ios::binary};
    if (!file.is_open()) {
        throw std::runtime_error("failed to open plan file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<planner::PlanDiagnostic> to_plan_diagnostics(const std::vector<parser::PlanTextDiagnostic>& diagnostics)
{
    std::vector<planner::PlanDiagnostic> converted;
    converted.reserve(diagnostics.size());
    for (const auto& diagnostic : diagnostics) {
        planner::PlanDiagnostic plan_diagnostic{};
        plan_diagnostic.code = diagnostic.code;
        plan_diagnostic.message = std::to_string(diagnostic.line) + ":" + std::to_string(diagnostic.column) + ": " +
                                  diagnostic.message;
        plan_diagnostic.remediation_hints = diagnostic.remediation_hints;
        converted.push_back(std::move(plan_diagnostic));
    }
    return converted;
}

void print_diagnostics_text(const std::vector<planner::PlanDiagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics) {
        std::cerr << "error[" << diagnostic.code.message() << "]: " << diagnostic.message << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cerr << "  hint: " << hint << '\n';
        }
    }
}

planner::LogicalOperatorPtr load_plan(const std::filesystem::path& path,
                                      std::vector<planner::PlanDiagnostic>& diagnostics)
{
    auto parsed = parser::parse_plan_text(read_plan_file(path));
    if (!parsed.success()) {
        diagnostics = to_plan_diagnostics(parsed.diagnostics);
        return nullptr;
    }
    return std::move(parsed.plan);
}

int run_rewrite(const std::filesystem::path& path,
                const std::string& ttl_text,
                const std::string& format,
                bool trace,
                bool show_keys)
{
    tributary::tools::RewriteLogSummary summary{};
    summary.source = path.string();
    summary.started_at = std::chrono::system_clock::now();

    planner::PlannerContextConfig config{};
    config.options.enable_rule_tracing = trace;
    if (!ttl_text.empty()) {
        const auto ttl = parser::parse_duration(ttl_text);
        if (!ttl.has_value()) {
            throw std::runtime_error("invalid --ttl value: " + ttl_text);
        }
        config.options.planning.ttl = *ttl;
    }
    summary.ttl = config.options.planning.ttl;

    planner::PlannerTelemetry telemetry;
    config.telemetry = &telemetry;
    planner::PlannerContext context{config};

    std::vector<planner::PlanDiagnostic> load_diagnostics;
    auto plan = load_plan(path, load_diagnostics);
    planner::RewriteResult result{};
    const auto start = std::chrono::steady_clock::now();
    if (plan) {
        summary.input_nodes = planner::count_nodes(*plan);
        result = planner::rewrite_streaming_joins(context, std::move(plan));
    } else {
        result.diagnostics = std::move(load_diagnostics);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;
    summary.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    summary.success = result.success();
    summary.rules_attempted = result.rules_attempted;
    summary.rules_applied = result.rules_applied;
    summary.diagnostics = result.diagnostics;
    if (result.plan) {
        summary.output_nodes = planner::count_nodes(*result.plan);
    }
    for (const auto& application : result.trace.applications) {
        summary.trace_lines.push_back(application.rule_name + " on " + application.node_kind +
                                      (application.success ? " applied" : " skipped"));
    }

    if (format == "json") {
        std::cout << tributary::tools::format_rewrite_log_json(summary) << '\n';
        return summary.success ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (!summary.success) {
        print_diagnostics_text(summary.diagnostics);
        return EXIT_FAILURE;
    }

    planner::DescribeOptions options{};
    options.show_materialized_keys = show_keys;
    std::cout << planner::describe_plan(*result.plan, options) << '\n';
    if (trace) {
        std::cout << '\n' << "Rule trace:" << '\n';
        for (const auto& line : summary.trace_lines) {
            std::cout << "  " << line << '\n';
        }
    }
    const auto snapshot = telemetry.snapshot();
    std::cout << '\n'
              << "joins rewritten: " << snapshot.joins_rewritten << " (instant " << snapshot.instant_joins
              << ", updating " << snapshot.updating_joins << ")" << '\n';
    return EXIT_SUCCESS;
}

void explain_joins(const planner::LogicalOperator& node, const planner::WindowOracle& oracle, std::size_t& ordinal)
{
    for (const auto* child : node.children()) {
        explain_joins(*child, oracle, ordinal);
    }
    if (node.kind != planner::LogicalOperatorKind::Join) {
        return;
    }

    const auto& join = static_cast<const planner::LogicalJoin&>(node);
    ++ordinal;
    std::cout << "join #" << ordinal << " (" << planner::join_type_name(join.join_type) << "): ";
    auto verdict = planner::check_join_windowing(join, oracle);
    if (!verdict.success()) {
        std::cout << "rejected: " << verdict.diagnostics.front().message << '\n';
        return;
    }
    if (*verdict.value) {
        const auto window = oracle.find_window(*join.left);
        std::cout << "instant, window " << window->describe() << '\n';
        return;
    }
    std::cout << "updating" << '\n';
}

int run_explain(const std::filesystem::path& path)
{
    std::vector<planner::PlanDiagnostic> diagnostics;
    auto plan = load_plan(path, diagnostics);
    if (!plan) {
        print_diagnostics_text(diagnostics);
        return EXIT_FAILURE;
    }

    std::cout << planner::describe_plan(*plan) << '\n' << '\n';
    std::size_t ordinal = 0U;
    explain_joins(*plan, planner::default_window_oracle(), ordinal);
    if (ordinal == 0U) {
        std::cout << "no joins" << '\n';
    }
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Streaming join planner tooling for tributary"};
    app.require_subcommand(1);

    int exit_code = EXIT_SUCCESS;

    std::string rewrite_path;
    std::string rewrite_ttl;
    std::string rewrite_format = "text";
    bool rewrite_trace = false;
    bool rewrite_show_keys = false;
    auto* rewrite = app.add_subcommand("rewrite", "Rewrite the joins of a plan file into streaming joins");
    rewrite->add_option("plan", rewrite_path, "Plan file in s-expression form")->required()->check(CLI::ExistingFile);
    rewrite->add_option("--ttl", rewrite_ttl, "State retention for updating joins (e.g. 30m, 24h)");
    rewrite->add_option("-f,--format", rewrite_format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    rewrite->add_flag("--trace", rewrite_trace, "Record and print rule applications");
    rewrite->add_flag("--show-keys", rewrite_show_keys, "Print key calculations with their key columns");
    rewrite->callback([&]() {
        exit_code = run_rewrite(rewrite_path, rewrite_ttl, rewrite_format, rewrite_trace, rewrite_show_keys);
    });

    std::string explain_path;
    auto* explain = app.add_subcommand("explain", "Print a plan and classify each of its joins");
    explain->add_option("plan", explain_path, "Plan file in s-expression form")->required()->check(CLI::ExistingFile);
    explain->callback([&]() {
        exit_code = run_explain(explain_path);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}

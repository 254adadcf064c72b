#include "tributary/planner/logical_plan.hpp"
#include "tributary/planner/planner.hpp"
#include "tributary/planner/planner_context.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <numeric>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

using namespace tributary::planner;

struct BenchmarkOptions final {
    std::size_t samples = 50U;
    std::size_t chain_length = 8U;
    bool json_output = false;
    std::optional<std::filesystem::path> baseline_path{};
    double tolerance = 0.10;  // 10% regression budget by default
};

struct BenchmarkResult final {
    std::string name{};
    std::vector<double> samples_ms{};
    std::size_t logical_nodes = 0U;
};

struct Summary final {
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double p95_ms = 0.0;
};

struct BaselineEntry final {
    double mean_ms = 0.0;
    double p95_ms = 0.0;
};

using BaselineMap = std::unordered_map<std::string, BaselineEntry>;

[[noreturn]] void usage()
{
    std::cerr << "Usage: tributary_planner_benchmarks [options]\n"
              << "  --samples=N         Samples per benchmark (default 50)\n"
              << "  --chain=N           Scans joined by the chain benchmark (default 8)\n"
              << "  --baseline=PATH     Load baseline JSON for regression enforcement\n"
              << "  --tolerance=F       Allowable fractional regression over baseline (default 0.10)\n"
              << "  --json              Emit JSON instead of table output\n"
              << "  --help              Show this message\n";
    std::exit(1);
}

std::size_t parse_size(std::string_view value, std::string_view option)
{
    std::size_t parsed = 0U;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    if (auto [ptr, ec] = std::from_chars(begin, end, parsed); ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }
    return parsed;
}

double parse_double(std::string_view value, std::string_view option)
{
    std::string buffer(value);
    std::size_t consumed = 0U;
    double parsed = 0.0;
    try {
        parsed = std::stod(buffer, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }
    if (consumed != buffer.size()) {
        throw std::invalid_argument(std::string{"Invalid value for "} + std::string(option));
    }
    return parsed;
}

BenchmarkOptions parse_options(int argc, char** argv)
{
    BenchmarkOptions options{};
    for (int index = 1; index < argc; ++index) {
        std::string_view argument{argv[index]};
        if (argument == "--json") {
            options.json_output = true;
        } else if (argument == "--help") {
            usage();
        } else if (argument.rfind("--samples=", 0) == 0) {
            options.samples = parse_size(argument.substr(10), "--samples");
        } else if (argument.rfind("--chain=", 0) == 0) {
            options.chain_length = parse_size(argument.substr(8), "--chain");
            if (options.chain_length < 2U) {
                throw std::invalid_argument("--chain must be at least 2");
            }
        } else if (argument.rfind("--baseline=", 0) == 0) {
            auto path_value = argument.substr(11);
            if (path_value.empty()) {
                throw std::invalid_argument("--baseline requires a path");
            }
            options.baseline_path = std::filesystem::path(std::string(path_value));
        } else if (argument.rfind("--tolerance=", 0) == 0) {
            options.tolerance = parse_double(argument.substr(12), "--tolerance");
            if (options.tolerance < 0.0) {
                throw std::invalid_argument("--tolerance must be non-negative");
            }
        } else {
            usage();
        }
    }
    return options;
}

Summary summarise(const std::vector<double>& samples)
{
    if (samples.empty()) {
        return {};
    }

    Summary summary{};
    summary.min_ms = *std::min_element(samples.begin(), samples.end());
    summary.max_ms = *std::max_element(samples.begin(), samples.end());
    summary.mean_ms = std::accumulate(samples.begin(), samples.end(), 0.0) / static_cast<double>(samples.size());

    auto sorted = samples;
    std::sort(sorted.begin(), sorted.end());
    const double percentile = 0.95 * static_cast<double>(sorted.size());
    const std::size_t index = percentile <= 1.0 ? 0U : static_cast<std::size_t>(std::ceil(percentile)) - 1U;
    summary.p95_ms = sorted[std::min(index, sorted.size() - 1U)];
    return summary;
}

template <typename T>
T expect(PlanResult<T> result, const char* what)
{
    if (!result.success()) {
        const auto message = result.diagnostics.empty() ? std::string{"unknown error"}
                                                        : result.diagnostics.front().message;
        throw std::runtime_error(std::string{what} + ": " + message);
    }
    return std::move(*result.value);
}

QualifiedField make_field(std::string name, DataType type, bool nullable = false)
{
    QualifiedField field{};
    field.name = std::move(name);
    field.type = type;
    field.nullable = nullable;
    return field;
}

LogicalOperatorPtr make_event_scan(std::size_t index)
{
    const auto name = "events_" + std::to_string(index);
    return expect(make_table_scan(name,
                                  "t" + std::to_string(index),
                                  {make_field("id", DataType::Int64),
                                   make_field("payload", DataType::Utf8, true),
                                   make_field(std::string{kTimestampField}, DataType::Timestamp)}),
                  "scan");
}

// t0 JOIN t1 ON t0.id = t1.id JOIN t2 ON t0.id = t2.id ...
LogicalOperatorPtr make_updating_chain(std::size_t length)
{
    auto plan = make_event_scan(0U);
    for (std::size_t index = 1U; index < length; ++index) {
        JoinSpec spec{};
        spec.on.push_back({col(std::string{"t0"}, "id"), col("t" + std::to_string(index), "id")});
        plan = expect(make_join(std::move(plan), make_event_scan(index), std::move(spec)), "join");
    }
    return plan;
}

LogicalOperatorPtr make_windowed_side(std::size_t index)
{
    const auto qualifier = "t" + std::to_string(index);
    auto aggregate = expect(make_aggregate(WindowType::tumbling(std::chrono::minutes{1}),
                                           {col(qualifier, "id")},
                                           {alias_qualified(call("count", {col(qualifier, "payload")}),
                                                            std::nullopt,
                                                            "events")},
                                           make_event_scan(index)),
                            "aggregate");
    return expect(make_subquery_alias(std::move(aggregate), "w" + std::to_string(index)), "alias");
}

LogicalOperatorPtr make_instant_join()
{
    JoinSpec spec{};
    spec.on.push_back({col(std::string{"w0"}, "id"), col(std::string{"w1"}, "id")});
    spec.join_type = JoinType::FullOuter;
    return expect(make_join(make_windowed_side(0U), make_windowed_side(1U), std::move(spec)), "join");
}

template <typename Factory>
BenchmarkResult run_rewrite_benchmark(std::string name, const BenchmarkOptions& options, Factory&& factory)
{
    BenchmarkResult result{};
    result.name = std::move(name);

    for (std::size_t sample = 0; sample < options.samples; ++sample) {
        auto plan = factory();
        PlannerContext context{};
        const auto start = std::chrono::steady_clock::now();
        auto rewrite = rewrite_streaming_joins(context, std::move(plan));
        const auto end = std::chrono::steady_clock::now();
        if (!rewrite.success()) {
            throw std::runtime_error(result.name + ": " + rewrite.diagnostics.front().message);
        }
        result.logical_nodes = count_nodes(*rewrite.plan);
        const auto duration = std::chrono::duration<double, std::milli>(end - start).count();
        result.samples_ms.push_back(duration);
    }

    return result;
}

BenchmarkResult benchmark_updating_chain(const BenchmarkOptions& options)
{
    return run_rewrite_benchmark("updating_join_chain", options, [&]() {
        return make_updating_chain(options.chain_length);
    });
}

BenchmarkResult benchmark_instant_join(const BenchmarkOptions& options)
{
    return run_rewrite_benchmark("instant_window_join", options, [] { return make_instant_join(); });
}

void print_json(const std::vector<BenchmarkResult>& results)
{
    std::cout << "{\"benchmarks\":[";
    for (std::size_t index = 0; index < results.size(); ++index) {
        const auto& result = results[index];
        const auto summary = summarise(result.samples_ms);
        if (index > 0U) {
            std::cout << ',';
        }
        std::cout << "{\"name\":\"" << result.name << "\""
                  << ",\"samples\":" << result.samples_ms.size()
                  << ",\"logical_nodes\":" << result.logical_nodes
                  << ",\"mean_ms\":" << std::fixed << std::setprecision(3) << summary.mean_ms
                  << ",\"min_ms\":" << std::fixed << std::setprecision(3) << summary.min_ms
                  << ",\"max_ms\":" << std::fixed << std::setprecision(3) << summary.max_ms
                  << ",\"p95_ms\":" << std::fixed << std::setprecision(3) << summary.p95_ms
                  << '}';
    }
    std::cout << "]}" << std::endl;
}

void print_table(const std::vector<BenchmarkResult>& results)
{
    std::cout << std::left << std::setw(22) << "Benchmark"
              << std::right << std::setw(10) << "Samples"
              << std::setw(14) << "Logical Nodes"
              << std::setw(14) << "Mean (ms)"
              << std::setw(14) << "Min (ms)"
              << std::setw(14) << "Max (ms)"
              << std::setw(14) << "P95 (ms)" << '\n';

    for (const auto& result : results) {
        const auto summary = summarise(result.samples_ms);
        std::cout << std::left << std::setw(22) << result.name
                  << std::right << std::setw(10) << result.samples_ms.size()
                  << std::setw(14) << result.logical_nodes
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.mean_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.min_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.max_ms
                  << std::setw(14) << std::fixed << std::setprecision(3) << summary.p95_ms
                  << '\n';
    }
}

BaselineMap load_baselines(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Failed to open baseline file: " + path.string());
    }
    std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    BaselineMap baselines;

    std::size_t cursor = 0U;
    const std::string name_token = "\"name\":\"";
    while ((cursor = content.find(name_token, cursor)) != std::string::npos) {
        cursor += name_token.size();
        const auto name_end = content.find('"', cursor);
        if (name_end == std::string::npos) {
            break;
        }
        std::string name = content.substr(cursor, name_end - cursor);

        auto locate_numeric = [&](std::string_view label, std::size_t start) -> std::pair<double, std::size_t> {
            auto value_pos = content.find(label, start);
            if (value_pos == std::string::npos) {
                throw std::runtime_error("Baseline missing field " + std::string(label));
            }
            value_pos += label.size();
            while (value_pos < content.size() && std::isspace(static_cast<unsigned char>(content[value_pos]))) {
                ++value_pos;
            }
            const auto value_end = content.find_first_of(",}", value_pos);
            if (value_end == std::string::npos) {
                throw std::runtime_error("Malformed baseline numeric value for " + std::string(label));
            }
            double value = std::stod(content.substr(value_pos, value_end - value_pos));
            return {value, value_end};
        };

        auto [mean_ms, mean_end] = locate_numeric("\"mean_ms\":", name_end);
        auto [p95_ms, p95_end] = locate_numeric("\"p95_ms\":", mean_end);
        baselines[name] = BaselineEntry{mean_ms, p95_ms};
        cursor = p95_end;
    }

    if (baselines.empty()) {
        throw std::runtime_error("Baseline file contained no benchmark entries");
    }

    return baselines;
}

std::vector<std::string> evaluate_baselines(const std::vector<BenchmarkResult>& results,
                                            const BaselineMap& baselines,
                                            double tolerance)
{
    std::vector<std::string> failures;
    for (const auto& result : results) {
        auto it = baselines.find(result.name);
        if (it == baselines.end()) {
            continue;
        }
        const auto summary = summarise(result.samples_ms);
        const auto& baseline = it->second;
        const double mean_budget = baseline.mean_ms * (1.0 + tolerance);
        const double p95_budget = baseline.p95_ms * (1.0 + tolerance);

        if (summary.mean_ms > mean_budget) {
            std::ostringstream oss;
            oss << result.name << ": mean " << std::fixed << std::setprecision(3) << summary.mean_ms
                << "ms exceeds baseline " << baseline.mean_ms << "ms by more than " << tolerance * 100.0 << '%';
            failures.push_back(oss.str());
        }
        if (summary.p95_ms > p95_budget) {
            std::ostringstream oss;
            oss << result.name << ": p95 " << std::fixed << std::setprecision(3) << summary.p95_ms
                << "ms exceeds baseline " << baseline.p95_ms << "ms by more than " << tolerance * 100.0 << '%';
            failures.push_back(oss.str());
        }
    }
    return failures;
}

}  // namespace

int main(int argc, char** argv)
{
    try {
        const auto options = parse_options(argc, argv);
        std::vector<BenchmarkResult> results;
        results.reserve(2U);
        results.push_back(benchmark_updating_chain(options));
        results.push_back(benchmark_instant_join(options));

        if (options.json_output) {
            print_json(results);
        } else {
            print_table(results);
        }

        if (options.baseline_path) {
            const auto baselines = load_baselines(*options.baseline_path);
            const auto failures = evaluate_baselines(results, baselines, options.tolerance);
            if (!failures.empty()) {
                std::cerr << "Planner benchmark regressions detected (tolerance "
                          << options.tolerance * 100.0 << "%):\n";
                for (const auto& failure : failures) {
                    std::cerr << "  - " << failure << '\n';
                }
                return 2;
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Planner benchmark harness failed: " << ex.what() << '\n';
        return 1;
    }
}

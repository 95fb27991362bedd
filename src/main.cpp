/// @file src/main.cpp
/// @brief nae CLI entry point.
///
/// Usage:
///   nae sales <csv_file>        Aggregate line items from CSV
///   nae sales --demo            Aggregate a generated week of demo sales
///   nae demo                    List a generated week of demo sales
///   nae stats <numbers...>      Statistics with sum and variance
///   nae sample [count]          Statistics over a generated normal sample
///   nae trend <numbers...>      Linear trend and forecast
///   nae chart                   Generated random-walk series
///   nae calc <op> <a> <b>       add | subtract | multiply | divide
///   nae --help                  Print usage
///
/// Numbers may be given as separate arguments, one comma-separated argument,
/// or "-" to read them from stdin.

#include "nae/calculator.hpp"
#include "nae/data_loader.hpp"
#include "nae/engine.hpp"

#include <fmt/core.h>

#include <charconv>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  nae sales <csv_file>        Aggregate line items (category,quantity,unit_price)\n"
        "  nae sales --demo            Aggregate a generated week of demo sales\n"
        "  nae demo                    List a generated week of demo sales\n"
        "  nae stats <numbers...>      Mean, median, std, min, max, count, sum, variance\n"
        "  nae sample [count]          Statistics over a generated N(100, 15) sample\n"
        "  nae trend <numbers...>      Least-squares trend and forecast\n"
        "  nae chart                   Generated 30-day random walk\n"
        "  nae calc <op> <a> <b>       add | subtract | multiply | divide\n"
        "  nae --help                  Show this help\n"
        "\n"
        "Options:\n"
        "  --horizon <n>         Forecast steps for 'trend' (default {})\n"
        "  --max-count <n>       Upper bound for 'sample' (default {})\n"
        "  --seed <n>            Seed for generated data\n"
        "  --strict-direction    Report a zero slope as 'decreasing'\n"
        "  --verbose             Per-call diagnostics on stderr\n",
        nae::constants::DEFAULT_FORECAST_HORIZON,
        nae::constants::MAX_SAMPLE_COUNT);
}

/// Transport status for an engine failure, as an HTTP layer would report it.
int status_for(nae::ErrorKind kind) noexcept {
    return kind == nae::ErrorKind::InvalidInput ? 422 : 400;
}

int report_error(const nae::Error& error) {
    fmt::print(stderr, "Error [{}]: {}\n", status_for(error.kind), error.message);
    return 1;
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end;
}

/// Command-line state after option extraction.
struct Invocation {
    std::string              command;
    std::vector<std::string> args;
    nae::core::EngineConfig  config;
    bool                     demo = false;
};

/// Pull --options out of argv, leaving the command and positional arguments.
/// Returns false (after printing why) on a malformed option.
bool parse_invocation(int argc, char* argv[], Invocation& inv) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);

        auto next_value = [&](std::string_view name) -> const char* {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--horizon") {
            const char* v = next_value(arg);
            if (!v || !parse_integer(v, inv.config.forecast_horizon)) {
                if (v) fmt::print(stderr, "Error: invalid --horizon '{}'\n", v);
                return false;
            }
        } else if (arg == "--max-count") {
            const char* v = next_value(arg);
            if (!v || !parse_integer(v, inv.config.statistics.max_sample_count)) {
                if (v) fmt::print(stderr, "Error: invalid --max-count '{}'\n", v);
                return false;
            }
        } else if (arg == "--seed") {
            const char* v = next_value(arg);
            std::uint64_t seed = 0;
            if (!v || !parse_integer(v, seed)) {
                if (v) fmt::print(stderr, "Error: invalid --seed '{}'\n", v);
                return false;
            }
            inv.config.seed = seed;
        } else if (arg == "--strict-direction") {
            inv.config.trend.direction_rule = nae::trend::DirectionRule::StrictPositive;
        } else if (arg == "--verbose") {
            inv.config.verbose = true;
        } else if (arg == "--demo") {
            inv.demo = true;
        } else if (inv.command.empty()) {
            inv.command = std::string(arg);
        } else {
            inv.args.emplace_back(arg);
        }
    }
    return true;
}

/// Numbers from positional arguments, or from stdin when the only argument
/// is "-".
std::vector<double> collect_numbers(const std::vector<std::string>& args) {
    std::string text;
    if (args.size() == 1 && args[0] == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        for (const auto& a : args) {
            text += a;
            text += ' ';
        }
    }
    return nae::core::DataLoader::parse_numbers(text);
}

int run_sales(nae::core::Engine& engine, const Invocation& inv) {
    std::vector<nae::LineItem> items;

    if (inv.demo) {
        for (auto& sale : engine.demo_sales(nae::generator::today_utc())) {
            items.push_back(std::move(sale.item));
        }
    } else {
        if (inv.args.empty()) {
            fmt::print(stderr, "Error: sales requires a CSV file path or --demo\n");
            return 1;
        }
        auto loaded = nae::core::DataLoader::load_line_items_csv(inv.args[0]);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", inv.args[0]);
            return 1;
        }
        items = std::move(*loaded);
        fmt::print("Loaded {} line items from '{}'\n", items.size(), inv.args[0]);
    }

    auto summary = engine.analyze_sales(items);
    if (!summary) return report_error(summary.error());

    fmt::print("{}", summary->to_string());
    return 0;
}

int run_demo(nae::core::Engine& engine) {
    const auto sales = engine.demo_sales(nae::generator::today_utc());
    fmt::print("{} demo sales\n", sales.size());
    fmt::print("{:<10}  {:<10}  {:>4}  {:>10}\n", "date", "product", "qty", "price");
    for (const auto& sale : sales) {
        fmt::print("{}\n", sale.to_string());
    }
    return 0;
}

int run_stats(nae::core::Engine& engine, const Invocation& inv) {
    const auto numbers = collect_numbers(inv.args);
    auto stats = engine.analyze_numbers(numbers);
    if (!stats) return report_error(stats.error());

    fmt::print("{}\n", stats->to_string());
    return 0;
}

int run_sample(nae::core::Engine& engine, const Invocation& inv) {
    std::int64_t count = nae::constants::DEFAULT_SAMPLE_COUNT;
    if (!inv.args.empty() && !parse_integer(inv.args[0], count)) {
        fmt::print(stderr, "Error: invalid count '{}'\n", inv.args[0]);
        return 1;
    }

    auto stats = engine.sample_statistics(count);
    if (!stats) return report_error(stats.error());

    fmt::print("{}\n", stats->to_string());
    return 0;
}

int run_trend(nae::core::Engine& engine, const Invocation& inv) {
    const auto points = collect_numbers(inv.args);
    auto forecast = engine.predict_trend(points);
    if (!forecast) return report_error(forecast.error());

    fmt::print("{}\n", forecast->to_string());
    return 0;
}

int run_chart(nae::core::Engine& engine) {
    const auto series = engine.chart_series();
    fmt::print("type: {}\n", series.kind);
    for (std::size_t i = 0; i < series.values.size(); ++i) {
        fmt::print("{}  {:10.4f}\n", series.labels[i], series.values[i]);
    }
    return 0;
}

int run_calc(const Invocation& inv) {
    if (inv.args.size() != 3) {
        fmt::print(stderr, "Error: calc requires <op> <a> <b>\n");
        return 1;
    }

    auto op = nae::calculator::parse_operation(inv.args[0]);
    if (!op) return report_error(op.error());

    const auto a = nae::core::DataLoader::parse_numbers(inv.args[1]);
    const auto b = nae::core::DataLoader::parse_numbers(inv.args[2]);
    if (a.size() != 1 || b.size() != 1) {
        return report_error(nae::Error{nae::ErrorKind::InvalidInput,
                                       "Operands must be finite numbers"});
    }

    auto calc = nae::calculator::Calculator::apply(*op, a[0], b[0]);
    if (!calc) return report_error(calc.error());

    fmt::print("{}\n", calc->to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    Invocation inv;
    if (!parse_invocation(argc, argv, inv)) {
        return 1;
    }

    if (inv.command == "calc") {
        return run_calc(inv);
    }

    nae::core::Engine engine(inv.config);

    if (inv.command == "sales")  return run_sales(engine, inv);
    if (inv.command == "demo")   return run_demo(engine);
    if (inv.command == "stats")  return run_stats(engine, inv);
    if (inv.command == "sample") return run_sample(engine, inv);
    if (inv.command == "trend")  return run_trend(engine, inv);
    if (inv.command == "chart")  return run_chart(engine);

    fmt::print(stderr, "Unknown command: {}\n", inv.command);
    print_usage();
    return 1;
}

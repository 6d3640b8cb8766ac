/**
 * @file main.cpp
 * @brief depimpact CLI entry point
 *
 * Commands:
 *   analyze   - Analyze the downstream impact of changing one entity
 *   replay    - Re-score a stored result with its embedded policy
 *   policy    - Print the current scoring policy snapshot
 *   version   - Show version information
 */

#include "depimpact/approval_policy.hpp"
#include "depimpact/canonical_json.hpp"
#include "depimpact/common.hpp"
#include "depimpact/config.hpp"
#include "depimpact/dependency_repository.hpp"
#include "depimpact/impact_analyzer.hpp"
#include "depimpact/report.hpp"
#include "depimpact/risk_evaluator.hpp"
#include "depimpact/schema_validate.hpp"
#include "depimpact/verdict.hpp"
#include "depimpact/version.hpp"

#include <charconv>
#include <chrono>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

enum class OutputFormat { kText, kJson };

void print_version()
{
    std::println("depimpact {} ({})", depimpact::kVersion, depimpact::kBuildId);
    std::println("  scoring:  {}", depimpact::kScoringPolicyVersion);
    std::println("  approval: {}", depimpact::kApprovalPolicyVersion);
    std::println("  result:   {}", depimpact::kResultSchemaVersion);
}

void print_help()
{
    std::print(R"(depimpact - Database entity change impact analysis

Usage: depimpact <command> [options]

Commands:
  analyze     Analyze the downstream impact of changing one entity
  replay      Re-score a stored result with its embedded policy snapshot
  policy      Print the current scoring policy snapshot
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'depimpact <command> --help' for command-specific options.
)");
}

void print_analyze_help()
{
    std::print(R"(Usage: depimpact analyze [options]

Analyze the downstream impact of changing one entity

Options:
  --rows FILE              Path to dependency_rows.v1 JSON (required)
  --root TYPE:ID           Entity being changed, e.g. Table:42 (required)
  --change KIND            Create, Modify or Delete (default: config, else Modify)
  --config FILE            analysis_config.v1 JSON
  --max-depth N            Maximum path depth (overrides config)
  --max-paths N            Maximum number of paths (overrides config)
  --timeout-ms N           Deadline for reading dependency rows
  --format text|json       Output format on stdout (default: text)
  --out FILE               Write the impact_result.v1 document to FILE
  --schema-dir DIR         Path to schema directory (default: ./schemas)
  --quiet, -q              Only print the report
  --verbose                Print per-stage counters
  --help, -h               Show this help

--max-depth and --max-paths are required unless the config file sets them.
)");
}

void print_replay_help()
{
    std::print(R"(Usage: depimpact replay [options]

Re-score every path of a stored result with the policy snapshot embedded in it.
Exits with status 1 when any stored score differs.

Options:
  --result FILE            Path to impact_result.v1 JSON (required)
  --schema-dir DIR         Path to schema directory (default: ./schemas)
  --help, -h               Show this help
)");
}

void print_policy_help()
{
    std::print(R"(Usage: depimpact policy [options]

Print the current scoring policy snapshot as canonical JSON

Options:
  --out FILE               Write the snapshot to FILE instead of stdout
  --help, -h               Show this help
)");
}

struct AnalyzeOptions
{
    std::string rows;
    std::string root;
    std::optional<std::string> change;
    std::optional<std::string> config;
    std::optional<int> max_depth;
    std::optional<int> max_paths;
    std::optional<int> timeout_ms;
    OutputFormat format;
    std::optional<std::string> output;
    std::string schema_dir;
    bool quiet;
    bool verbose;
    bool show_help;
};

struct ReplayOptions
{
    std::string result;
    std::string schema_dir;
    bool show_help;
};

struct PolicyOptions
{
    std::optional<std::string> output;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> depimpact::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(depimpact::Error::make(
            "MissingArgument",
            std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

/// Range checks are left to the consumer so non-positive limits are reported, not clamped.
[[nodiscard]] depimpact::Result<int> parse_int_value(std::string_view value,
                                                     std::string_view option)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(depimpact::Error::make(
            "InvalidArgument",
            std::string("Invalid ") + std::string(option) + " value: " + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] depimpact::Result<int>
read_int_option(std::span<char*> args, std::size_t index, std::string_view option)
{
    auto value = read_option_value(args, index, option);
    if (!value) {
        return std::unexpected(value.error());
    }
    return parse_int_value(*value, option);
}

[[nodiscard]] auto set_analyze_value_option(std::string_view arg,
                                            // CLI parsing signature is stable.
                                            // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                            std::span<char*> args,
                                            std::size_t idx,
                                            AnalyzeOptions& options) -> depimpact::Result<bool>
{
    if (arg == "--max-depth" || arg == "--max-paths" || arg == "--timeout-ms") {
        auto parsed = read_int_option(args, idx, arg);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        if (arg == "--max-depth") {
            options.max_depth = *parsed;
        } else if (arg == "--max-paths") {
            options.max_paths = *parsed;
        } else {
            options.timeout_ms = *parsed;
        }
        return depimpact::Result<bool>{true};
    }
    if (arg == "--format") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (*value == "text") {
            options.format = OutputFormat::kText;
        } else if (*value == "json") {
            options.format = OutputFormat::kJson;
        } else {
            return std::unexpected(
                depimpact::Error::make("InvalidArgument", "Invalid --format value: " + *value));
        }
        return depimpact::Result<bool>{true};
    }

    std::string* target = nullptr;
    std::optional<std::string>* optional_target = nullptr;
    if (arg == "--rows") {
        target = &options.rows;
    } else if (arg == "--root") {
        target = &options.root;
    } else if (arg == "--schema-dir") {
        target = &options.schema_dir;
    } else if (arg == "--change") {
        optional_target = &options.change;
    } else if (arg == "--config") {
        optional_target = &options.config;
    } else if (arg == "--out" || arg == "-o") {
        optional_target = &options.output;
    } else {
        return depimpact::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (target != nullptr) {
        *target = std::move(*value);
    } else {
        *optional_target = std::move(*value);
    }
    return depimpact::Result<bool>{true};
}

[[nodiscard]] depimpact::Result<AnalyzeOptions> parse_analyze_args(std::span<char*> args)
{
    AnalyzeOptions options{.rows = std::string{},
                           .root = std::string{},
                           .change = std::nullopt,
                           .config = std::nullopt,
                           .max_depth = std::nullopt,
                           .max_paths = std::nullopt,
                           .timeout_ms = std::nullopt,
                           .format = OutputFormat::kText,
                           .output = std::nullopt,
                           .schema_dir = "schemas",
                           .quiet = false,
                           .verbose = false,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        auto consumed = set_analyze_value_option(arg, args, static_cast<std::size_t>(i), options);
        if (!consumed) {
            return std::unexpected(consumed.error());
        }
        if (!*consumed) {
            return std::unexpected(
                depimpact::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] depimpact::Result<ReplayOptions> parse_replay_args(std::span<char*> args)
{
    ReplayOptions options{.result = std::string{}, .schema_dir = "schemas", .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--result") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.result = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            depimpact::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] depimpact::Result<PolicyOptions> parse_policy_args(std::span<char*> args)
{
    PolicyOptions options{.output = std::nullopt, .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--out" || arg == "-o") {
            auto value = read_option_value(args, static_cast<std::size_t>(i), arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            depimpact::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

/// Config file values first, then command-line overrides.
[[nodiscard]] depimpact::Result<depimpact::config::AnalysisConfig>
resolve_config(const AnalyzeOptions& options)
{
    depimpact::config::AnalysisConfig config;
    if (options.config) {
        auto loaded = depimpact::config::load_config(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.max_depth) {
        config.max_depth = options.max_depth;
    }
    if (options.max_paths) {
        config.max_paths = options.max_paths;
    }
    if (options.timeout_ms) {
        if (*options.timeout_ms <= 0) {
            return std::unexpected(depimpact::Error::make(
                "InvalidArgument",
                "--timeout-ms must be positive (got " + std::to_string(*options.timeout_ms) + ")"));
        }
        config.fetch_timeout_ms = options.timeout_ms;
    }
    if (options.change) {
        auto change = depimpact::scoring::parse_change_type(*options.change);
        if (!change) {
            return std::unexpected(change.error());
        }
        config.change_type = *change;
    }
    return config;
}

[[nodiscard]] depimpact::VoidResult write_result_document(const AnalyzeOptions& options,
                                                          const nlohmann::json& document)
{
    const std::filesystem::path schema_path =
        std::filesystem::path(options.schema_dir)
        / (std::string(depimpact::kResultSchemaVersion) + ".schema.json");
    if (auto validation = depimpact::common::validate_json(document, schema_path.string());
        !validation) {
        return std::unexpected(
            depimpact::Error::make("SchemaInvalid",
                                   std::string("impact_result schema validation failed: ")
                                       + validation.error().message));
    }
    return depimpact::canonical::write_canonical_json_file(*options.output, document);
}

[[nodiscard]] int run_analyze(const AnalyzeOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }
    auto limits = depimpact::config::resolve_limits(*config);
    if (!limits) {
        std::println(stderr, "Error: {}", limits.error().message);
        return 1;
    }
    auto root = depimpact::graph::parse_stable_key(options.root);
    if (!root) {
        std::println(stderr, "Error: invalid --root: {}", root.error().message);
        return 1;
    }
    auto approval_policy = depimpact::approval::make_approval_policy(config->approval_policy_version);
    if (!approval_policy) {
        std::println(stderr, "Error: {}", approval_policy.error().message);
        return 1;
    }

    const depimpact::analysis::ImpactAnalyzer analyzer(depimpact::scoring::PathRiskEvaluator{},
                                                       std::move(*approval_policy));
    const depimpact::analysis::JsonFileDependencyRepository repository(options.rows,
                                                                       options.schema_dir);
    const auto context =
        config->fetch_timeout_ms
            ? depimpact::analysis::FetchContext::with_timeout(
                  std::chrono::milliseconds(*config->fetch_timeout_ms))
            : depimpact::analysis::FetchContext{};

    if (!options.quiet) {
        std::println("[analyze] {} ({}), max depth {}, max paths {}",
                     root->stable_key(),
                     depimpact::scoring::to_string(config->change_type),
                     limits->max_depth,
                     limits->max_paths);
    }
    auto result = analyzer.analyze(repository, *root, config->change_type, *limits, context);
    if (!result) {
        std::println(stderr, "Error: analyze failed: {}", result.error().message);
        return 1;
    }
    if (options.verbose) {
        std::println("[analyze] rows fetched: {}", result->stats.rows_fetched);
        std::println("[analyze] graph: {} nodes, {} edges",
                     result->stats.graph_nodes,
                     result->stats.graph_edges);
        std::println("[analyze] paths emitted: {}", result->total_paths);
        std::println("[analyze] entities impacted: {}", result->total_entities);
    }

    const depimpact::verdict::VerdictBuilder verdict_builder;
    const auto verdict = verdict_builder.build(*result);
    const auto document =
        depimpact::report::build_result_document(*result, verdict, depimpact::default_tool_info());

    if (options.output) {
        if (auto written = write_result_document(options, document); !written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
        if (!options.quiet) {
            std::println("[analyze] wrote {}", *options.output);
        }
    }

    if (options.format == OutputFormat::kJson) {
        auto canonical = depimpact::canonical::canonicalize(document);
        if (!canonical) {
            std::println(stderr, "Error: {}", canonical.error().message);
            return 1;
        }
        std::println("{}", *canonical);
        return 0;
    }
    for (const auto& line : depimpact::report::render_text(*result, verdict)) {
        std::println("{}", line);
    }
    return 0;
}

[[nodiscard]] int run_replay(const ReplayOptions& options)
{
    auto document = depimpact::canonical::read_json_file(options.result);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return 1;
    }
    const std::filesystem::path schema_path =
        std::filesystem::path(options.schema_dir)
        / (std::string(depimpact::kResultSchemaVersion) + ".schema.json");
    if (auto validation = depimpact::common::validate_json(*document, schema_path.string());
        !validation) {
        std::println(stderr,
                     "Error: impact_result schema validation failed: {}",
                     validation.error().message);
        return 1;
    }

    auto report = depimpact::report::replay_result(*document);
    if (!report) {
        std::println(stderr, "Error: replay failed: {}", report.error().message);
        return 1;
    }
    std::println("[replay] policy {}: {} paths checked, {} mismatches",
                 report->policy_version,
                 report->paths_checked,
                 report->mismatches.size());
    for (const auto& mismatch : report->mismatches) {
        std::println("  {}: stored {} ({}), replayed {} ({})",
                     mismatch.path_id,
                     mismatch.stored_score,
                     depimpact::pathing::to_string(mismatch.stored_level),
                     mismatch.replayed_score,
                     depimpact::pathing::to_string(mismatch.replayed_level));
    }
    return report->clean() ? 0 : 1;
}

[[nodiscard]] int run_policy(const PolicyOptions& options)
{
    const depimpact::scoring::PathRiskEvaluator evaluator;
    const auto snapshot = depimpact::scoring::policy_snapshot_to_json(evaluator.policy_snapshot());
    if (options.output) {
        auto written = depimpact::canonical::write_canonical_json_file(*options.output, snapshot);
        if (!written) {
            std::println(stderr, "Error: {}", written.error().message);
            return 1;
        }
        std::println("[policy] wrote {}", *options.output);
        return 0;
    }
    auto canonical = depimpact::canonical::canonicalize(snapshot);
    if (!canonical) {
        std::println(stderr, "Error: {}", canonical.error().message);
        return 1;
    }
    std::println("{}", *canonical);
    return 0;
}

int cmd_analyze(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_analyze_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_analyze_help();
        return 0;
    }
    if (options->rows.empty() || options->root.empty()) {
        std::println(stderr, "Error: --rows and --root are required");
        print_analyze_help();
        return 1;
    }
    return run_analyze(*options);
}

int cmd_replay(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_replay_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_replay_help();
        return 0;
    }
    if (options->result.empty()) {
        std::println(stderr, "Error: --result is required");
        print_replay_help();
        return 1;
    }
    return run_replay(*options);
}

int cmd_policy(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_policy_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_policy_help();
        return 0;
    }
    return run_policy(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "analyze") {
            return cmd_analyze(sub_argc, sub_argv);
        }
        if (cmd == "replay") {
            return cmd_replay(sub_argc, sub_argv);
        }
        if (cmd == "policy") {
            return cmd_policy(sub_argc, sub_argv);
        }

        std::println(stderr, "Error: unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}

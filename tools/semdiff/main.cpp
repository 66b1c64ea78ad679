/**
 * @file main.cpp
 * @brief semdiff CLI entry point
 *
 * Commands:
 *   diff      - Compare two JSON documents
 *   hints     - Infer type hints from a JSON Schema
 *   version   - Show version information
 */

#include "semdiff/require_cpp23.hpp"

#include "semdiff/common.hpp"
#include "semdiff/config.hpp"
#include "semdiff/diff.hpp"
#include "semdiff/report.hpp"
#include "semdiff/rules_file.hpp"
#include "semdiff/tree.hpp"
#include "semdiff/type_hints.hpp"
#include "semdiff/version.hpp"

#include <charconv>
#include <cstdio>
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
#include <vector>

namespace {

void print_version()
{
    std::println("semdiff {} ({})", semdiff::kVersion, semdiff::kBuildId);
    std::println("  rules:  {}", semdiff::kRulesVersion);
    std::println("  report: {}", semdiff::report::kReportSchemaVersion);
}

void print_help()
{
    std::print(R"(semdiff - Semantic JSON diff

Usage: semdiff <command> [options]

Commands:
  diff        Compare two JSON documents
  hints       Infer type hints from a JSON Schema
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'semdiff <command> --help' for command-specific options.
)");
}

void print_diff_help()
{
    std::print(R"(Usage: semdiff diff [options]

Compare two JSON documents

Options:
  --left FILE               Document before the change (required)
  --right FILE              Document after the change (required)
  --rules FILE              Rules file (lists, ignores, equivalences)
  --hints FILE              Type hints ({"/path": "Label"}), e.g. from 'semdiff hints'
  --format text|json        Output format (default: text)
  --output FILE, -o         Output file (default: stdout)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --exit-code               Exit with 1 when differences are found
  --help, -h                Show this help
)");
}

void print_hints_help()
{
    std::print(R"(Usage: semdiff hints [options]

Infer type hints from a JSON Schema

Options:
  --schema FILE             JSON Schema document (required)
  --depth N                 Re-entries allowed per self-referential definition (default: 1)
  --output FILE, -o         Output file (default: stdout)
  --help, -h                Show this help
)");
}

enum class OutputFormat {
    kText,
    kJson
};

struct DiffOptions
{
    std::string left;
    std::string right;
    std::optional<std::string> rules;
    std::optional<std::string> hints;
    OutputFormat format;
    std::optional<std::string> output;
    std::string schema_dir;
    bool exit_code;
    bool show_help;
};

struct HintsOptions
{
    std::string schema;
    int depth;
    std::optional<std::string> output;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> semdiff::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            semdiff::Error::make("MissingArgument",
                                 std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] semdiff::Result<int> parse_depth_value(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed < 0) {
        return std::unexpected(
            semdiff::Error::make("InvalidArgument",
                                 std::string("Invalid --depth value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] semdiff::Result<DiffOptions> parse_diff_args(std::span<char*> args)
{
    DiffOptions options{.left = std::string{},
                        .right = std::string{},
                        .rules = std::nullopt,
                        .hints = std::nullopt,
                        .format = OutputFormat::kText,
                        .output = std::nullopt,
                        .schema_dir = "schemas",
                        .exit_code = false,
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
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--exit-code") {
            options.exit_code = true;
            continue;
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
                    semdiff::Error::make("InvalidArgument", "Invalid --format value: " + *value));
            }
            skip_next = true;
            continue;
        }

        std::string* target = nullptr;
        std::optional<std::string>* optional_target = nullptr;
        if (arg == "--left") {
            target = &options.left;
        } else if (arg == "--right") {
            target = &options.right;
        } else if (arg == "--schema-dir") {
            target = &options.schema_dir;
        } else if (arg == "--rules") {
            optional_target = &options.rules;
        } else if (arg == "--hints") {
            optional_target = &options.hints;
        } else if (arg == "--output" || arg == "-o") {
            optional_target = &options.output;
        } else {
            return std::unexpected(
                semdiff::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }

        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        if (target != nullptr) {
            *target = *value;
        } else {
            *optional_target = *value;
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] semdiff::Result<HintsOptions> parse_hints_args(std::span<char*> args)
{
    HintsOptions options{.schema = std::string{},
                         .depth = semdiff::InferenceDepth::kDefaultMaxDepth,
                         .output = std::nullopt,
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
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--schema") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--depth") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto parsed = parse_depth_value(*value);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            options.depth = *parsed;
            skip_next = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            semdiff::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
    }
    return options;
}

[[nodiscard]] semdiff::VoidResult load_hints_file(semdiff::ConfigurationBuilder& builder,
                                                  const std::filesystem::path& path)
{
    auto document = semdiff::read_tree_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (!document->is_object()) {
        return std::unexpected(semdiff::Error::make(
            "ParseError", "Type hints file must be a JSON object: " + path.string()));
    }
    for (const auto& [pointer, label] : document->items()) {
        if (!label.is_string()) {
            return std::unexpected(semdiff::Error::make(
                "InvalidLabel", "Type hint for " + pointer + " must be a string"));
        }
        if (auto result = builder.type_hint(pointer, label.get<std::string>()); !result) {
            return result;
        }
    }
    return {};
}

[[nodiscard]] semdiff::VoidResult emit(const std::optional<std::string>& output,
                                       const std::string& content)
{
    if (!output) {
        std::print("{}", content);
        return {};
    }
    return semdiff::write_text_file(*output, content);
}

[[nodiscard]] semdiff::Result<semdiff::Configuration> build_configuration(const DiffOptions& options)
{
    semdiff::ConfigurationBuilder builder;
    if (options.rules) {
        auto loaded = semdiff::load_rules_file(*options.rules, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        builder = std::move(*loaded);
    }
    if (options.hints) {
        if (auto result = load_hints_file(builder, *options.hints); !result) {
            return std::unexpected(result.error());
        }
    }
    return builder.build();
}

[[nodiscard]] int run_diff(const DiffOptions& options)
{
    auto config = build_configuration(options);
    if (!config) {
        std::println(stderr, "Error: {}", config.error().message);
        return 1;
    }

    auto left = semdiff::read_tree_file(options.left);
    if (!left) {
        std::println(stderr, "Error: {}", left.error().message);
        return 1;
    }
    auto right = semdiff::read_tree_file(options.right);
    if (!right) {
        std::println(stderr, "Error: {}", right.error().message);
        return 1;
    }

    const semdiff::Differ differ(std::move(*config));
    const auto entries = differ.compare(*left, *right);

    std::string content;
    if (options.format == OutputFormat::kJson) {
        content = semdiff::report::build_report(entries).dump(2) + "\n";
    } else {
        for (const auto& line : semdiff::report::render_text(entries)) {
            content += line;
            content += '\n';
        }
    }
    if (auto result = emit(options.output, content); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }

    if (options.output) {
        const auto summary = semdiff::report::summarize(entries);
        std::println("[diff] {} change(s): {} added, {} removed, {} changed",
                     summary.total(),
                     summary.added,
                     summary.removed,
                     summary.changed);
        std::println("  output: {}", *options.output);
    }
    return options.exit_code && !entries.empty() ? 1 : 0;
}

[[nodiscard]] int run_hints(const HintsOptions& options)
{
    auto schema = semdiff::read_tree_file(options.schema);
    if (!schema) {
        std::println(stderr, "Error: {}", schema.error().message);
        return 1;
    }

    semdiff::InferenceDepthBuilder depth;
    if (auto result = depth.default_max_depth(options.depth); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    auto hints = semdiff::infer_type_hints(*schema, depth.build());
    if (!hints) {
        std::println(stderr, "Error: type hint inference failed: {}", hints.error().message);
        return 1;
    }

    const nlohmann::json payload(hints->entries());
    if (auto result = emit(options.output, payload.dump(2) + "\n"); !result) {
        std::println(stderr, "Error: {}", result.error().message);
        return 1;
    }
    if (options.output) {
        std::println("[hints] {} type hint(s)", hints->entries().size());
        std::println("  output: {}", *options.output);
    }
    return 0;
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_diff_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_diff_help();
        return 0;
    }
    if (options->left.empty() || options->right.empty()) {
        std::println(stderr, "Error: --left and --right are required");
        print_diff_help();
        return 1;
    }
    return run_diff(*options);
}

int cmd_hints(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_hints_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_hints_help();
        return 0;
    }
    if (options->schema.empty()) {
        std::println(stderr, "Error: --schema is required");
        print_hints_help();
        return 1;
    }
    return run_hints(*options);
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

        if (cmd == "diff") {
            return cmd_diff(sub_argc, sub_argv);
        }
        if (cmd == "hints") {
            return cmd_hints(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
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

/**
 * @file cli.cpp
 * @brief Command line implementation.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into a one-shot validation run:
 *   Request → Classify → Engine (TierScheduler | SequentialFallback) → RunSummary → exit code
 */

#include "app/cli.hpp"

#include "codec/json_codec.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "task/task_descriptor.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <exception>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <sstream>
#include <system_error>

namespace tier_gate {

namespace {

Result<uint32_t> parse_millis(std::string_view text) {
    uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return Error{"Invalid millisecond value: " + std::string{text}};
    }
    return value;
}

Result<std::string> read_request(const std::optional<std::filesystem::path>& path,
                                 std::istream& in) {
    if (!path) {
        return std::string{std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>()};
    }
    std::ifstream file(*path, std::ios::binary);
    if (!file) {
        return Error{"Cannot open request file: " + path->string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void print_json(std::ostream& out, const nlohmann::ordered_json& doc) {
    out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

int run_validation(const RunRequest& request, std::ostream& out) {
    auto reports = nlohmann::ordered_json::array();
    bool all_valid = true;
    for (const auto& raw : request.hooks) {
        auto report = validate(raw);
        all_valid = all_valid && report.valid();
        reports.push_back(encode_report(report));
    }
    print_json(out, reports);
    return all_valid ? 0 : kExitError;
}

int run_hooks(const Config& config, const RunRequest& request, CliStreams io,
              std::unique_ptr<IInvoker> invoker) {
    // ── Initialize Logger ────────────────────
    auto log_level = parse_log_level(config.telemetry.log_level);
    if (!log_level) {
        io.err << "tier_gate: unknown log level '" << config.telemetry.log_level
               << "', using info" << std::endl;
    }

    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    try {
        if (!config.telemetry.log_dir.empty()) {
            log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "tier_gate",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
            metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                          "tier_gate_metrics",
                                                          config.telemetry.max_file_size_mb,
                                                          config.telemetry.rotate_count);
        } else {
            log_sink = std::make_unique<StderrSink>();
        }
    } catch (const std::exception& ex) {
        io.err << "tier_gate: cannot open log directory: " << ex.what() << std::endl;
        return kExitError;
    }

    // ── Run ──────────────────────────────────
    try {
        auto tasks = classify_all(request.hooks, config.tiers);

        Engine engine(Engine::Options{
            .config = config,
            .log_sink = std::move(log_sink),
            .log_level = log_level.value_or(LogLevel::Info),
            .invoker = std::move(invoker),
            .metrics_sink = std::move(metrics_sink),
        });
        engine.logger().log(config.engine.verbose ? LogLevel::Info : LogLevel::Debug,
                            "Running " + std::to_string(tasks.size()) + " hook(s)");

        auto summary = engine.execute(tasks, request.data, engine.default_run_options());
        engine.metrics().flush();
        engine.logger().flush();

        print_json(io.out, encode_summary(summary));
        return exit_code_for(summary);

    } catch (const std::exception& ex) {
        io.err << "tier_gate: fatal: " << ex.what() << std::endl;
        return kExitError;
    }
}

}  // anonymous namespace

void print_usage(std::ostream& out) {
    out << "Usage: tier_gate [OPTIONS] [REQUEST.json]\n"
        << "Reads {\"hooks\": [...], \"data\": {...}} from REQUEST.json or stdin and\n"
        << "prints the run summary as JSON.\n\n"
        << "  --config <path>      Configuration file (TOML)\n"
        << "  --verbose            Log tier progress at info level\n"
        << "  --no-fallback        Fail instead of replaying sequentially on a fault\n"
        << "  --timeout-ms <n>     Cap every hook's timeout for this run\n"
        << "  --validate           Print a validation report per hook, do not run\n"
        << "  --classify           Print the hooks grouped by tier, do not run\n"
        << "  --stats              Print hook counts and timeout totals, do not run\n"
        << "  --help, -h           Show this help message\n\n"
        << "Exit status: 0 allowed, 2 blocked, 1 a hook failed or timed out, or error.\n";
}

Result<CLIArgs> parse_args(const std::vector<std::string>& words) {
    CLIArgs args;
    bool mode_given = false;
    auto set_mode = [&](CliMode mode) -> Result<void> {
        if (mode_given && args.mode != mode) {
            return Error{"Only one of --validate, --classify and --stats may be given"};
        }
        args.mode = mode;
        mode_given = true;
        return Result<void>{};
    };

    for (size_t i = 0; i < words.size(); ++i) {
        const auto& arg = words[i];
        if (arg == "--config") {
            if (i + 1 >= words.size()) return Error{"--config requires a path"};
            args.config_path = words[++i];
        } else if (arg == "--timeout-ms") {
            if (i + 1 >= words.size()) return Error{"--timeout-ms requires a value"};
            auto value = parse_millis(words[++i]);
            if (!value) return value.error();
            args.timeout_ms = *value;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--no-fallback") {
            args.no_fallback = true;
        } else if (arg == "--validate" || arg == "--classify" || arg == "--stats") {
            auto mode = arg == "--validate" ? CliMode::Validate
                      : arg == "--classify" ? CliMode::Classify
                                            : CliMode::Stats;
            if (auto set = set_mode(mode); !set) return set.error();
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg.size() > 1 && arg.front() == '-') {
            return Error{"Unknown option: " + arg};
        } else if (args.input_path) {
            return Error{"Only one request file may be given"};
        } else {
            args.input_path = arg;
        }
    }
    return args;
}

int run_cli(const CLIArgs& args, CliStreams io, std::unique_ptr<IInvoker> invoker) {
    if (args.help) {
        print_usage(io.out);
        return 0;
    }

    // Load configuration
    Config config = default_config();
    if (args.config_path) {
        auto config_result = load_config(*args.config_path);
        if (!config_result) {
            io.err << "tier_gate: failed to load config: "
                   << config_result.error().message << std::endl;
            return kExitError;
        }
        config = *config_result;
    }

    // Apply CLI overrides
    if (args.verbose) config.engine.verbose = true;
    if (args.no_fallback) config.engine.fallback_to_sequential = false;
    if (args.timeout_ms) config.engine.timeout_ms = *args.timeout_ms;

    auto text = read_request(args.input_path, io.in);
    if (!text) {
        io.err << "tier_gate: " << text.error().message << std::endl;
        return kExitError;
    }
    auto request = decode_request(*text);
    if (!request) {
        io.err << "tier_gate: " << request.error().message << std::endl;
        return kExitError;
    }

    switch (args.mode) {
        case CliMode::Validate:
            return run_validation(*request, io.out);
        case CliMode::Classify:
            print_json(io.out, encode_classification(classify_all(request->hooks, config.tiers)));
            return 0;
        case CliMode::Stats:
            print_json(io.out, encode_task_stats(task_stats(classify_all(request->hooks,
                                                                        config.tiers))));
            return 0;
        case CliMode::Run:
            break;
    }
    return run_hooks(config, *request, io, std::move(invoker));
}

int cli_main(const std::vector<std::string>& words, CliStreams io,
             std::unique_ptr<IInvoker> invoker) {
    auto args = parse_args(words);
    if (!args) {
        io.err << "tier_gate: " << args.error().message << "\n";
        print_usage(io.err);
        return kExitError;
    }
    return run_cli(*args, io, std::move(invoker));
}

}  // namespace tier_gate

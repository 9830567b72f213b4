#include "core/config.hpp"
#include "engine/analysis_engine.hpp"
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <input.csv|input.json>\n"
              << "       " << program << " --simulate <count> [--seed <n>] [-o <file>]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>      Load configuration from JSON file\n"
              << "  -m, --method <name>      Detection method: zscore | iqr\n"
              << "  -w, --window <n>         Rolling window size (>= 2)\n"
              << "  -z, --z-threshold <x>    |z| above which a reading is anomalous\n"
              << "  -k, --iqr-k <x>          IQR fence multiplier\n"
              << "  -t, --threads <n>        Worker threads for per-sensor evaluation (1-256)\n"
              << "      --sensor <id>        Only analyse this sensor\n"
              << "      --since <iso8601>    Only analyse readings at or after this instant\n"
              << "      --limit <n>          Only analyse the n most recent readings\n"
              << "      --alerts-only        Report anomalies instead of every row\n"
              << "      --alert-limit <n>    Maximum alerts in the report (0 = all)\n"
              << "      --format <csv|json>  Input format (default: from extension)\n"
              << "  -o, --output <path>      Write the report to a file instead of stdout\n"
              << "      --pretty             Indent the JSON report\n"
              << "      --simulate <count>   Emit simulated readings as CSV\n"
              << "      --seed <n>           Simulator seed (default 42)\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << "\nEnvironment Variables:\n"
              << "  FLOWGUARD_WINDOW, FLOWGUARD_METHOD, FLOWGUARD_Z_THRESHOLD,\n"
              << "  FLOWGUARD_IQR_K, FLOWGUARD_THREADS, FLOWGUARD_SENSOR_COLUMN,\n"
              << "  FLOWGUARD_VALUE_COLUMN, FLOWGUARD_TIMESTAMP_COLUMN, FLOWGUARD_SENSOR,\n"
              << "  FLOWGUARD_SINCE, FLOWGUARD_LIMIT, FLOWGUARD_ALERT_LIMIT, FLOWGUARD_LOG_LEVEL\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "flowguard v1.0.0\n"
              << "Rolling anomaly detection for flow-meter readings\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> method;
    std::optional<std::size_t> window;
    std::optional<double> z_threshold;
    std::optional<double> iqr_k;
    std::optional<std::size_t> threads;
    std::optional<std::string> sensor;
    std::optional<std::string> since;
    std::optional<std::size_t> limit;
    std::optional<std::size_t> alert_limit;
    std::optional<std::string> format;
    std::optional<std::string> output;
    std::optional<std::size_t> simulate;
    std::uint32_t seed = 42;
    std::optional<std::string> input;
    bool alerts_only = false;
    bool pretty = false;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> error;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto next = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = "Missing value for " + flag;
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    // Non-negative integer option
    auto next_size = [&](int& i, const std::string& flag) -> std::optional<std::size_t> {
        auto text = next(i, flag);
        if (!text) {
            return std::nullopt;
        }
        auto parsed = flowguard::parse_size(*text);
        if (parsed.is_err()) {
            args.error = flag + ": " + parsed.error();
            return std::nullopt;
        }
        return parsed.value();
    };

    try {
        for (int i = 1; i < argc && !args.error; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.show_help = true;
            } else if (arg == "-v" || arg == "--version") {
                args.show_version = true;
            } else if (arg == "-c" || arg == "--config") {
                args.config_path = next(i, arg);
            } else if (arg == "-m" || arg == "--method") {
                args.method = next(i, arg);
            } else if (arg == "-w" || arg == "--window") {
                args.window = next_size(i, arg);
            } else if (arg == "-z" || arg == "--z-threshold") {
                if (auto v = next(i, arg)) args.z_threshold = std::stod(*v);
            } else if (arg == "-k" || arg == "--iqr-k") {
                if (auto v = next(i, arg)) args.iqr_k = std::stod(*v);
            } else if (arg == "-t" || arg == "--threads") {
                args.threads = next_size(i, arg);
            } else if (arg == "--sensor") {
                args.sensor = next(i, arg);
            } else if (arg == "--since") {
                args.since = next(i, arg);
            } else if (arg == "--limit") {
                args.limit = next_size(i, arg);
            } else if (arg == "--alert-limit") {
                args.alert_limit = next_size(i, arg);
            } else if (arg == "--alerts-only") {
                args.alerts_only = true;
            } else if (arg == "--format") {
                args.format = next(i, arg);
            } else if (arg == "-o" || arg == "--output") {
                args.output = next(i, arg);
            } else if (arg == "--pretty") {
                args.pretty = true;
            } else if (arg == "--simulate") {
                args.simulate = next_size(i, arg);
            } else if (arg == "--seed") {
                if (auto v = next_size(i, arg)) {
                    if (*v > std::numeric_limits<std::uint32_t>::max()) {
                        args.error = arg + ": seed must fit in 32 bits";
                    } else {
                        args.seed = static_cast<std::uint32_t>(*v);
                    }
                }
            } else if (!arg.empty() && arg.front() == '-') {
                args.error = "Unknown option: " + arg;
            } else if (!args.input) {
                args.input = arg;
            } else {
                args.error = "Unexpected argument: " + arg;
            }
        }
    } catch (const std::exception& e) {
        args.error = std::string("Invalid numeric option: ") + e.what();
    }

    return args;
}

/// CLI overrides (highest priority)
void apply_cli_overrides(const CliArgs& args, flowguard::Config& config) {
    if (args.method) config.detector.method = *args.method;
    if (args.window) config.detector.window = *args.window;
    if (args.z_threshold) config.detector.z_threshold = *args.z_threshold;
    if (args.iqr_k) config.detector.iqr_k = *args.iqr_k;
    if (args.threads) config.detector.threads = *args.threads;
    if (args.sensor) config.query.sensor_id = *args.sensor;
    if (args.since) config.query.since = *args.since;
    if (args.limit) config.query.limit = *args.limit;
    if (args.alert_limit) config.output.alert_limit = *args.alert_limit;
    if (args.alerts_only) config.output.alerts_only = true;
    if (args.pretty) config.output.pretty = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (args.error) {
        std::cerr << "Error: " << *args.error << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    if (!args.simulate && !args.input) {
        std::cerr << "Error: no input file given\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Priority: CLI > env > file > defaults
    auto config = flowguard::Config::load(args.config_path);
    apply_cli_overrides(args, config);

    if (auto problem = config.validate(); !problem.empty()) {
        std::cerr << "Invalid configuration: " << problem << std::endl;
        return 1;
    }

    try {
        flowguard::AnalysisEngine::setup_logging(config.output.log_level);
        flowguard::AnalysisEngine engine(config);

        if (args.simulate) {
            return engine.simulate(*args.simulate, args.seed, args.output);
        }
        return engine.run(*args.input, args.format, args.output);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

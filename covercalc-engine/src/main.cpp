#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include "config_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "money.hpp"
#include "policy_book.hpp"
#include "portfolio_simulator.hpp"
#include "quote_pipeline.hpp"
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

using namespace covercalc;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_VALIDATION = 1;
constexpr int EXIT_RUNTIME = 2;

struct CLIArgs {
    std::string command;
    std::string config_path;
    std::string request_path;
    std::string script_path;
    std::string policies_path;
    std::string date;
    std::string as_of_month;
    std::string retentions;
    std::string output_path;
    std::string book_out_path;
    int num_scenarios = 1000;
    uint64_t seed = 42;
    double rate_on_line = 0.10;
    double load = 0.20;
    int threads = 0;
    bool sensitivity = false;
    bool distribution = false;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "CoverCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  quote                       Score, price and route one quote request\n";
    std::cerr << "  session                     Run a script of quote / bind / cancel steps\n";
    std::cerr << "  simulate                    Monte Carlo portfolio simulation\n\n";
    std::cerr << "Quote options:\n";
    std::cerr << "  --config <path>             Underwriting configuration JSON (required)\n";
    std::cerr << "  --request <path>            Quote request JSON (required)\n";
    std::cerr << "  --date <YYYY-MM-DD>         Quote date (default: today, UTC)\n\n";
    std::cerr << "Session options:\n";
    std::cerr << "  --config <path>             Underwriting configuration JSON (required)\n";
    std::cerr << "  --script <path>             Session script JSON (required)\n";
    std::cerr << "  --book-out <path>           Write bound policies as a policy book CSV\n\n";
    std::cerr << "Simulate options:\n";
    std::cerr << "  --policies <path>           Policy book, CSV or Parquet (required)\n";
    std::cerr << "  --as-of-month <YYYY-MM>     Month to simulate (required)\n";
    std::cerr << "  --retentions <c1,c2,...>    Retention grid in cents (required)\n";
    std::cerr << "  --config <path>             Configuration JSON for loss model and limits\n";
    std::cerr << "  --scenarios <count>         Number of scenarios (default: 1000)\n";
    std::cerr << "  --seed <value>              Random seed (default: 42)\n";
    std::cerr << "  --rate-on-line <r>          Reinsurance rate on line (default: 0.10)\n";
    std::cerr << "  --load <l>                  Reinsurance load (default: 0.20)\n";
    std::cerr << "  --threads <n>               Worker threads, 0 = all cores (default: 0)\n";
    std::cerr << "  --sensitivity               Add rate-on-line and load sensitivity\n";
    std::cerr << "  --distribution              Include per-scenario losses in output\n\n";
    std::cerr << "Common options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also write log events to a file\n";
    std::cerr << "  --log-text                  Plain-text log lines instead of JSON\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 usage or validation error, 2 configuration or runtime error\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " quote --config config/underwriting.json \\\n";
    std::cerr << "      --request data/shipping_request.json --date 2025-01-15\n\n";
    std::cerr << "  " << program_name << " simulate --policies data/policy_book.csv \\\n";
    std::cerr << "      --as-of-month 2025-01 --retentions 50000,100000,250000 --sensitivity\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    int start = 1;
    if (argc > 1 && argv[1][0] != '-') {
        args.command = argv[1];
        start = 2;
    }

    try {
        for (int i = start; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--request" && i + 1 < argc) {
                args.request_path = argv[++i];
            } else if (arg == "--script" && i + 1 < argc) {
                args.script_path = argv[++i];
            } else if (arg == "--policies" && i + 1 < argc) {
                args.policies_path = argv[++i];
            } else if (arg == "--date" && i + 1 < argc) {
                args.date = argv[++i];
            } else if (arg == "--as-of-month" && i + 1 < argc) {
                args.as_of_month = argv[++i];
            } else if (arg == "--retentions" && i + 1 < argc) {
                args.retentions = argv[++i];
            } else if (arg == "--scenarios" && i + 1 < argc) {
                args.num_scenarios = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
            } else if (arg == "--rate-on-line" && i + 1 < argc) {
                args.rate_on_line = std::stod(argv[++i]);
            } else if (arg == "--load" && i + 1 < argc) {
                args.load = std::stod(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                args.threads = std::stoi(argv[++i]);
            } else if (arg == "--sensitivity") {
                args.sensitivity = true;
            } else if (arg == "--distribution") {
                args.distribution = true;
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--book-out" && i + 1 < argc) {
                args.book_out_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        return false;
    }
    return true;
}

bool require_file(const std::string& path, const std::string& flag, const std::string& what) {
    if (path.empty()) {
        std::cerr << "Error: " << flag << " is required\n";
        return false;
    }
    if (!file_exists(path)) {
        std::cerr << "Error: " << what << " not found: " << path << "\n";
        return false;
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.command == "quote") {
        valid &= require_file(args.config_path, "--config", "Config file");
        valid &= require_file(args.request_path, "--request", "Request file");
    } else if (args.command == "session") {
        valid &= require_file(args.config_path, "--config", "Config file");
        valid &= require_file(args.script_path, "--script", "Script file");
    } else if (args.command == "simulate") {
        valid &= require_file(args.policies_path, "--policies", "Policies file");
        if (!args.config_path.empty()) {
            valid &= require_file(args.config_path, "--config", "Config file");
        }
        if (args.as_of_month.empty()) {
            std::cerr << "Error: --as-of-month is required\n";
            valid = false;
        }
        if (args.retentions.empty()) {
            std::cerr << "Error: --retentions is required\n";
            valid = false;
        }
        if (args.threads < 0) {
            std::cerr << "Error: --threads must be non-negative\n";
            valid = false;
        }
    } else {
        std::cerr << "Error: Unknown command '" << args.command << "'\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    LoggerConfig config;
    config.min_level = string_to_level(args.log_level);
    config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    Logger::get_instance().configure(config);
}

Date today_utc() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    gmtime_r(&now, &tm_buf);
    return Date(tm_buf.tm_year + 1900, static_cast<unsigned>(tm_buf.tm_mon + 1),
                static_cast<unsigned>(tm_buf.tm_mday));
}

std::vector<Cents> parse_retentions(const std::string& text) {
    std::vector<Cents> grid;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        try {
            size_t consumed = 0;
            long long value = std::stoll(item, &consumed);
            if (consumed != item.size()) {
                throw std::invalid_argument(item);
            }
            grid.push_back(static_cast<Cents>(value));
        } catch (const std::logic_error&) {
            throw ValidationError("--retentions entry '" + item + "' is not an integer");
        }
    }
    return grid;
}

// Exit code for an exception escaping a command
int exit_code_for(const std::exception& e) {
    if (dynamic_cast<const ConfigurationError*>(&e) || dynamic_cast<const RateNotFoundError*>(&e)) {
        return EXIT_RUNTIME;
    }
    if (dynamic_cast<const UnderwritingError*>(&e)) {
        return EXIT_VALIDATION;
    }
    return EXIT_RUNTIME;
}

std::shared_ptr<ConfigStore> load_config(const std::string& path) {
    auto store = ConfigStore::from_file(path);
    Logger::get_instance().log_config_loaded(*store->snapshot(), store->generation());
    return store;
}

// ============================================================================
// Commands
// ============================================================================

int run_quote(const CLIArgs& args) {
    QuotePipeline pipeline(load_config(args.config_path));

    QuoteRequest request = io::quote_request_from_json(io::read_json_file(args.request_path));
    Date quote_date = args.date.empty() ? today_utc() : Date::parse(args.date);

    Quote quote = pipeline.quote(request, quote_date);
    io::write_json_document(std::cout, args.output_path, io::quote_to_json(quote));
    return EXIT_OK;
}

/**
 * Session script:
 *   {"steps": [
 *     {"op": "quote", "as": "q1", "date": "2025-01-15", "request": {...}},
 *     {"op": "bind", "quote": "q1", "as": "p1", "date": "2025-01-16", "policyholder": {...}},
 *     {"op": "cancel", "policy": "p1", "date": "2025-03-01"},
 *     {"op": "bind", "quote": "q1", "date": "2025-01-17", "policyholder": {...},
 *      "expect_error": "QuoteNotFoundError"}
 *   ]}
 *
 * "as" names a step's quote or policy id for later steps. A failing step is
 * recorded and the session continues; the exit code is non-zero if any step
 * failed other than with its expect_error.
 */
int run_session(const CLIArgs& args) {
    QuotePipeline pipeline(load_config(args.config_path));
    json script = io::read_json_file(args.script_path);
    if (!script.contains("steps") || !script.at("steps").is_array()) {
        throw ValidationError("session script must contain a \"steps\" array");
    }

    std::map<std::string, std::string> aliases;
    auto resolve = [&aliases](const std::string& name) {
        auto it = aliases.find(name);
        return it == aliases.end() ? name : it->second;
    };

    json results = json::array();
    int exit_code = EXIT_OK;
    size_t index = 0;

    for (const auto& step : script.at("steps")) {
        json result;
        result["step"] = index++;
        std::string expected = step.value("expect_error", std::string());

        try {
            std::string op = step.value("op", std::string());
            result["op"] = op;
            Date date = step.contains("date") ? Date::parse(step.at("date").get<std::string>()) : today_utc();

            if (op == "quote") {
                if (!step.contains("request")) {
                    throw ValidationError("quote step needs a request");
                }
                Quote quote = pipeline.quote(io::quote_request_from_json(step.at("request")), date);
                if (step.contains("as")) aliases[step.at("as").get<std::string>()] = quote.id;
                result["quote"] = io::quote_to_json(quote);
            } else if (op == "bind") {
                if (!step.contains("policyholder")) {
                    throw ValidationError("bind step needs a policyholder");
                }
                Policy policy = pipeline.bind(resolve(step.value("quote", std::string())),
                                              io::policyholder_from_json(step.at("policyholder")), date);
                if (step.contains("as")) aliases[step.at("as").get<std::string>()] = policy.id;
                result["policy"] = io::policy_to_json(policy);
            } else if (op == "cancel") {
                Policy policy = pipeline.cancel(resolve(step.value("policy", std::string())), date);
                result["policy"] = io::policy_to_json(policy);
            } else {
                throw ValidationError("unknown session op '" + op + "'");
            }

            result["ok"] = true;
            if (!expected.empty()) {
                result["unexpected_success"] = true;
                exit_code = std::max(exit_code, EXIT_VALIDATION);
            }

        } catch (const UnderwritingError& e) {
            result["ok"] = false;
            result["error_kind"] = error_kind(e);
            result["error"] = e.what();
            if (const auto* blocked = dynamic_cast<const ComplianceBlockedError*>(&e)) {
                result["blocking_rules"] = blocked->rule_ids();
            }
            if (expected != error_kind(e)) {
                exit_code = std::max(exit_code, exit_code_for(e));
            }
        } catch (const json::exception& e) {
            result["ok"] = false;
            result["error_kind"] = "ValidationError";
            result["error"] = std::string("malformed step: ") + e.what();
            exit_code = std::max(exit_code, EXIT_VALIDATION);
        }

        results.push_back(result);
    }

    json doc;
    doc["steps"] = results;
    json policies = json::array();
    for (const auto& policy : pipeline.policies()) {
        policies.push_back(io::policy_to_json(policy));
    }
    doc["policies"] = policies;
    doc["quote_count"] = pipeline.quote_count();

    io::write_json_document(std::cout, args.output_path, doc);

    if (!args.book_out_path.empty()) {
        std::ofstream book_file(args.book_out_path);
        if (!book_file) {
            throw std::runtime_error("Failed to open policy book output: " + args.book_out_path);
        }
        pipeline.policy_book_snapshot().write_csv(book_file);
    }

    return exit_code;
}

int run_simulate(const CLIArgs& args) {
    SimulationSettings settings;
    if (!args.config_path.empty()) {
        settings = load_config(args.config_path)->snapshot()->simulation;
    }

    SimulationRequest request;
    request.as_of_month = YearMonth::parse(args.as_of_month);
    request.scenario_count = args.num_scenarios;
    request.retention_grid = parse_retentions(args.retentions);
    request.reinsurance = ReinsuranceParams(args.rate_on_line, args.load);
    request.seed = args.seed;
    request.worker_count = args.threads;

    PolicyBook book = PolicyBook::load(args.policies_path);

    std::cerr << "CoverCalc v1.0.0\n";
    std::cerr << "Simulation:\n";
    std::cerr << "  Policies:    " << args.policies_path << " (" << book.size() << " loaded)\n";
    std::cerr << "  Month:       " << args.as_of_month << "\n";
    std::cerr << "  Scenarios:   " << request.scenario_count << "\n";
    std::cerr << "  Seed:        " << request.seed << "\n";
    std::cerr << "  Retentions:  " << request.retention_grid.size() << "\n\n";

    PortfolioResult result = simulate(request, book, settings);
    Logger::get_instance().log_simulation_complete(request, result);

    SensitivityResult sensitivity;
    if (args.sensitivity) {
        sensitivity = run_sensitivity_analysis(result.scenario_losses, request.retention_grid,
                                               request.reinsurance);
    }
    const SensitivityResult* sensitivity_ptr = args.sensitivity ? &sensitivity : nullptr;

    if (args.output_path.empty()) {
        io::write_portfolio_result_json(std::cout, result, sensitivity_ptr, args.distribution);
    } else {
        io::write_portfolio_result_json(args.output_path, result, sensitivity_ptr, args.distribution);
        std::cerr << "Results written to: " << args.output_path << "\n";
    }

    std::cerr << "Active policies: " << result.active_policy_count << "\n";
    std::cerr << "VaR95 / VaR99 / TailVaR99: $" << format_dollars(result.var95)
              << " / $" << format_dollars(result.var99)
              << " / $" << format_dollars(result.tailvar99) << "\n";
    std::cerr << result.recommended.rationale << " at retention $"
              << format_dollars(static_cast<double>(result.recommended.retention)) << "\n";
    return EXIT_OK;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_VALIDATION;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_VALIDATION;
    }

    configure_logging(args);

    int exit_code = EXIT_OK;
    try {
        if (args.command == "quote") {
            exit_code = run_quote(args);
        } else if (args.command == "session") {
            exit_code = run_session(args);
        } else {
            exit_code = run_simulate(args);
        }
    } catch (const std::exception& e) {
        Logger::get_instance().log_error("cli", std::string(error_kind(e)) + ": " + e.what());
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = exit_code_for(e);
    }

    Logger::get_instance().flush();
    return exit_code;
}

/**
 * @file logger.hpp
 * @brief Structured logging for the underwriting engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - One event per underwriting operation (quote, bind, cancel, simulate)
 * - Partner token masking
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef COVERCALC_LOGGER_HPP
#define COVERCALC_LOGGER_HPP

#include "policy_store.hpp"
#include "portfolio_simulator.hpp"
#include "quote_book.hpp"
#include "underwriting_config.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace covercalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (carrier evaluations, rule traces)
    INFO,    ///< Informational messages (quotes issued, policies bound)
    WARN,    ///< Warning messages (quote-time compliance blocks, rejected binds)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string; unknown names fall back to INFO
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("covercalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "covercalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *   logger.log_quote_issued(quote);
 *   @endcode
 *
 * All methods are safe to call from concurrent binds.
 */
class Logger {
public:
    static Logger& get_instance();

    void configure(const LoggerConfig& config);

    /**
     * @brief Log a configuration snapshot being loaded or reloaded
     *
     * Partner API tokens are masked.
     */
    void log_config_loaded(const UnderwritingConfig& config, uint64_t generation);

    void log_quote_issued(const Quote& quote);

    /**
     * @brief Log a quote request that raised
     *
     * @param request The request as received
     * @param error_kind Error class, e.g. "NoCarrierAvailableError"
     * @param error_message what() of the exception
     */
    void log_quote_failed(const QuoteRequest& request,
                          const std::string& error_kind,
                          const std::string& error_message);

    void log_bind_completed(const Policy& policy);

    /**
     * @brief Log a rejected bind
     *
     * @param blocking_rules Compliance rule ids, when compliance was the reason
     */
    void log_bind_rejected(const std::string& quote_id,
                           const std::string& error_kind,
                           const std::string& error_message,
                           const std::vector<std::string>& blocking_rules = {});

    void log_policy_cancelled(const Policy& policy);

    void log_simulation_complete(const SimulationRequest& request, const PortfolioResult& result);

    void log_warning(const std::string& component, const std::string& warning_message);

    void log_error(const std::string& component, const std::string& error_message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    // Show the first and last 4 characters of long tokens, "***" otherwise
    static std::string mask_token(const std::string& token);

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace covercalc

#endif // COVERCALC_LOGGER_HPP

/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace covercalc {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += values[i];
    }
    return out;
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_config_loaded(const UnderwritingConfig& config, uint64_t generation) {
    std::map<std::string, std::string> fields;
    fields["event"] = "config_loaded";
    fields["source"] = config.source_path.empty() ? "inline" : config.source_path;
    fields["generation"] = std::to_string(generation);
    fields["partner_count"] = std::to_string(config.partners.size());
    fields["carrier_count"] = std::to_string(config.carriers.size());
    fields["rules_version"] = config.compliance.version;
    fields["rule_count"] = std::to_string(config.compliance.rules.size());
    fields["quote_validity_days"] = std::to_string(config.quote_validity_days);
    fields["max_scenario_count"] = std::to_string(config.simulation.max_scenario_count);

    for (const auto& [id, partner] : config.partners) {
        fields["partner." + id + ".token"] = mask_token(partner.api_token);
    }

    log(LogLevel::INFO, "Configuration loaded", fields);
}

void Logger::log_quote_issued(const Quote& quote) {
    std::map<std::string, std::string> fields;
    fields["event"] = "quote_issued";
    fields["quote_id"] = quote.id;
    fields["partner_id"] = quote.request.partner_id;
    fields["product_code"] = to_string(quote.request.product_code);
    fields["state"] = quote.request.state();
    fields["risk_score"] = std::to_string(quote.risk.score);
    fields["risk_band"] = to_string(quote.risk.band);
    fields["base_premium_cents"] = std::to_string(quote.price.base_premium_cents);
    fields["total_premium_cents"] = std::to_string(quote.price.total_premium_cents);
    fields["carrier_id"] = quote.carrier_id;
    fields["compliance_decision"] = to_string(quote.compliance.decision);
    fields["compliance_report_id"] = quote.compliance.report_id;
    fields["expires_on"] = quote.expires_on.to_string();

    if (quote.compliance.blocked()) {
        fields["blocking_rules"] = join(quote.compliance.blocking_rules);
        log(LogLevel::WARN, "Quote issued with compliance block", fields);
        return;
    }
    log(LogLevel::INFO, "Quote issued", fields);
}

void Logger::log_quote_failed(const QuoteRequest& request,
                              const std::string& error_kind,
                              const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "quote_failed";
    fields["partner_id"] = request.partner_id;
    fields["product_code"] = to_string(request.product_code);
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Quote failed", fields);
}

void Logger::log_bind_completed(const Policy& policy) {
    std::map<std::string, std::string> fields;
    fields["event"] = "bind_completed";
    fields["policy_id"] = policy.id;
    fields["quote_id"] = policy.quote_id;
    fields["product_code"] = to_string(policy.product_code);
    fields["carrier_id"] = policy.carrier_id;
    fields["premium_total_cents"] = std::to_string(policy.premium_total_cents);
    fields["effective_date"] = policy.effective_date.to_string();
    fields["expiration_date"] = policy.expiration_date.to_string();
    fields["disclosure_count"] = std::to_string(policy.disclosures.size());

    log(LogLevel::INFO, "Policy bound", fields);
}

void Logger::log_bind_rejected(const std::string& quote_id,
                               const std::string& error_kind,
                               const std::string& error_message,
                               const std::vector<std::string>& blocking_rules) {
    std::map<std::string, std::string> fields;
    fields["event"] = "bind_rejected";
    fields["quote_id"] = quote_id;
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;
    if (!blocking_rules.empty()) {
        fields["blocking_rules"] = join(blocking_rules);
    }

    log(LogLevel::WARN, "Bind rejected", fields);
}

void Logger::log_policy_cancelled(const Policy& policy) {
    std::map<std::string, std::string> fields;
    fields["event"] = "policy_cancelled";
    fields["policy_id"] = policy.id;
    fields["premium_total_cents"] = std::to_string(policy.premium_total_cents);
    fields["refund_cents"] = std::to_string(policy.refund_cents);
    if (policy.cancelled_on) {
        fields["cancel_date"] = policy.cancelled_on->to_string();
    }

    log(LogLevel::INFO, "Policy cancelled", fields);
}

void Logger::log_simulation_complete(const SimulationRequest& request, const PortfolioResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "simulation_complete";
    fields["as_of_month"] = request.as_of_month.to_string();
    fields["scenario_count"] = std::to_string(result.scenario_count);
    fields["seed"] = std::to_string(result.seed);
    fields["worker_count"] = std::to_string(request.worker_count);
    fields["active_policy_count"] = std::to_string(result.active_policy_count);
    fields["var95"] = std::to_string(result.var95);
    fields["var99"] = std::to_string(result.var99);
    fields["tailvar99"] = std::to_string(result.tailvar99);
    fields["recommended_retention"] = std::to_string(result.recommended.retention);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    fields["throughput_scenarios_per_sec"] = std::to_string(
        result.execution_time_ms > 0 ? (result.scenario_count * 1000.0 / result.execution_time_ms) : 0
    );

    log(LogLevel::INFO, "Simulation completed", fields);
}

void Logger::log_warning(const std::string& component, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = component;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& component, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = component;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Error", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::mask_token(const std::string& token) {
    if (token.size() <= 8) {
        return "***";
    }
    return token.substr(0, 4) + "..." + token.substr(token.size() - 4);
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace covercalc

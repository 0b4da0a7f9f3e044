/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace covercalc;

namespace {

// Flat JSON object of string values, as the logger writes them
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = val_start + 1;
        while (val_end < line.size() && !(line[val_end] == '"' && line[val_end - 1] != '\\')) {
            ++val_end;
        }
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG, bool json = true) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_json = json;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

Quote create_quote(bool blocked) {
    Quote quote;
    quote.id = "q_000007";
    quote.request.product_code = ProductCode::Ppi;
    quote.request.partner_id = "p_shopmart";
    quote.request.ppi.state = "GA";
    quote.risk.band = RiskBand::B;
    quote.price.base_premium_cents = 7200;
    quote.price.total_premium_cents = 8165;
    quote.carrier_id = "c_atlas";
    quote.quote_date = Date(2025, 1, 15);
    quote.expires_on = Date(2025, 2, 14);
    if (blocked) {
        quote.compliance.decision = Decision::Block;
        quote.compliance.blocking_rules = {"ppi_ga_block", "ban_ppi_states"};
    }
    return quote;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    SECTION("Default configuration") {
        LoggerConfig config;
        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "covercalc.log");
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }

    SECTION("Set level") {
        Logger& logger = Logger::get_instance();
        logger.set_min_level(LogLevel::ERROR);
        REQUIRE(logger.get_min_level() == LogLevel::ERROR);
    }
}

TEST_CASE("Token masking", "[logger]") {
    REQUIRE(Logger::mask_token("tok_live_1234567890") == "tok_...7890");
    REQUIRE(Logger::mask_token("short") == "***");
    REQUIRE(Logger::mask_token("") == "***");
}

TEST_CASE("Config loaded event masks partner tokens", "[logger]") {
    const std::string path = "test_config_loaded.log";
    log_to_file(path);

    UnderwritingConfig config;
    PartnerTerms partner;
    partner.id = "p_shopmart";
    partner.api_token = "tok_live_1234567890";
    config.partners[partner.id] = partner;
    config.compliance.version = "2025.01";
    config.source_path = "config/underwriting.json";

    Logger::get_instance().log_config_loaded(config, 3);
    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("tok_live_1234567890") == std::string::npos);

    auto fields = parse_json_log(lines[0]);
    REQUIRE(fields["event"] == "config_loaded");
    REQUIRE(fields["generation"] == "3");
    REQUIRE(fields["rules_version"] == "2025.01");
    REQUIRE(fields["partner.p_shopmart.token"] == "tok_...7890");
    REQUIRE(fields["level"] == "INFO");

    std::filesystem::remove(path);
}

TEST_CASE("Quote events", "[logger]") {
    const std::string path = "test_quote_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    SECTION("clean quote logs at INFO") {
        logger.log_quote_issued(create_quote(false));
        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "quote_issued");
        REQUIRE(fields["level"] == "INFO");
        REQUIRE(fields["quote_id"] == "q_000007");
        REQUIRE(fields["total_premium_cents"] == "8165");
        REQUIRE(fields["compliance_decision"] == "allow");
        REQUIRE(fields.count("blocking_rules") == 0);
    }

    SECTION("blocked quote logs at WARN with the rules") {
        logger.log_quote_issued(create_quote(true));
        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["level"] == "WARN");
        REQUIRE(fields["blocking_rules"] == "ppi_ga_block,ban_ppi_states");
    }

    SECTION("failed quote") {
        QuoteRequest request;
        request.partner_id = "p_gadgetly";
        logger.log_quote_failed(request, "NoCarrierAvailableError", "No carrier available: HI");
        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "quote_failed");
        REQUIRE(fields["error_kind"] == "NoCarrierAvailableError");
        REQUIRE(fields["product_code"] == "shipping");
    }

    std::filesystem::remove(path);
}

TEST_CASE("Bind and cancel events", "[logger]") {
    const std::string path = "test_bind_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    Policy policy;
    policy.id = "pol_000001";
    policy.quote_id = "q_000001";
    policy.premium_total_cents = 7999;
    policy.effective_date = Date(2025, 1, 20);
    policy.expiration_date = Date(2026, 7, 20);

    logger.log_bind_completed(policy);
    logger.log_bind_rejected("q_000002", "ComplianceBlockedError", "Blocked by compliance",
                             {"ppi_ga_block", "ban_ppi_states"});

    policy.status = PolicyStatus::Cancelled;
    policy.cancelled_on = Date(2025, 4, 20);
    policy.refund_cents = 5999;
    logger.log_policy_cancelled(policy);

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 3);

    auto bound = parse_json_log(lines[0]);
    REQUIRE(bound["event"] == "bind_completed");
    REQUIRE(bound["expiration_date"] == "2026-07-20");

    auto rejected = parse_json_log(lines[1]);
    REQUIRE(rejected["event"] == "bind_rejected");
    REQUIRE(rejected["blocking_rules"] == "ppi_ga_block,ban_ppi_states");

    auto cancelled = parse_json_log(lines[2]);
    REQUIRE(cancelled["event"] == "policy_cancelled");
    REQUIRE(cancelled["refund_cents"] == "5999");
    REQUIRE(cancelled["cancel_date"] == "2025-04-20");

    std::filesystem::remove(path);
}

TEST_CASE("Log level filtering", "[logger]") {
    const std::string path = "test_level_filter.log";
    log_to_file(path, LogLevel::WARN);
    Logger& logger = Logger::get_instance();

    logger.log_quote_issued(create_quote(false));   // INFO, dropped
    logger.log_warning("quote_pipeline", "cancel failed");
    logger.log_error("cli", "boom");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    REQUIRE(parse_json_log(lines[0])["event"] == "warning");
    REQUIRE(parse_json_log(lines[1])["error_message"] == "boom");

    std::filesystem::remove(path);
}

TEST_CASE("Plain text output", "[logger]") {
    const std::string path = "test_plain_text.log";
    log_to_file(path, LogLevel::DEBUG, false);

    Logger::get_instance().log_warning("config_store", "reload skipped");
    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[WARN] reload skipped") != std::string::npos);
    REQUIRE(lines[0].find("component=config_store") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Special characters are escaped", "[logger]") {
    const std::string path = "test_escape.log";
    log_to_file(path);

    Logger::get_instance().log_error("cli", "bad \"quote\"\nline");
    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("bad \\\"quote\\\"\\nline") != std::string::npos);

    std::filesystem::remove(path);
}

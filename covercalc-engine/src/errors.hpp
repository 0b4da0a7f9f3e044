#ifndef COVERCALC_ERRORS_HPP
#define COVERCALC_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace covercalc {

/**
 * @brief Base exception for underwriting errors
 */
class UnderwritingError : public std::runtime_error {
public:
    explicit UnderwritingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when request input is malformed or out of domain
 */
class ValidationError : public UnderwritingError {
public:
    explicit ValidationError(const std::string& message)
        : UnderwritingError("Validation failed: " + message) {}
};

/**
 * @brief Raised when a rate curve has no entry for a lookup key
 *
 * Indicates incomplete rate data rather than a bad request.
 */
class RateNotFoundError : public UnderwritingError {
public:
    explicit RateNotFoundError(const std::string& message)
        : UnderwritingError("Rate not found: " + message) {}
};

/**
 * @brief Raised when no carrier can write the risk
 */
class NoCarrierAvailableError : public UnderwritingError {
public:
    explicit NoCarrierAvailableError(const std::string& message)
        : UnderwritingError("No carrier available: " + message) {}
};

/**
 * @brief Raised when bind-time compliance evaluation blocks the policy
 *
 * Carries the ids of every block rule that triggered.
 */
class ComplianceBlockedError : public UnderwritingError {
public:
    explicit ComplianceBlockedError(std::vector<std::string> rule_ids)
        : UnderwritingError("Blocked by compliance: " + join(rule_ids)),
          rule_ids_(std::move(rule_ids)) {}

    const std::vector<std::string>& rule_ids() const { return rule_ids_; }

private:
    static std::string join(const std::vector<std::string>& ids) {
        std::string out;
        for (size_t i = 0; i < ids.size(); ++i) {
            if (i > 0) out += ", ";
            out += ids[i];
        }
        return out;
    }

    std::vector<std::string> rule_ids_;
};

class QuoteNotFoundError : public UnderwritingError {
public:
    explicit QuoteNotFoundError(const std::string& quote_id)
        : UnderwritingError("Quote not found or no longer open: " + quote_id) {}
};

class QuoteExpiredError : public UnderwritingError {
public:
    explicit QuoteExpiredError(const std::string& quote_id)
        : UnderwritingError("Quote expired: " + quote_id) {}
};

class PolicyNotFoundError : public UnderwritingError {
public:
    explicit PolicyNotFoundError(const std::string& policy_id)
        : UnderwritingError("Policy not found: " + policy_id) {}
};

/**
 * @brief Raised when a configuration document cannot be read or is invalid
 */
class ConfigurationError : public UnderwritingError {
public:
    explicit ConfigurationError(const std::string& message)
        : UnderwritingError("Configuration error: " + message) {}
};

// Class name of an underwriting error, for log events and CLI output
inline std::string error_kind(const std::exception& e) {
    if (dynamic_cast<const ValidationError*>(&e)) return "ValidationError";
    if (dynamic_cast<const RateNotFoundError*>(&e)) return "RateNotFoundError";
    if (dynamic_cast<const NoCarrierAvailableError*>(&e)) return "NoCarrierAvailableError";
    if (dynamic_cast<const ComplianceBlockedError*>(&e)) return "ComplianceBlockedError";
    if (dynamic_cast<const QuoteNotFoundError*>(&e)) return "QuoteNotFoundError";
    if (dynamic_cast<const QuoteExpiredError*>(&e)) return "QuoteExpiredError";
    if (dynamic_cast<const PolicyNotFoundError*>(&e)) return "PolicyNotFoundError";
    if (dynamic_cast<const ConfigurationError*>(&e)) return "ConfigurationError";
    if (dynamic_cast<const UnderwritingError*>(&e)) return "UnderwritingError";
    return "InternalError";
}

} // namespace covercalc

#endif // COVERCALC_ERRORS_HPP

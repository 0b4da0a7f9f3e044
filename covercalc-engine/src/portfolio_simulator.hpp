#ifndef COVERCALC_PORTFOLIO_SIMULATOR_HPP
#define COVERCALC_PORTFOLIO_SIMULATOR_HPP

#include "calendar.hpp"
#include "money.hpp"
#include "policy_book.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace covercalc {

// Per-policy loss model. A claim occurs with probability claim_probability[band];
// its severity is coverage * severity_scale * U^(-1/pareto_alpha), capped at coverage.
struct LossModelParams {
    std::array<double, 5> claim_probability;  // bands A..E
    double severity_scale;
    double pareto_alpha;

    LossModelParams();
};

// Simulator limits and loss model, from the "simulation" config section
struct SimulationSettings {
    int max_scenario_count;
    LossModelParams loss_model;

    SimulationSettings();
};

struct ReinsuranceParams {
    double rate_on_line;  // 0 < r <= 1
    double load;          // 0 <= l <= 1

    ReinsuranceParams();
    ReinsuranceParams(double rol, double l) : rate_on_line(rol), load(l) {}
};

struct SimulationRequest {
    YearMonth as_of_month;
    int scenario_count;
    std::vector<Cents> retention_grid;
    ReinsuranceParams reinsurance;
    uint64_t seed;
    int worker_count;  // 0 = OpenMP default

    SimulationRequest();
};

struct ScenarioStatistics {
    double mean;
    double median;
    double std_dev;   // sample standard deviation
    double min;
    double max;

    ScenarioStatistics();
};

// One row of the retention table; all amounts in cents
struct RetentionRow {
    Cents retention;
    double expected_loss;
    double expected_ceded;
    double reinsurance_premium;
    double expected_net;
};

struct RecommendedRetention {
    Cents retention;
    double expected_net;
    std::string rationale;

    RecommendedRetention() : retention(0), expected_net(0.0) {}
};

struct PortfolioResult {
    YearMonth as_of_month;
    int scenario_count;
    uint64_t seed;
    size_t active_policy_count;

    // Loss distribution (cents); tailvar99 >= var99 >= var95
    double var95;
    double var99;
    double tailvar99;
    ScenarioStatistics statistics;

    std::vector<RetentionRow> retention_table;  // grid order
    RecommendedRetention recommended;

    std::vector<double> scenario_losses;        // indexed by scenario
    double execution_time_ms;

    PortfolioResult();
};

struct SensitivityPoint {
    double value;
    Cents recommended_retention;
    double expected_net;
};

// Recommended retention under varied reinsurance pricing. Each series varies
// one parameter and holds the other at the base request's value.
struct SensitivityResult {
    std::vector<SensitivityPoint> rate_on_line;
    std::vector<SensitivityPoint> load;
};

constexpr std::array<double, 4> SENSITIVITY_RATE_ON_LINE = {0.05, 0.10, 0.15, 0.20};
constexpr std::array<double, 4> SENSITIVITY_LOAD = {0.1, 0.2, 0.3, 0.4};

// Throws ValidationError naming the first invalid field
void validate_simulation_request(const SimulationRequest& request, int max_scenario_count);

// SplitMix64 derivation of an independent stream seed for one scenario
uint64_t derive_scenario_seed(uint64_t seed, uint64_t scenario_index);

// Total portfolio loss per scenario. Scenario i depends only on (seed, i), so
// the result is identical for any worker count.
std::vector<double> simulate_scenario_losses(const std::vector<PolicyBookEntry>& active,
                                             int scenario_count, uint64_t seed,
                                             const LossModelParams& model,
                                             int worker_count = 0);

// Linear interpolation between order statistics at p/100 * (n - 1).
// sorted_values must be ascending; p in [0, 100].
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Mean of the values >= threshold; sorted_values must be ascending
double calculate_tail_mean(const std::vector<double>& sorted_values, double threshold);

ScenarioStatistics calculate_statistics(const std::vector<double>& losses);

std::vector<RetentionRow> build_retention_table(const std::vector<double>& losses,
                                                const std::vector<Cents>& retention_grid,
                                                const ReinsuranceParams& reinsurance);

// Row with the minimum expected_net; ties go to the smallest retention
RecommendedRetention recommend_retention(const std::vector<RetentionRow>& table);

/**
 * @brief Run the Monte Carlo portfolio simulation
 *
 * Filters the book to policies active in as_of_month, simulates scenario
 * losses, and derives VaR, TailVaR, scenario statistics and the retention table.
 *
 * @throws ValidationError if the request is invalid
 */
PortfolioResult simulate(const SimulationRequest& request,
                         const PolicyBook& book,
                         const SimulationSettings& settings = SimulationSettings());

// Re-run the retention analysis over SENSITIVITY_RATE_ON_LINE and SENSITIVITY_LOAD
SensitivityResult run_sensitivity_analysis(const std::vector<double>& losses,
                                           const std::vector<Cents>& retention_grid,
                                           const ReinsuranceParams& base);

} // namespace covercalc

#endif // COVERCALC_PORTFOLIO_SIMULATOR_HPP

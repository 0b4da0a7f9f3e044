#include "portfolio_simulator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <random>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace covercalc {

// ============================================================================
// Parameter defaults
// ============================================================================

LossModelParams::LossModelParams()
    : claim_probability{0.02, 0.04, 0.07, 0.11, 0.16},
      severity_scale(0.35),
      pareto_alpha(2.5) {}

SimulationSettings::SimulationSettings()
    : max_scenario_count(10000) {}

ReinsuranceParams::ReinsuranceParams()
    : rate_on_line(0.10),
      load(0.20) {}

SimulationRequest::SimulationRequest()
    : scenario_count(1000),
      seed(42),
      worker_count(0) {}

ScenarioStatistics::ScenarioStatistics()
    : mean(0.0), median(0.0), std_dev(0.0), min(0.0), max(0.0) {}

PortfolioResult::PortfolioResult()
    : scenario_count(0),
      seed(0),
      active_policy_count(0),
      var95(0.0),
      var99(0.0),
      tailvar99(0.0),
      execution_time_ms(0.0) {}

// ============================================================================
// Validation
// ============================================================================

void validate_simulation_request(const SimulationRequest& request, int max_scenario_count) {
    if (request.scenario_count < 1 || request.scenario_count > max_scenario_count) {
        throw ValidationError("scenario_count must be in [1, " +
                              std::to_string(max_scenario_count) + "], got " +
                              std::to_string(request.scenario_count));
    }
    if (request.retention_grid.empty()) {
        throw ValidationError("retention_grid must not be empty");
    }
    for (Cents r : request.retention_grid) {
        if (r <= 0) {
            throw ValidationError("retention_grid values must be positive, got " +
                                  std::to_string(r));
        }
    }
    if (!(request.reinsurance.rate_on_line > 0.0 && request.reinsurance.rate_on_line <= 1.0)) {
        throw ValidationError("rate_on_line must be in (0, 1]");
    }
    if (!(request.reinsurance.load >= 0.0 && request.reinsurance.load <= 1.0)) {
        throw ValidationError("load must be in [0, 1]");
    }
    if (request.worker_count < 0) {
        throw ValidationError("worker_count must not be negative");
    }
}

// ============================================================================
// Scenario generation
// ============================================================================

uint64_t derive_scenario_seed(uint64_t seed, uint64_t scenario_index) {
    uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (scenario_index + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

namespace {

// Uniform in [0, 1) from the top 53 bits; independent of the library's
// distribution implementation
inline double next_uniform(std::mt19937_64& rng) {
    return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

double scenario_loss(const std::vector<PolicyBookEntry>& active, uint64_t stream_seed,
                     const LossModelParams& model) {
    std::mt19937_64 rng(stream_seed);
    double total = 0.0;
    for (const auto& policy : active) {
        double p = model.claim_probability[static_cast<size_t>(policy.risk_band)];
        if (next_uniform(rng) >= p) {
            continue;
        }
        double coverage = static_cast<double>(policy.coverage_cents);
        double u = 1.0 - next_uniform(rng);  // (0, 1]
        double severity = coverage * model.severity_scale * std::pow(u, -1.0 / model.pareto_alpha);
        total += std::min(severity, coverage);
    }
    return total;
}

} // anonymous namespace

std::vector<double> simulate_scenario_losses(const std::vector<PolicyBookEntry>& active,
                                             int scenario_count, uint64_t seed,
                                             const LossModelParams& model,
                                             int worker_count) {
    std::vector<double> losses(static_cast<size_t>(std::max(scenario_count, 0)), 0.0);

#ifdef HAVE_OPENMP
    int threads = worker_count > 0 ? worker_count : omp_get_max_threads();
    #pragma omp parallel for num_threads(threads) schedule(static)
    for (int s = 0; s < scenario_count; ++s) {
        losses[static_cast<size_t>(s)] =
            scenario_loss(active, derive_scenario_seed(seed, static_cast<uint64_t>(s)), model);
    }
#else
    (void)worker_count;
    for (int s = 0; s < scenario_count; ++s) {
        losses[static_cast<size_t>(s)] =
            scenario_loss(active, derive_scenario_seed(seed, static_cast<uint64_t>(s)), model);
    }
#endif

    return losses;
}

// ============================================================================
// Statistics Helper Functions
// ============================================================================

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    // Convert percentile to index position
    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    // Linear interpolation
    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double calculate_tail_mean(const std::vector<double>& sorted_values, double threshold) {
    auto first = std::lower_bound(sorted_values.begin(), sorted_values.end(), threshold);
    if (first == sorted_values.end()) {
        return threshold;
    }
    double sum = std::accumulate(first, sorted_values.end(), 0.0);
    return sum / static_cast<double>(std::distance(first, sorted_values.end()));
}

ScenarioStatistics calculate_statistics(const std::vector<double>& losses) {
    ScenarioStatistics stats;
    if (losses.empty()) {
        return stats;
    }

    double n = static_cast<double>(losses.size());
    stats.mean = std::accumulate(losses.begin(), losses.end(), 0.0) / n;

    if (losses.size() > 1) {
        double sum_sq_diff = 0.0;
        for (double v : losses) {
            double diff = v - stats.mean;
            sum_sq_diff += diff * diff;
        }
        stats.std_dev = std::sqrt(sum_sq_diff / (n - 1.0));
    }

    std::vector<double> sorted = losses;
    std::sort(sorted.begin(), sorted.end());
    stats.median = calculate_percentile(sorted, 50.0);
    stats.min = sorted.front();
    stats.max = sorted.back();
    return stats;
}

// ============================================================================
// Retention analysis
// ============================================================================

std::vector<RetentionRow> build_retention_table(const std::vector<double>& losses,
                                                const std::vector<Cents>& retention_grid,
                                                const ReinsuranceParams& reinsurance) {
    std::vector<RetentionRow> table;
    table.reserve(retention_grid.size());
    double n = losses.empty() ? 1.0 : static_cast<double>(losses.size());

    for (Cents retention : retention_grid) {
        double r = static_cast<double>(retention);
        double sum_loss = 0.0;
        double sum_ceded = 0.0;
        double sum_retained = 0.0;
        for (double loss : losses) {
            sum_loss += loss;
            sum_ceded += std::max(0.0, loss - r);
            sum_retained += std::min(loss, r);
        }

        RetentionRow row;
        row.retention = retention;
        row.expected_loss = sum_loss / n;
        row.expected_ceded = sum_ceded / n;
        row.reinsurance_premium = row.expected_ceded * reinsurance.rate_on_line * (1.0 + reinsurance.load);
        row.expected_net = sum_retained / n + row.reinsurance_premium;
        table.push_back(row);
    }
    return table;
}

RecommendedRetention recommend_retention(const std::vector<RetentionRow>& table) {
    if (table.empty()) {
        throw std::logic_error("recommend_retention called with an empty table");
    }

    const RetentionRow* best = &table.front();
    for (const auto& row : table) {
        if (row.expected_net < best->expected_net ||
            (row.expected_net == best->expected_net && row.retention < best->retention)) {
            best = &row;
        }
    }

    RecommendedRetention rec;
    rec.retention = best->retention;
    rec.expected_net = best->expected_net;
    rec.rationale = "Minimum expected net cost of $" + format_dollars(best->expected_net);
    return rec;
}

// ============================================================================
// Simulation
// ============================================================================

PortfolioResult simulate(const SimulationRequest& request,
                         const PolicyBook& book,
                         const SimulationSettings& settings) {
    validate_simulation_request(request, settings.max_scenario_count);

    auto start_time = std::chrono::high_resolution_clock::now();

    PortfolioResult result;
    result.as_of_month = request.as_of_month;
    result.scenario_count = request.scenario_count;
    result.seed = request.seed;

    std::vector<PolicyBookEntry> active = book.active_in(request.as_of_month);
    result.active_policy_count = active.size();

    result.scenario_losses = simulate_scenario_losses(
        active, request.scenario_count, request.seed, settings.loss_model, request.worker_count);

    std::vector<double> sorted = result.scenario_losses;
    std::sort(sorted.begin(), sorted.end());

    result.var95 = calculate_percentile(sorted, 95.0);
    result.var99 = calculate_percentile(sorted, 99.0);
    result.tailvar99 = calculate_tail_mean(sorted, result.var99);
    result.statistics = calculate_statistics(result.scenario_losses);

    result.retention_table = build_retention_table(
        result.scenario_losses, request.retention_grid, request.reinsurance);
    result.recommended = recommend_retention(result.retention_table);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(
        end_time - start_time).count();

    return result;
}

SensitivityResult run_sensitivity_analysis(const std::vector<double>& losses,
                                           const std::vector<Cents>& retention_grid,
                                           const ReinsuranceParams& base) {
    SensitivityResult result;

    for (double rol : SENSITIVITY_RATE_ON_LINE) {
        auto table = build_retention_table(losses, retention_grid, ReinsuranceParams(rol, base.load));
        auto rec = recommend_retention(table);
        result.rate_on_line.push_back(SensitivityPoint{rol, rec.retention, rec.expected_net});
    }

    for (double load : SENSITIVITY_LOAD) {
        auto table = build_retention_table(losses, retention_grid, ReinsuranceParams(base.rate_on_line, load));
        auto rec = recommend_retention(table);
        result.load.push_back(SensitivityPoint{load, rec.retention, rec.expected_net});
    }

    return result;
}

} // namespace covercalc

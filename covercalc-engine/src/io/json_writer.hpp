#ifndef COVERCALC_IO_JSON_WRITER_HPP
#define COVERCALC_IO_JSON_WRITER_HPP

#include "../policy_store.hpp"
#include "../portfolio_simulator.hpp"
#include "../quote_book.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace covercalc {
namespace io {

nlohmann::json quote_to_json(const Quote& quote);
nlohmann::json policy_to_json(const Policy& policy);

// Write PortfolioResult to JSON format. The sensitivity block is written when
// sensitivity is non-null; the per-scenario distribution when include_distribution.
void write_portfolio_result_json(std::ostream& os, const PortfolioResult& result,
                                 const SensitivityResult* sensitivity = nullptr,
                                 bool include_distribution = false,
                                 bool pretty_print = true);

void write_portfolio_result_json(const std::string& filepath, const PortfolioResult& result,
                                 const SensitivityResult* sensitivity = nullptr,
                                 bool include_distribution = false,
                                 bool pretty_print = true);

// Write a JSON document to a file, or to os when filepath is empty
void write_json_document(std::ostream& os, const std::string& filepath, const nlohmann::json& doc);

} // namespace io
} // namespace covercalc

#endif // COVERCALC_IO_JSON_WRITER_HPP

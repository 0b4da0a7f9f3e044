#ifndef COVERCALC_IO_JSON_READER_HPP
#define COVERCALC_IO_JSON_READER_HPP

#include "../product.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace covercalc {
namespace io {

// Parse a flat quote request:
//   {"product_code": "shipping", "partner_id": "...", "declared_value": 65000, ...}
// Missing or mistyped fields raise ValidationError. Domain checks (known
// states, categories, ranges) are left to the risk scorer.
QuoteRequest quote_request_from_json(const nlohmann::json& j);

// Parse {"name", "email", "state", "age"?, "tenure_months"?}
Policyholder policyholder_from_json(const nlohmann::json& j);

// Read and parse a JSON document; throws ValidationError naming the file
nlohmann::json read_json_file(const std::string& filepath);

} // namespace io
} // namespace covercalc

#endif // COVERCALC_IO_JSON_READER_HPP

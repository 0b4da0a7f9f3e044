#ifndef COVERCALC_PARQUET_READER_HPP
#define COVERCALC_PARQUET_READER_HPP

#include "../policy_book.hpp"
#include <string>

namespace covercalc {

class ParquetReader {
public:
    /**
     * Load a policy book snapshot from a Parquet file.
     *
     * Expected schema:
     *   - policy_id: string
     *   - product_code: string ("shipping" | "ppi")
     *   - risk_band: string ("A".."E")
     *   - premium_cents: int64
     *   - coverage_cents: int64
     *   - effective_date: string (YYYY-MM-DD)
     *   - expiration_date: string (YYYY-MM-DD)
     *   - status: string ("active" | "cancelled")
     *
     * @param filepath Path to Parquet file
     * @return PolicyBook containing the loaded entries
     * @throws std::runtime_error if the file cannot be read, the schema is invalid,
     *         or Parquet support was not compiled in
     * @throws ValidationError if a row holds an out-of-domain value
     */
    static PolicyBook load_policy_book(const std::string& filepath);
};

} // namespace covercalc

#endif // COVERCALC_PARQUET_READER_HPP

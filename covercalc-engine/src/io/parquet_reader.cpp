#include "parquet_reader.hpp"
#include "../errors.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace covercalc {

#ifdef HAVE_ARROW

namespace {

std::shared_ptr<arrow::Array> required_column(const std::shared_ptr<arrow::Table>& table,
                                              const std::string& name,
                                              arrow::Type::type expected) {
    int idx = table->schema()->GetFieldIndex(name);
    if (idx < 0) {
        throw std::runtime_error("Parquet file missing required column: " + name);
    }
    auto chunked = table->column(idx);
    if (chunked->num_chunks() != 1) {
        throw std::runtime_error("Parquet column " + name + " was not combined into one chunk");
    }
    auto array = chunked->chunk(0);
    if (array->type_id() != expected) {
        throw std::runtime_error("Parquet column " + name + " has type " +
                                 array->type()->ToString());
    }
    return array;
}

} // anonymous namespace

PolicyBook ParquetReader::load_policy_book(const std::string& filepath) {
    PolicyBook book;

    // Open Parquet file
    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    // Create Parquet reader
    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    // Read entire table into memory
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    int64_t num_rows = table->num_rows();
    if (num_rows == 0) {
        return book;
    }

    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    auto policy_id = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "policy_id", arrow::Type::STRING));
    auto product_code = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "product_code", arrow::Type::STRING));
    auto risk_band = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "risk_band", arrow::Type::STRING));
    auto premium = std::static_pointer_cast<arrow::Int64Array>(
        required_column(table, "premium_cents", arrow::Type::INT64));
    auto coverage = std::static_pointer_cast<arrow::Int64Array>(
        required_column(table, "coverage_cents", arrow::Type::INT64));
    auto effective = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "effective_date", arrow::Type::STRING));
    auto expiration = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "expiration_date", arrow::Type::STRING));
    auto status_column = std::static_pointer_cast<arrow::StringArray>(
        required_column(table, "status", arrow::Type::STRING));

    book.reserve(static_cast<size_t>(num_rows));

    for (int64_t i = 0; i < num_rows; ++i) {
        PolicyBookEntry e;
        e.policy_id = policy_id->GetString(i);
        e.product_code = parse_product_code(product_code->GetString(i));
        e.risk_band = parse_risk_band(risk_band->GetString(i));
        e.premium_cents = premium->Value(i);
        e.coverage_cents = coverage->Value(i);
        e.effective_date = Date::parse(effective->GetString(i));
        e.expiration_date = Date::parse(expiration->GetString(i));
        e.status = parse_policy_status(status_column->GetString(i));

        if (e.coverage_cents < 0 || e.premium_cents < 0) {
            throw ValidationError("row " + std::to_string(i + 1) + ": negative amount for " +
                                  e.policy_id);
        }

        book.add(std::move(e));
    }

    return book;
}

#else // !HAVE_ARROW

PolicyBook ParquetReader::load_policy_book(const std::string& filepath) {
    (void)filepath;
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace covercalc

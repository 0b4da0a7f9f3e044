#include "policy_book.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include "io/parquet_reader.hpp"
#include <fstream>
#include <stdexcept>

namespace covercalc {

bool PolicyBookEntry::is_active_in(const YearMonth& month) const {
    return status == PolicyStatus::Active &&
           effective_date <= month.last_day() &&
           expiration_date >= month.first_day();
}

bool PolicyBookEntry::operator==(const PolicyBookEntry& other) const {
    return policy_id == other.policy_id &&
           product_code == other.product_code &&
           risk_band == other.risk_band &&
           premium_cents == other.premium_cents &&
           coverage_cents == other.coverage_cents &&
           effective_date == other.effective_date &&
           expiration_date == other.expiration_date &&
           status == other.status;
}

void PolicyBook::add(const PolicyBookEntry& entry) {
    entries_.push_back(entry);
}

void PolicyBook::add(PolicyBookEntry&& entry) {
    entries_.push_back(std::move(entry));
}

const PolicyBookEntry& PolicyBook::get(size_t index) const {
    if (index >= entries_.size()) {
        throw std::out_of_range("Policy book index out of range");
    }
    return entries_[index];
}

size_t PolicyBook::size() const {
    return entries_.size();
}

bool PolicyBook::empty() const {
    return entries_.empty();
}

void PolicyBook::reserve(size_t count) {
    entries_.reserve(count);
}

void PolicyBook::clear() {
    entries_.clear();
}

std::vector<PolicyBookEntry> PolicyBook::active_in(const YearMonth& month) const {
    std::vector<PolicyBookEntry> active;
    for (const auto& entry : entries_) {
        if (entry.is_active_in(month)) {
            active.push_back(entry);
        }
    }
    return active;
}

PolicyBook PolicyBook::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_from_csv(file);
}

PolicyBook PolicyBook::load_from_parquet(const std::string& filepath) {
    return ParquetReader::load_policy_book(filepath);
}

PolicyBook PolicyBook::load(const std::string& filepath) {
    const std::string ext = ".parquet";
    if (filepath.size() >= ext.size() &&
        filepath.compare(filepath.size() - ext.size(), ext.size(), ext) == 0) {
        return load_from_parquet(filepath);
    }
    return load_from_csv(filepath);
}

namespace {

Cents parse_cents(const std::string& text, const std::string& column, size_t line) {
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument(text);
        }
        return static_cast<Cents>(value);
    } catch (const std::logic_error&) {
        throw ValidationError("line " + std::to_string(line) + ": " + column +
                              " is not an integer: '" + text + "'");
    }
}

} // anonymous namespace

PolicyBook PolicyBook::load_from_csv(std::istream& is) {
    PolicyBook book;
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return book;
    }

    size_t line = 1;
    while (reader.has_more()) {
        auto row = reader.read_row();
        ++line;
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        if (row.size() < 8) {
            throw ValidationError("line " + std::to_string(line) + ": expected 8 columns, got " +
                                  std::to_string(row.size()));
        }

        PolicyBookEntry e;
        e.policy_id = row[0];
        e.product_code = parse_product_code(row[1]);
        e.risk_band = parse_risk_band(row[2]);
        e.premium_cents = parse_cents(row[3], "premium_cents", line);
        e.coverage_cents = parse_cents(row[4], "coverage_cents", line);
        e.effective_date = Date::parse(row[5]);
        e.expiration_date = Date::parse(row[6]);
        e.status = parse_policy_status(row[7]);

        if (e.coverage_cents < 0 || e.premium_cents < 0) {
            throw ValidationError("line " + std::to_string(line) + ": negative amount for " +
                                  e.policy_id);
        }

        book.add(std::move(e));
    }

    return book;
}

PolicyBook PolicyBook::from_policies(const std::vector<Policy>& policies) {
    PolicyBook book;
    book.reserve(policies.size());
    for (const auto& policy : policies) {
        PolicyBookEntry e;
        e.policy_id = policy.id;
        e.product_code = policy.product_code;
        e.risk_band = policy.risk_band;
        e.premium_cents = policy.premium_total_cents;
        e.coverage_cents = policy.coverage_cents;
        e.effective_date = policy.effective_date;
        e.expiration_date = policy.expiration_date;
        e.status = policy.status;
        book.add(std::move(e));
    }
    return book;
}

void PolicyBook::write_csv(std::ostream& os) const {
    os << "policy_id,product_code,risk_band,premium_cents,coverage_cents,"
          "effective_date,expiration_date,status\n";
    for (const auto& e : entries_) {
        os << e.policy_id << ','
           << to_string(e.product_code) << ','
           << to_string(e.risk_band) << ','
           << e.premium_cents << ','
           << e.coverage_cents << ','
           << e.effective_date.to_string() << ','
           << e.expiration_date.to_string() << ','
           << to_string(e.status) << '\n';
    }
}

} // namespace covercalc

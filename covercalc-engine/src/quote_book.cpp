#include "quote_book.hpp"
#include "errors.hpp"
#include <cstdio>

namespace covercalc {

std::string to_string(QuoteStatus status) {
    switch (status) {
        case QuoteStatus::Quoted:  return "quoted";
        case QuoteStatus::Expired: return "expired";
        case QuoteStatus::Bound:   return "bound";
    }
    throw std::logic_error("Unknown QuoteStatus");
}

QuoteBook::QuoteBook() : sequence_(0) {}

std::string QuoteBook::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "q_%06llu", static_cast<unsigned long long>(++sequence_));
    return std::string(buf);
}

void QuoteBook::add(const Quote& quote) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (quotes_.count(quote.id) > 0) {
        throw std::logic_error("Duplicate quote id: " + quote.id);
    }
    quotes_[quote.id] = Entry{std::make_shared<const Quote>(quote), QuoteStatus::Quoted};
}

std::shared_ptr<const Quote> QuoteBook::get(const std::string& quote_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quote_id);
    if (it == quotes_.end()) {
        throw QuoteNotFoundError(quote_id);
    }
    return it->second.quote;
}

QuoteStatus QuoteBook::status(const std::string& quote_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quote_id);
    if (it == quotes_.end()) {
        throw QuoteNotFoundError(quote_id);
    }
    return it->second.status;
}

std::shared_ptr<const Quote> QuoteBook::claim_for_bind(const std::string& quote_id,
                                                       const Date& bind_date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quote_id);
    if (it == quotes_.end()) {
        throw QuoteNotFoundError(quote_id);
    }

    Entry& entry = it->second;
    if (entry.status == QuoteStatus::Bound || in_flight_.count(quote_id) > 0) {
        throw QuoteNotFoundError(quote_id);
    }
    if (entry.status == QuoteStatus::Expired) {
        throw QuoteExpiredError(quote_id);
    }
    if (bind_date > entry.quote->expires_on) {
        entry.status = QuoteStatus::Expired;
        throw QuoteExpiredError(quote_id);
    }

    in_flight_.insert(quote_id);
    return entry.quote;
}

void QuoteBook::complete_bind(const std::string& quote_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = quotes_.find(quote_id);
    if (it == quotes_.end() || in_flight_.count(quote_id) == 0) {
        throw std::logic_error("complete_bind without claim: " + quote_id);
    }
    it->second.status = QuoteStatus::Bound;
    in_flight_.erase(quote_id);
}

void QuoteBook::release_claim(const std::string& quote_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(quote_id);
}

size_t QuoteBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quotes_.size();
}

} // namespace covercalc

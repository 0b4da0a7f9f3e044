#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "config_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "quote_pipeline.hpp"

using namespace covercalc;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

const std::string CONFIG_PATH = std::string(COVERCALC_SAMPLE_DIR) + "/config/underwriting.json";

void silence_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

std::shared_ptr<ConfigStore> create_store() {
    silence_logger();
    return ConfigStore::from_file(CONFIG_PATH);
}

QuoteRequest shipping_example() {
    QuoteRequest r;
    r.product_code = ProductCode::Shipping;
    r.partner_id = "p_shopmart";
    r.shipping.declared_value = 65000;
    r.shipping.item_category = "electronics";
    r.shipping.destination_state = "CA";
    r.shipping.destination_risk = "medium";
    r.shipping.service_level = "ground";
    return r;
}

QuoteRequest ppi_request(const std::string& state) {
    QuoteRequest r;
    r.product_code = ProductCode::Ppi;
    r.partner_id = "p_shopmart";
    r.ppi.order_value = 90000;
    r.ppi.term_months = 18;
    r.ppi.job_category = "contractor";
    r.ppi.state = state;
    r.ppi.age = 41;
    r.ppi.tenure_months = 30;
    return r;
}

Policyholder create_holder(const std::string& state) {
    Policyholder holder;
    holder.name = "Ada Moreno";
    holder.email = "ada@example.com";
    holder.state = state;
    return holder;
}

const Date QUOTE_DATE(2025, 1, 15);
const Date BIND_DATE(2025, 1, 16);

} // anonymous namespace

// ============================================================================
// Quote
// ============================================================================

TEST_CASE("Shipping example quote end to end", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);

    REQUIRE(quote.id == "q_000001");
    REQUIRE(quote.risk.band == RiskBand::E);
    REQUIRE(quote.risk.risk_multiplier == 1.4);
    REQUIRE(quote.price.base_premium_cents == 41113);
    REQUIRE(quote.price.total_premium_cents == 62162);
    REQUIRE(quote.carrier_id == "c_atlas");
    REQUIRE(quote.carrier_margin_cents > 0.0);
    REQUIRE(quote.routing_rationale.rfind("Selected c_atlas with margin $", 0) == 0);
    REQUIRE(quote.expires_on == Date(2025, 2, 14));
    REQUIRE_FALSE(quote.compliance.blocked());
    REQUIRE(quote.compliance.rules_applied == std::vector<std::string>{"ship_ca_disclosure"});
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Quoted);
    REQUIRE(pipeline.quote_count() == 1);
}

TEST_CASE("Quotes are deterministic apart from the id", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote a = pipeline.quote(shipping_example(), QUOTE_DATE);
    Quote b = pipeline.quote(shipping_example(), QUOTE_DATE);

    REQUIRE(a.id == "q_000001");
    REQUIRE(b.id == "q_000002");
    REQUIRE(a.price.total_premium_cents == b.price.total_premium_cents);
    REQUIRE(a.carrier_id == b.carrier_id);
    REQUIRE(a.compliance.report_id == b.compliance.report_id);
}

TEST_CASE("Quote-time compliance block is recorded, not raised", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(ppi_request("GA"), QUOTE_DATE);

    REQUIRE(quote.compliance.blocked());
    REQUIRE(quote.compliance.blocking_rules ==
            (std::vector<std::string>{"ppi_ga_block", "ban_ppi_states"}));
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Quoted);
}

TEST_CASE("Failed quotes are not stored", "[pipeline]") {
    QuotePipeline pipeline(create_store());

    SECTION("no carrier writes the state") {
        QuoteRequest request = shipping_example();
        request.shipping.destination_state = "HI";
        REQUIRE_THROWS_AS(pipeline.quote(request, QUOTE_DATE), NoCarrierAvailableError);
    }

    SECTION("unknown partner") {
        QuoteRequest request = shipping_example();
        request.partner_id = "p_unknown";
        REQUIRE_THROWS_AS(pipeline.quote(request, QUOTE_DATE), ValidationError);
    }

    SECTION("partner does not sell the product") {
        QuoteRequest request = ppi_request("TX");
        request.partner_id = "p_gadgetly";
        REQUIRE_THROWS_AS(pipeline.quote(request, QUOTE_DATE), ValidationError);
    }

    SECTION("invalid input") {
        QuoteRequest request = shipping_example();
        request.shipping.declared_value = 0;
        REQUIRE_THROWS_AS(pipeline.quote(request, QUOTE_DATE), ValidationError);
    }

    REQUIRE(pipeline.quote_count() == 0);
}

// ============================================================================
// Bind
// ============================================================================

TEST_CASE("Bind creates an active policy", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);
    Cents before = pipeline.remaining_capacity("c_atlas");

    Policy policy = pipeline.bind(quote.id, create_holder("CA"), BIND_DATE);

    REQUIRE(policy.id == "pol_000001");
    REQUIRE(policy.quote_id == quote.id);
    REQUIRE(policy.status == PolicyStatus::Active);
    REQUIRE(policy.premium_total_cents == 62162);
    REQUIRE(policy.coverage_cents == 65000);
    REQUIRE(policy.carrier_id == "c_atlas");
    REQUIRE(policy.effective_date == BIND_DATE);
    REQUIRE(policy.expiration_date == Date(2025, 2, 15));
    REQUIRE(policy.disclosures.size() == 1);
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Bound);
    REQUIRE(pipeline.remaining_capacity("c_atlas") == before - 62162);
    REQUIRE(pipeline.get_policy(policy.id).quote_id == quote.id);
}

TEST_CASE("PPI policy runs for term_months", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(ppi_request("TX"), QUOTE_DATE);
    Policy policy = pipeline.bind(quote.id, create_holder("TX"), Date(2025, 1, 20));
    REQUIRE(policy.expiration_date == Date(2026, 7, 20));
    REQUIRE(policy.product_code == ProductCode::Ppi);
}

TEST_CASE("Double bind fails with QuoteNotFoundError", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);

    REQUIRE_NOTHROW(pipeline.bind(quote.id, create_holder("CA"), BIND_DATE));
    REQUIRE_THROWS_AS(pipeline.bind(quote.id, create_holder("CA"), BIND_DATE), QuoteNotFoundError);
    REQUIRE(pipeline.policies().size() == 1);
}

TEST_CASE("Unknown quote id", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    REQUIRE_THROWS_AS(pipeline.bind("q_999999", create_holder("CA"), BIND_DATE), QuoteNotFoundError);
}

TEST_CASE("Binding past expiry expires the quote", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);

    REQUIRE_THROWS_AS(pipeline.bind(quote.id, create_holder("CA"), Date(2025, 2, 15)), QuoteExpiredError);
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Expired);
    REQUIRE_THROWS_AS(pipeline.bind(quote.id, create_holder("CA"), BIND_DATE), QuoteExpiredError);
    REQUIRE(pipeline.policies().empty());
}

TEST_CASE("Binding on the expiry date succeeds", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);
    REQUIRE_NOTHROW(pipeline.bind(quote.id, create_holder("CA"), quote.expires_on));
}

TEST_CASE("PPI in GA fails bind with exactly the blocking rules", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(ppi_request("GA"), QUOTE_DATE);

    try {
        pipeline.bind(quote.id, create_holder("GA"), BIND_DATE);
        FAIL("bind should have been blocked");
    } catch (const ComplianceBlockedError& e) {
        REQUIRE(e.rule_ids() == (std::vector<std::string>{"ppi_ga_block", "ban_ppi_states"}));
    }

    REQUIRE(pipeline.policies().empty());
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Quoted);
}

TEST_CASE("Policyholder state is evaluated at bind", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(ppi_request("TX"), QUOTE_DATE);
    REQUIRE_FALSE(quote.compliance.blocked());

    try {
        pipeline.bind(quote.id, create_holder("VT"), BIND_DATE);
        FAIL("bind should have been blocked");
    } catch (const ComplianceBlockedError& e) {
        REQUIRE(e.rule_ids() == std::vector<std::string>{"ban_ppi_states"});
    }

    // The claim is released, so a corrected bind goes through
    REQUIRE_NOTHROW(pipeline.bind(quote.id, create_holder("TX"), BIND_DATE));
}

TEST_CASE("Invalid policyholder is rejected before claiming", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);

    Policyholder holder = create_holder("ZZ");
    REQUIRE_THROWS_AS(pipeline.bind(quote.id, holder, BIND_DATE), ValidationError);
    REQUIRE(pipeline.quote_status(quote.id) == QuoteStatus::Quoted);
}

TEST_CASE("Capacity is consumed at bind", "[pipeline]") {
    auto store = create_store();
    UnderwritingConfig config = *store->snapshot();
    for (auto& carrier : config.carriers) {
        if (carrier.id == "c_atlas") {
            carrier.capacity_cents = 100000;
        } else if (carrier.id == "c_beacon") {
            carrier.capacity_cents = 0;
        }
    }
    store->replace(config);

    QuotePipeline pipeline(store);
    Quote first = pipeline.quote(shipping_example(), QUOTE_DATE);
    Quote second = pipeline.quote(shipping_example(), QUOTE_DATE);
    REQUIRE(first.carrier_id == "c_atlas");
    REQUIRE(second.carrier_id == "c_atlas");

    REQUIRE_NOTHROW(pipeline.bind(first.id, create_holder("CA"), BIND_DATE));
    REQUIRE(pipeline.remaining_capacity("c_atlas") == 100000 - 62162);

    REQUIRE_THROWS_AS(pipeline.bind(second.id, create_holder("CA"), BIND_DATE), NoCarrierAvailableError);
    REQUIRE(pipeline.quote_status(second.id) == QuoteStatus::Quoted);
    REQUIRE(pipeline.remaining_capacity("c_atlas") == 100000 - 62162);

    SECTION("a third quote no longer routes") {
        REQUIRE_THROWS_AS(pipeline.quote(shipping_example(), QUOTE_DATE), NoCarrierAvailableError);
    }
}

TEST_CASE("Concurrent binds of one quote produce one policy", "[pipeline][concurrency]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(shipping_example(), QUOTE_DATE);

    std::atomic<int> bound{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                pipeline.bind(quote.id, create_holder("CA"), BIND_DATE);
                ++bound;
            } catch (const QuoteNotFoundError&) {
                ++rejected;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(bound == 1);
    REQUIRE(rejected == 7);
    REQUIRE(pipeline.policies().size() == 1);
}

TEST_CASE("Concurrent binds of different quotes all succeed", "[pipeline][concurrency]") {
    QuotePipeline pipeline(create_store());
    std::vector<std::string> ids;
    for (int i = 0; i < 16; ++i) {
        ids.push_back(pipeline.quote(shipping_example(), QUOTE_DATE).id);
    }

    std::vector<std::thread> threads;
    for (const auto& id : ids) {
        threads.emplace_back([&pipeline, id]() {
            pipeline.bind(id, create_holder("CA"), BIND_DATE);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(pipeline.policies().size() == 16);
}

// ============================================================================
// Cancel
// ============================================================================

TEST_CASE("Cancel refunds the unexpired premium pro rata", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote quote = pipeline.quote(ppi_request("TX"), QUOTE_DATE);
    REQUIRE(quote.price.total_premium_cents == 7999);

    Policy policy = pipeline.bind(quote.id, create_holder("TX"), Date(2025, 1, 20));
    Policy cancelled = pipeline.cancel(policy.id, Date(2025, 4, 20));

    // 90 of 360 days used
    REQUIRE(cancelled.status == PolicyStatus::Cancelled);
    REQUIRE(cancelled.refund_cents == 5999);
    REQUIRE(cancelled.cancelled_on.has_value());
    REQUIRE(*cancelled.cancelled_on == Date(2025, 4, 20));
    REQUIRE(pipeline.get_policy(policy.id).status == PolicyStatus::Cancelled);

    REQUIRE_THROWS_AS(pipeline.cancel(policy.id, Date(2025, 4, 21)), ValidationError);
}

TEST_CASE("Cancel of an unknown policy", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    REQUIRE_THROWS_AS(pipeline.cancel("pol_999999", BIND_DATE), PolicyNotFoundError);
}

TEST_CASE("Refund formula edges", "[pipeline]") {
    REQUIRE(prorata_refund_cents(36000, Date(2025, 1, 1), Date(2025, 1, 1)) == 36000);
    REQUIRE(prorata_refund_cents(36000, Date(2025, 1, 10), Date(2025, 1, 1)) == 36000);
    REQUIRE(prorata_refund_cents(36000, Date(2025, 1, 1), Date(2026, 1, 1)) == 0);
    REQUIRE(prorata_refund_cents(36000, Date(2025, 1, 1), Date(2027, 1, 1)) == 0);
    REQUIRE(prorata_refund_cents(1000, Date(2025, 1, 1), Date(2025, 1, 2)) == 997);
}

// ============================================================================
// Configuration reload and policy book
// ============================================================================

TEST_CASE("Replaced rules apply to later binds", "[pipeline][config]") {
    auto store = create_store();
    QuotePipeline pipeline(store);
    Quote quote = pipeline.quote(ppi_request("GA"), QUOTE_DATE);
    REQUIRE(quote.compliance.blocked());

    RuleSet permissive;
    permissive.version = "2025.02";
    uint64_t generation = store->replace_rules(permissive);
    REQUIRE(generation == store->generation());

    Policy policy = pipeline.bind(quote.id, create_holder("GA"), BIND_DATE);
    REQUIRE(policy.status == PolicyStatus::Active);
    REQUIRE(policy.disclosures.empty());
}

TEST_CASE("Bound policies feed the simulator book", "[pipeline]") {
    QuotePipeline pipeline(create_store());
    Quote ship = pipeline.quote(shipping_example(), QUOTE_DATE);
    Quote ppi = pipeline.quote(ppi_request("TX"), QUOTE_DATE);
    Policy p1 = pipeline.bind(ship.id, create_holder("CA"), BIND_DATE);
    pipeline.bind(ppi.id, create_holder("TX"), BIND_DATE);
    pipeline.cancel(p1.id, Date(2025, 1, 20));

    PolicyBook book = pipeline.policy_book_snapshot();
    REQUIRE(book.size() == 2);
    REQUIRE(book.get(0).policy_id == p1.id);
    REQUIRE(book.get(0).status == PolicyStatus::Cancelled);
    REQUIRE(book.get(0).risk_band == RiskBand::E);
    REQUIRE(book.get(1).premium_cents == 7999);
    REQUIRE(book.active_in(YearMonth(2025, 1)).size() == 1);
}

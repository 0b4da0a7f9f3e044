#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "pricing_engine.hpp"

using namespace covercalc;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

RateCurveSet create_curves() {
    ShippingRateCurve shipping;
    shipping.base_rate = 0.55;
    shipping.minimum_premium_cents = 99;
    shipping.category = {{"general", 0.8}, {"electronics", 1.0}, {"jewelry_high_value", 1.35}};
    shipping.destination_risk = {{"low", 1.0}, {"medium", 1.15}, {"high", 1.3}};
    shipping.service_level = {{"ground", 1.0}, {"expedited", 0.95}, {"overnight", 0.9}};

    PpiRateCurve ppi;
    ppi.base_rate = 0.06;
    ppi.minimum_premium_cents = 199;
    ppi.term_buckets = {{6, 0.9}, {12, 1.0}, {24, 1.25}};
    ppi.job_category = {{"full_time", 1.0}, {"contractor", 1.25}};
    ppi.band = {{"A", 0.9}, {"B", 1.0}, {"C", 1.1}, {"D", 1.2}, {"E", 1.35}};
    ppi.age_factors = {{25, 1.2}, {35, 1.0}, {INT_MAX, 1.1}};
    ppi.tenure_factors = {{6, 1.3}, {INT_MAX, 1.0}};

    RateCurveSet curves;
    curves.shipping = shipping;
    curves.ppi = ppi;
    return curves;
}

PartnerTerms create_partner(double markup) {
    PartnerTerms partner;
    partner.id = "p_test";
    partner.products = {ProductCode::Shipping, ProductCode::Ppi};
    partner.markup_pct = markup;
    return partner;
}

QuoteRequest shipping_example() {
    QuoteRequest r;
    r.product_code = ProductCode::Shipping;
    r.partner_id = "p_test";
    r.shipping.declared_value = 65000;
    r.shipping.item_category = "electronics";
    r.shipping.destination_state = "CA";
    r.shipping.destination_risk = "medium";
    r.shipping.service_level = "ground";
    return r;
}

QuoteRequest ppi_example() {
    QuoteRequest r;
    r.product_code = ProductCode::Ppi;
    r.partner_id = "p_test";
    r.ppi.order_value = 120000;
    r.ppi.term_months = 12;
    r.ppi.job_category = "full_time";
    r.ppi.state = "TX";
    r.ppi.age = 34;
    r.ppi.tenure_months = 24;
    return r;
}

} // anonymous namespace

// ============================================================================
// Composition
// ============================================================================

TEST_CASE("Shipping example premium breakdown", "[pricing]") {
    QuoteRequest request = shipping_example();
    RiskAssessment risk = score_risk(request);
    PriceBreakdown price = price_quote(request, risk, create_partner(0.08), create_curves());

    // 65000 * 0.55 * 1.15 = 41112.5, rounded once after the multipliers
    REQUIRE_THAT(price.base_premium_exact, WithinAbs(41112.5, 1e-6));
    REQUIRE(price.base_premium_cents == 41113);
    REQUIRE(price.risk_adjusted_premium_cents == 57558);
    REQUIRE(price.total_premium_cents == 62162);
    REQUIRE(price.base_rate == 0.55);
    REQUIRE(price.factor("destination_risk") == 1.15);
    REQUIRE(price.factor("category") == 1.0);
    REQUIRE(price.factor("state") == 1.0);
    REQUIRE(price.risk_multiplier == 1.4);
    REQUIRE(price.partner_markup_pct == 0.08);
}

TEST_CASE("Total premium satisfies the composition identity", "[pricing]") {
    RateCurveSet curves = create_curves();
    for (Cents value : {1000, 25000, 65000, 99999, 250000}) {
        for (double markup : {0.0, 0.05, 0.08, 0.25}) {
            QuoteRequest request = shipping_example();
            request.shipping.declared_value = value;
            RiskAssessment risk = score_risk(request);
            PriceBreakdown price = price_quote(request, risk, create_partner(markup), curves);

            REQUIRE(price.total_premium_cents ==
                    round_half_up(price.base_premium_exact * risk.risk_multiplier * (1.0 + markup)));
            REQUIRE(price.total_premium_cents ==
                    compose_total_premium(price.base_premium_exact, risk.risk_multiplier, markup));
            REQUIRE(price.base_premium_cents == round_half_up(price.base_premium_exact));
        }
    }
}

TEST_CASE("PPI premium applies term, job, band, age and tenure", "[pricing]") {
    QuoteRequest request = ppi_example();
    RiskAssessment risk = score_risk(request);
    REQUIRE(risk.band == RiskBand::B);

    PriceBreakdown price = price_quote(request, risk, create_partner(0.08), create_curves());
    REQUIRE(price.base_premium_cents == 7200);
    REQUIRE(price.risk_adjusted_premium_cents == 7560);
    REQUIRE(price.total_premium_cents == 8165);

    SECTION("young applicant with short tenure") {
        request.ppi.age = 22;
        request.ppi.tenure_months = 3;
        RiskAssessment young_risk = score_risk(request);
        PriceBreakdown young = price_quote(request, young_risk, create_partner(0.08), create_curves());
        REQUIRE(young.factor("age") == 1.2);
        REQUIRE(young.factor("tenure") == 1.3);
        REQUIRE(young.base_premium_cents > price.base_premium_cents);
    }

    SECTION("age and tenure factors are skipped when not supplied") {
        request.ppi.age.reset();
        request.ppi.tenure_months.reset();
        PriceBreakdown bare = price_quote(request, score_risk(request), create_partner(0.0), create_curves());
        REQUIRE(bare.factors.size() == 3);
    }
}

TEST_CASE("Minimum premium floors the base", "[pricing]") {
    QuoteRequest request = ppi_example();
    request.ppi.order_value = 1000;
    PriceBreakdown price = price_quote(request, score_risk(request), create_partner(0.0), create_curves());
    REQUIRE(price.base_premium_cents == 199);
    REQUIRE(price.base_premium_exact == 199.0);
    REQUIRE(price.total_premium_cents ==
            round_half_up(199.0 * price.risk_multiplier));
}

TEST_CASE("Premium is monotone in declared value", "[pricing]") {
    RateCurveSet curves = create_curves();
    Cents prev = 0;
    for (Cents value = 1000; value <= 300000; value += 11000) {
        QuoteRequest request = shipping_example();
        request.shipping.declared_value = value;
        PriceBreakdown price = price_quote(request, score_risk(request), create_partner(0.08), curves);
        REQUIRE(price.total_premium_cents >= prev);
        prev = price.total_premium_cents;
    }
}

TEST_CASE("PPI premium, score and band are monotone in order value", "[pricing]") {
    RateCurveSet curves = create_curves();
    Cents prev_total = 0;
    double prev_score = -1.0;
    RiskBand prev_band = RiskBand::A;
    RiskBand first_band = RiskBand::E;
    for (Cents value = 5000; value <= 1500000; value += 45000) {
        QuoteRequest request = ppi_example();
        request.ppi.order_value = value;
        RiskAssessment risk = score_risk(request);
        PriceBreakdown price = price_quote(request, risk, create_partner(0.08), curves);

        if (value == 5000) {
            first_band = risk.band;
        }
        REQUIRE(risk.score >= prev_score);
        REQUIRE(risk.band >= prev_band);
        REQUIRE(price.total_premium_cents >= prev_total);
        prev_score = risk.score;
        prev_band = risk.band;
        prev_total = price.total_premium_cents;
    }
    REQUIRE(first_band < RiskBand::E);
    REQUIRE(prev_band == RiskBand::E);
}

// ============================================================================
// Failure modes
// ============================================================================

TEST_CASE("Missing rate entries fail closed", "[pricing]") {
    RateCurveSet curves = create_curves();
    PartnerTerms partner = create_partner(0.08);

    SECTION("unknown category") {
        QuoteRequest request = shipping_example();
        request.shipping.item_category = "apparel";
        REQUIRE_THROWS_AS(price_quote(request, score_risk(request), partner, curves), RateNotFoundError);
    }

    SECTION("state table present but state missing") {
        curves.shipping->state = {{"TX", 1.1}};
        QuoteRequest request = shipping_example();
        REQUIRE_THROWS_AS(price_quote(request, score_risk(request), partner, curves), RateNotFoundError);
    }

    SECTION("term beyond the last bucket") {
        QuoteRequest request = ppi_example();
        request.ppi.term_months = 30;
        REQUIRE_THROWS_AS(price_quote(request, score_risk(request), partner, curves), RateNotFoundError);
    }

    SECTION("job category missing") {
        QuoteRequest request = ppi_example();
        request.ppi.job_category = "part_time";
        REQUIRE_THROWS_AS(price_quote(request, score_risk(request), partner, curves), RateNotFoundError);
    }

    SECTION("no curve for the product") {
        curves.ppi.reset();
        QuoteRequest request = ppi_example();
        REQUIRE_THROWS_AS(price_quote(request, score_risk(request), partner, curves), RateNotFoundError);
    }
}

TEST_CASE("Partner markup outside [0,1) is rejected", "[pricing]") {
    QuoteRequest request = shipping_example();
    RiskAssessment risk = score_risk(request);
    REQUIRE_THROWS_AS(price_quote(request, risk, create_partner(1.0), create_curves()), ValidationError);
    REQUIRE_THROWS_AS(price_quote(request, risk, create_partner(-0.01), create_curves()), ValidationError);
}

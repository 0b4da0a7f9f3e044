#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "errors.hpp"
#include "risk_scorer.hpp"

using namespace covercalc;
using Catch::Matchers::WithinAbs;

namespace {

QuoteRequest shipping_request(Cents declared_value,
                              const std::string& category = "electronics",
                              const std::string& risk = "medium",
                              const std::string& service = "ground") {
    QuoteRequest r;
    r.product_code = ProductCode::Shipping;
    r.partner_id = "p_test";
    r.shipping.declared_value = declared_value;
    r.shipping.item_category = category;
    r.shipping.destination_state = "CA";
    r.shipping.destination_risk = risk;
    r.shipping.service_level = service;
    return r;
}

QuoteRequest ppi_request(Cents order_value, int term_months,
                         const std::string& job = "full_time") {
    QuoteRequest r;
    r.product_code = ProductCode::Ppi;
    r.partner_id = "p_test";
    r.ppi.order_value = order_value;
    r.ppi.term_months = term_months;
    r.ppi.job_category = job;
    r.ppi.state = "TX";
    return r;
}

} // anonymous namespace

TEST_CASE("Shipping example scores band E", "[risk]") {
    RiskAssessment risk = score_risk(shipping_request(65000));

    // 0.02 * 65 + 0.5 (medium) + 0.2 (ground)
    REQUIRE_THAT(risk.raw_score, WithinAbs(2.0, 1e-12));
    REQUIRE_THAT(risk.score, WithinAbs(1.0, 1e-12));
    REQUIRE(risk.band == RiskBand::E);
    REQUIRE(risk.risk_multiplier == 1.4);
}

TEST_CASE("Shipping components", "[risk]") {
    SECTION("low risk overnight") {
        RiskAssessment risk = score_risk(shipping_request(10000, "apparel", "low", "overnight"));
        REQUIRE_THAT(risk.raw_score, WithinAbs(0.2, 1e-12));
        REQUIRE_THAT(risk.score, WithinAbs(0.1, 1e-12));
        REQUIRE(risk.band == RiskBand::A);
        REQUIRE(risk.risk_multiplier == 1.0);
    }

    SECTION("high-value category adds 0.3") {
        double plain = shipping_raw_score(shipping_request(10000, "jewelry", "low", "overnight").shipping);
        double high = shipping_raw_score(shipping_request(10000, "jewelry_high_value", "low", "overnight").shipping);
        REQUIRE_THAT(high - plain, WithinAbs(0.3, 1e-12));
    }
}

TEST_CASE("PPI components", "[risk]") {
    QuoteRequest r = ppi_request(120000, 12);
    REQUIRE_THAT(ppi_raw_score(r.ppi), WithinAbs(0.44, 1e-12));

    r.ppi.age = 22;
    r.ppi.tenure_months = 3;
    r.ppi.job_category = "seasonal_temp";
    // + 0.3 young + 0.3 short tenure + 0.2 seasonal
    REQUIRE_THAT(ppi_raw_score(r.ppi), WithinAbs(1.24, 1e-12));
    REQUIRE(score_risk(r).band == RiskBand::D);
}

TEST_CASE("Band thresholds are half-open", "[risk]") {
    REQUIRE(band_for_score(0.0) == RiskBand::A);
    REQUIRE(band_for_score(0.1999) == RiskBand::A);
    REQUIRE(band_for_score(0.2) == RiskBand::B);
    REQUIRE(band_for_score(0.4) == RiskBand::C);
    REQUIRE(band_for_score(0.6) == RiskBand::D);
    REQUIRE(band_for_score(0.8) == RiskBand::E);
    REQUIRE(band_for_score(1.0) == RiskBand::E);

    REQUIRE(multiplier_for_band(RiskBand::B) == 1.05);
    REQUIRE(multiplier_for_band(RiskBand::C) == 1.10);
    REQUIRE(multiplier_for_band(RiskBand::D) == 1.25);
}

TEST_CASE("Score and band are monotone in value", "[risk]") {
    double prev_score = -1.0;
    RiskBand prev_band = RiskBand::A;
    for (Cents value = 1000; value <= 200000; value += 7000) {
        RiskAssessment risk = score_risk(shipping_request(value, "general", "low", "overnight"));
        REQUIRE(risk.score >= prev_score);
        REQUIRE(risk.band >= prev_band);
        prev_score = risk.score;
        prev_band = risk.band;
    }
}

TEST_CASE("PPI score and band are monotone in order value", "[risk]") {
    double prev_score = -1.0;
    RiskBand prev_band = RiskBand::A;
    for (Cents value = 5000; value <= 1500000; value += 45000) {
        RiskAssessment risk = score_risk(ppi_request(value, 12));
        REQUIRE(risk.score >= prev_score);
        REQUIRE(risk.band >= prev_band);
        prev_score = risk.score;
        prev_band = risk.band;
    }
    REQUIRE(score_risk(ppi_request(5000, 12)).band == RiskBand::A);
    REQUIRE(prev_band == RiskBand::E);
}

TEST_CASE("Scoring is deterministic", "[risk]") {
    QuoteRequest r = ppi_request(90000, 18, "contractor");
    r.ppi.age = 41;
    RiskAssessment a = score_risk(r);
    RiskAssessment b = score_risk(r);
    REQUIRE(a.raw_score == b.raw_score);
    REQUIRE(a.band == b.band);
}

TEST_CASE("Out-of-domain inputs raise ValidationError", "[risk]") {
    REQUIRE_THROWS_AS(score_risk(shipping_request(0)), ValidationError);
    REQUIRE_THROWS_AS(score_risk(shipping_request(1000, "furniture")), ValidationError);
    REQUIRE_THROWS_AS(score_risk(shipping_request(1000, "general", "extreme")), ValidationError);
    REQUIRE_THROWS_AS(score_risk(shipping_request(1000, "general", "low", "drone")), ValidationError);

    QuoteRequest bad_state = shipping_request(1000);
    bad_state.shipping.destination_state = "ZZ";
    REQUIRE_THROWS_AS(score_risk(bad_state), ValidationError);

    REQUIRE_THROWS_AS(score_risk(ppi_request(-5, 12)), ValidationError);
    REQUIRE_THROWS_AS(score_risk(ppi_request(1000, 0)), ValidationError);
    REQUIRE_THROWS_AS(score_risk(ppi_request(1000, 37)), ValidationError);
    REQUIRE_THROWS_AS(score_risk(ppi_request(1000, 12, "astronaut")), ValidationError);

    QuoteRequest young = ppi_request(1000, 12);
    young.ppi.age = 17;
    REQUIRE_THROWS_AS(score_risk(young), ValidationError);

    QuoteRequest negative_tenure = ppi_request(1000, 12);
    negative_tenure.ppi.tenure_months = -1;
    REQUIRE_THROWS_AS(score_risk(negative_tenure), ValidationError);
}

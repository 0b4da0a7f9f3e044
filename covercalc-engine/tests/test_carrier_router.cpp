#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "carrier_router.hpp"
#include "errors.hpp"

using namespace covercalc;
using Catch::Matchers::WithinAbs;

namespace {

Carrier create_carrier(const std::string& id, double loss_ratio, Cents fixed_cost,
                       Cents capacity = 50000000) {
    Carrier c;
    c.id = id;
    c.name = id;
    c.loss_ratio = loss_ratio;
    c.fixed_cost_cents = fixed_cost;
    c.capacity_cents = capacity;
    c.appetite[ProductCode::Shipping] = CarrierAppetite();
    c.appetite[ProductCode::Ppi] = CarrierAppetite();
    return c;
}

RoutingRequest shipping_routing(Cents premium = 62163) {
    RoutingRequest r;
    r.product_code = ProductCode::Shipping;
    r.state = "CA";
    r.item_category = "electronics";
    r.declared_value_cents = 65000;
    r.risk_band = RiskBand::E;
    r.risk_multiplier = 1.4;
    r.premium_cents = premium;
    return r;
}

RoutingRequest ppi_routing() {
    RoutingRequest r;
    r.product_code = ProductCode::Ppi;
    r.state = "TX";
    r.job_category = "contractor";
    r.term_months = 18;
    r.risk_band = RiskBand::B;
    r.risk_multiplier = 1.05;
    r.premium_cents = 10000;
    return r;
}

} // anonymous namespace

TEST_CASE("Margin formula", "[router]") {
    Carrier atlas = create_carrier("c_atlas", 0.50, 500);
    REQUIRE_THAT(atlas.margin_cents(62163, 1.4), WithinAbs(18148.9, 1e-6));
    REQUIRE_THAT(atlas.margin_cents(10000, 1.0), WithinAbs(4500.0, 1e-9));
}

TEST_CASE("Router selects the highest margin carrier", "[router]") {
    std::vector<Carrier> carriers = {
        create_carrier("c_atlas", 0.50, 500),
        create_carrier("c_beacon", 0.58, 300)
    };

    RoutingDecision decision = route_to_carrier(shipping_routing(), carriers);
    REQUIRE(decision.carrier_id == "c_atlas");
    REQUIRE(decision.margin_cents > 0.0);
    REQUIRE(decision.rationale ==
            "Selected c_atlas with margin $181.49 (premium: $621.63, capacity: $500000.00)");
    REQUIRE(decision.evaluations.size() == 2);
    REQUIRE(decision.evaluations[1].carrier_id == "c_beacon");
    REQUIRE(decision.evaluations[1].eligible);
}

TEST_CASE("Equal margins break ties by carrier id", "[router]") {
    std::vector<Carrier> carriers = {
        create_carrier("c_zulu", 0.5, 100),
        create_carrier("c_alpha", 0.5, 100),
        create_carrier("c_mike", 0.5, 100)
    };
    REQUIRE(route_to_carrier(shipping_routing(), carriers).carrier_id == "c_alpha");
}

TEST_CASE("Appetite rules exclude carriers", "[router]") {
    Carrier carrier = create_carrier("c_one", 0.5, 0);
    CarrierAppetite& shipping = carrier.appetite[ProductCode::Shipping];
    RoutingRequest request = shipping_routing();

    SECTION("eligible state list") {
        shipping.eligible_states = {"TX", "NY"};
        REQUIRE(check_appetite(request, shipping) == "State CA not in appetite");
    }

    SECTION("excluded state") {
        shipping.excluded_states = {"CA"};
        REQUIRE(check_appetite(request, shipping) == "State CA excluded");
    }

    SECTION("excluded category") {
        shipping.excluded_categories = {"electronics"};
        REQUIRE(check_appetite(request, shipping) == "Category electronics excluded");
    }

    SECTION("declared value limit") {
        shipping.max_declared_value_cents = 50000;
        REQUIRE(check_appetite(request, shipping).find("exceeds max") != std::string::npos);
    }

    SECTION("risk band ceiling") {
        shipping.max_risk_band = RiskBand::D;
        REQUIRE(check_appetite(request, shipping) == "Risk band E exceeds max D");
    }

    SECTION("matching appetite") {
        shipping.eligible_states = {"CA"};
        shipping.eligible_categories = {"electronics"};
        REQUIRE(check_appetite(request, shipping).empty());
    }
}

TEST_CASE("PPI appetite limits", "[router]") {
    CarrierAppetite appetite;
    RoutingRequest request = ppi_routing();

    appetite.max_term_months = 12;
    REQUIRE(check_appetite(request, appetite) == "Term 18 months exceeds max 12");

    appetite.max_term_months = 24;
    appetite.excluded_job_categories = {"contractor"};
    REQUIRE(check_appetite(request, appetite) == "Job category contractor excluded");

    appetite.excluded_job_categories.clear();
    appetite.excluded_risk_bands = {RiskBand::B};
    REQUIRE(check_appetite(request, appetite) == "Risk band B excluded");
}

TEST_CASE("Product not written and insufficient capacity", "[router]") {
    Carrier ppi_only = create_carrier("c_ppi", 0.4, 0);
    ppi_only.appetite.erase(ProductCode::Shipping);
    Carrier small = create_carrier("c_small", 0.4, 0, 1000);

    auto evaluations = evaluate_carriers(shipping_routing(), {ppi_only, small});
    REQUIRE(evaluations.size() == 2);
    REQUIRE_FALSE(evaluations[0].eligible);
    REQUIRE(evaluations[0].reason == "Product shipping not written");
    REQUIRE(evaluations[1].reason == "Insufficient capacity");

    REQUIRE_THROWS_AS(route_to_carrier(shipping_routing(), {ppi_only, small}), NoCarrierAvailableError);
}

TEST_CASE("Capacity equal to the premium is enough", "[router]") {
    Carrier exact = create_carrier("c_exact", 0.4, 0, 62163);
    REQUIRE(route_to_carrier(shipping_routing(), {exact}).carrier_id == "c_exact");
}

TEST_CASE("Empty carrier list raises NoCarrierAvailableError", "[router]") {
    REQUIRE_THROWS_AS(route_to_carrier(shipping_routing(), {}), NoCarrierAvailableError);
}

TEST_CASE("Negative capacity is an invariant violation", "[router]") {
    Carrier broken = create_carrier("c_broken", 0.4, 0, -1);
    REQUIRE_THROWS_AS(evaluate_carriers(shipping_routing(), {broken}), std::logic_error);
}

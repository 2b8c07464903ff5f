#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "monte_carlo.hpp"
#include "statistics.hpp"

using namespace loadsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

LoadModel make_model(double light_p) {
    DeviceCatalog catalog;
    catalog.add(Device("Light", 10.0, 40, true, "Domestic"));
    catalog.add(Device("TV", 60.0, 8, true, "Domestic"));

    UtilizationProfile light;
    UtilizationProfile tv;
    for (size_t h = 0; h < 24; ++h) {
        for (size_t m = 0; m < 12; ++m) {
            light.set_probability(h, m, light_p);
            tv.set_probability(h, m, (h >= 19 && h <= 22) ? 0.6 : 0.1);
        }
    }

    ProfileSet profiles;
    profiles.add("Light", light);
    profiles.add("TV", tv);
    return LoadModel(std::move(catalog), profiles);
}

} // anonymous namespace

// ============================================================================
// MonthEnsemble
// ============================================================================

TEST_CASE("MonthEnsemble shape and access", "[monte_carlo]") {
    MonthEnsemble ensemble(4, 10);

    REQUIRE(ensemble.month() == 4);
    REQUIRE(ensemble.trials() == 10);
    REQUIRE(MonthEnsemble::hours() == 24);

    ensemble.set(5, 3, 1.25);
    REQUIRE(ensemble.get(5, 3) == 1.25);
    REQUIRE(ensemble.get(5, 2) == 0.0);

    REQUIRE(ensemble.hour_values(5).size() == 10);
    REQUIRE(ensemble.hour_values(5)[3] == 1.25);
}

TEST_CASE("MonthEnsemble trial columns", "[monte_carlo]") {
    MonthEnsemble ensemble(0, 3);
    TrialLoadVector load{};
    for (size_t h = 0; h < 24; ++h) {
        load[h] = static_cast<double>(h);
    }

    ensemble.set_trial(1, load);
    REQUIRE(ensemble.trial_load(1) == load);
    REQUIRE(ensemble.get(23, 1) == 23.0);
    REQUIRE(ensemble.get(23, 0) == 0.0);

    std::vector<double> totals = ensemble.daily_totals_kwh();
    REQUIRE(totals.size() == 3);
    REQUIRE(totals[0] == 0.0);
    REQUIRE_THAT(totals[1], WithinRel(276.0, 1e-12));  // 0 + 1 + ... + 23
}

TEST_CASE("MonthEnsemble bounds", "[monte_carlo][boundary]") {
    REQUIRE_THROWS_AS(MonthEnsemble(12, 5), std::out_of_range);

    MonthEnsemble ensemble(0, 5);
    REQUIRE_THROWS_AS(ensemble.get(24, 0), std::out_of_range);
    REQUIRE_THROWS_AS(ensemble.get(0, 5), std::out_of_range);
    REQUIRE_THROWS_AS(ensemble.set(0, 5, 1.0), std::out_of_range);
    REQUIRE_THROWS_AS(ensemble.trial_load(5), std::out_of_range);
    REQUIRE_THROWS_AS(ensemble.hour_values(24), std::out_of_range);
}

// ============================================================================
// Monte Carlo loop
// ============================================================================

TEST_CASE("Ensemble has 24 x trials entries", "[monte_carlo]") {
    LoadModel model = make_model(0.5);
    MonthEnsemble ensemble = run_month_ensemble(model, 2, 37, 42);

    REQUIRE(ensemble.month() == 2);
    REQUIRE(ensemble.trials() == 37);
    for (size_t h = 0; h < 24; ++h) {
        REQUIRE(ensemble.hour_values(h).size() == 37);
    }
}

TEST_CASE("Ensemble columns match independent trials", "[monte_carlo]") {
    LoadModel model = make_model(0.5);
    MonthEnsemble ensemble = run_month_ensemble(model, 8, 20, 42);

    for (size_t t = 0; t < 20; ++t) {
        REQUIRE(ensemble.trial_load(t) == simulate_trial(model, 8, t, 42));
    }
}

TEST_CASE("Ensemble is independent of thread count", "[monte_carlo][parallel]") {
    LoadModel model = make_model(0.35);

    MonthEnsemble single = run_month_ensemble(model, 6, 200, 42, 1);
    MonthEnsemble multi = run_month_ensemble(model, 6, 200, 42, 4);
    MonthEnsemble runtime_default = run_month_ensemble(model, 6, 200, 42, 0);

    for (size_t t = 0; t < 200; ++t) {
        REQUIRE(single.trial_load(t) == multi.trial_load(t));
        REQUIRE(single.trial_load(t) == runtime_default.trial_load(t));
    }
}

TEST_CASE("Different seeds give different ensembles", "[monte_carlo]") {
    LoadModel model = make_model(0.5);

    MonthEnsemble a = run_month_ensemble(model, 0, 50, 1);
    MonthEnsemble b = run_month_ensemble(model, 0, 50, 2);

    bool any_difference = false;
    for (size_t t = 0; t < 50 && !any_difference; ++t) {
        any_difference = a.trial_load(t) != b.trial_load(t);
    }
    REQUIRE(any_difference);
}

TEST_CASE("Ensemble with certain use is constant", "[monte_carlo]") {
    // One device, owned_count=10, power=100 W, p(0,0)=1
    DeviceCatalog catalog;
    catalog.add(Device("Heater", 100.0, 10));
    UtilizationProfile profile;
    profile.set_probability(0, 0, 1.0);
    ProfileSet profiles;
    profiles.add("Heater", profile);
    LoadModel model(std::move(catalog), profiles);

    MonthEnsemble ensemble = run_month_ensemble(model, 0, 50, 42);
    for (size_t t = 0; t < 50; ++t) {
        REQUIRE_THAT(ensemble.get(0, t), WithinRel(1.0, 1e-12));
        REQUIRE(ensemble.get(1, t) == 0.0);
    }
}

TEST_CASE("Ensemble mean converges to expected load", "[monte_carlo][statistical]") {
    LoadModel model = make_model(0.3);
    MonthEnsemble ensemble = run_month_ensemble(model, 0, 5000, 2024);

    for (size_t h : {0u, 12u, 20u}) {
        double mean = calculate_mean(ensemble.hour_values(h));
        // 5000 trials keep the standard error well under 1% of the mean
        REQUIRE_THAT(mean, WithinRel(model.expected_load_kw(h, 0), 0.03));
    }
}

TEST_CASE("Ensemble rejects zero trials", "[monte_carlo]") {
    LoadModel model = make_model(0.5);
    REQUIRE_THROWS_AS(run_month_ensemble(model, 0, 0, 42), std::invalid_argument);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <set>
#include "sampler.hpp"
#include "load_model.hpp"

using namespace loadsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

namespace {

LoadModel make_single_device_model(int64_t owned, double power_w, double p, bool available = true) {
    DeviceCatalog catalog;
    catalog.add(Device("Light", power_w, owned, available, "Domestic"));
    ProfileSet profiles;
    profiles.add("Light", UtilizationProfile::constant(p));
    return LoadModel(std::move(catalog), profiles);
}

} // anonymous namespace

// ============================================================================
// Active unit sampling
// ============================================================================

TEST_CASE("Active units stay within [0, owned_count]", "[sampler]") {
    RandomEngine rng(123);
    for (int i = 0; i < 2000; ++i) {
        int64_t active = sample_active_units(25, 0.37, rng);
        REQUIRE(active >= 0);
        REQUIRE(active <= 25);
    }
}

TEST_CASE("Active units at probability extremes", "[sampler][boundary]") {
    RandomEngine rng(7);

    SECTION("p = 0 gives no active units") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(sample_active_units(50, 0.0, rng) == 0);
        }
    }

    SECTION("p = 1 gives all units") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(sample_active_units(50, 1.0, rng) == 50);
        }
    }

    SECTION("No owned units") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(sample_active_units(0, 0.6, rng) == 0);
        }
    }
}

TEST_CASE("Active unit mean converges to n * p", "[sampler][statistical]") {
    RandomEngine rng(2024);
    const int draws = 20000;
    double total = 0.0;
    for (int i = 0; i < draws; ++i) {
        total += static_cast<double>(sample_active_units(40, 0.3, rng));
    }
    // n*p = 12, sd of the mean = sqrt(40*0.3*0.7/20000) ~ 0.02
    REQUIRE_THAT(total / draws, WithinAbs(12.0, 0.1));
}

TEST_CASE("Active unit sampling rejects bad inputs", "[sampler]") {
    RandomEngine rng(1);
    REQUIRE_THROWS_AS(sample_active_units(-1, 0.5, rng), std::invalid_argument);
    REQUIRE_THROWS_AS(sample_active_units(5, -0.1, rng), std::invalid_argument);
    REQUIRE_THROWS_AS(sample_active_units(5, 1.1, rng), std::invalid_argument);
    REQUIRE_THROWS_AS(sample_active_units(5, std::nan(""), rng), std::invalid_argument);
}

TEST_CASE("Device load in kW", "[sampler]") {
    RandomEngine rng(5);

    Device light("Light", 100.0, 10);
    REQUIRE_THAT(sample_device_load_kw(light, 1.0, rng), WithinRel(1.0, 1e-12));

    Device off("Radio", 100.0, 10, false);
    REQUIRE(sample_device_load_kw(off, 1.0, rng) == 0.0);

    Device none("Fan", 100.0, 0);
    REQUIRE(sample_device_load_kw(none, 1.0, rng) == 0.0);
}

TEST_CASE("Unit conversion factor", "[sampler]") {
    REQUIRE(WATTS_TO_KILOWATTS == 0.001);
    REQUIRE(HOURS_PER_DAY == 24);
    REQUIRE(MONTHS_PER_YEAR == 12);
}

// ============================================================================
// Stream seeding
// ============================================================================

TEST_CASE("Stream seeds are deterministic", "[sampler][seed]") {
    REQUIRE(derive_stream_seed(42, 3, 17, 2) == derive_stream_seed(42, 3, 17, 2));
}

TEST_CASE("Stream seeds differ across coordinates", "[sampler][seed]") {
    std::set<uint64_t> seeds;
    for (size_t month = 0; month < 12; ++month) {
        for (size_t trial = 0; trial < 20; ++trial) {
            for (size_t device = 0; device < 5; ++device) {
                seeds.insert(derive_stream_seed(42, month, trial, device));
            }
        }
    }
    REQUIRE(seeds.size() == 12 * 20 * 5);

    REQUIRE(derive_stream_seed(42, 0, 0, 0) != derive_stream_seed(43, 0, 0, 0));
    // Swapped coordinates must not collide
    REQUIRE(derive_stream_seed(42, 1, 2, 0) != derive_stream_seed(42, 2, 1, 0));
}

TEST_CASE("Device day sampling", "[sampler]") {
    SECTION("Certain use gives full load every hour") {
        LoadModel model = make_single_device_model(10, 100.0, 1.0);
        DeviceDayLoad day = sample_device_day(model, 0, 0, 0, 42);
        for (double load : day) {
            REQUIRE_THAT(load, WithinRel(1.0, 1e-12));
        }
    }

    SECTION("Unavailable device gives zero") {
        LoadModel model = make_single_device_model(10, 100.0, 1.0, false);
        DeviceDayLoad day = sample_device_day(model, 0, 5, 3, 42);
        for (double load : day) {
            REQUIRE(load == 0.0);
        }
    }

    SECTION("Same coordinates reproduce the same day") {
        LoadModel model = make_single_device_model(30, 60.0, 0.4);
        REQUIRE(sample_device_day(model, 0, 2, 9, 42) == sample_device_day(model, 0, 2, 9, 42));
    }

    SECTION("Loads are whole multiples of unit power") {
        LoadModel model = make_single_device_model(30, 60.0, 0.4);
        DeviceDayLoad day = sample_device_day(model, 0, 7, 1, 99);
        for (double load : day) {
            double units = load / 0.06;
            REQUIRE_THAT(units, WithinAbs(std::round(units), 1e-9));
            REQUIRE(units <= 30.0 + 1e-9);
        }
    }
}

TEST_CASE("Month names", "[sampler]") {
    REQUIRE(month_name(0) == "Jan");
    REQUIRE(month_name(5) == "Jun");
    REQUIRE(month_name(11) == "Dec");
    REQUIRE_THROWS_AS(month_name(12), std::out_of_range);
}

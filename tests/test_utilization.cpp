#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "utilization.hpp"
#include "errors.hpp"

using namespace loadsim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

namespace fs = std::filesystem;

namespace {

// 24 rows x 12 columns, cell = (hour * 12 + month) / 1000
std::string make_profile_csv() {
    std::ostringstream ss;
    for (size_t h = 0; h < 24; ++h) {
        for (size_t m = 0; m < 12; ++m) {
            if (m > 0) ss << ",";
            ss << static_cast<double>(h * 12 + m) / 1000.0;
        }
        ss << "\n";
    }
    return ss.str();
}

std::string constant_profile_csv(const std::string& value, size_t rows = 24, size_t cols = 12) {
    std::ostringstream ss;
    for (size_t h = 0; h < rows; ++h) {
        for (size_t m = 0; m < cols; ++m) {
            if (m > 0) ss << ",";
            ss << value;
        }
        ss << "\n";
    }
    return ss.str();
}

// Scratch directory removed at scope exit
struct TempDir {
    fs::path path;
    explicit TempDir(const std::string& name)
        : path(fs::temp_directory_path() / name) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    void write(const std::string& file, const std::string& content) const {
        std::ofstream out(path / file);
        out << content;
    }
};

} // anonymous namespace

// ============================================================================
// UtilizationProfile Tests
// ============================================================================

TEST_CASE("UtilizationProfile defaults to zero", "[utilization]") {
    UtilizationProfile profile;
    REQUIRE(profile.get_probability(0, 0) == 0.0);
    REQUIRE(profile.get_probability(23, 11) == 0.0);
}

TEST_CASE("UtilizationProfile set and get", "[utilization]") {
    UtilizationProfile profile;
    profile.set_probability(0, 0, 1.0);
    profile.set_probability(18, 6, 0.35);

    REQUIRE(profile.get_probability(0, 0) == 1.0);
    REQUIRE_THAT(profile.get_probability(18, 6), WithinRel(0.35, 1e-12));
    REQUIRE(profile.get_probability(18, 7) == 0.0);
}

TEST_CASE("UtilizationProfile bounds", "[utilization][boundary]") {
    UtilizationProfile profile;

    REQUIRE_THROWS_AS(profile.set_probability(24, 0, 0.5), std::out_of_range);
    REQUIRE_THROWS_AS(profile.set_probability(0, 12, 0.5), std::out_of_range);
    REQUIRE_THROWS_AS(profile.get_probability(24, 0), std::out_of_range);
    REQUIRE_THROWS_AS(profile.get_probability(0, 12), std::out_of_range);

    REQUIRE_THROWS_AS(profile.set_probability(0, 0, -0.01), DataError);
    REQUIRE_THROWS_AS(profile.set_probability(0, 0, 1.01), DataError);
    REQUIRE_NOTHROW(profile.set_probability(0, 0, 0.0));
    REQUIRE_NOTHROW(profile.set_probability(0, 0, 1.0));
}

TEST_CASE("UtilizationProfile constant", "[utilization]") {
    UtilizationProfile profile = UtilizationProfile::constant(0.25);
    for (size_t h = 0; h < 24; ++h) {
        for (size_t m = 0; m < 12; ++m) {
            REQUIRE(profile.get_probability(h, m) == 0.25);
        }
    }
    REQUIRE_THROWS_AS(UtilizationProfile::constant(2.0), DataError);
}

TEST_CASE("UtilizationProfile loads 24 x 12 CSV", "[utilization][csv]") {
    std::istringstream ss(make_profile_csv());
    UtilizationProfile profile = UtilizationProfile::load_from_csv(ss, "Light_times.csv");

    REQUIRE(profile.get_probability(0, 0) == 0.0);
    REQUIRE_THAT(profile.get_probability(0, 11), WithinRel(0.011, 1e-12));
    REQUIRE_THAT(profile.get_probability(23, 0), WithinRel(0.276, 1e-12));
    REQUIRE_THAT(profile.get_probability(23, 11), WithinRel(0.287, 1e-12));
}

TEST_CASE("UtilizationProfile CSV errors", "[utilization][csv]") {
    SECTION("Too few rows") {
        std::istringstream ss(constant_profile_csv("0.5", 23));
        REQUIRE_THROWS_WITH(UtilizationProfile::load_from_csv(ss, "p.csv"),
                            ContainsSubstring("24 hour rows"));
    }

    SECTION("Too many rows") {
        std::istringstream ss(constant_profile_csv("0.5", 25));
        REQUIRE_THROWS_AS(UtilizationProfile::load_from_csv(ss), DataError);
    }

    SECTION("Wrong column count") {
        std::istringstream ss(constant_profile_csv("0.5", 24, 11));
        REQUIRE_THROWS_WITH(UtilizationProfile::load_from_csv(ss, "p.csv"),
                            ContainsSubstring("12 month columns"));
    }

    SECTION("Probability above one is rejected, not clamped") {
        std::istringstream ss(constant_profile_csv("1.5"));
        REQUIRE_THROWS_AS(UtilizationProfile::load_from_csv(ss), DataError);
    }

    SECTION("Negative probability") {
        std::istringstream ss(constant_profile_csv("-0.1"));
        REQUIRE_THROWS_AS(UtilizationProfile::load_from_csv(ss), DataError);
    }

    SECTION("Non-numeric cell") {
        std::istringstream ss(constant_profile_csv("often"));
        REQUIRE_THROWS_AS(UtilizationProfile::load_from_csv(ss), DataError);
    }
}

// ============================================================================
// ProfileSet Tests
// ============================================================================

TEST_CASE("ProfileSet add and get", "[profile_set]") {
    ProfileSet set;
    REQUIRE(set.empty());

    set.add("Light", UtilizationProfile::constant(0.5));
    set.add("Fridge", UtilizationProfile::constant(0.9));

    REQUIRE(set.size() == 2);
    REQUIRE(set.contains("Light"));
    REQUIRE_FALSE(set.contains("TV"));
    REQUIRE(set.get("Fridge").get_probability(3, 3) == 0.9);
    REQUIRE_THROWS_AS(set.get("TV"), DataError);
}

TEST_CASE("ProfileSet file naming", "[profile_set]") {
    REQUIRE(ProfileSet::profile_filename("Light") == "Light_times.csv");
    REQUIRE(ProfileSet::profile_filename("Phone charger") == "Phone charger_times.csv");
}

TEST_CASE("ProfileSet loads a directory", "[profile_set][csv]") {
    TempDir dir("loadsim_test_profiles");
    dir.write("Light_times.csv", constant_profile_csv("0.5"));
    dir.write("Fridge_times.csv", constant_profile_csv("0.9"));
    dir.write("Kettle_times.csv", constant_profile_csv("0.1"));
    dir.write("notes.txt", "not a profile");

    SECTION("Requested devices only") {
        ProfileSet set = ProfileSet::load_from_directory(dir.path.string(), {"Light", "Fridge"});
        REQUIRE(set.size() == 2);
        REQUIRE(set.get("Light").get_probability(12, 5) == 0.5);
        REQUIRE_FALSE(set.contains("Kettle"));
    }

    SECTION("Missing profile names the device") {
        REQUIRE_THROWS_WITH(
            ProfileSet::load_from_directory(dir.path.string(), {"Light", "TV"}),
            ContainsSubstring("'TV'"));
    }

    SECTION("Directory listing") {
        auto ids = ProfileSet::list_directory(dir.path.string());
        REQUIRE(ids == std::vector<std::string>{"Fridge", "Kettle", "Light"});
    }

    SECTION("Missing directory") {
        REQUIRE_THROWS_AS(
            ProfileSet::load_from_directory((dir.path / "absent").string(), {"Light"}),
            DataError);
    }
}

/*
===============================================================================
TEST DATA_STORE — Tests for data_store.h and config.h
===============================================================================

OVERVIEW
--------
Validates the `Value` / `DataStore` holder and the study parameter structs
that read from it: defaults, overrides by plain number or Quantity, reserve
policy selection and validation errors.

TEST ORGANIZATION
-----------------
• Section A: Value type safety
• Section B: Value access patterns
• Section C: Parameter defaults and validation
• Section D: Parameters from a DataStore

TEST STRATEGY
-------------
• Verify thrown exceptions with REQUIRE_THROWS_AS
• Every invalid field must produce a ConfigurationError
• Plain numbers are read in the field's default unit

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• data_store.h, config.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <evtol_gp/config.h>
#include <evtol_gp/data_store.h>

#include <any>
#include <string>
#include <vector>

using namespace evtol;
using Catch::Approx;

// ============================================================================
// SECTION A: VALUE TYPE SAFETY
// ============================================================================

/**
 * @test ValueAccess::ThrowsOnTypeMismatch
 * @brief Verifies that accessing stored values with incorrect types throws
 *
 * @scenario A Value stores an int, then attempts to access it as double
 * @given A DataStore with an integer value under key "N"
 * @when Accessing the value with get<double>()
 * @then std::bad_any_cast is thrown
 *
 * @covers Value::get<T>()
 * @covers Value::is<T>()
 */
TEST_CASE("A1: ValueAccess::ThrowsOnTypeMismatch", "[data_store][value][exception]")
{
    DataStore data;
    data["N"] = 12;

    REQUIRE(data["N"].is<int>());
    REQUIRE_FALSE(data["N"].is<double>());
    REQUIRE_THROWS_AS(data["N"].get<double>(), std::bad_any_cast);
    REQUIRE(data["N"].get<int>() == 12);
}

/**
 * @test ValueLifecycle::OverwriteAndReset
 * @brief Verifies assignment replaces the stored type and reset() empties it
 *
 * @covers Value::operator=()
 * @covers Value::reset()
 * @covers Value::has_value()
 */
TEST_CASE("A2: ValueLifecycle::OverwriteAndReset", "[data_store][value][lifecycle]")
{
    Value v = 0.3444;
    REQUIRE(v.is<double>());

    v = std::string("Uber");
    REQUIRE(v.is<std::string>());
    REQUIRE(v.get<std::string>() == "Uber");

    Value copy = v;
    REQUIRE(copy.is<std::string>());

    v.reset();
    REQUIRE_FALSE(v.has_value());
    REQUIRE(copy.has_value());
}

// ============================================================================
// SECTION B: VALUE ACCESS PATTERNS
// ============================================================================

/**
 * @test OptionalAccess::TryGetAndGetOr
 * @brief Verifies the non-throwing accessors
 *
 * @covers Value::try_get<T>()
 * @covers Value::get_or<T>()
 */
TEST_CASE("B1: OptionalAccess::TryGetAndGetOr", "[data_store][value][optional]")
{
    Value q = Quantity(400.0, "Wh/kg");

    auto hit = q.try_get<Quantity>();
    REQUIRE(hit.has_value());
    REQUIRE(hit->get().in("Wh/kg") == Approx(400.0));
    REQUIRE_FALSE(q.try_get<double>().has_value());

    REQUIRE(q.get_or<int>(1) == 1);
    REQUIRE(Value(2).get_or<int>(1) == 2);
}

/**
 * @test DataStoreIntegration::MapBehavior
 * @brief Verifies DataStore keys are case-sensitive and hold mixed types
 *
 * @covers DataStore
 */
TEST_CASE("B2: DataStoreIntegration::MapBehavior", "[data_store][integration]")
{
    DataStore store;
    store["C_m"] = Quantity(300.0, "Wh/kg");
    store["N"] = 8.0;
    store["labels"] = std::vector<std::string>{ "Takeoff", "Cruise" };

    REQUIRE(store.size() == 3);
    REQUIRE(store.find("c_m") == store.end());
    REQUIRE(store.at("labels").get<std::vector<std::string>>().size() == 2);
}

// ============================================================================
// SECTION C: PARAMETER DEFAULTS AND VALIDATION
// ============================================================================

/**
 * @test Parameters::DefaultsValidate
 * @brief Verifies the default study is valid and matches the reference case
 *
 * @covers StudyParameters::validate()
 */
TEST_CASE("C1: Parameters::DefaultsValidate", "[config][defaults]")
{
    StudyParameters p;

    REQUIRE_NOTHROW(p.validate());
    REQUIRE(p.vehicle.N == Approx(12.0));
    REQUIRE(p.vehicle.weight_fraction == Approx(0.3444));
    REQUIRE(p.sizing.reserve == ReservePolicy::FixedDuration);
    REQUIRE(p.sizing.mission_range.in("nautical_mile") == Approx(200.0));
    REQUIRE(p.typical.mission_range.in("nautical_mile") == Approx(100.0));
    REQUIRE(p.hover_disk_loading.has_value());
    REQUIRE(p.hover_disk_loading->in("lbf/ft^2") == Approx(16.3));
}

/**
 * @test Parameters::InvalidFields
 * @brief Verifies each class of invalid field raises ConfigurationError
 *
 * @covers VehicleParameters::validate()
 * @covers MissionParameters::validate()
 * @covers CostParameters::validate()
 * @covers StudyParameters::validate()
 */
TEST_CASE("C2: Parameters::InvalidFields", "[config][validate][exception]")
{
    SECTION("Fewer than one rotor")
    {
        VehicleParameters v;
        v.N = 0.5;
        REQUIRE_THROWS_AS(v.validate(), ConfigurationError);
    }

    SECTION("Efficiency above one")
    {
        VehicleParameters v;
        v.eta_cruise = 1.2;
        REQUIRE_THROWS_AS(v.validate(), ConfigurationError);
    }

    SECTION("Structural fraction of one")
    {
        VehicleParameters v;
        v.weight_fraction = 1.0;
        REQUIRE_THROWS_AS(v.validate(), ConfigurationError);
    }

    SECTION("Energy density in the wrong unit")
    {
        VehicleParameters v;
        v.C_m = Quantity(400.0, "W/kg");
        REQUIRE_THROWS_AS(v.validate(), ConfigurationError);
    }

    SECTION("Negative range")
    {
        MissionParameters m;
        m.mission_range = Quantity(-10.0, "nautical_mile");
        REQUIRE_THROWS_AS(m.validate(), ConfigurationError);
    }

    SECTION("Invalid reserve enumerator")
    {
        MissionParameters m;
        m.reserve = ReservePolicy::COUNT;
        REQUIRE_THROWS_AS(m.validate(), ConfigurationError);
    }

    SECTION("Unbound cost rate")
    {
        CostParameters c;
        c.pilot_salary = Quantity::unbound(Unit::parse("hr**-1"));
        REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    }

    SECTION("Disk loading as a pressure of the wrong kind")
    {
        StudyParameters s;
        s.hover_disk_loading = Quantity(16.3, "lbf");
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
}

// ============================================================================
// SECTION D: PARAMETERS FROM A DATASTORE
// ============================================================================

/**
 * @test FromStore::OverridesAndPrefixes
 * @brief Verifies keys override defaults under their prefixes
 *
 * @scenario A driver supplying a handful of overrides
 * @given N = 8, C_m = 300 Wh/kg, sizing.reserve = "Uber", typical.mission_range = 50
 * @when Reading StudyParameters::fromStore
 * @then Those fields change; plain numbers take the default unit; the rest keep defaults
 *
 * @covers StudyParameters::fromStore()
 */
TEST_CASE("D1: FromStore::OverridesAndPrefixes", "[config][store]")
{
    DataStore in;
    in["N"] = 8.0;
    in["C_m"] = Quantity(300.0, "Wh/kg");
    in["sizing.reserve"] = std::string("Uber");
    in["typical.mission_range"] = 50;
    in["typical.pilot_salary"] = Quantity(1.0, "minute**-1");
    in["hover_disk_loading"] = 10.0;

    StudyParameters p = StudyParameters::fromStore(in);

    REQUIRE(p.vehicle.N == Approx(8.0));
    REQUIRE(p.vehicle.C_m.in("Wh/kg") == Approx(300.0));
    REQUIRE(p.vehicle.L_D == Approx(14.0));
    REQUIRE(p.sizing.reserve == ReservePolicy::FixedDistance);
    REQUIRE(p.typical.mission_range.in("nautical_mile") == Approx(50.0));
    REQUIRE(p.typical.costs.pilot_salary.in("hr**-1") == Approx(60.0));
    REQUIRE(p.hover_disk_loading->in("lbf/ft^2") == Approx(10.0));
}

/**
 * @test FromStore::RejectedEntries
 * @brief Verifies wrong types, wrong dimensions and bad policies are refused
 *
 * @covers VehicleParameters::fromStore()
 * @covers MissionParameters::fromStore()
 */
TEST_CASE("D2: FromStore::RejectedEntries", "[config][store][exception]")
{
    SECTION("Number stored as a string")
    {
        DataStore in;
        in["N"] = std::string("twelve");
        REQUIRE_THROWS_AS(VehicleParameters::fromStore(in), ConfigurationError);
    }

    SECTION("Quantity of the wrong dimension")
    {
        DataStore in;
        in["sizing.V_cruise"] = Quantity(200.0, "ft");
        REQUIRE_THROWS_AS(MissionParameters::fromStore(in), ConfigurationError);
    }

    SECTION("Unknown reserve policy")
    {
        DataStore in;
        in["sizing.reserve"] = std::string("EASA");
        REQUIRE_THROWS_AS(MissionParameters::fromStore(in), ConfigurationError);
    }

    SECTION("Override that fails validation")
    {
        DataStore in;
        in["usable_energy_fraction"] = 0.0;
        REQUIRE_THROWS_AS(VehicleParameters::fromStore(in), ConfigurationError);
    }
}

/*
===============================================================================
TEST MISSION — Tests for mission.h
===============================================================================

OVERVIEW
--------
Validates mission-level energy chaining, time accumulation, segment
extraction and the build-time reserve policy switch.

TEST ORGANIZATION
-----------------
• Section A: Segments, chain and accumulate
• Section B: Reserve policy names and parsing
• Section C: Reserve constraint per policy

TEST STRATEGY
-------------
• Build small segment models through NodeBuilder as missions do
• Inspect the produced constraint shape (sense, term count, label)
• Unknown policy spellings must raise ConfigurationError

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• mission.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <evtol_gp/mission.h>

#include <algorithm>
#include <array>
#include <format>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace evtol;
using Catch::Approx;

// ============================================================================
// TEST MODELS
// ============================================================================

namespace {

    struct Segment {
        static constexpr std::string_view type_name = "Segment";

        void setup(NodeBuilder& b) const {
            auto E = b.var("E", "kWh", "Segment energy");
            auto P = b.var("P", "kW", "Segment power");
            auto t = b.var("t", "s", "Segment time");
            b.var("segment_range", "nautical_mile", "Segment range");
            b.add(E == P * t);
        }
    };

    struct Flight {
        static constexpr std::string_view type_name = "Flight";
        ReservePolicy policy;

        void setup(NodeBuilder& b) const {
            auto C = b.var("C_{eff}", "kWh", "Usable energy");
            auto t_mission = b.var("t_{mission}", "minutes", "Mission time");

            const ModelNode& takeoff = b.child(Segment{}, "Takeoff");
            const ModelNode& cruise = b.child(Segment{}, "Cruise");
            const ModelNode& reserve = b.child(Segment{}, "Reserve");

            std::array<MissionSegment, 3> segments{
                MissionSegment::from(takeoff), MissionSegment::from(cruise), MissionSegment::from(reserve) };
            b.add(chain(C, segments), "energy");
            b.add(accumulate(t_mission, segmentTimes(segments)), "time");

            reserveConstraint(b, policy, reserve, Quantity(45.0, "minutes"), Quantity(2.0, "nautical_mile"));
        }
    };

    const Constraint* labelled(const ModelNode& node, std::string_view label) {
        std::string full = std::format("{}#{}", node.path().str(), label);
        for (const auto& c : node.constraints()) {
            if (c.label() == full) return &c;
        }
        return nullptr;
    }

} // namespace

// ============================================================================
// SECTION A: SEGMENTS, CHAIN AND ACCUMULATE
// ============================================================================

/**
 * @test Segments::FromBuiltNode
 * @brief Verifies MissionSegment::from picks the node's own E and t
 *
 * @covers MissionSegment::from()
 */
TEST_CASE("A1: Segments::FromBuiltNode", "[mission][segment]")
{
    ModelNode node = build(Segment{}, "Takeoff");

    MissionSegment s = MissionSegment::from(node);
    REQUIRE(s.name == "Takeoff");
    REQUIRE(s.energy.key() == node.topvar("E").key());
    REQUIRE(s.time.key() == node.topvar("t").key());
    REQUIRE(s.path == node.path());

    REQUIRE_THROWS_AS(MissionSegment::from(node, "E_{missing}"), UnresolvedVariableError);
}

/**
 * @test Chain::EnergyBudget
 * @brief Verifies chain() bounds the budget by the sum of segment energies
 *
 * @scenario Three-segment flight
 * @given Takeoff, Cruise and Reserve segments
 * @when Building the Flight model
 * @then An "energy" constraint C_eff >= E_0 + E_1 + E_2 exists
 *
 * @covers chain()
 */
TEST_CASE("A2: Chain::EnergyBudget", "[mission][chain]")
{
    ModelNode flight = build(Flight{ ReservePolicy::FixedDuration });

    const Constraint* energy = labelled(flight, "energy");
    REQUIRE(energy != nullptr);
    REQUIRE(energy->sense() == Sense::GreaterEqual);
    REQUIRE(energy->smallSide().size() == 3);
    REQUIRE(energy->largeSide().exponentOf(flight.topvar("C_{eff}").key()) == Approx(1.0));
}

/**
 * @test Accumulate::MissionTime
 * @brief Verifies accumulate() converts segment seconds into mission minutes
 *
 * @covers accumulate()
 * @covers segmentTimes()
 */
TEST_CASE("A3: Accumulate::MissionTime", "[mission][accumulate]")
{
    ModelNode flight = build(Flight{ ReservePolicy::FixedDuration });

    const Constraint* time = labelled(flight, "time");
    REQUIRE(time != nullptr);
    REQUIRE(time->smallSide().size() == 3);
    for (const auto& term : time->smallSide().terms()) {
        REQUIRE(term.coefficient() == Approx(1.0 / 60.0));
    }
}

/**
 * @test Chain::EmptyInputs
 * @brief Verifies empty segment lists are rejected
 *
 * @covers chain()
 * @covers accumulate()
 */
TEST_CASE("A4: Chain::EmptyInputs", "[mission][chain][exception]")
{
    Variable total = Variable::declare(ModelPath::parse("Mission"), "E", Unit::parse("kWh"), "Energy");

    REQUIRE_THROWS_AS(chain(total, std::vector<MissionSegment>{}), std::invalid_argument);
    REQUIRE_THROWS_AS(accumulate(total, std::vector<Variable>{}), std::invalid_argument);
}

namespace {

    /// Each chain term as "<coefficient> <variable>", for order-free comparison
    std::multiset<std::string> termSignature(const Constraint& c) {
        std::multiset<std::string> out;
        for (const auto& term : c.smallSide().terms()) {
            std::string key = std::format("{:.12g}", term.coefficient());
            for (const auto& [name, factor] : term.factors()) {
                key += std::format(" {}^{}", name.str(), factor.exponent);
            }
            out.insert(key);
        }
        return out;
    }

} // namespace

/**
 * @test Chain::OrderIndependent
 * @brief Verifies the energy budget is the same sum for any segment order
 *
 * @scenario Takeoff, cruise and reserve listed in every order
 * @given Three built segments and one budget Variable
 * @when Chaining each of the six permutations
 * @then Every constraint carries the same terms, each segment energy once
 *
 * @covers chain()
 */
TEST_CASE("A5: Chain::OrderIndependent", "[mission][chain]")
{
    ModelNode takeoff = build(Segment{}, "Takeoff");
    ModelNode cruise = build(Segment{}, "Cruise");
    ModelNode reserve = build(Segment{}, "Reserve");
    Variable C = Variable::declare(ModelPath::parse("Flight"), "C_{eff}", Unit::parse("kWh"), "Usable energy");

    std::vector<MissionSegment> segments{
        MissionSegment::from(cruise), MissionSegment::from(reserve), MissionSegment::from(takeoff) };
    auto byName = [](const MissionSegment& a, const MissionSegment& b) { return a.name < b.name; };
    std::sort(segments.begin(), segments.end(), byName);

    const std::multiset<std::string> reference = termSignature(chain(C, segments));
    REQUIRE(reference.size() == 3);

    int permutations = 0;
    do {
        Constraint c = chain(C, segments);
        REQUIRE(termSignature(c) == reference);
        REQUIRE(c.largeSide().exponentOf(C.key()) == Approx(1.0));
        for (const auto& s : segments) {
            REQUIRE(c.smallSide().terms().end() != std::find_if(
                c.smallSide().terms().begin(), c.smallSide().terms().end(),
                [&](const Monomial& m) { return m.exponentOf(s.energy.key()) == 1.0; }));
        }
        ++permutations;
    } while (std::next_permutation(segments.begin(), segments.end(), byName));

    REQUIRE(permutations == 6);
}

// ============================================================================
// SECTION B: RESERVE POLICY NAMES AND PARSING
// ============================================================================

/**
 * @test Reserve::ParseSpellings
 * @brief Verifies every accepted spelling maps to its policy
 *
 * @covers parseReservePolicy()
 * @covers reservePolicyName()
 */
TEST_CASE("B1: Reserve::ParseSpellings", "[mission][reserve]")
{
    for (std::string_view s : { "FAA", "duration", "fixed_duration", "FixedDuration" }) {
        REQUIRE(parseReservePolicy(s) == ReservePolicy::FixedDuration);
    }
    for (std::string_view s : { "Uber", "distance", "fixed_distance", "FixedDistance" }) {
        REQUIRE(parseReservePolicy(s) == ReservePolicy::FixedDistance);
    }

    REQUIRE(reservePolicyName(ReservePolicy::FixedDuration) == "FixedDuration");
    REQUIRE(reservePolicyName(ReservePolicy::FixedDistance) == "FixedDistance");
}

/**
 * @test Reserve::UnknownSpelling
 * @brief Verifies an unrecognized selector is a configuration error
 *
 * @covers parseReservePolicy()
 */
TEST_CASE("B2: Reserve::UnknownSpelling", "[mission][reserve][exception]")
{
    REQUIRE_THROWS_AS(parseReservePolicy("EASA"), ConfigurationError);
    REQUIRE_THROWS_AS(parseReservePolicy(""), ConfigurationError);
    REQUIRE_THROWS_AS(parseReservePolicy("faa"), ConfigurationError);
}

// ============================================================================
// SECTION C: RESERVE CONSTRAINT PER POLICY
// ============================================================================

/**
 * @test Reserve::FixedDuration
 * @brief Verifies the duration policy pins the reserve segment time
 *
 * @scenario FAA-style 45 minute reserve
 * @given Flight built with ReservePolicy::FixedDuration
 * @when Looking at its "reserve" constraint
 * @then t_{loiter} = 45 min is declared and tied to Reserve::t; no R_{divert}
 *
 * @covers reserveConstraint()
 */
TEST_CASE("C1: Reserve::FixedDuration", "[mission][reserve]")
{
    ModelNode flight = build(Flight{ ReservePolicy::FixedDuration });

    const Variable& t_loiter = flight.topvar("t_{loiter}");
    REQUIRE(*t_loiter.value() == Approx(45.0));
    REQUIRE_FALSE(flight.variables().contains("R_{divert}"));

    const Constraint* reserve = labelled(flight, "reserve");
    REQUIRE(reserve != nullptr);
    REQUIRE(reserve->sense() == Sense::Equal);
    REQUIRE(reserve->largeSide().exponentOf(flight.child("Reserve").topvar("t").key()) == Approx(1.0));
}

/**
 * @test Reserve::FixedDistance
 * @brief Verifies the distance policy pins the reserve segment range
 *
 * @covers reserveConstraint()
 */
TEST_CASE("C2: Reserve::FixedDistance", "[mission][reserve]")
{
    ModelNode flight = build(Flight{ ReservePolicy::FixedDistance });

    const Variable& R_divert = flight.topvar("R_{divert}");
    REQUIRE(*R_divert.value() == Approx(2.0));
    REQUIRE_FALSE(flight.variables().contains("t_{loiter}"));

    const Constraint* reserve = labelled(flight, "reserve");
    REQUIRE(reserve != nullptr);
    REQUIRE(reserve->largeSide().exponentOf(flight.child("Reserve").topvar("segment_range").key()) == Approx(1.0));
}

/**
 * @test Reserve::InvalidPolicyValue
 * @brief Verifies the COUNT sentinel is not a policy
 *
 * @covers reserveConstraint()
 */
TEST_CASE("C3: Reserve::InvalidPolicyValue", "[mission][reserve][exception]")
{
    REQUIRE_THROWS_AS(build(Flight{ ReservePolicy::COUNT }), ConfigurationError);
}

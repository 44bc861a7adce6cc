/*
===============================================================================
TEST DIAGNOSTICS — Tests for diagnostics.h and solution.h
===============================================================================

OVERVIEW
--------
Validates status names, problem statistics, the one-line summary and the
solution-quality check that re-evaluates every constraint with solved values.

TEST ORGANIZATION
-----------------
• Section A: Status strings
• Section B: Problem statistics and summary
• Section C: Solution access
• Section D: Solution quality

TEST STRATEGY
-------------
• Solutions are assembled by hand; no optimizer runs in this file
• Violations are compared against hand-computed ratios

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• Gurobi C++ API - Status codes
• diagnostics.h, solution.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <evtol_gp/diagnostics.h>
#include <evtol_gp/substitutions.h>

#include <string>

using namespace evtol;
using Catch::Approx;

// ============================================================================
// TEST SUPPORT
// ============================================================================

namespace {

    const ModelPath kOwner = ModelPath::parse("Battery");

    struct Fixture {
        Variable C = Variable::declare(kOwner, "C", Unit::parse("kWh"), "Capacity");
        Variable m = Variable::declare(kOwner, "m", Unit::parse("kg"), "Mass");
        Variable C_m = Variable::declare(kOwner, "C_m", Unit::parse("Wh/kg"), "Energy density", 400.0);
        Variable E1 = Variable::declare(kOwner, "E1", Unit::parse("kWh"), "First draw");
        Variable E2 = Variable::declare(kOwner, "E2", Unit::parse("kWh"), "Second draw");
        FlatSystem system;

        Fixture() {
            system.addConstraint((C == m * C_m).withLabel("Battery#capacity"));
            system.addConstraint((E1 + E2 <= C).withLabel("Battery#energy"));
        }

        Solution solution(double C_val, double m_val, double E1_val, double E2_val) const {
            Solution s;
            s.values.emplace(C.key(), Quantity(C_val, "kWh"));
            s.values.emplace(m.key(), Quantity(m_val, "kg"));
            s.values.emplace(E1.key(), Quantity(E1_val, "kWh"));
            s.values.emplace(E2.key(), Quantity(E2_val, "kWh"));
            s.constants.emplace(C_m.key(), Quantity(400.0, "Wh/kg"));
            s.objective = Quantity(C_val, "kWh");
            s.status = "OPTIMAL";
            return s;
        }
    };

} // namespace

// ============================================================================
// SECTION A: STATUS STRINGS
// ============================================================================

/**
 * @test StatusString::KnownAndUnknown
 * @brief Verifies Gurobi status codes map to names
 *
 * @covers statusString()
 */
TEST_CASE("A1: StatusString::KnownAndUnknown", "[diagnostics][status]")
{
    REQUIRE(statusString(GRB_OPTIMAL) == "OPTIMAL");
    REQUIRE(statusString(GRB_INFEASIBLE) == "INFEASIBLE");
    REQUIRE(statusString(GRB_INF_OR_UNBD) == "INF_OR_UNBD");
    REQUIRE(statusString(GRB_TIME_LIMIT) == "TIME_LIMIT");
    REQUIRE(statusString(GRB_NUMERIC) == "NUMERIC");
    REQUIRE(statusString(9999) == "UNKNOWN(9999)");
}

// ============================================================================
// SECTION B: PROBLEM STATISTICS AND SUMMARY
// ============================================================================

/**
 * @test Statistics::CountsByKind
 * @brief Verifies Variables and constraints are counted by kind
 *
 * @scenario Battery capacity and a two-draw energy budget
 * @given Four free Variables, one fixed; one equality, one posynomial inequality
 * @when Computing statistics, then substituting E2
 * @then Counts match and the substitution moves E2 out of the free set
 *
 * @covers computeStatistics()
 * @covers modelSummary()
 */
TEST_CASE("B1: Statistics::CountsByKind", "[diagnostics][statistics]")
{
    Fixture f;

    ProblemStatistics stats = computeStatistics(f.system);
    REQUIRE(stats.numVars == 5);
    REQUIRE(stats.numFree == 4);
    REQUIRE(stats.numFixed == 1);
    REQUIRE(stats.numSubstituted == 0);
    REQUIRE(stats.numConstraints == 2);
    REQUIRE(stats.numEqualities == 1);
    REQUIRE(stats.numInequalities == 1);
    REQUIRE(stats.numPosynomial == 1);
    REQUIRE(stats.numTerms == 5);

    REQUIRE(modelSummary(f.system) == "5 vars (4 free, 1 fixed), 2 constraints (1 posynomial)");

    SubstitutionTable table;
    table.set(f.E2, Quantity(10.0, "kWh"));
    FlatSystem pinned = applySubstitutions(f.system, table);
    REQUIRE(computeStatistics(pinned).numSubstituted == 1);
    REQUIRE(modelSummary(pinned) == "5 vars (3 free, 1 fixed, 1 substituted), 2 constraints (1 posynomial)");
}

/**
 * @test Statistics::EmptySystem
 * @brief Verifies an empty system yields zero counts
 *
 * @covers computeStatistics()
 */
TEST_CASE("B2: Statistics::EmptySystem", "[diagnostics][statistics]")
{
    FlatSystem empty;
    ProblemStatistics stats = computeStatistics(empty);

    REQUIRE(stats.numVars == 0);
    REQUIRE(stats.numConstraints == 0);
    REQUIRE(modelSummary(empty) == "0 vars (0 free, 0 fixed), 0 constraints");
}

// ============================================================================
// SECTION C: SOLUTION ACCESS
// ============================================================================

/**
 * @test Solution::ValuesAndConstants
 * @brief Verifies lookup over solved and pinned values
 *
 * @covers Solution::value()
 * @covers Solution::contains()
 * @covers Solution::sensitivity()
 * @covers isOptimal()
 */
TEST_CASE("C1: Solution::ValuesAndConstants", "[diagnostics][solution]")
{
    Fixture f;
    Solution s = f.solution(20.0, 50.0, 5.0, 10.0);
    s.sensitivities["Battery#energy"] = 1.0;

    REQUIRE(s.value(f.m).in("kg") == Approx(50.0));
    REQUIRE(s.value(f.C_m).in("Wh/kg") == Approx(400.0));
    REQUIRE(s.contains(f.C.key()));
    REQUIRE(s.sensitivity("Battery#energy") == Approx(1.0));
    REQUIRE(s.sensitivity("Battery#capacity") == 0.0);

    Variable other = Variable::declare(kOwner, "W", Unit::parse("lbf"), "Weight");
    REQUIRE_THROWS_AS(s.value(other), UnresolvedVariableError);

    SolveResult ok = s;
    SolveResult none = Infeasible{ "INFEASIBLE", { "Battery#energy" } };
    REQUIRE(isOptimal(ok));
    REQUIRE(isInfeasible(none));
}

// ============================================================================
// SECTION D: SOLUTION QUALITY
// ============================================================================

/**
 * @test SolutionQuality::ExactPoint
 * @brief Verifies a point satisfying every constraint has zero violation
 *
 * @covers computeSolutionQuality()
 */
TEST_CASE("D1: SolutionQuality::ExactPoint", "[diagnostics][quality]")
{
    Fixture f;
    SolutionQuality q = computeSolutionQuality(f.system, f.solution(20.0, 50.0, 5.0, 10.0));

    REQUIRE(q.maxRelativeViolation == Approx(0.0).margin(1e-12));
    REQUIRE(q.worstConstraint.empty());
}

/**
 * @test SolutionQuality::ReportsWorstConstraint
 * @brief Verifies violations are measured relative to the monomial side
 *
 * @scenario Draws exceed capacity by 10 percent; capacity relation off by 1 percent
 * @given C = 20, m = 50.5, E1 = 12, E2 = 10
 * @when Computing quality
 * @then The energy budget is worst at 0.1; the sum includes the capacity error
 *
 * @covers computeSolutionQuality()
 */
TEST_CASE("D2: SolutionQuality::ReportsWorstConstraint", "[diagnostics][quality]")
{
    Fixture f;
    SolutionQuality q = computeSolutionQuality(f.system, f.solution(20.0, 50.5, 12.0, 10.0));

    REQUIRE(q.worstConstraint == "Battery#energy");
    REQUIRE(q.maxRelativeViolation == Approx(0.1));
    REQUIRE(q.sumRelativeViolation == Approx(0.1 + (1.0 - 20.0 / 20.2)));
}

/**
 * @test SolutionQuality::MissingValue
 * @brief Verifies a Solution lacking a Variable of the system throws
 *
 * @covers computeSolutionQuality()
 */
TEST_CASE("D3: SolutionQuality::MissingValue", "[diagnostics][quality][exception]")
{
    Fixture f;
    Solution s = f.solution(20.0, 50.0, 5.0, 10.0);
    s.values.erase(f.E2.key());

    REQUIRE_THROWS_AS(computeSolutionQuality(f.system, s), UnresolvedVariableError);
}

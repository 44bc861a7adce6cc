/*
===============================================================================
TEST LOG SPACE — Tests for log_space.h
===============================================================================

OVERVIEW
--------
Validates the translation of a flattened geometric program into log-space
rows: folding of fixed and substituted values, zero handling, like-term
merging, constant-row verdicts and objective translation.

TEST ORGANIZATION
-----------------
• Section A: Folding and zero values
• Section B: Like terms and constant terms
• Section C: Constant rows
• Section D: Columns and objective

TEST STRATEGY
-------------
• Systems are assembled directly through FlatSystem::addConstraint
• Log coefficients are compared against hand-computed logarithms
• No optimizer is involved

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• log_space.h, substitutions.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <evtol_gp/log_space.h>
#include <evtol_gp/substitutions.h>

#include <algorithm>
#include <cmath>
#include <optional>

using namespace evtol;
using Catch::Approx;

// ============================================================================
// TEST SUPPORT
// ============================================================================

namespace {

    const ModelPath kOwner = ModelPath::parse("Check");

    Variable freeVar(const char* symbol) {
        return Variable::declare(kOwner, symbol, Unit::parse("-"), symbol);
    }

    Variable fixedVar(const char* symbol, double value) {
        return Variable::declare(kOwner, symbol, Unit::parse("-"), symbol, value);
    }

    std::size_t columnOf(const LogSpaceProblem& p, const Variable& v) {
        auto it = std::find_if(p.columns.begin(), p.columns.end(),
            [&](const Variable& c) { return c.key() == v.key(); });
        REQUIRE(it != p.columns.end());
        return static_cast<std::size_t>(it - p.columns.begin());
    }

} // namespace

// ============================================================================
// SECTION A: FOLDING AND ZERO VALUES
// ============================================================================

/**
 * @test Folding::FixedValuesIntoCoefficient
 * @brief Verifies fixed Variables are folded into log c and are not columns
 *
 * @scenario k <= x with k fixed at 4
 * @given One free and one fixed Variable
 * @when Translating
 * @then One column; one linear row with log c = log 4 and exponent -1 on x
 *
 * @covers toLogSpace()
 */
TEST_CASE("A1: Folding::FixedValuesIntoCoefficient", "[log_space][fold]")
{
    Variable x = freeVar("x");
    Variable k = fixedVar("k", 4.0);

    FlatSystem system;
    system.addConstraint(k <= x);
    LogSpaceProblem p = toLogSpace(system, minimize(x));

    REQUIRE(p.columns.size() == 1);
    REQUIRE(p.rows.size() == 1);
    REQUIRE(p.rows[0].sense == LogSense::LessEqual);
    REQUIRE(p.rows[0].isLinear());
    REQUIRE(p.rows[0].terms[0].logCoeff == Approx(std::log(4.0)));
    REQUIRE(p.rows[0].terms[0].exps.at(columnOf(p, x)) == Approx(-1.0));
    REQUIRE(p.isLinear());
}

/**
 * @test Folding::ZeroWithPositiveExponentVanishes
 * @brief Verifies a zero-valued factor removes its whole term
 *
 * @scenario Weightless component in a weight sum
 * @given a + z*b <= w with z fixed at 0
 * @when Translating
 * @then Only the a/w term remains and b is never used
 *
 * @covers toLogSpace()
 */
TEST_CASE("A2: Folding::ZeroWithPositiveExponentVanishes", "[log_space][fold][zero]")
{
    Variable a = freeVar("a");
    Variable b = freeVar("b");
    Variable w = freeVar("w");
    Variable z = fixedVar("z", 0.0);

    FlatSystem system;
    system.addConstraint(a + z * b <= w);
    LogSpaceProblem p = toLogSpace(system, minimize(w));

    REQUIRE(p.rows.size() == 1);
    REQUIRE(p.rows[0].terms.size() == 1);
    REQUIRE(p.rows[0].terms[0].exps.contains(columnOf(p, a)));
    REQUIRE(p.unused.size() == 1);
    REQUIRE(p.unused[0].key() == b.key());
}

/**
 * @test Folding::ZeroDivisorsRejected
 * @brief Verifies zero under a negative exponent and zero monomial sides throw
 *
 * @covers toLogSpace()
 */
TEST_CASE("A3: Folding::ZeroDivisorsRejected", "[log_space][fold][zero][exception]")
{
    Variable x = freeVar("x");
    Variable w = freeVar("w");
    Variable z = fixedVar("z", 0.0);

    SECTION("Negative exponent on zero")
    {
        FlatSystem system;
        system.addConstraint(x / z <= w);
        REQUIRE_THROWS_AS(toLogSpace(system, minimize(w)), GeometricFormError);
    }

    SECTION("Zero monomial side")
    {
        FlatSystem system;
        system.addConstraint(x <= z * w);
        REQUIRE_THROWS_AS(toLogSpace(system, minimize(x)), GeometricFormError);
    }

    SECTION("Zero side of an equality")
    {
        FlatSystem system;
        system.addConstraint(x == z * w);
        REQUIRE_THROWS_AS(toLogSpace(system, minimize(x)), GeometricFormError);
    }
}

// ============================================================================
// SECTION B: LIKE TERMS AND CONSTANT TERMS
// ============================================================================

/**
 * @test LikeTerms::MergeAfterFolding
 * @brief Verifies terms that become alike after folding are merged
 *
 * @scenario k1*x + k2*x <= w with k1 = 2, k2 = 3
 * @given Two terms distinct before folding
 * @when Translating
 * @then One term with coefficient 5
 *
 * @covers toLogSpace()
 */
TEST_CASE("B1: LikeTerms::MergeAfterFolding", "[log_space][merge]")
{
    Variable x = freeVar("x");
    Variable w = freeVar("w");
    Variable k1 = fixedVar("k1", 2.0);
    Variable k2 = fixedVar("k2", 3.0);

    FlatSystem system;
    system.addConstraint(k1 * x + k2 * x <= w);
    LogSpaceProblem p = toLogSpace(system, minimize(w));

    REQUIRE(p.rows.size() == 1);
    REQUIRE(p.rows[0].terms.size() == 1);
    REQUIRE(p.rows[0].terms[0].logCoeff == Approx(std::log(5.0)));
}

/**
 * @test Constants::MoveToRightHandSide
 * @brief Verifies constant terms of an inequality rescale the others
 *
 * @scenario x + c <= w with c = 0.5, w = 1
 * @given One variable term and one constant term
 * @when Translating
 * @then The row becomes x / (1 - 0.5) <= 1
 *
 * @covers toLogSpace()
 */
TEST_CASE("B2: Constants::MoveToRightHandSide", "[log_space][constant]")
{
    Variable x = freeVar("x");
    Variable c = fixedVar("c", 0.5);
    Variable w = fixedVar("w", 1.0);

    FlatSystem system;
    system.addConstraint(x + c <= w);
    LogSpaceProblem p = toLogSpace(system, maximize(x));

    REQUIRE(p.maximize);
    REQUIRE(p.rows.size() == 1);
    REQUIRE(p.rows[0].terms.size() == 1);
    REQUIRE(p.rows[0].terms[0].logCoeff == Approx(std::log(2.0)));
}

// ============================================================================
// SECTION C: CONSTANT ROWS
// ============================================================================

/**
 * @test ConstantRows::SatisfiedDroppedViolatedListed
 * @brief Verifies rows without columns are decided immediately
 *
 * @scenario Checks between fixed values only
 * @given a = 2, b = 3
 * @when Translating a <= b, b <= a and a == b
 * @then The first is dropped; the others are listed as violated
 *
 * @covers toLogSpace()
 * @covers LogSpaceProblem::violated
 */
TEST_CASE("C1: ConstantRows::SatisfiedDroppedViolatedListed", "[log_space][constant]")
{
    Variable x = freeVar("x");
    Variable a = fixedVar("a", 2.0);
    Variable b = fixedVar("b", 3.0);

    FlatSystem system;
    system.addConstraint((a <= b).withLabel("Check#ok"));
    system.addConstraint((b <= a).withLabel("Check#order"));
    system.addConstraint((a == b).withLabel("Check#equal"));
    system.addConstraint(a <= x);
    LogSpaceProblem p = toLogSpace(system, minimize(x));

    REQUIRE(p.dropped == 1);
    REQUIRE(p.violated.size() == 2);
    REQUIRE(p.violated[0] == "Check#order");
    REQUIRE(p.violated[1] == "Check#equal");
    REQUIRE(p.rows.size() == 1);
}

/**
 * @test ConstantRows::ConstantPartTooLarge
 * @brief Verifies a row whose constant terms already exceed 1 is violated
 *
 * @covers toLogSpace()
 */
TEST_CASE("C2: ConstantRows::ConstantPartTooLarge", "[log_space][constant]")
{
    Variable x = freeVar("x");
    Variable a = fixedVar("a", 3.0);
    Variable b = fixedVar("b", 2.0);

    FlatSystem system;
    system.addConstraint((x + a <= b).withLabel("Check#budget"));
    LogSpaceProblem p = toLogSpace(system, minimize(x));

    REQUIRE(p.rows.empty());
    REQUIRE(p.violated.size() == 1);
    REQUIRE(p.violated[0] == "Check#budget");
}

// ============================================================================
// SECTION D: COLUMNS AND OBJECTIVE
// ============================================================================

/**
 * @test Columns::SubstitutedVariablesFold
 * @brief Verifies substituted Variables are folded like fixed ones
 *
 * @covers toLogSpace()
 * @covers applySubstitutions()
 */
TEST_CASE("D1: Columns::SubstitutedVariablesFold", "[log_space][substitutions]")
{
    Variable x = freeVar("x");
    Variable s = freeVar("s");

    FlatSystem system;
    system.addConstraint(s <= x);
    REQUIRE(toLogSpace(system, minimize(x)).columns.size() == 2);

    SubstitutionTable table;
    table.set(s, Quantity(8.0, "-"));
    LogSpaceProblem p = toLogSpace(applySubstitutions(system, table), minimize(x));

    REQUIRE(p.columns.size() == 1);
    REQUIRE(p.rows[0].terms[0].logCoeff == Approx(std::log(8.0)));
}

/**
 * @test Objective::TermsAndErrors
 * @brief Verifies objective translation and its failure modes
 *
 * @covers toLogSpace()
 * @covers minimize()
 */
TEST_CASE("D2: Objective::TermsAndErrors", "[log_space][objective]")
{
    Variable x = freeVar("x");
    Variable y = freeVar("y");
    Variable k = fixedVar("k", 3.0);
    Variable z = fixedVar("z", 0.0);

    FlatSystem system;
    system.addConstraint(k <= x * y);

    LogSpaceProblem p = toLogSpace(system, minimize(x + k * y));
    REQUIRE(p.objective.size() == 2);
    REQUIRE_FALSE(p.maximize);
    REQUIRE(p.objective[1].logCoeff == Approx(std::log(3.0)));

    REQUIRE_THROWS_AS(toLogSpace(system, minimize(z * x)), GeometricFormError);
    REQUIRE_THROWS_AS(toLogSpace(system, minimize(freeVar("stranger"))), UnresolvedVariableError);
}

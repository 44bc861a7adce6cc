/*
===============================================================================
TEST VARIABLES — Tests for variables.h
===============================================================================

OVERVIEW
--------
Validates Variable declaration, identity by qualified name, fixed values and
the per-node VariableRegistry.

TEST ORGANIZATION
-----------------
• Section A: Variable declaration and accessors
• Section B: Fixed values and quantities
• Section C: VariableRegistry lookup and uniqueness

TEST STRATEGY
-------------
• Compare identities through key(); operator== on Variables builds a
  Constraint and is never used as a test predicate
• Check each declaration error with REQUIRE_THROWS_AS

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• variables.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <evtol_gp/variables.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace evtol;
using Catch::Approx;

// ============================================================================
// SECTION A: VARIABLE DECLARATION AND ACCESSORS
// ============================================================================

/**
 * @test Variable::DeclareFree
 * @brief Verifies a free Variable carries its owner, symbol, unit and description
 *
 * @scenario A decision Variable of the battery model
 * @given Owner "Aircraft/Battery", symbol "C", unit kWh
 * @when Declaring without a value
 * @then The Variable is free and named "<owner>::<symbol>"
 *
 * @covers Variable::declare()
 * @covers Variable::name()
 * @covers Variable::fixed()
 */
TEST_CASE("A1: Variable::DeclareFree", "[variables][declare]")
{
    Variable C = Variable::declare(ModelPath::parse("Aircraft/Battery"), "C", Unit::parse("kWh"), "Battery capacity");

    REQUIRE(C.symbol() == "C");
    REQUIRE(C.owner().str() == "Aircraft/Battery");
    REQUIRE(C.name() == "Aircraft/Battery::C");
    REQUIRE(C.unit() == Unit::parse("kWh"));
    REQUIRE(C.description() == "Battery capacity");
    REQUIRE_FALSE(C.fixed());
    REQUIRE_FALSE(C.value().has_value());
}

/**
 * @test Variable::IdentityByDefinition
 * @brief Verifies copies share a definition and same-name declarations do not
 *
 * @covers Variable::key()
 * @covers Variable::sameDefinition()
 */
TEST_CASE("A2: Variable::IdentityByDefinition", "[variables][identity]")
{
    ModelPath owner = ModelPath::parse("Mission/Hover");
    Variable t = Variable::declare(owner, "t", Unit::parse("s"), "Time");
    Variable copy = t;
    Variable other = Variable::declare(owner, "t", Unit::parse("s"), "Time");

    REQUIRE(copy.key() == t.key());
    REQUIRE(copy.sameDefinition(t));
    REQUIRE(other.key() == t.key());
    REQUIRE_FALSE(other.sameDefinition(t));
}

/**
 * @test Variable::RejectsBadDeclarations
 * @brief Verifies malformed symbols and invalid fixed values throw
 *
 * @covers Variable::declare()
 */
TEST_CASE("A3: Variable::RejectsBadDeclarations", "[variables][declare][exception]")
{
    ModelPath owner = ModelPath::parse("M");
    Unit u = Unit::parse("m");

    REQUIRE_THROWS_AS(Variable::declare(owner, "", u, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(Variable::declare(owner, "a::b", u, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(Variable::declare(owner, "x", u, "", -1.0), std::invalid_argument);
    REQUIRE_THROWS_AS(Variable::declare(owner, "x", u, "", std::numeric_limits<double>::infinity()),
        std::invalid_argument);
    REQUIRE_THROWS_AS(Variable::declare(owner, "x", u, "", std::nan("")), std::invalid_argument);
}

// ============================================================================
// SECTION B: FIXED VALUES AND QUANTITIES
// ============================================================================

/**
 * @test Variable::FixedValueAsQuantity
 * @brief Verifies fixed Variables expose their value as a Quantity
 *
 * @covers Variable::quantity()
 */
TEST_CASE("B1: Variable::FixedValueAsQuantity", "[variables][fixed]")
{
    ModelPath owner = ModelPath::parse("Aircraft/Battery");
    Variable C_m = Variable::declare(owner, "C_m", Unit::parse("Wh/kg"), "Energy density", 400.0);
    Variable m = Variable::declare(owner, "m", Unit::parse("kg"), "Mass");

    REQUIRE(C_m.fixed());
    REQUIRE(*C_m.value() == Approx(400.0));
    REQUIRE(C_m.quantity().in("J/kg") == Approx(400.0 * 3600.0));
    REQUIRE_FALSE(m.quantity().bound());
    REQUIRE(m.quantity().unit() == Unit::parse("kg"));
}

/**
 * @test Variable::ZeroIsAValidFixedValue
 * @brief Verifies zero is accepted (e.g. a weightless component)
 *
 * @covers Variable::declare()
 */
TEST_CASE("B2: Variable::ZeroIsAValidFixedValue", "[variables][fixed]")
{
    Variable W = Variable::declare(ModelPath::parse("Aircraft/Rotors"), "W", Unit::parse("lbf"), "Weight", 0.0);

    REQUIRE(W.fixed());
    REQUIRE(*W.value() == 0.0);
}

// ============================================================================
// SECTION C: VARIABLE REGISTRY
// ============================================================================

/**
 * @test Registry::DeclareAndLookup
 * @brief Verifies declaration order, lookup and owner stamping
 *
 * @scenario One node declaring three Variables
 * @given A registry owned by "Aircraft/Battery"
 * @when Declaring and looking up symbols
 * @then Variables are found by symbol and keep declaration order
 *
 * @covers VariableRegistry::declare()
 * @covers VariableRegistry::find()
 * @covers VariableRegistry::at()
 * @covers VariableRegistry::all()
 */
TEST_CASE("C1: Registry::DeclareAndLookup", "[variables][registry]")
{
    VariableRegistry reg(ModelPath::parse("Aircraft/Battery"));
    Variable C = reg.declare("C", Unit::parse("kWh"), "Capacity");
    reg.declare("C_m", Unit::parse("Wh/kg"), "Energy density", 400.0);
    reg.declare("m", Unit::parse("kg"), "Mass");

    REQUIRE(reg.size() == 3);
    REQUIRE(reg.contains("C_m"));
    REQUIRE(reg.at("C").key() == C.key());
    REQUIRE(reg.find("W") == nullptr);
    REQUIRE(reg.all()[2].symbol() == "m");
    REQUIRE(C.owner() == reg.owner());

    int count = 0;
    for (const auto& v : reg) {
        REQUIRE(v.owner() == reg.owner());
        ++count;
    }
    REQUIRE(count == 3);
}

/**
 * @test Registry::DuplicateAndMissingSymbols
 * @brief Verifies a repeated symbol and an unknown lookup both throw
 *
 * @covers VariableRegistry::declare()
 * @covers VariableRegistry::at()
 */
TEST_CASE("C2: Registry::DuplicateAndMissingSymbols", "[variables][registry][exception]")
{
    VariableRegistry reg(ModelPath::parse("Crew"));
    reg.declare("W", Unit::parse("lbf"), "Weight");

    REQUIRE_THROWS_AS(reg.declare("W", Unit::parse("lbf"), "Again"), DuplicateSymbolError);
    REQUIRE_THROWS_AS(reg.at("N"), UnresolvedVariableError);
    REQUIRE(reg.size() == 1);
}

#pragma once
/*
===============================================================================
CONSTRAINTS — Geometric-program constraints built with ==, <= and >=
===============================================================================

OVERVIEW
--------
A Constraint relates two expressions with one of three senses. Construction
checks, up front, that the relation can be written as a geometric program:

    Equal          monomial   == monomial
    LessEqual      posynomial <= monomial
    GreaterEqual   monomial   >= posynomial

and that both sides measure the same dimension. The right-hand side is
re-expressed in the left-hand side's unit so later stages never convert.

KEY COMPONENTS
--------------
• Sense              — Equal | LessEqual | GreaterEqual
• Constraint         — lhs, sense, rhs, label
• ConstraintList     — Ordered list of Constraints
• involvedVariables  — Distinct Variables a Constraint mentions
• operators          — ==, <=, >= over posynomial-like operands

USAGE EXAMPLES
--------------
    Constraint c1 = T == N * T_perRotor;
    Constraint c2 = ki * CPi + CPp <= CP;
    Constraint c3 = (W_noPassengers >= W_rotors + W_battery).withLabel("weight build-up");

    c2.str();   // "{.../RotorsAero::ki}*{.../RotorsAero::CPi} + {...::CPp} <= {...::CP}"

NOTES
-----
• Because operator== on Variables builds a Constraint, Variable identity is
  tested with `a.key() == b.key()`.
• Labels are assigned by the node that adds the constraint (see model.h);
  a Constraint built outside a node has an empty label until withLabel().

EXCEPTION SAFETY
----------------
• Incompatible units throw UnitMismatchError
• A relation not expressible in GP form throws GeometricFormError

===============================================================================
*/

#include <format>
#include <set>
#include <string>
#include <vector>

#include "errors.h"
#include "expressions.h"
#include "variables.h"

namespace evtol {

    /// @brief Relational sense of a Constraint
    enum class Sense { Equal, LessEqual, GreaterEqual };

    inline const char* senseString(Sense s) {
        switch (s) {
            case Sense::Equal:        return "==";
            case Sense::LessEqual:    return "<=";
            case Sense::GreaterEqual: return ">=";
        }
        return "?";
    }

    // ============================================================================
    // CONSTRAINT
    // ============================================================================

    /**
     * @class Constraint
     * @brief A validated GP relation between two expressions
     */
    class Constraint {
        Posynomial lhs_;
        Sense sense_;
        Posynomial rhs_;
        std::string label_;

        Constraint(Posynomial lhs, Sense sense, Posynomial rhs)
            : lhs_(std::move(lhs)), sense_(sense), rhs_(std::move(rhs)) {}

    public:
        /**
         * @brief Validate and build a Constraint
         *
         * @throws UnitMismatchError if the two sides measure different dimensions
         * @throws GeometricFormError if the relation is not GP-expressible
         */
        static Constraint make(const Posynomial& lhs, Sense sense, const Posynomial& rhs) {
            if (!lhs.unit().compatible(rhs.unit())) {
                throw UnitMismatchError(std::format(
                    "Constraint::make: '{}' [{}] {} '{}' [{}] mixes incompatible units",
                    lhs.str(), lhs.unit().symbol(), senseString(sense), rhs.str(), rhs.unit().symbol()));
            }
            bool ok = true;
            switch (sense) {
                case Sense::Equal:        ok = lhs.isMonomial() && rhs.isMonomial(); break;
                case Sense::LessEqual:    ok = rhs.isMonomial(); break;
                case Sense::GreaterEqual: ok = lhs.isMonomial(); break;
            }
            if (!ok) {
                throw GeometricFormError(std::format(
                    "Constraint::make: '{} {} {}' is not a geometric-program constraint",
                    lhs.str(), senseString(sense), rhs.str()));
            }
            return Constraint(lhs, sense, rhs.to(lhs.unit()));
        }

        [[nodiscard]] const Posynomial& lhs() const noexcept { return lhs_; }
        [[nodiscard]] const Posynomial& rhs() const noexcept { return rhs_; }
        [[nodiscard]] Sense sense() const noexcept { return sense_; }
        [[nodiscard]] const std::string& label() const noexcept { return label_; }

        /// @brief Copy carrying @p label
        [[nodiscard]] Constraint withLabel(std::string label) const {
            Constraint c = *this;
            c.label_ = std::move(label);
            return c;
        }

        /// @brief Posynomial side (the "small" side) in normalized `posy <= mono` form
        [[nodiscard]] const Posynomial& smallSide() const {
            return sense_ == Sense::GreaterEqual ? rhs_ : lhs_;
        }

        /// @brief Monomial side (the "large" side) in normalized `posy <= mono` form
        [[nodiscard]] const Monomial& largeSide() const {
            return (sense_ == Sense::GreaterEqual ? lhs_ : rhs_).asMonomial();
        }

        [[nodiscard]] std::string str() const {
            return std::format("{} {} {}", lhs_.str(), senseString(sense_), rhs_.str());
        }
    };

    using ConstraintList = std::vector<Constraint>;

    /**
     * @brief Distinct Variables mentioned by @p c, in order of first appearance
     */
    inline std::vector<Variable> involvedVariables(const Constraint& c) {
        std::vector<Variable> out;
        std::set<QualifiedName> seen;
        for (const Posynomial* side : { &c.lhs(), &c.rhs() }) {
            for (const auto& term : side->terms()) {
                for (const auto& [key, f] : term.factors()) {
                    if (seen.insert(key).second) out.push_back(f.var);
                }
            }
        }
        return out;
    }

    // ============================================================================
    // RELATIONAL OPERATORS
    // ============================================================================

    template<PosynomialLike A, PosynomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Constraint operator==(const A& a, const B& b) {
        return Constraint::make(expr_detail::toPosynomial(a), Sense::Equal, expr_detail::toPosynomial(b));
    }

    template<PosynomialLike A, PosynomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Constraint operator<=(const A& a, const B& b) {
        return Constraint::make(expr_detail::toPosynomial(a), Sense::LessEqual, expr_detail::toPosynomial(b));
    }

    template<PosynomialLike A, PosynomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Constraint operator>=(const A& a, const B& b) {
        return Constraint::make(expr_detail::toPosynomial(a), Sense::GreaterEqual, expr_detail::toPosynomial(b));
    }

} // namespace evtol

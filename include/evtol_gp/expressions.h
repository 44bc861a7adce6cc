#pragma once
/*
===============================================================================
EXPRESSIONS — Monomials and posynomials over Variables
===============================================================================

OVERVIEW
--------
Model constraints are written with ordinary operators on Variables,
Quantities and numbers. The results are the two expression forms a geometric
program admits:

    Monomial    c * x1^a1 * x2^a2 * ...         (c > 0, real exponents)
    Posynomial  sum of Monomials in one unit

Every expression carries a Unit. Multiplication, division and pow compose
units and never fail on dimension grounds; addition requires compatible units
and converts the right operand's coefficients into the left operand's unit.

KEY COMPONENTS
--------------
• Factor          — (Variable, exponent) pair
• Monomial        — Coefficient, factors keyed by QualifiedName, unit
• Posynomial      — Terms with like terms merged, unit
• MonomialLike    — Concept: Variable, Monomial, Quantity, arithmetic
• PosynomialLike  — Concept: MonomialLike or Posynomial
• Operators       — *, /, +, pow, sum (no subtraction: not GP-expressible)

OPERATOR DISPATCH
-----------------
Operators are constrained templates and at least one operand must be
symbolic (Variable, Monomial or Posynomial); arithmetic between two
Quantities stays in quantity.h. The result type follows the operands:

    MonomialLike   * MonomialLike    -> Monomial
    PosynomialLike * PosynomialLike  -> Posynomial   (if either is one)
    MonomialLike   / MonomialLike    -> Monomial
    Posynomial     / MonomialLike    -> Posynomial
    PosynomialLike + PosynomialLike  -> Posynomial

USAGE EXAMPLES
--------------
    Monomial  thrust = 0.5 * rho * pow(VT, 2) * A * CT;
    Posynomial power = ki * CPi + CPp;
    Posynomial weights = sum(std::vector<Variable>{W1, W2, W3});

EXCEPTION SAFETY
----------------
• A non-positive or non-finite coefficient throws GeometricFormError
• An unbound Quantity used as a coefficient throws DomainError
• + between incompatible units throws UnitMismatchError
• sum() of an empty range throws std::invalid_argument

===============================================================================
*/

#include <cmath>
#include <concepts>
#include <format>
#include <initializer_list>
#include <map>
#include <ranges>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "errors.h"
#include "naming.h"
#include "quantity.h"
#include "units.h"
#include "variables.h"

namespace evtol {

    inline constexpr double kExponentTolerance = 1e-12;

    /// @brief One Variable raised to a real power inside a Monomial
    struct Factor {
        Variable var;
        double exponent;
    };

    // ============================================================================
    // MONOMIAL
    // ============================================================================

    /**
     * @class Monomial
     * @brief c * prod(x_i ^ a_i), measured in unit()
     *
     * @details Factors are keyed by qualified name so repeated Variables
     *          combine their exponents; a factor whose exponent cancels to
     *          zero is removed.
     */
    class Monomial {
        double coeff_ = 1.0;
        std::map<QualifiedName, Factor> factors_;
        Unit unit_;

        static double checkedCoefficient(double c) {
            if (!(c > 0.0) || !std::isfinite(c)) {
                throw GeometricFormError(std::format(
                    "Monomial: coefficient {} must be positive and finite", c));
            }
            return c;
        }

        void multiplyFactor(const Variable& v, double e) {
            auto [it, inserted] = factors_.try_emplace(v.key(), Factor{v, e});
            if (!inserted) {
                it->second.exponent += e;
                if (std::abs(it->second.exponent) < kExponentTolerance) {
                    factors_.erase(it);
                }
            }
        }

    public:
        Monomial() = default;

        Monomial(double coeff, Unit unit = Unit{})
            : coeff_(checkedCoefficient(coeff)), unit_(std::move(unit)) {}

        Monomial(const Variable& v) : unit_(v.unit()) {
            factors_.emplace(v.key(), Factor{v, 1.0});
        }

        /// @throws DomainError if @p q is unbound
        Monomial(const Quantity& q) : coeff_(checkedCoefficient(q.value())), unit_(q.unit()) {}

        [[nodiscard]] double coefficient() const noexcept { return coeff_; }
        [[nodiscard]] const Unit& unit() const noexcept { return unit_; }
        [[nodiscard]] const std::map<QualifiedName, Factor>& factors() const noexcept { return factors_; }
        [[nodiscard]] bool isConstant() const noexcept { return factors_.empty(); }

        [[nodiscard]] double exponentOf(const QualifiedName& key) const {
            auto it = factors_.find(key);
            return it == factors_.end() ? 0.0 : it->second.exponent;
        }

        /// @brief True if both monomials have the same Variables with the same exponents
        [[nodiscard]] bool likeTerm(const Monomial& other) const {
            if (factors_.size() != other.factors_.size()) return false;
            auto a = factors_.begin();
            auto b = other.factors_.begin();
            for (; a != factors_.end(); ++a, ++b) {
                if (a->first != b->first) return false;
                if (std::abs(a->second.exponent - b->second.exponent) >= kExponentTolerance) return false;
            }
            return true;
        }

        /// @brief Copy with the coefficient multiplied by @p k
        [[nodiscard]] Monomial scaled(double k) const {
            Monomial m = *this;
            m.coeff_ = checkedCoefficient(coeff_ * k);
            return m;
        }

        /// @brief Same monomial re-expressed in @p target (coefficient rescaled)
        [[nodiscard]] Monomial to(const Unit& target) const {
            Monomial m = *this;
            m.coeff_ = checkedCoefficient(coeff_ * unit_.factorTo(target));
            m.unit_ = target;
            return m;
        }

        Monomial& operator*=(const Monomial& o) {
            coeff_ = checkedCoefficient(coeff_ * o.coeff_);
            for (const auto& [key, f] : o.factors_) {
                multiplyFactor(f.var, f.exponent);
            }
            unit_ = unit_ * o.unit_;
            return *this;
        }

        Monomial& operator/=(const Monomial& o) {
            coeff_ = checkedCoefficient(coeff_ / o.coeff_);
            for (const auto& [key, f] : o.factors_) {
                multiplyFactor(f.var, -f.exponent);
            }
            unit_ = unit_ / o.unit_;
            return *this;
        }

        [[nodiscard]] Monomial pow(double e) const {
            Monomial m(std::pow(coeff_, e), unit_.pow(e));
            if (std::abs(e) < kExponentTolerance) return m;
            for (const auto& [key, f] : factors_) {
                m.factors_.emplace(key, Factor{f.var, f.exponent * e});
            }
            return m;
        }

        /**
         * @brief Numeric value given a lookup of Variable magnitudes
         * @param valueOf Callable `double(const Variable&)` returning the value
         *                in the Variable's own unit
         */
        template<typename Lookup>
        [[nodiscard]] double evaluate(Lookup&& valueOf) const {
            double v = coeff_;
            for (const auto& [key, f] : factors_) {
                v *= std::pow(valueOf(f.var), f.exponent);
            }
            return v;
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            if (coeff_ != 1.0 || factors_.empty()) {
                out = std::format("{}", coeff_);
            }
            for (const auto& [key, f] : factors_) {
                if (!out.empty()) out += "*";
                out += "{" + key.str() + "}";
                if (f.exponent != 1.0) out += std::format("^{}", f.exponent);
            }
            return out;
        }
    };

    // ============================================================================
    // POSYNOMIAL
    // ============================================================================

    /**
     * @class Posynomial
     * @brief Sum of Monomials, all expressed in unit()
     */
    class Posynomial {
        std::vector<Monomial> terms_;
        Unit unit_;

    public:
        Posynomial(const Monomial& m) : terms_{m}, unit_(m.unit()) {}
        Posynomial(const Variable& v) : Posynomial(Monomial(v)) {}
        Posynomial(const Quantity& q) : Posynomial(Monomial(q)) {}
        Posynomial(double c) : Posynomial(Monomial(c)) {}

        [[nodiscard]] const std::vector<Monomial>& terms() const noexcept { return terms_; }
        [[nodiscard]] const Unit& unit() const noexcept { return unit_; }
        [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
        [[nodiscard]] bool isMonomial() const noexcept { return terms_.size() == 1; }

        /// @throws GeometricFormError if more than one term remains
        [[nodiscard]] const Monomial& asMonomial() const {
            if (!isMonomial()) {
                throw GeometricFormError(std::format(
                    "Posynomial::asMonomial: '{}' has {} terms", str(), terms_.size()));
            }
            return terms_.front();
        }

        /**
         * @brief Add a term, merging it into a like term when one exists
         * @throws UnitMismatchError if @p m is not compatible with unit()
         */
        Posynomial& add(const Monomial& m) {
            if (!m.unit().compatible(unit_)) {
                throw UnitMismatchError(std::format(
                    "Posynomial::add: cannot add '{}' [{}] to '{}' [{}]",
                    m.str(), m.unit().symbol(), str(), unit_.symbol()));
            }
            Monomial converted = m.to(unit_);
            for (auto& t : terms_) {
                if (t.likeTerm(converted)) {
                    t = t.scaled(1.0 + converted.coefficient() / t.coefficient());
                    return *this;
                }
            }
            terms_.push_back(std::move(converted));
            return *this;
        }

        Posynomial& operator+=(const Posynomial& o) {
            for (const auto& t : o.terms_) add(t);
            return *this;
        }

        Posynomial& operator*=(const Monomial& m) {
            for (auto& t : terms_) t *= m;
            unit_ = unit_ * m.unit();
            return *this;
        }

        Posynomial& operator/=(const Monomial& m) {
            for (auto& t : terms_) t /= m;
            unit_ = unit_ / m.unit();
            return *this;
        }

        /// @brief Same posynomial re-expressed in @p target
        [[nodiscard]] Posynomial to(const Unit& target) const {
            Posynomial p(terms_.front().to(target));
            for (std::size_t i = 1; i < terms_.size(); ++i) p.add(terms_[i]);
            return p;
        }

        template<typename Lookup>
        [[nodiscard]] double evaluate(Lookup&& valueOf) const {
            double v = 0.0;
            for (const auto& t : terms_) v += t.evaluate(valueOf);
            return v;
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            for (std::size_t i = 0; i < terms_.size(); ++i) {
                if (i > 0) out += " + ";
                out += terms_[i].str();
            }
            return out;
        }
    };

    // ============================================================================
    // OPERAND CONCEPTS
    // ============================================================================

    template<typename T>
    concept Symbolic = std::same_as<std::remove_cvref_t<T>, Variable> ||
                       std::same_as<std::remove_cvref_t<T>, Monomial> ||
                       std::same_as<std::remove_cvref_t<T>, Posynomial>;

    template<typename T>
    concept MonomialLike = std::same_as<std::remove_cvref_t<T>, Variable> ||
                           std::same_as<std::remove_cvref_t<T>, Monomial> ||
                           std::same_as<std::remove_cvref_t<T>, Quantity> ||
                           std::is_arithmetic_v<std::remove_cvref_t<T>>;

    template<typename T>
    concept PosynomialLike = MonomialLike<T> || std::same_as<std::remove_cvref_t<T>, Posynomial>;

    template<typename T>
    concept IsPosynomial = std::same_as<std::remove_cvref_t<T>, Posynomial>;

    namespace expr_detail {

        template<MonomialLike T>
        Monomial toMonomial(const T& x) {
            if constexpr (std::is_arithmetic_v<T>) {
                return Monomial(static_cast<double>(x));
            }
            else {
                return Monomial(x);
            }
        }

        template<PosynomialLike T>
        Posynomial toPosynomial(const T& x) {
            if constexpr (IsPosynomial<T>) {
                return x;
            }
            else {
                return Posynomial(toMonomial(x));
            }
        }

    } // namespace expr_detail

    // ============================================================================
    // OPERATORS
    // ============================================================================

    template<MonomialLike A, MonomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Monomial operator*(const A& a, const B& b) {
        Monomial m = expr_detail::toMonomial(a);
        m *= expr_detail::toMonomial(b);
        return m;
    }

    template<PosynomialLike A, PosynomialLike B>
        requires (IsPosynomial<A> || IsPosynomial<B>)
    Posynomial operator*(const A& a, const B& b) {
        Posynomial pa = expr_detail::toPosynomial(a);
        Posynomial pb = expr_detail::toPosynomial(b);
        Posynomial out = Posynomial(pa.terms().front() * pb.terms().front());
        bool first = true;
        for (const auto& ta : pa.terms()) {
            for (const auto& tb : pb.terms()) {
                if (first) { first = false; continue; }
                out.add(ta * tb);
            }
        }
        return out;
    }

    template<MonomialLike A, MonomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Monomial operator/(const A& a, const B& b) {
        Monomial m = expr_detail::toMonomial(a);
        m /= expr_detail::toMonomial(b);
        return m;
    }

    template<MonomialLike B>
    Posynomial operator/(const Posynomial& p, const B& b) {
        Posynomial out = p;
        out /= expr_detail::toMonomial(b);
        return out;
    }

    template<PosynomialLike A, PosynomialLike B>
        requires (Symbolic<A> || Symbolic<B>)
    Posynomial operator+(const A& a, const B& b) {
        Posynomial p = expr_detail::toPosynomial(a);
        p += expr_detail::toPosynomial(b);
        return p;
    }

    /// @brief x ^ e for a symbolic monomial-like operand
    template<MonomialLike T>
        requires Symbolic<T>
    Monomial pow(const T& x, double e) {
        return expr_detail::toMonomial(x).pow(e);
    }

    /**
     * @brief Sum of a range of posynomial-like values
     * @throws std::invalid_argument if the range is empty
     *
     * @example
     *     sum(std::vector<Variable>{E0, E1, E2});
     */
    template<std::ranges::input_range R>
        requires PosynomialLike<std::ranges::range_value_t<R>>
    Posynomial sum(const R& range) {
        auto it = std::ranges::begin(range);
        auto last = std::ranges::end(range);
        if (it == last) {
            throw std::invalid_argument("sum: empty range");
        }
        Posynomial out = expr_detail::toPosynomial(*it);
        for (++it; it != last; ++it) {
            out += expr_detail::toPosynomial(*it);
        }
        return out;
    }

    inline Posynomial sum(std::initializer_list<Posynomial> items) {
        return sum(std::vector<Posynomial>(items));
    }

} // namespace evtol

#pragma once
/*
===============================================================================
QUANTITY — Unit-bearing scalar, possibly unbound
===============================================================================

OVERVIEW
--------
A Quantity is a numeric value tagged with a Unit. It is the currency in which
fixed Variable values, substitutions, atmosphere results and solved values are
exchanged. A Quantity may also be "unbound" (unit known, value unknown), which
is how free decision Variables present themselves before a solve.

KEY COMPONENTS
--------------
• Quantity(value, unit)      — Bound quantity
• Quantity::unbound(unit)    — Value-less quantity
• to(unit) / in(unit)        — Conversion (Quantity / raw double)
• + and -                    — Require compatible units; result in lhs unit
• *, / and pow               — Compose units; never fail on dimension grounds

ARITHMETIC WITH UNBOUND OPERANDS
--------------------------------
Any arithmetic involving an unbound operand yields an unbound result whose
unit is computed normally. Reading value() of an unbound Quantity throws
DomainError.

EXCEPTION SAFETY
----------------
• Incompatible conversions and +/- throw UnitMismatchError
• value() on an unbound quantity throws DomainError
• Unknown unit strings throw std::invalid_argument (see units.h)

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "errors.h"
#include "units.h"

namespace evtol {

    /**
     * @class Quantity
     * @brief Immutable value + Unit pair
     *
     * @example
     *     Quantity range(200, "nautical_mile");
     *     range.in("km");                                 // 370.4
     *     Quantity(5, "kWh") + Quantity(3600, "kJ");      // 6 kWh
     *     (Quantity(16.3, "lbf/ft^2") * Quantity(2, "ft^2")).in("lbf");   // 32.6
     */
    class Quantity {
        std::optional<double> value_;
        Unit unit_;

        Quantity(std::optional<double> value, Unit unit)
            : value_(value), unit_(std::move(unit)) {}

    public:
        /// @brief Dimensionless 0
        Quantity() : value_(0.0) {}

        Quantity(double value, Unit unit) : value_(value), unit_(std::move(unit)) {}

        Quantity(double value, std::string_view unit) : value_(value), unit_(Unit::parse(unit)) {}

        /// @brief A quantity with a known unit and no value
        static Quantity unbound(Unit unit) {
            return Quantity(std::nullopt, std::move(unit));
        }

        [[nodiscard]] bool bound() const noexcept { return value_.has_value(); }
        [[nodiscard]] const Unit& unit() const noexcept { return unit_; }

        /// @throws DomainError if the quantity is unbound
        [[nodiscard]] double value() const {
            if (!value_) {
                throw DomainError(std::format("Quantity::value: quantity in '{}' is unbound", unit_.symbol()));
            }
            return *value_;
        }

        /**
         * @brief Same quantity expressed in @p target
         * @throws UnitMismatchError if the dimensions differ
         */
        [[nodiscard]] Quantity to(const Unit& target) const {
            double f = unit_.factorTo(target);
            if (!value_) return unbound(target);
            return Quantity(*value_ * f, target);
        }

        [[nodiscard]] Quantity to(std::string_view target) const {
            return to(Unit::parse(target));
        }

        /// @brief Raw magnitude in @p target
        [[nodiscard]] double in(const Unit& target) const {
            double f = unit_.factorTo(target);
            return value() * f;
        }

        [[nodiscard]] double in(std::string_view target) const {
            return in(Unit::parse(target));
        }

        // --------------------------------------------------------------------
        // Arithmetic
        // --------------------------------------------------------------------

        friend Quantity operator+(const Quantity& a, const Quantity& b) {
            if (!a.unit_.compatible(b.unit_)) {
                throw UnitMismatchError(std::format(
                    "Quantity::operator+: '{}' and '{}' are incompatible",
                    a.unit_.symbol(), b.unit_.symbol()));
            }
            if (!a.value_ || !b.value_) return unbound(a.unit_);
            return Quantity(*a.value_ + *b.value_ * b.unit_.factorTo(a.unit_), a.unit_);
        }

        friend Quantity operator-(const Quantity& a, const Quantity& b) {
            if (!a.unit_.compatible(b.unit_)) {
                throw UnitMismatchError(std::format(
                    "Quantity::operator-: '{}' and '{}' are incompatible",
                    a.unit_.symbol(), b.unit_.symbol()));
            }
            if (!a.value_ || !b.value_) return unbound(a.unit_);
            return Quantity(*a.value_ - *b.value_ * b.unit_.factorTo(a.unit_), a.unit_);
        }

        friend Quantity operator*(const Quantity& a, const Quantity& b) {
            Unit u = a.unit_ * b.unit_;
            if (!a.value_ || !b.value_) return unbound(u);
            return Quantity(*a.value_ * *b.value_, u);
        }

        friend Quantity operator/(const Quantity& a, const Quantity& b) {
            Unit u = a.unit_ / b.unit_;
            if (!a.value_ || !b.value_) return unbound(u);
            return Quantity(*a.value_ / *b.value_, u);
        }

        friend Quantity operator*(const Quantity& a, double k) {
            if (!a.value_) return a;
            return Quantity(*a.value_ * k, a.unit_);
        }

        friend Quantity operator*(double k, const Quantity& a) { return a * k; }

        friend Quantity operator/(const Quantity& a, double k) {
            if (!a.value_) return a;
            return Quantity(*a.value_ / k, a.unit_);
        }

        friend Quantity pow(const Quantity& a, double e) {
            Unit u = a.unit_.pow(e);
            if (!a.value_) return unbound(u);
            return Quantity(std::pow(*a.value_, e), u);
        }

        /// @brief True if both are bound, compatible and equal within @p rel_tol
        [[nodiscard]] bool approxEqual(const Quantity& other, double rel_tol = 1e-9) const {
            if (!value_ || !other.value_ || !unit_.compatible(other.unit_)) return false;
            double b = other.in(unit_);
            double scale = std::max(std::abs(*value_), std::abs(b));
            return std::abs(*value_ - b) <= rel_tol * std::max(scale, 1e-300);
        }

        [[nodiscard]] std::string str() const {
            if (!value_) return std::format("? {}", unit_.symbol());
            return std::format("{} {}", *value_, unit_.symbol());
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const Quantity& q) {
        return os << q.str();
    }

} // namespace evtol

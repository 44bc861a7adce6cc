#pragma once
/*
===============================================================================
UNITS — Dimensions, units and the unit-expression parser
===============================================================================

OVERVIEW
--------
Every Variable and Quantity in a model carries a physical unit. A Unit is a
scale factor to SI base units (kg, m, s) together with a Dimension, the vector
of mass/length/time exponents. Two units are compatible when their dimensions
agree; the factor between them is the ratio of their scales.

    Unit::parse("lbf/ft^2").factorTo(Unit::parse("Pa"));   // 47.88...

KEY COMPONENTS
--------------
• Dimension     — (M, L, T) exponents, real-valued, compared within 1e-10
• Unit          — SI scale, dimension and display symbol; *, / and pow
• UnitRegistry  — Singleton table of named units plus the expression parser

UNIT EXPRESSIONS
----------------
    expr   := term (('*' | '/') term)*
    term   := factor (('^' | '**') number)?
    factor := symbol | '(' expr ')' | '1'
    number := ['+' | '-'] digits ['.' digits] [('e' | 'E') ['+' | '-'] digits]
              | '(' number ')'

"-" and the empty string denote the dimensionless unit. Angles (rad, deg,
rev) are dimensionless with the matching scale; rpm is rev/min in s^-1.

EXCEPTION SAFETY
----------------
• Unknown symbols or malformed expressions throw std::invalid_argument
• Conversion between incompatible units throws UnitMismatchError
• All other operations are no-throw apart from allocation

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cctype>
#include <format>
#include <numbers>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "errors.h"

namespace evtol {

    // ============================================================================
    // DIMENSION
    // ============================================================================

    /**
     * @struct Dimension
     * @brief Exponents of mass, length and time
     *
     * @example
     *     Dimension force{1, 1, -2};                 // kg m s^-2
     *     (force / Dimension{0, 2, 0}).str();         // "M L^-1 T^-2"
     */
    struct Dimension {
        double M = 0.0;
        double L = 0.0;
        double T = 0.0;

        static constexpr double kTolerance = 1e-10;

        bool operator==(const Dimension& other) const {
            return std::abs(M - other.M) < kTolerance &&
                   std::abs(L - other.L) < kTolerance &&
                   std::abs(T - other.T) < kTolerance;
        }

        [[nodiscard]] bool dimensionless() const {
            return *this == Dimension{};
        }

        Dimension operator*(const Dimension& o) const { return {M + o.M, L + o.L, T + o.T}; }
        Dimension operator/(const Dimension& o) const { return {M - o.M, L - o.L, T - o.T}; }
        [[nodiscard]] Dimension pow(double e) const { return {M * e, L * e, T * e}; }

        [[nodiscard]] std::string str() const {
            if (dimensionless()) return "1";
            std::string out;
            auto put = [&out](const char* base, double e) {
                if (std::abs(e) < kTolerance) return;
                if (!out.empty()) out += ' ';
                out += base;
                if (std::abs(e - 1.0) >= kTolerance) out += std::format("^{}", e);
            };
            put("M", M);
            put("L", L);
            put("T", T);
            return out;
        }
    };

    // ============================================================================
    // UNIT
    // ============================================================================

    /**
     * @class Unit
     * @brief Physical unit: SI scale factor, dimension and display symbol
     *
     * @details Units are plain values. Composite units built with *, / and pow
     *          keep a readable symbol ("kW*hr", "lbf/(ft^2)") and the exact
     *          combined scale, so conversion never depends on the symbol text.
     *
     * @example
     *     Unit kWh = Unit::parse("kWh");
     *     Unit J   = Unit::parse("J");
     *     kWh.factorTo(J);            // 3.6e6
     *     kWh.factorTo(Unit::parse("lbf"));   // throws UnitMismatchError
     */
    class Unit {
        double scale_ = 1.0;
        Dimension dim_{};
        std::string symbol_ = "-";

        static bool needsParens(const std::string& s) {
            return s.find_first_of("*/^ ") != std::string::npos;
        }

        static std::string wrap(const std::string& s) {
            return needsParens(s) ? "(" + s + ")" : s;
        }

    public:
        Unit() = default;

        Unit(double scale, Dimension dim, std::string symbol)
            : scale_(scale), dim_(dim), symbol_(std::move(symbol)) {
            if (!(scale_ > 0.0) || !std::isfinite(scale_)) {
                throw std::invalid_argument(
                    std::format("Unit: scale of '{}' must be positive and finite", symbol_));
            }
        }

        /// @brief Parse a unit expression through the global UnitRegistry
        static Unit parse(std::string_view text);

        static Unit dimensionless() { return Unit{}; }

        [[nodiscard]] double scale() const noexcept { return scale_; }
        [[nodiscard]] const Dimension& dimension() const noexcept { return dim_; }
        [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
        [[nodiscard]] bool isDimensionless() const { return dim_.dimensionless(); }

        /// @brief True if both units measure the same dimension
        [[nodiscard]] bool compatible(const Unit& other) const {
            return dim_ == other.dim_;
        }

        /**
         * @brief Multiplicative factor taking a value in this unit to @p target
         * @throws UnitMismatchError if the dimensions differ
         */
        [[nodiscard]] double factorTo(const Unit& target) const {
            if (!compatible(target)) {
                throw UnitMismatchError(std::format(
                    "Unit::factorTo: cannot convert '{}' [{}] to '{}' [{}]",
                    symbol_, dim_.str(), target.symbol_, target.dim_.str()));
            }
            return scale_ / target.scale_;
        }

        Unit operator*(const Unit& o) const {
            if (isDimensionless() && scale_ == 1.0) return o;
            if (o.isDimensionless() && o.scale_ == 1.0) return *this;
            return Unit(scale_ * o.scale_, dim_ * o.dim_, symbol_ + "*" + wrap(o.symbol_));
        }

        Unit operator/(const Unit& o) const {
            if (o.isDimensionless() && o.scale_ == 1.0) return *this;
            std::string num = (isDimensionless() && scale_ == 1.0) ? std::string("1") : symbol_;
            return Unit(scale_ / o.scale_, dim_ / o.dim_, num + "/" + wrap(o.symbol_));
        }

        [[nodiscard]] Unit pow(double e) const {
            if (e == 1.0) return *this;
            if (e == 0.0 || (isDimensionless() && scale_ == 1.0)) return Unit{};
            return Unit(std::pow(scale_, e), dim_.pow(e), std::format("{}^{}", wrap(symbol_), e));
        }

        /// @brief Same dimension and the same scale within a relative 1e-12
        bool operator==(const Unit& o) const {
            return compatible(o) && std::abs(scale_ - o.scale_) <= 1e-12 * std::max(scale_, o.scale_);
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const Unit& u) {
        return os << u.symbol();
    }

    // ============================================================================
    // UNIT REGISTRY
    // ============================================================================

    /**
     * @class UnitRegistry
     * @brief Process-wide table of named units and the unit-expression parser
     *
     * @note The registry is populated once on first use and is read-only
     *       afterwards unless define() is called.
     */
    class UnitRegistry {
        std::unordered_map<std::string, Unit> units_;

        UnitRegistry() { populate(); }

        void alias(const std::string& name, const std::string& target) {
            const Unit& u = units_.at(target);
            units_.insert_or_assign(name, Unit(u.scale(), u.dimension(), name));
        }

        void populate() {
            constexpr double pi = std::numbers::pi;
            const Dimension none{};
            const Dimension mass{1, 0, 0};
            const Dimension length{0, 1, 0};
            const Dimension time{0, 0, 1};
            const Dimension speed{0, 1, -1};
            const Dimension force{1, 1, -2};
            const Dimension energy{1, 2, -2};
            const Dimension power{1, 2, -3};
            const Dimension pressure{1, -1, -2};
            const Dimension frequency{0, 0, -1};

            // length
            define("m", Unit(1.0, length, "m"));
            define("km", Unit(1000.0, length, "km"));
            define("ft", Unit(0.3048, length, "ft"));
            define("inch", Unit(0.0254, length, "inch"));
            define("mi", Unit(1609.344, length, "mi"));
            define("nautical_mile", Unit(1852.0, length, "nautical_mile"));
            alias("nmi", "nautical_mile");

            // mass
            define("kg", Unit(1.0, mass, "kg"));
            define("g", Unit(1e-3, mass, "g"));
            define("lb", Unit(0.45359237, mass, "lb"));

            // time
            define("s", Unit(1.0, time, "s"));
            define("min", Unit(60.0, time, "min"));
            alias("minute", "min");
            alias("minutes", "min");
            define("hr", Unit(3600.0, time, "hr"));
            alias("hour", "hr");
            alias("hours", "hr");
            define("day", Unit(86400.0, time, "day"));
            define("year", Unit(365.25 * 86400.0, time, "year"));
            alias("years", "year");

            // force
            define("N", Unit(1.0, force, "N"));
            define("kN", Unit(1000.0, force, "kN"));
            define("lbf", Unit(4.4482216152605, force, "lbf"));

            // energy
            define("J", Unit(1.0, energy, "J"));
            define("kJ", Unit(1e3, energy, "kJ"));
            define("MJ", Unit(1e6, energy, "MJ"));
            define("Wh", Unit(3600.0, energy, "Wh"));
            define("kWh", Unit(3.6e6, energy, "kWh"));

            // power
            define("W", Unit(1.0, power, "W"));
            define("kW", Unit(1e3, power, "kW"));
            define("MW", Unit(1e6, power, "MW"));
            define("hp", Unit(745.69987158227022, power, "hp"));

            // speed
            define("mph", Unit(0.44704, speed, "mph"));
            define("knot", Unit(1852.0 / 3600.0, speed, "knot"));
            alias("kt", "knot");

            // angle and rotation
            define("rad", Unit(1.0, none, "rad"));
            define("deg", Unit(pi / 180.0, none, "deg"));
            define("rev", Unit(2.0 * pi, none, "rev"));
            define("rpm", Unit(2.0 * pi / 60.0, frequency, "rpm"));

            // pressure
            define("Pa", Unit(1.0, pressure, "Pa"));
            define("kPa", Unit(1e3, pressure, "kPa"));
            define("psi", Unit(6894.757293168361, pressure, "psi"));
        }

        // --------------------------------------------------------------------
        // Recursive-descent parser over a string_view cursor
        // --------------------------------------------------------------------
        class Parser {
            const UnitRegistry& reg_;
            std::string_view text_;
            std::size_t pos_ = 0;

            [[noreturn]] void fail(std::string_view what) const {
                throw std::invalid_argument(std::format(
                    "UnitRegistry::parse: {} at position {} in '{}'", what, pos_, text_));
            }

            void skip() {
                while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
            }

            bool peek(std::string_view token) {
                skip();
                return text_.substr(pos_, token.size()) == token;
            }

            bool accept(std::string_view token) {
                if (!peek(token)) return false;
                pos_ += token.size();
                return true;
            }

            double number() {
                skip();
                if (accept("(")) {
                    double v = number();
                    if (!accept(")")) fail("expected ')' after exponent");
                    return v;
                }
                std::size_t start = pos_;
                if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
                bool digits = false;
                while (pos_ < text_.size() && (std::isdigit(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '.')) {
                    digits = true;
                    ++pos_;
                }
                if (!digits) fail("expected a number");
                if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
                    ++pos_;
                    if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
                    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) ++pos_;
                }
                try {
                    return std::stod(std::string(text_.substr(start, pos_ - start)));
                }
                catch (const std::exception&) {
                    fail("malformed number");
                }
            }

            Unit factor() {
                skip();
                if (accept("(")) {
                    Unit u = expr();
                    if (!accept(")")) fail("expected ')'");
                    return u;
                }
                if (accept("1")) {
                    return Unit{};
                }
                std::size_t start = pos_;
                while (pos_ < text_.size() &&
                       (std::isalpha(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_' ||
                        (pos_ > start && std::isdigit(static_cast<unsigned char>(text_[pos_]))))) {
                    ++pos_;
                }
                if (pos_ == start) fail("expected a unit symbol");
                return reg_.get(text_.substr(start, pos_ - start));
            }

            Unit term() {
                Unit base = factor();
                if (accept("**") || accept("^")) {
                    return base.pow(number());
                }
                return base;
            }

        public:
            Parser(const UnitRegistry& reg, std::string_view text) : reg_(reg), text_(text) {}

            Unit expr() {
                Unit u = term();
                while (true) {
                    if (peek("**")) break;
                    if (accept("*")) {
                        u = u * term();
                    }
                    else if (accept("/")) {
                        u = u / term();
                    }
                    else {
                        break;
                    }
                }
                return u;
            }

            Unit parseAll() {
                Unit u = expr();
                skip();
                if (pos_ != text_.size()) fail("unexpected trailing input");
                return u;
            }
        };

    public:
        UnitRegistry(const UnitRegistry&) = delete;
        UnitRegistry& operator=(const UnitRegistry&) = delete;

        /// @brief The process-wide registry
        static UnitRegistry& instance() {
            static UnitRegistry registry;
            return registry;
        }

        /// @brief Add or replace a named unit
        void define(const std::string& name, Unit unit) {
            units_.insert_or_assign(name, std::move(unit));
        }

        [[nodiscard]] bool has(std::string_view name) const {
            return units_.find(std::string(name)) != units_.end();
        }

        /// @brief Every registered symbol, aliases included, in sorted order
        [[nodiscard]] std::vector<std::string> symbols() const {
            std::vector<std::string> out;
            out.reserve(units_.size());
            for (const auto& [name, unit] : units_) out.push_back(name);
            std::sort(out.begin(), out.end());
            return out;
        }

        /// @throws std::invalid_argument for an unknown symbol
        [[nodiscard]] const Unit& get(std::string_view name) const {
            auto it = units_.find(std::string(name));
            if (it == units_.end()) {
                throw std::invalid_argument(std::format("UnitRegistry::get: unknown unit '{}'", name));
            }
            return it->second;
        }

        /**
         * @brief Parse a unit expression such as "lbf/ft**2" or "kWh**-1"
         * @throws std::invalid_argument on unknown symbols or malformed input
         */
        [[nodiscard]] Unit parse(std::string_view text) const {
            std::size_t b = text.find_first_not_of(" \t");
            if (b == std::string_view::npos) return Unit{};
            std::size_t e = text.find_last_not_of(" \t");
            std::string_view trimmed = text.substr(b, e - b + 1);
            if (trimmed == "-") return Unit{};
            Unit u = Parser(*this, trimmed).parseAll();
            // keep the caller's spelling for display
            return Unit(u.scale(), u.dimension(), std::string(trimmed));
        }
    };

    inline Unit Unit::parse(std::string_view text) {
        return UnitRegistry::instance().parse(text);
    }

} // namespace evtol

#pragma once
/*
===============================================================================
VARIABLE MANAGEMENT — Named, unit-bearing Variables and per-node registries
===============================================================================

OVERVIEW
--------
A Variable is a named Quantity slot owned by exactly one Model node. It is
either a parameter (fixed value) or a decision variable (no value, solved
for). Variables are immutable once declared; copies of a Variable are cheap
handles onto one shared definition.

KEY COMPONENTS
--------------
• VariableDef       — Immutable definition: qualified name, unit, description,
                      optional fixed value
• Variable          — Shared handle; identity is the qualified name
• VariableRegistry  — Ordered symbol table of one Model node

DESIGN NOTES
------------
• Identity comparisons go through key() (QualifiedName). The comparison
  operators on Variable build Constraints (see constraints.h), so
  `a.key() == b.key()` is the way to ask "same Variable?".
• Two handles may share a key yet point at different definitions only if two
  nodes were (wrongly) given the same path. The Composer detects that case
  with sameDefinition().
• A fixed value of zero is legal: it marks a term that vanishes from every
  posynomial it appears in (e.g. an unmodeled component weight).

USAGE EXAMPLES
--------------
    VariableRegistry reg(ModelPath::parse("Aircraft/Battery"));
    Variable C   = reg.declare("C", Unit::parse("kWh"), "Battery capacity");
    Variable C_m = reg.declare("C_m", Unit::parse("Wh/kg"), "Energy density", 400.0);

    C.key().str();        // "Aircraft/Battery::C"
    C_m.fixed();          // true
    reg.at("C").key() == C.key();   // true

EXCEPTION SAFETY
----------------
• Malformed symbols, negative or non-finite fixed values throw
  std::invalid_argument
• VariableRegistry::declare throws DuplicateSymbolError on a repeated symbol
• VariableRegistry::at throws UnresolvedVariableError for unknown symbols

===============================================================================
*/

#include <cmath>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "errors.h"
#include "naming.h"
#include "quantity.h"
#include "units.h"

namespace evtol {

    // ============================================================================
    // VARIABLE DEFINITION
    // ============================================================================

    /// @brief Immutable definition shared by every handle of one Variable
    struct VariableDef {
        QualifiedName key;
        Unit unit;
        std::string description;
        std::optional<double> value;
    };

    // ============================================================================
    // VARIABLE
    // ============================================================================

    /**
     * @class Variable
     * @brief Cheap-to-copy handle onto a VariableDef
     *
     * @details Always refers to a definition; there is no empty Variable.
     *          Use std::optional<Variable> where "no variable yet" is needed.
     */
    class Variable {
        std::shared_ptr<const VariableDef> def_;

        explicit Variable(std::shared_ptr<const VariableDef> def) : def_(std::move(def)) {}

    public:
        /**
         * @brief Create a Variable owned by @p owner
         *
         * @param owner       Path of the owning node
         * @param symbol      Local symbol ("T/A", "C_{eff}", ...)
         * @param unit        Unit in which the value is expressed
         * @param description Human-readable description
         * @param value       Fixed value (parameter) or nullopt (decision variable)
         *
         * @throws std::invalid_argument if the symbol is malformed or the value
         *         is negative or non-finite
         *
         * @note No uniqueness check; VariableRegistry::declare adds it.
         */
        static Variable declare(const ModelPath& owner, std::string symbol, Unit unit,
                                std::string description, std::optional<double> value = std::nullopt)
        {
            naming_detail::check_symbol(symbol);
            if (value && (!std::isfinite(*value) || *value < 0.0)) {
                throw std::invalid_argument(std::format(
                    "Variable::declare: fixed value {} of '{}' must be finite and non-negative",
                    *value, symbol));
            }
            auto def = std::make_shared<const VariableDef>(VariableDef{
                QualifiedName{owner, std::move(symbol)}, std::move(unit),
                std::move(description), value });
            return Variable(std::move(def));
        }

        [[nodiscard]] const QualifiedName& key() const noexcept { return def_->key; }
        [[nodiscard]] const std::string& symbol() const noexcept { return def_->key.symbol; }
        [[nodiscard]] const ModelPath& owner() const noexcept { return def_->key.owner; }
        [[nodiscard]] const Unit& unit() const noexcept { return def_->unit; }
        [[nodiscard]] const std::string& description() const noexcept { return def_->description; }

        /// @brief Printed qualified name, "<path>::<symbol>"
        [[nodiscard]] std::string name() const { return def_->key.str(); }

        [[nodiscard]] bool fixed() const noexcept { return def_->value.has_value(); }
        [[nodiscard]] const std::optional<double>& value() const noexcept { return def_->value; }

        /// @brief Fixed value as a Quantity, or an unbound Quantity for a free Variable
        [[nodiscard]] Quantity quantity() const {
            return def_->value ? Quantity(*def_->value, def_->unit) : Quantity::unbound(def_->unit);
        }

        /// @brief True if both handles refer to the very same definition object
        [[nodiscard]] bool sameDefinition(const Variable& other) const noexcept {
            return def_ == other.def_;
        }
    };

    // ============================================================================
    // VARIABLE REGISTRY
    // ============================================================================

    /**
     * @class VariableRegistry
     * @brief Ordered, symbol-unique set of the Variables one node declares
     */
    class VariableRegistry {
        ModelPath owner_;
        std::vector<Variable> vars_;
        std::unordered_map<std::string, std::size_t> index_;

    public:
        VariableRegistry() = default;
        explicit VariableRegistry(ModelPath owner) : owner_(std::move(owner)) {}

        [[nodiscard]] const ModelPath& owner() const noexcept { return owner_; }

        /**
         * @brief Declare a Variable under this registry's owner path
         * @throws DuplicateSymbolError if @p symbol is already declared here
         */
        Variable declare(std::string symbol, Unit unit, std::string description,
                         std::optional<double> value = std::nullopt)
        {
            if (index_.contains(symbol)) {
                throw DuplicateSymbolError(std::format(
                    "VariableRegistry::declare: '{}' already declared under '{}'", symbol, owner_.str()));
            }
            Variable v = Variable::declare(owner_, symbol, std::move(unit), std::move(description), value);
            index_.emplace(std::move(symbol), vars_.size());
            vars_.push_back(v);
            return v;
        }

        [[nodiscard]] bool contains(std::string_view symbol) const {
            return index_.contains(std::string(symbol));
        }

        /// @brief Pointer to the Variable or nullptr
        [[nodiscard]] const Variable* find(std::string_view symbol) const {
            auto it = index_.find(std::string(symbol));
            return it == index_.end() ? nullptr : &vars_[it->second];
        }

        /// @throws UnresolvedVariableError if @p symbol is not declared here
        [[nodiscard]] const Variable& at(std::string_view symbol) const {
            const Variable* v = find(symbol);
            if (!v) {
                throw UnresolvedVariableError(std::format(
                    "VariableRegistry::at: no '{}' under '{}'", symbol, owner_.str()));
            }
            return *v;
        }

        [[nodiscard]] std::size_t size() const noexcept { return vars_.size(); }
        [[nodiscard]] bool empty() const noexcept { return vars_.empty(); }
        [[nodiscard]] const std::vector<Variable>& all() const noexcept { return vars_; }

        auto begin() const noexcept { return vars_.begin(); }
        auto end() const noexcept { return vars_.end(); }
    };

} // namespace evtol

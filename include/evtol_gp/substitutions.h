#pragma once
/*
===============================================================================
SUBSTITUTIONS — Pinning free Variables for one particular solve
===============================================================================

OVERVIEW
--------
A SubstitutionTable maps qualified Variable names to Quantities. Applying it
to a FlatSystem pins each target to its value, converted into the target's
own unit, without touching the model's structural definition: the same tree
can be solved again with a different table.

    SubstitutionTable subs;
    subs.set(takeoff.topvar("T/A"), Quantity(16.3, "lbf/ft^2"));
    FlatSystem pinned = applySubstitutions(system, subs);

RULES
-----
Every entry is validated before anything is applied:
• the target must exist in the system                 -> SubstitutionTargetError
• the target must be free (not fixed at build time
  and not already substituted)                          -> SubstitutionTargetError
• the value must be bound, finite and non-negative      -> SubstitutionTargetError
• the value's unit must match the target's dimension   -> UnitMismatchError

The input system is never modified; on any failure no system is returned.

===============================================================================
*/

#include <cmath>
#include <format>
#include <map>
#include <string_view>

#include "composer.h"
#include "errors.h"
#include "logging.h"
#include "naming.h"
#include "quantity.h"
#include "variables.h"

namespace evtol {

    /**
     * @class SubstitutionTable
     * @brief Qualified name -> Quantity, ordered by name
     */
    class SubstitutionTable {
        std::map<QualifiedName, Quantity> entries_;

    public:
        /// @brief Pin @p v; replaces an earlier entry for the same Variable
        SubstitutionTable& set(const Variable& v, const Quantity& value) {
            entries_.insert_or_assign(v.key(), value);
            return *this;
        }

        SubstitutionTable& set(const QualifiedName& key, const Quantity& value) {
            entries_.insert_or_assign(key, value);
            return *this;
        }

        /// @brief Pin by printed name, "<path>::<symbol>"
        SubstitutionTable& set(std::string_view printed, const Quantity& value) {
            entries_.insert_or_assign(QualifiedName::parse(printed), value);
            return *this;
        }

        [[nodiscard]] bool contains(const QualifiedName& key) const { return entries_.contains(key); }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
        [[nodiscard]] const std::map<QualifiedName, Quantity>& entries() const noexcept { return entries_; }
    };

    /**
     * @brief Return a copy of @p system with every entry of @p table pinned
     *
     * @throws SubstitutionTargetError for unknown, fixed or already substituted
     *         targets and for unbound, negative or non-finite values
     * @throws UnitMismatchError for a value of the wrong dimension
     */
    inline FlatSystem applySubstitutions(const FlatSystem& system, const SubstitutionTable& table) {
        std::map<QualifiedName, double> converted;
        for (const auto& [key, q] : table.entries()) {
            const Variable* v = system.find(key);
            if (!v) {
                throw SubstitutionTargetError(std::format(
                    "applySubstitutions: '{}' is not in the system", key.str()));
            }
            if (v->fixed()) {
                throw SubstitutionTargetError(std::format(
                    "applySubstitutions: '{}' is fixed at build time", key.str()));
            }
            if (system.substituted(key)) {
                throw SubstitutionTargetError(std::format(
                    "applySubstitutions: '{}' is already substituted", key.str()));
            }
            if (!q.bound()) {
                throw SubstitutionTargetError(std::format(
                    "applySubstitutions: value for '{}' is unbound", key.str()));
            }
            double value = q.in(v->unit());
            if (!std::isfinite(value) || value < 0.0) {
                throw SubstitutionTargetError(std::format(
                    "applySubstitutions: value {} for '{}' must be finite and non-negative", value, key.str()));
            }
            converted.emplace(key, value);
        }

        FlatSystem out = system;
        for (const auto& [key, value] : converted) {
            logger()->debug("substitute {} = {} {}", key.str(), value, system.at(key).unit().symbol());
            out.substitutions_.emplace(key, value);
        }
        return out;
    }

} // namespace evtol

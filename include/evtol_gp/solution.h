#pragma once
/*
===============================================================================
SOLUTION — Outcome of one solve
===============================================================================

OVERVIEW
--------
Every solve ends in exactly one of two values:

    Solution    the optimum: a value (with unit) for every free Variable,
                the fixed and substituted Variables echoed as constants,
                the objective, and optional per-constraint sensitivities
    Infeasible  a proof that no point satisfies the constraints; carries no
                partial values, optionally the labels of an irreducible
                conflicting subset

    SolveResult r = solver.solve(system, minimize(C_eff));
    if (auto* s = std::get_if<Solution>(&r)) {
        s->value(battery.topvar("m")).in("kg");
    }
    else {
        const auto& inf = std::get<Infeasible>(r);
        for (const auto& label : inf.iis) std::cout << label << "\n";
    }

Solution values are stored in each Variable's own (canonical) unit; callers
convert with Quantity::to / Quantity::in.

===============================================================================
*/

#include <format>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "errors.h"
#include "naming.h"
#include "quantity.h"
#include "variables.h"

namespace evtol {

    /**
     * @struct Solution
     * @brief Optimal point of a solved problem
     */
    struct Solution {
        std::map<QualifiedName, Quantity> values;       ///< Free Variables
        std::map<QualifiedName, Quantity> constants;    ///< Fixed and substituted Variables
        Quantity objective;
        std::map<std::string, double> sensitivities;    ///< Constraint label -> d log(obj) / d log(rhs)
        std::string status;
        double runtime = 0.0;                           ///< Seconds spent in the optimizer

        [[nodiscard]] bool contains(const QualifiedName& key) const {
            return values.contains(key) || constants.contains(key);
        }

        /**
         * @brief Solved or pinned value of @p key
         * @throws UnresolvedVariableError if the Variable was not part of the problem
         */
        [[nodiscard]] const Quantity& value(const QualifiedName& key) const {
            if (auto it = values.find(key); it != values.end()) return it->second;
            if (auto it = constants.find(key); it != constants.end()) return it->second;
            throw UnresolvedVariableError(std::format("Solution::value: no value for '{}'", key.str()));
        }

        [[nodiscard]] const Quantity& value(const Variable& v) const { return value(v.key()); }

        /// @brief Sensitivity of a constraint label, 0 when none was recorded
        [[nodiscard]] double sensitivity(const std::string& label) const {
            auto it = sensitivities.find(label);
            return it == sensitivities.end() ? 0.0 : it->second;
        }
    };

    /**
     * @struct Infeasible
     * @brief Proven infeasibility; no values
     */
    struct Infeasible {
        std::string status;
        std::vector<std::string> iis;   ///< Conflicting constraint labels (empty unless computed)
    };

    using SolveResult = std::variant<Solution, Infeasible>;

    [[nodiscard]] inline bool isOptimal(const SolveResult& r) noexcept {
        return std::holds_alternative<Solution>(r);
    }

    [[nodiscard]] inline bool isInfeasible(const SolveResult& r) noexcept {
        return std::holds_alternative<Infeasible>(r);
    }

} // namespace evtol

#pragma once
/*
===============================================================================
DIAGNOSTICS — Problem statistics, status strings and solution checks
===============================================================================

Overview
--------
Free functions for inspecting a flattened problem before a solve and a
Solution after it:

    * Human-readable Gurobi status names
    * Problem statistics (Variables by kind, constraints by sense and form)
    * A one-line summary for logs
    * Solution quality: every constraint re-evaluated in the modeling layer
      with the solved values, reporting the largest relative violation

The quality check is independent of the optimizer's own tolerances: the
log-space rows are approximations (piecewise exp), so this is the number to
look at when judging how well the original posynomial constraints hold.

Typical Usage
-------------
    FlatSystem system = Composer::flatten(root);
    spdlog::info("{}", evtol::modelSummary(system));

    SolveResult r = solver.solve(system, minimize(E));
    if (const auto* s = std::get_if<Solution>(&r)) {
        auto q = evtol::computeSolutionQuality(system, *s);
        if (q.maxRelativeViolation > 1e-3) spdlog::warn("worst: {}", q.worstConstraint);
    }

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <string>

#include "gurobi_c++.h"

#include "composer.h"
#include "constraints.h"
#include "solution.h"

namespace evtol {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert a Gurobi status code to its name
 *
 * @example
 *     statusString(GRB_OPTIMAL);     // "OPTIMAL"
 */
inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// PROBLEM STATISTICS
// =============================================================================

/**
 * @brief Size and composition of a flattened problem
 */
struct ProblemStatistics {
    int numVars = 0;            ///< Every Variable in the system
    int numFree = 0;            ///< Decision Variables (solver columns)
    int numFixed = 0;           ///< Fixed at build time
    int numSubstituted = 0;     ///< Pinned by a substitution table
    int numConstraints = 0;
    int numEqualities = 0;
    int numInequalities = 0;
    int numPosynomial = 0;      ///< Inequalities whose small side has several terms
    int numTerms = 0;           ///< Monomial terms over all constraints
};

inline ProblemStatistics computeStatistics(const FlatSystem& system) {
    ProblemStatistics stats;

    for (const auto& v : system.variables()) {
        ++stats.numVars;
        if (v.fixed()) ++stats.numFixed;
        else if (system.substituted(v.key())) ++stats.numSubstituted;
        else ++stats.numFree;
    }

    for (const auto& c : system.constraints()) {
        ++stats.numConstraints;
        stats.numTerms += static_cast<int>(c.lhs().size() + c.rhs().size());
        if (c.sense() == Sense::Equal) {
            ++stats.numEqualities;
        }
        else {
            ++stats.numInequalities;
            if (c.smallSide().size() > 1) ++stats.numPosynomial;
        }
    }

    return stats;
}

/**
 * @brief One-line summary
 * @return e.g. "212 vars (148 free, 60 fixed, 4 substituted), 190 constraints (23 posynomial)"
 */
inline std::string modelSummary(const FlatSystem& system) {
    auto stats = computeStatistics(system);

    std::string result = std::format("{} vars ({} free, {} fixed", stats.numVars, stats.numFree, stats.numFixed);
    if (stats.numSubstituted > 0) {
        result += std::format(", {} substituted", stats.numSubstituted);
    }
    result += std::format("), {} constraints", stats.numConstraints);
    if (stats.numPosynomial > 0) {
        result += std::format(" ({} posynomial)", stats.numPosynomial);
    }
    return result;
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Constraint violations of a Solution, measured on the original GP
 *
 * @details Relative violation of `p <= m` is max(0, p/m - 1); of `a == b`
 *          it is |a/b - 1|.
 */
struct SolutionQuality {
    double maxRelativeViolation = 0.0;
    double sumRelativeViolation = 0.0;
    std::string worstConstraint;        ///< Label of the largest violation
};

/**
 * @throws UnresolvedVariableError if @p solution lacks a Variable of @p system
 */
inline SolutionQuality computeSolutionQuality(const FlatSystem& system, const Solution& solution) {
    SolutionQuality quality;
    auto valueOf = [&](const Variable& v) { return solution.value(v).in(v.unit()); };

    for (const auto& c : system.constraints()) {
        double violation = 0.0;
        if (c.sense() == Sense::Equal) {
            double a = c.lhs().evaluate(valueOf);
            double b = c.rhs().evaluate(valueOf);
            violation = b > 0.0 ? std::abs(a / b - 1.0) : std::abs(a - b);
        }
        else {
            double p = c.smallSide().evaluate(valueOf);
            double m = c.largeSide().evaluate(valueOf);
            violation = m > 0.0 ? std::max(0.0, p / m - 1.0) : std::max(0.0, p - m);
        }

        quality.sumRelativeViolation += violation;
        if (violation > quality.maxRelativeViolation) {
            quality.maxRelativeViolation = violation;
            quality.worstConstraint = c.label();
        }
    }

    return quality;
}

} // namespace evtol

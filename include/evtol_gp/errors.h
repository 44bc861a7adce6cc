#pragma once
/*
===============================================================================
ERRORS — Exception taxonomy for the evtol_gp modeling layer
===============================================================================

OVERVIEW
--------
Every failure the modeling layer can detect while a problem is being declared,
composed, or prepared for the solver is reported by throwing one of the types
below. All of them derive from ModelError, which itself derives from
std::runtime_error, so callers that only want a message can catch the standard
base.

KEY COMPONENTS
--------------
• ModelError               — Common base
• DuplicateSymbolError     — Two Variables collide under one owner path
• UnitMismatchError        — Incompatible-dimension arithmetic or conversion
• UnresolvedVariableError  — Cross-model lookup found no match
• AmbiguousVariableError   — Cross-model lookup found several matches
• SubstitutionTargetError  — Substitution names an unknown or fixed Variable
• DomainError              — External lookup (atmosphere, ...) out of range
• GeometricFormError       — Constraint not expressible as a geometric program
• ConfigurationError       — Invalid study-level input
• SolverError              — Optimizer ended neither optimal nor infeasible

PROPAGATION POLICY
------------------
Build-time errors abort construction of the whole problem; no partially built
model is ever returned. Infeasibility is NOT an exception: it is a terminal
value of SolveResult (see solution.h) and callers branch on it explicitly.

===============================================================================
*/

#include <stdexcept>
#include <string>

namespace evtol {

    /// @brief Base class of every modeling-layer exception
    class ModelError : public std::runtime_error {
    public:
        explicit ModelError(const std::string& what) : std::runtime_error(what) {}
    };

    /// @brief A symbol was declared twice under one owner path
    class DuplicateSymbolError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief Arithmetic or conversion between incompatible dimensions
    class UnitMismatchError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief A lookup found no Variable with the requested symbol
    class UnresolvedVariableError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief A lookup found more than one candidate and no owner path was given
    class AmbiguousVariableError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief A substitution references an unknown or already-fixed Variable
    class SubstitutionTargetError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief An external lookup was asked for a value outside its domain
    class DomainError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief A constraint cannot be written in geometric-program form
    class GeometricFormError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /// @brief Study-level input failed validation
    class ConfigurationError : public ModelError {
    public:
        using ModelError::ModelError;
    };

    /**
     * @brief The optimizer stopped in a state that is neither a proven
     *        optimum nor a proven infeasibility (time limit, numerics, ...)
     *
     * @note Carries the Gurobi status code that caused it.
     */
    class SolverError : public ModelError {
        int status_;

    public:
        SolverError(const std::string& what, int status)
            : ModelError(what), status_(status) {}

        [[nodiscard]] int status() const noexcept { return status_; }
    };

} // namespace evtol

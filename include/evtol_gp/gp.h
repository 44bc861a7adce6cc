#pragma once
/*
===============================================================================
EVTOL GP — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the geometric-programming modeling layer and the
on-demand rotorcraft models built on it.

WHAT'S INCLUDED
---------------
• units.h, quantity.h   — Unit registry and unit-bearing scalars
• naming.h              — Model paths and qualified Variable names
• variables.h           — Variables and per-node registries
• expressions.h         — Monomials, posynomials and their operators
• constraints.h         — GP constraints and labels
• model.h, lookup.h     — Model tree construction and cross-model lookup
• composer.h            — Flattening a tree into one constraint system
• mission.h             — Segment energy chain and reserve policies
• substitutions.h       — Pinning Variables without rebuilding models
• log_space.h           — Log-space translation of a system
• solver_adapter.h      — Gurobi backend, Solution / Infeasible results
• diagnostics.h         — Statistics, status names and solution checks
• atmosphere.h          — Standard atmosphere
• config.h              — Study parameters and DataStore loading
• models/*.h            — Rotorcraft components, vehicle, segments,
                          missions and the composed study

QUICK START
-----------
    #include <evtol_gp/gp.h>

    using namespace evtol;
    using namespace evtol::models;

    int main() {
        Study study = buildStudy(StudyParameters{});
        SolverAdapter solver;
        solver.quiet();
        SolveResult r = solveStudy(study, solver);
        if (const auto* s = std::get_if<Solution>(&r)) {
            std::cout << StudyReport::from(study, *s).str();
        }
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+ for <format>)
• Gurobi Optimizer 10.0+ with C++ API (general exponential constraints)
• spdlog

NAMESPACE
---------
The modeling layer is in `evtol::`, the rotorcraft models in
`evtol::models::`. `make_name::` and `force_name::` are in `evtol::` as well.

CONFIGURATION
-------------
• EVTOL_DEBUG (or _DEBUG) keeps human-readable names on solver columns
  and rows; otherwise they are left empty

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

#include "errors.h"
#include "logging.h"
#include "enum_utils.h"
#include "data_store.h"

#include "units.h"
#include "quantity.h"
#include "naming.h"
#include "variables.h"
#include "expressions.h"
#include "constraints.h"

#include "model.h"
#include "lookup.h"
#include "composer.h"
#include "mission.h"
#include "substitutions.h"

// ============================================================================
// SOLVING
// ============================================================================

#include "log_space.h"
#include "solution.h"
#include "diagnostics.h"
#include "solver_adapter.h"

// ============================================================================
// ROTORCRAFT MODELS
// ============================================================================

#include "atmosphere.h"
#include "config.h"
#include "models/components.h"
#include "models/vehicle.h"
#include "models/segments.h"
#include "models/missions.h"
#include "models/study.h"

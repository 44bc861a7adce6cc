#pragma once
/*
===============================================================================
SOLVER ADAPTER — Solving a flattened geometric program with Gurobi
===============================================================================

Overview
--------
SolverAdapter is a thin pass-through between a FlatSystem and the Gurobi
optimizer. One call to solve() does:

    applySubstitutions()        (when a table is given)
    toLogSpace()                (log_space.h)
    constant rows violated?  -> Infeasible, the optimizer is not called
    initialize()                lazy GRBEnv (owned, or borrowed)
    GRBModel model(env)
    addParameters(model)        tracked setters, then the derived hook
    columns, rows, objective
    beforeOptimize(model)
    model.optimize()
    afterOptimize(model)
    OPTIMAL     -> Solution
    INFEASIBLE  -> Infeasible   (IIS labels if computeIIS(true))
    otherwise   -> SolverError

There is no retry, no relaxation and no repair: infeasibility is returned as
is. Dual reductions are disabled on every model so that Gurobi proves
infeasibility instead of reporting INF_OR_UNBD.

Log-space rows
--------------
• Single-term rows are linear:     sum(e_j * y_j) (<=|==) -log c
• Multi-term rows use one general exponential constraint per term:
      z_k == log c_k + sum(e_kj * y_j),   w_k = exp(z_k),   sum_k w_k <= 1
  approximated piecewise (FuncPieces=-1, FuncPieceError=expPieceError()).
• A multi-term objective gets an auxiliary column t with sum exp(term_k - t) <= 1.

Every free Variable's column is bounded to [-logBound, logBound]; a solved
value at that bound is reported with a warning since it usually means the
model leaves that Variable unbounded in one direction.

Sensitivities (-Pi of each linear row, i.e. the relative change of the
objective per relative tightening of the constraint) are only reported when
the log-space problem has no general constraints.

Parameters
----------
Named setters (timeLimit, threads, quiet, verbose, presolve) and presets are
recorded and applied to every model this adapter creates; each is echoed into
store() under "param:<Name>". logBound, expPieceError and computeIIS are
adapter settings, echoed the same way.

Typical Usage
-------------
    FlatSystem system = Composer::flatten(study);

    SolverAdapter solver;
    solver.quiet();
    SolveResult r = solver.solve(system, minimize(costPerTrip), substitutions);

    if (const auto* s = std::get_if<Solution>(&r)) { ... }

Extending
---------
    class TunedSolver : public SolverAdapter {
        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_Threads, 4);
        }
        void beforeOptimize(GRBModel& model) override {
            model.write("study.lp");
        }
    };

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "gurobi_c++.h"

#include "composer.h"
#include "data_store.h"
#include "diagnostics.h"
#include "errors.h"
#include "log_space.h"
#include "logging.h"
#include "naming.h"
#include "quantity.h"
#include "solution.h"
#include "substitutions.h"
#include "variables.h"

namespace evtol {

    inline constexpr double kDefaultLogBound = 20.0;
    inline constexpr double kDefaultExpPieceError = 1e-4;
    inline constexpr double kBoundWarningTolerance = 1e-6;

    /*
    ===============================================================================
    SOLVER ADAPTER
    ===============================================================================
    */
    class SolverAdapter {
        std::unique_ptr<GRBEnv> env_;
        GRBEnv* external_env_ = nullptr;
        bool initialized_ = false;

        std::vector<std::function<void(GRBModel&)>> params_;
        double logBound_ = kDefaultLogBound;
        double expPieceError_ = kDefaultExpPieceError;
        bool computeIIS_ = false;

    protected:
        DataStore store_;

    public:
        // -------------------------------------------------------------------------
        // Constructors
        // -------------------------------------------------------------------------

        /// @brief No environment is created until the first solve
        SolverAdapter() = default;

        /**
         * @brief Solve in a caller-owned environment
         *
         * @note The caller keeps ownership; @p env must outlive the adapter.
         *       configureEnvironment() is not called for a borrowed environment.
         */
        explicit SolverAdapter(GRBEnv& env)
            : external_env_(&env), initialized_(true)
        {
        }

        SolverAdapter(const SolverAdapter&) = delete;
        SolverAdapter& operator=(const SolverAdapter&) = delete;

        virtual ~SolverAdapter() = default;

        /**
         * @brief Create and start the owned environment, once
         *
         * @throws GRBException if the license check fails
         */
        void initialize() {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);  // defer license check
            configureEnvironment(*env_);
            env_->start();
            initialized_ = true;
        }

        GRBEnv& env() {
            initialize();
            return external_env_ ? *external_env_ : *env_;
        }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        /**
         * @brief Record a Gurobi parameter for every model this adapter creates
         * @param name Key for store() tracking ("param:<name>")
         *
         * @example
         *     solver.setParam(GRB_DoubleParam_FeasibilityTol, 1e-8, "FeasibilityTol");
         */
        template <typename Param, typename Val>
        void setParam(Param p, Val value, const std::string& name) {
            params_.push_back([p, value](GRBModel& m) { m.set(p, value); });
            store_[std::string("param:") + name] = value;
        }

        /// @brief Optimizer time limit in seconds
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds, "TimeLimit");
        }

        /// @brief Thread count (0 = automatic)
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n, "Threads");
        }

        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0, "OutputFlag");
        }

        void verbose() {
            setParam(GRB_IntParam_OutputFlag, 1, "OutputFlag");
        }

        /// @brief -1 = auto, 0 = off, 1 = conservative, 2 = aggressive
        void presolve(int level) {
            setParam(GRB_IntParam_Presolve, level, "Presolve");
        }

        /**
         * @brief Bound on |log x| for every free Variable
         * @throws ConfigurationError unless @p bound is positive and finite
         */
        void logBound(double bound) {
            if (!(bound > 0.0) || !std::isfinite(bound)) {
                throw ConfigurationError(std::format("SolverAdapter::logBound: {} must be positive", bound));
            }
            logBound_ = bound;
            store_["param:LogBound"] = bound;
        }

        /**
         * @brief Absolute error of the piecewise-linear exp approximation
         * @throws ConfigurationError unless @p err is positive and finite
         */
        void expPieceError(double err) {
            if (!(err > 0.0) || !std::isfinite(err)) {
                throw ConfigurationError(std::format("SolverAdapter::expPieceError: {} must be positive", err));
            }
            expPieceError_ = err;
            store_["param:ExpPieceError"] = err;
        }

        /// @brief Compute an IIS when the optimizer proves infeasibility
        void computeIIS(bool enabled) {
            computeIIS_ = enabled;
            store_["param:ComputeIIS"] = enabled;
        }

        [[nodiscard]] double logBound() const noexcept { return logBound_; }
        [[nodiscard]] double expPieceError() const noexcept { return expPieceError_; }
        [[nodiscard]] bool computeIIS() const noexcept { return computeIIS_; }

        // -------------------------------------------------------------------------
        // Parameter Presets
        // -------------------------------------------------------------------------

        enum class Preset {
            Fast,       ///< 60 s limit, coarse exp approximation
            Accurate,   ///< 1 h limit, fine exp approximation
            Quiet,      ///< No solver output
            Debug       ///< Solver output, no presolve, IIS on infeasibility
        };

        void applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimit(60.0);
                    expPieceError(1e-3);
                    store_["param:Preset"] = std::string("Fast");
                    break;

                case Preset::Accurate:
                    timeLimit(3600.0);
                    expPieceError(1e-6);
                    store_["param:Preset"] = std::string("Accurate");
                    break;

                case Preset::Quiet:
                    quiet();
                    store_["param:Preset"] = std::string("Quiet");
                    break;

                case Preset::Debug:
                    verbose();
                    presolve(0);
                    computeIIS(true);
                    store_["param:Preset"] = std::string("Debug");
                    break;
            }
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Configure the owned environment before it starts (license, logging)
        virtual void configureEnvironment(GRBEnv& env) {}

        /// @brief Extra model parameters, applied after the tracked ones
        virtual void addParameters(GRBModel& model) {}

        /// @brief Called with the complete model right before optimize()
        virtual void beforeOptimize(GRBModel& model) {}

        /// @brief Called right after optimize(), before the result is extracted
        virtual void afterOptimize(GRBModel& model) {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Solve @p system for @p objective
         *
         * @throws GeometricFormError if the problem folds to a non-GP form
         * @throws SolverError if the optimizer ends in any status but OPTIMAL
         *         or INFEASIBLE, or raises an error
         */
        SolveResult solve(const FlatSystem& system, const Objective& objective) {
            LogSpaceProblem problem = toLogSpace(system, objective);

            for (const auto& v : problem.unused) {
                logger()->warn("free variable {} appears in no constraint", v.name());
            }

            logger()->info("solve: {} columns, {} rows, {} constant rows", problem.columns.size(),
                problem.rows.size(), problem.dropped + problem.violated.size());

            if (!problem.violated.empty()) {
                logger()->info("solve: INFEASIBLE ({} constant rows violated)", problem.violated.size());
                return Infeasible{ statusString(GRB_INFEASIBLE), problem.violated };
            }

            try {
                return optimize(system, objective, problem);
            }
            catch (const GRBException& e) {
                throw SolverError(std::format("SolverAdapter::solve: Gurobi error {}: {}",
                    e.getErrorCode(), e.getMessage()), e.getErrorCode());
            }
        }

        /// @brief applySubstitutions(), then solve()
        SolveResult solve(const FlatSystem& system, const Objective& objective, const SubstitutionTable& table) {
            return solve(applySubstitutions(system, table), objective);
        }

    private:
        struct RowRef {
            GRBConstr constr;
            std::string label;
            bool linear;
        };

        struct GenRef {
            GRBGenConstr constr;
            std::string label;
        };

        struct Built {
            std::vector<GRBVar> columns;
            std::vector<RowRef> rows;
            std::vector<GenRef> gens;
        };

        [[nodiscard]] GRBLinExpr linear(const Built& b, const LogTerm& t) const {
            GRBLinExpr e = t.logCoeff;
            for (const auto& [col, exp] : t.exps) e += exp * b.columns[col];
            return e;
        }

        [[nodiscard]] double span(const LogTerm& t) const {
            double s = 0.0;
            for (const auto& [col, exp] : t.exps) s += std::abs(exp);
            return s * logBound_;
        }

        /**
         * sum_k exp(terms[k] - shift) <= 1, one exp general constraint per term.
         * @p shift is the objective column (upper bound @p shiftUpper), or zero.
         */
        void addExpRow(GRBModel& model, Built& b, const std::vector<LogTerm>& terms,
                       const GRBLinExpr& shift, double shiftUpper, const std::string& label)
        {
            const std::string options = std::format("FuncPieces=-1 FuncPieceError={}", expPieceError_);
            GRBLinExpr total = 0.0;
            for (std::size_t k = 0; k < terms.size(); ++k) {
                const LogTerm& t = terms[k];
                double lb = std::min(t.logCoeff - span(t) - shiftUpper, 0.0);
                GRBVar z = model.addVar(lb, 0.0, 0.0, GRB_CONTINUOUS, make_name::format("{}:z{}", label, k));
                GRBVar w = model.addVar(0.0, 1.0, 0.0, GRB_CONTINUOUS, make_name::format("{}:w{}", label, k));
                GRBConstr def = model.addConstr(z == linear(b, t) - shift, make_name::format("{}:def{}", label, k));
                GRBGenConstr g = model.addGenConstrExp(z, w, make_name::format("{}:exp{}", label, k), options);
                b.rows.push_back(RowRef{ def, label, false });
                b.gens.push_back(GenRef{ g, label });
                total += w;
            }
            GRBConstr sum = model.addConstr(total <= 1.0, make_name::format("{}:sum", label));
            b.rows.push_back(RowRef{ sum, label, false });
        }

        SolveResult optimize(const FlatSystem& system, const Objective& objective, const LogSpaceProblem& problem) {
            GRBModel model(env());
            for (const auto& apply : params_) apply(model);
            model.set(GRB_IntParam_DualReductions, 0);
            addParameters(model);

            Built b;
            b.columns.reserve(problem.columns.size());
            for (const auto& v : problem.columns) {
                b.columns.push_back(model.addVar(-logBound_, logBound_, 0.0, GRB_CONTINUOUS,
                    make_name::concat("log(", v.name(), ")")));
            }

            for (const auto& row : problem.rows) {
                if (row.isLinear()) {
                    const LogTerm& t = row.terms.front();
                    GRBLinExpr lhs = linear(b, t) - t.logCoeff;
                    char sense = row.sense == LogSense::Equal ? GRB_EQUAL : GRB_LESS_EQUAL;
                    GRBConstr c = model.addConstr(lhs, sense, -t.logCoeff, make_name::concat(row.label));
                    b.rows.push_back(RowRef{ c, row.label, true });
                    logger()->debug("row {}: linear ({} columns)", row.label, t.exps.size());
                }
                else {
                    addExpRow(model, b, row.terms, GRBLinExpr(0.0), 0.0, row.label);
                    logger()->debug("row {}: {} exp terms", row.label, row.terms.size());
                }
            }

            int sense = problem.maximize ? GRB_MAXIMIZE : GRB_MINIMIZE;
            if (problem.objective.size() == 1) {
                model.setObjective(linear(b, problem.objective.front()), sense);
            }
            else {
                double lo = 0.0, hi = 0.0;
                bool first = true;
                for (const auto& t : problem.objective) {
                    double tl = t.logCoeff - span(t), th = t.logCoeff + span(t);
                    lo = first ? tl : std::min(lo, tl);
                    hi = first ? th : std::max(hi, th);
                    first = false;
                }
                hi += std::log(static_cast<double>(problem.objective.size()));
                GRBVar t = model.addVar(lo, hi, 0.0, GRB_CONTINUOUS, make_name::concat("log(objective)"));
                addExpRow(model, b, problem.objective, GRBLinExpr(t), hi, "objective");
                model.setObjective(GRBLinExpr(t), sense);
            }

            beforeOptimize(model);
            model.optimize();
            afterOptimize(model);

            int status = model.get(GRB_IntAttr_Status);
            double runtime = model.get(GRB_DoubleAttr_Runtime);
            logger()->info("solve: {} after {:.3f} s", statusString(status), runtime);

            if (status == GRB_INFEASIBLE) {
                Infeasible inf{ statusString(status), {} };
                if (computeIIS_) inf.iis = iisLabels(model, b);
                return inf;
            }
            if (status != GRB_OPTIMAL) {
                throw SolverError(std::format(
                    "SolverAdapter::solve: optimizer stopped with status {}", statusString(status)), status);
            }

            return extract(system, objective, problem, b, status, runtime);
        }

        Solution extract(const FlatSystem& system, const Objective& objective, const LogSpaceProblem& problem,
                         const Built& b, int status, double runtime) const
        {
            Solution s;
            s.status = statusString(status);
            s.runtime = runtime;

            std::unordered_map<QualifiedName, double, QualifiedNameHash> solved;
            for (std::size_t i = 0; i < problem.columns.size(); ++i) {
                const Variable& v = problem.columns[i];
                double y = b.columns[i].get(GRB_DoubleAttr_X);
                if (std::abs(y) >= logBound_ - kBoundWarningTolerance) {
                    logger()->warn("{} is at the log bound ({} = {}); the model may not bound it",
                        v.name(), y > 0 ? "upper" : "lower", std::exp(y));
                }
                double x = std::exp(y);
                solved.emplace(v.key(), x);
                s.values.emplace(v.key(), Quantity(x, v.unit()));
            }
            for (const auto& v : system.pinnedVariables()) {
                s.constants.emplace(v.key(), Quantity(*system.pinnedValue(v), v.unit()));
            }

            auto valueOf = [&](const Variable& v) {
                if (auto p = system.pinnedValue(v)) return *p;
                auto it = solved.find(v.key());
                return it == solved.end() ? 0.0 : it->second;
            };
            s.objective = Quantity(objective.expression().evaluate(valueOf), objective.unit());

            if (b.gens.empty()) {
                for (const auto& r : b.rows) {
                    if (r.linear) s.sensitivities[r.label] = -r.constr.get(GRB_DoubleAttr_Pi);
                }
            }
            return s;
        }

        static std::vector<std::string> iisLabels(GRBModel& model, const Built& b) {
            model.computeIIS();
            std::vector<std::string> labels;
            auto note = [&](const std::string& label) {
                if (std::find(labels.begin(), labels.end(), label) == labels.end()) labels.push_back(label);
            };
            for (const auto& r : b.rows) {
                if (r.constr.get(GRB_IntAttr_IISConstr) > 0) note(r.label);
            }
            for (const auto& g : b.gens) {
                if (g.constr.get(GRB_IntAttr_IISGenConstr) > 0) note(g.label);
            }
            return labels;
        }
    };

} // namespace evtol

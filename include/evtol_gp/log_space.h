#pragma once
/*
===============================================================================
LOG SPACE — Geometric program -> convex log-space form
===============================================================================

OVERVIEW
--------
With y = log x for every free Variable, a monomial c * prod(x_i ^ a_i)
becomes the affine function log c + sum(a_i * y_i) and a posynomial
constraint sum(m_k) <= m becomes

    sum_k exp( log(c_k / c) + sum_i (a_ki - a_i) * y_i ) <= 1

This header performs that translation without touching the optimizer, so the
folding rules can be inspected and tested on their own. solver_adapter.h
hands the result to Gurobi.

FOLDING
-------
Fixed and substituted Variables are not columns. Their values multiply into
the term coefficient:

    value > 0                  -> log c += a * log(value)
    value == 0, a > 0          -> the whole term is zero and vanishes
    value == 0, a < 0          -> GeometricFormError (division by zero)
    monomial side == 0         -> GeometricFormError

After folding, like terms (same columns, same exponents) merge, and constant
terms of an inequality move to the right-hand side:

    sum(var terms) + C <= 1    ->  sum(var terms) / (1 - C) <= 1

Rows that end up with no column at all are checked immediately: satisfied
ones are dropped, violated ones are reported (LogSpaceProblem::violated) and
the problem is infeasible without calling the optimizer.

KEY COMPONENTS
--------------
• Objective        — minimize(posynomial) / maximize(monomial)
• LogTerm          — log c + sum(e_j * y_j) over column indices
• LogRow           — Equal (one term == 0) or LessEqual (sum exp <= 1)
• LogSpaceProblem  — Columns, rows, objective terms, constant-row verdicts
• toLogSpace       — FlatSystem + Objective -> LogSpaceProblem

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "composer.h"
#include "constraints.h"
#include "errors.h"
#include "expressions.h"
#include "logging.h"
#include "naming.h"
#include "variables.h"

namespace evtol {

    inline constexpr double kConstantRowTolerance = 1e-9;

    // ============================================================================
    // OBJECTIVE
    // ============================================================================

    /**
     * @class Objective
     * @brief Quantity to optimize: a posynomial to minimize or a monomial to maximize
     */
    class Objective {
        Posynomial expr_;
        bool maximize_;

        Objective(Posynomial expr, bool maximize) : expr_(std::move(expr)), maximize_(maximize) {}

    public:
        static Objective minimize(const Posynomial& p) { return Objective(p, false); }
        static Objective maximize(const Monomial& m) { return Objective(Posynomial(m), true); }

        [[nodiscard]] const Posynomial& expression() const noexcept { return expr_; }
        [[nodiscard]] bool isMaximize() const noexcept { return maximize_; }
        [[nodiscard]] const Unit& unit() const noexcept { return expr_.unit(); }
    };

    template<PosynomialLike T>
        requires Symbolic<T>
    Objective minimize(const T& x) {
        return Objective::minimize(expr_detail::toPosynomial(x));
    }

    template<MonomialLike T>
        requires Symbolic<T>
    Objective maximize(const T& x) {
        return Objective::maximize(expr_detail::toMonomial(x));
    }

    // ============================================================================
    // LOG-SPACE FORM
    // ============================================================================

    /// @brief log c + sum(e_j * y_j); exps maps column index -> exponent
    struct LogTerm {
        double logCoeff = 0.0;
        std::map<std::size_t, double> exps;

        [[nodiscard]] bool isConstant() const noexcept { return exps.empty(); }
    };

    enum class LogSense { Equal, LessEqual };

    /**
     * @struct LogRow
     * @brief One translated constraint
     *
     * @details Equal: terms[0] == 0. LessEqual: sum_k exp(terms[k]) <= 1.
     *          A row with a single term is linear in y.
     */
    struct LogRow {
        std::string label;
        LogSense sense = LogSense::LessEqual;
        std::vector<LogTerm> terms;

        [[nodiscard]] bool isLinear() const noexcept { return terms.size() == 1; }
    };

    struct LogSpaceProblem {
        std::vector<Variable> columns;          ///< One per free Variable, y = log x
        std::vector<LogRow> rows;
        std::vector<LogTerm> objective;         ///< log of each objective term
        bool maximize = false;
        std::vector<std::string> violated;      ///< Labels of constant rows that fail
        std::vector<Variable> unused;           ///< Free Variables in no row and not in the objective
        std::size_t dropped = 0;                ///< Constant rows found satisfied

        [[nodiscard]] bool isLinear() const {
            return std::all_of(rows.begin(), rows.end(), [](const LogRow& r) { return r.isLinear(); });
        }
    };

    namespace log_space_detail {

        /// log(exp(a) + exp(b)) without overflow
        inline double logAddExp(double a, double b) {
            double hi = std::max(a, b);
            double lo = std::min(a, b);
            return hi + std::log1p(std::exp(lo - hi));
        }

        class Translator {
            const FlatSystem& system_;
            std::unordered_map<QualifiedName, std::size_t, QualifiedNameHash> column_;
            std::unordered_set<std::size_t> used_;
            LogSpaceProblem out_;

        public:
            explicit Translator(const FlatSystem& system) : system_(system) {
                for (const auto& v : system.variables()) {
                    if (system.isFree(v)) {
                        column_.emplace(v.key(), out_.columns.size());
                        out_.columns.push_back(v);
                    }
                }
            }

            /// nullopt when a zero-valued factor makes the term vanish
            std::optional<LogTerm> fold(const Monomial& m, const std::string& where) {
                LogTerm t;
                t.logCoeff = std::log(m.coefficient());
                for (const auto& [key, f] : m.factors()) {
                    if (auto pinned = system_.pinnedValue(f.var)) {
                        if (*pinned == 0.0) {
                            if (f.exponent > 0.0) return std::nullopt;
                            throw GeometricFormError(std::format(
                                "toLogSpace: {}: '{}' is zero and appears with exponent {}",
                                where, key.str(), f.exponent));
                        }
                        t.logCoeff += f.exponent * std::log(*pinned);
                    }
                    else {
                        auto it = column_.find(key);
                        if (it == column_.end()) {
                            throw UnresolvedVariableError(std::format(
                                "toLogSpace: {}: '{}' is not part of the system", where, key.str()));
                        }
                        std::size_t col = it->second;
                        t.exps[col] += f.exponent;
                        used_.insert(col);
                    }
                }
                std::erase_if(t.exps, [](const auto& e) { return std::abs(e.second) < kExponentTolerance; });
                return t;
            }

            LogTerm foldNonZero(const Monomial& m, const std::string& where) {
                auto t = fold(m, where);
                if (!t) {
                    throw GeometricFormError(std::format(
                        "toLogSpace: {}: monomial '{}' evaluates to zero", where, m.str()));
                }
                return *t;
            }

            static LogTerm divide(const LogTerm& a, const LogTerm& b) {
                LogTerm r = a;
                r.logCoeff -= b.logCoeff;
                for (const auto& [col, e] : b.exps) r.exps[col] -= e;
                std::erase_if(r.exps, [](const auto& x) { return std::abs(x.second) < kExponentTolerance; });
                return r;
            }

            static void mergeLike(std::vector<LogTerm>& terms) {
                std::vector<LogTerm> merged;
                for (auto& t : terms) {
                    auto same = std::find_if(merged.begin(), merged.end(), [&](const LogTerm& m) {
                        if (m.exps.size() != t.exps.size()) return false;
                        return std::equal(m.exps.begin(), m.exps.end(), t.exps.begin(), [](const auto& a, const auto& b) {
                            return a.first == b.first && std::abs(a.second - b.second) < kExponentTolerance;
                        });
                    });
                    if (same != merged.end()) same->logCoeff = logAddExp(same->logCoeff, t.logCoeff);
                    else merged.push_back(std::move(t));
                }
                terms = std::move(merged);
            }

            void addConstraint(const Constraint& c) {
                const std::string& label = c.label();
                if (c.sense() == Sense::Equal) {
                    LogTerm lhs = foldNonZero(c.lhs().asMonomial(), label);
                    LogTerm rhs = foldNonZero(c.rhs().asMonomial(), label);
                    LogTerm row = divide(lhs, rhs);
                    if (row.isConstant()) {
                        checkConstant(label, std::abs(row.logCoeff) <= kConstantRowTolerance);
                        return;
                    }
                    out_.rows.push_back(LogRow{ label, LogSense::Equal, { std::move(row) } });
                    return;
                }

                LogTerm large = foldNonZero(c.largeSide(), label);
                std::vector<LogTerm> terms;
                for (const auto& m : c.smallSide().terms()) {
                    if (auto t = fold(m, label)) terms.push_back(divide(*t, large));
                }
                mergeLike(terms);

                double constant = 0.0;
                std::vector<LogTerm> variable;
                for (auto& t : terms) {
                    if (t.isConstant()) constant += std::exp(t.logCoeff);
                    else variable.push_back(std::move(t));
                }
                if (variable.empty()) {
                    checkConstant(label, constant <= 1.0 + kConstantRowTolerance);
                    return;
                }
                if (constant >= 1.0) {
                    checkConstant(label, false);
                    return;
                }
                if (constant > 0.0) {
                    double shift = std::log1p(-constant);
                    for (auto& t : variable) t.logCoeff -= shift;
                }
                out_.rows.push_back(LogRow{ label, LogSense::LessEqual, std::move(variable) });
            }

            void checkConstant(const std::string& label, bool satisfied) {
                if (satisfied) {
                    ++out_.dropped;
                    logger()->debug("constant row '{}' holds; dropped", label);
                }
                else {
                    out_.violated.push_back(label);
                    logger()->debug("constant row '{}' is violated", label);
                }
            }

            void setObjective(const Objective& objective) {
                out_.maximize = objective.isMaximize();
                for (const auto& m : objective.expression().terms()) {
                    if (auto t = fold(m, "objective")) out_.objective.push_back(std::move(*t));
                }
                if (out_.objective.empty()) {
                    throw GeometricFormError(std::format(
                        "toLogSpace: objective '{}' evaluates to zero", objective.expression().str()));
                }
                mergeLike(out_.objective);
            }

            LogSpaceProblem finish() && {
                for (std::size_t i = 0; i < out_.columns.size(); ++i) {
                    if (!used_.contains(i)) out_.unused.push_back(out_.columns[i]);
                }
                return std::move(out_);
            }
        };

    } // namespace log_space_detail

    /**
     * @brief Translate @p system and @p objective into log-space form
     *
     * @throws GeometricFormError for zero divisors, zero monomial sides and a
     *         zero objective
     */
    inline LogSpaceProblem toLogSpace(const FlatSystem& system, const Objective& objective) {
        log_space_detail::Translator t(system);
        for (const auto& c : system.constraints()) t.addConstraint(c);
        t.setObjective(objective);
        LogSpaceProblem p = std::move(t).finish();
        logger()->debug("log space: {} columns, {} rows ({} constant rows dropped, {} violated)",
            p.columns.size(), p.rows.size(), p.dropped, p.violated.size());
        return p;
    }

} // namespace evtol

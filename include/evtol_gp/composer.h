#pragma once
/*
===============================================================================
COMPOSER — Flattening a model tree into one constraint system
===============================================================================

OVERVIEW
--------
The Composer walks a built model tree and produces a FlatSystem: every
Variable the tree declares or mentions, indexed by qualified name, and every
Constraint, in one list. This is the form handed to substitutions and to the
solver adapter.

    Composer::flatten(root)
        visit(node):
            node's own Variables
            node's own Constraints (and any Variable they mention)
            visit(child) for each child, in declaration order

The resulting order is pre-order and deterministic. It matters for
readability of diagnostics only; the solver treats the set as unordered.

KEY COMPONENTS
--------------
• FlatSystem          — Variables (unique by qualified name), Constraints,
                        pinned substitution values
• Composer::flatten   — Tree -> FlatSystem
• Composer::merge     — FlatSystem + FlatSystem -> FlatSystem (associative)

COLLISIONS
----------
Two distinct Variable definitions that share a qualified name can only come
from two nodes built at the same path. That is a modeling error and raises
DuplicateSymbolError. The same definition reached twice (a borrowed
Variable) is recorded once.

===============================================================================
*/

#include <format>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "constraints.h"
#include "errors.h"
#include "logging.h"
#include "model.h"
#include "naming.h"
#include "variables.h"

namespace evtol {

    class SubstitutionTable;

    // ============================================================================
    // FLAT SYSTEM
    // ============================================================================

    /**
     * @class FlatSystem
     * @brief Flattened Variables + Constraints of one problem
     */
    class FlatSystem {
        friend class Composer;
        friend FlatSystem applySubstitutions(const FlatSystem& system, const SubstitutionTable& table);

        std::vector<Variable> variables_;
        std::unordered_map<QualifiedName, std::size_t, QualifiedNameHash> index_;
        ConstraintList constraints_;
        std::map<QualifiedName, double> substitutions_;

    public:
        /**
         * @brief Record @p v unless its definition is already present
         * @throws DuplicateSymbolError if a different definition has the same name
         */
        void addVariable(const Variable& v) {
            auto it = index_.find(v.key());
            if (it != index_.end()) {
                if (!variables_[it->second].sameDefinition(v)) {
                    throw DuplicateSymbolError(std::format(
                        "FlatSystem::addVariable: two distinct Variables are named '{}'", v.name()));
                }
                return;
            }
            index_.emplace(v.key(), variables_.size());
            variables_.push_back(v);
        }

        /// @brief Append @p c and record every Variable it mentions
        void addConstraint(const Constraint& c) {
            for (const auto& v : involvedVariables(c)) addVariable(v);
            constraints_.push_back(c);
        }

        [[nodiscard]] const std::vector<Variable>& variables() const noexcept { return variables_; }
        [[nodiscard]] const ConstraintList& constraints() const noexcept { return constraints_; }
        [[nodiscard]] const std::map<QualifiedName, double>& substitutions() const noexcept { return substitutions_; }

        [[nodiscard]] bool contains(const QualifiedName& key) const {
            return index_.contains(key);
        }

        /// @brief Variable by qualified name, or nullptr
        [[nodiscard]] const Variable* find(const QualifiedName& key) const {
            auto it = index_.find(key);
            return it == index_.end() ? nullptr : &variables_[it->second];
        }

        /// @throws UnresolvedVariableError if @p key is not in the system
        [[nodiscard]] const Variable& at(const QualifiedName& key) const {
            const Variable* v = find(key);
            if (!v) {
                throw UnresolvedVariableError(std::format("FlatSystem::at: no Variable '{}'", key.str()));
            }
            return *v;
        }

        /// @brief True if substituted in this system
        [[nodiscard]] bool substituted(const QualifiedName& key) const {
            return substitutions_.contains(key);
        }

        /// @brief Fixed or substituted value in the Variable's own unit
        [[nodiscard]] std::optional<double> pinnedValue(const Variable& v) const {
            if (v.fixed()) return v.value();
            auto it = substitutions_.find(v.key());
            if (it != substitutions_.end()) return it->second;
            return std::nullopt;
        }

        [[nodiscard]] bool isFree(const Variable& v) const {
            return !pinnedValue(v).has_value();
        }

        [[nodiscard]] std::vector<Variable> freeVariables() const {
            std::vector<Variable> out;
            for (const auto& v : variables_) if (isFree(v)) out.push_back(v);
            return out;
        }

        [[nodiscard]] std::vector<Variable> pinnedVariables() const {
            std::vector<Variable> out;
            for (const auto& v : variables_) if (!isFree(v)) out.push_back(v);
            return out;
        }
    };

    // ============================================================================
    // COMPOSER
    // ============================================================================

    /**
     * @class Composer
     * @brief Stateless flatten / merge operations
     */
    class Composer {
        static void visit(const ModelNode& node, FlatSystem& out) {
            for (const auto& v : node.variables()) out.addVariable(v);
            for (const auto& c : node.constraints()) out.addConstraint(c);
            for (const auto& child : node.children()) visit(child, out);
        }

    public:
        /**
         * @brief Flatten the tree rooted at @p root
         * @throws DuplicateSymbolError on colliding qualified names
         */
        static FlatSystem flatten(const ModelNode& root) {
            FlatSystem out;
            visit(root, out);
            logger()->debug("flattened '{}': {} nodes, {} variables, {} constraints",
                root.path().str(), root.subtreeSize(), out.variables().size(), out.constraints().size());
            return out;
        }

        /**
         * @brief Union of two systems: @p a's content, then @p b's
         *
         * @throws DuplicateSymbolError on colliding qualified names
         * @throws SubstitutionTargetError if both pin one Variable to different values
         */
        static FlatSystem merge(const FlatSystem& a, const FlatSystem& b) {
            FlatSystem out = a;
            for (const auto& v : b.variables_) out.addVariable(v);
            out.constraints_.insert(out.constraints_.end(), b.constraints_.begin(), b.constraints_.end());
            for (const auto& [key, value] : b.substitutions_) {
                auto [it, inserted] = out.substitutions_.emplace(key, value);
                if (!inserted && it->second != value) {
                    throw SubstitutionTargetError(std::format(
                        "Composer::merge: '{}' is pinned to {} and {}", key.str(), it->second, value));
                }
            }
            return out;
        }
    };

} // namespace evtol

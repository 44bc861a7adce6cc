#pragma once
/*
===============================================================================
LOOKUP — Cross-model Variable resolution on built nodes
===============================================================================

OVERVIEW
--------
Models stitch their condition-specific Variables to another node's design
Variables through equality constraints. These functions find the Variable to
stitch to. Each has one defined search order and two failure modes:

    topvar(node, sym)         own Variables only
    resolve(node, sym)        own Variables, then registered references
    find(node, sym)           nearest descendant: the node itself, then its
                              children, grandchildren, ... (breadth first)
    findAll(node, sym)        every match in the subtree, pre-order

• UnresolvedVariableError — nothing matches
• AmbiguousVariableError  — several distinct Variables match at the nearest
                            level and no owner path was given

Every function has an overload taking the owner path, which filters the
candidates to Variables declared by exactly that node.

USAGE EXAMPLES
--------------
    const ModelNode& takeoff = mission.child("Hover");
    Variable p = find(takeoff, "p_{ratio}");            // RotorsAero's p_ratio
    Variable W = find(aircraft, "W", aircraft.child("Battery").path());

===============================================================================
*/

#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"
#include "model.h"
#include "variables.h"

namespace evtol {

    /// @brief Own Variable of @p node (throws UnresolvedVariableError)
    inline const Variable& topvar(const ModelNode& node, std::string_view symbol) {
        return node.topvar(symbol);
    }

    /// @brief Own Variables, then the node's references
    inline const Variable& resolve(const ModelNode& node, std::string_view symbol) {
        return model_detail::resolveSymbol(node.path(), node.variables(), node.references(), symbol, std::nullopt);
    }

    inline const Variable& resolve(const ModelNode& node, std::string_view symbol, const ModelPath& owner) {
        return model_detail::resolveSymbol(node.path(), node.variables(), node.references(), symbol, owner);
    }

    namespace lookup_detail {

        inline const Variable& nearest(const ModelNode& root, std::string_view symbol,
                                       const std::optional<ModelPath>& owner)
        {
            std::vector<const ModelNode*> level{ &root };
            while (!level.empty()) {
                std::vector<const Variable*> hits;
                std::vector<const ModelNode*> next;
                for (const ModelNode* n : level) {
                    if (const Variable* v = n->variables().find(symbol); v && model_detail::ownerMatches(*v, owner)) {
                        hits.push_back(v);
                    }
                    for (const auto& c : n->children()) next.push_back(&c);
                }
                if (hits.size() == 1) {
                    return *hits.front();
                }
                if (hits.size() > 1) {
                    std::string list;
                    for (const Variable* v : hits) list += (list.empty() ? "" : ", ") + v->name();
                    throw AmbiguousVariableError(std::format(
                        "find: '{}' matches {} Variables below '{}' ({}); pass an owner path",
                        symbol, hits.size(), root.path().str(), list));
                }
                level = std::move(next);
            }
            throw UnresolvedVariableError(std::format(
                "find: no '{}' in the subtree of '{}'{}", symbol, root.path().str(),
                owner ? std::format(" under '{}'", owner->str()) : std::string{}));
        }

        inline void collect(const ModelNode& node, std::string_view symbol, std::vector<Variable>& out) {
            if (const Variable* v = node.variables().find(symbol)) out.push_back(*v);
            for (const auto& c : node.children()) collect(c, symbol, out);
        }

    } // namespace lookup_detail

    /**
     * @brief Nearest Variable named @p symbol in the subtree of @p node
     * @throws UnresolvedVariableError, AmbiguousVariableError
     */
    inline const Variable& find(const ModelNode& node, std::string_view symbol) {
        return lookup_detail::nearest(node, symbol, std::nullopt);
    }

    inline const Variable& find(const ModelNode& node, std::string_view symbol, const ModelPath& owner) {
        return lookup_detail::nearest(node, symbol, owner);
    }

    /// @brief Every Variable named @p symbol in the subtree, in pre-order
    inline std::vector<Variable> findAll(const ModelNode& node, std::string_view symbol) {
        std::vector<Variable> out;
        lookup_detail::collect(node, symbol, out);
        return out;
    }

} // namespace evtol

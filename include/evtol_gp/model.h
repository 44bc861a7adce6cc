#pragma once
/*
===============================================================================
MODEL TREE — Immutable model nodes and the builder that produces them
===============================================================================

OVERVIEW
--------
A model is any type that can describe itself to a NodeBuilder: it declares
Variables, adds Constraints, builds child models and registers references to
nodes it borrows Variables from. The builder turns that description into an
immutable ModelNode. Nothing in a finished node is ever mutated; parents only
ever read their children.

    struct Battery {
        static constexpr std::string_view type_name = "Battery";
        double C_m_Wh_per_kg;

        void setup(NodeBuilder& b) const {
            auto C   = b.var("C", "kWh", "Battery capacity");
            auto m   = b.var("m", "kg", "Battery mass");
            auto C_m = b.var("C_m", C_m_Wh_per_kg, "Wh/kg", "Energy density");
            b.add(C == m * C_m);
        }
    };

    ModelNode battery = build(Battery{400});

KEY COMPONENTS
--------------
• Constrainable  — Concept: `type_name` + `void setup(NodeBuilder&) const`
• Reference      — Snapshot of a borrowed node (path, type, Variables)
• ModelNode      — Built node: type, path, Variables, Constraints, children,
                   references
• NodeBuilder    — Mutable build scope handed to setup()
• build()        — Build a root node from a model
• compose()      — Wrap already-built nodes under a new root

INSTANCE PATHS
--------------
A child's path is its parent's path plus one segment. The segment is the
child's type name (or an explicit name); repeated segments under one parent
are numbered: "Hover", "Hover[1]", "Hover[2]". Qualified Variable names
therefore never collide between instances.

CONSTRAINT LABELS
-----------------
Constraints added through NodeBuilder::add are labelled "<path>#<n>" in
order of addition, or "<path>#<label>" when a label is given.

LIFETIME
--------
References returned by NodeBuilder::child() and adopt() stay valid until
finish() is called on that builder; models keep `const ModelNode&` members
only for the duration of their setup().

EXCEPTION SAFETY
----------------
• var(): DuplicateSymbolError, std::invalid_argument (see variables.h)
• resolve(): UnresolvedVariableError, AmbiguousVariableError
• child(): propagates anything the child's setup() throws; the partially
  built parent is discarded by the caller's unwinding

===============================================================================
*/

#include <concepts>
#include <deque>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "constraints.h"
#include "errors.h"
#include "logging.h"
#include "naming.h"
#include "quantity.h"
#include "units.h"
#include "variables.h"

namespace evtol {

    class NodeBuilder;

    /**
     * @concept Constrainable
     * @brief A type that can describe itself to a NodeBuilder
     */
    template<typename M>
    concept Constrainable = requires(const M& m, NodeBuilder& b) {
        { M::type_name } -> std::convertible_to<std::string_view>;
        { m.setup(b) } -> std::same_as<void>;
    };

    /// @brief Snapshot of a node another node borrows Variables from
    struct Reference {
        ModelPath path;
        std::string type;
        std::vector<Variable> variables;
    };

    // ============================================================================
    // MODEL NODE
    // ============================================================================

    /**
     * @class ModelNode
     * @brief Immutable result of building one model
     */
    class ModelNode {
        friend class NodeBuilder;
        friend ModelNode compose(std::string type, std::vector<ModelNode> nodes);

        std::string type_;
        ModelPath path_;
        VariableRegistry vars_;
        ConstraintList constraints_;
        std::vector<ModelNode> children_;
        std::vector<Reference> references_;

        ModelNode(std::string type, ModelPath path)
            : type_(std::move(type)), path_(path), vars_(std::move(path)) {}

    public:
        [[nodiscard]] const std::string& type() const noexcept { return type_; }
        [[nodiscard]] const ModelPath& path() const noexcept { return path_; }
        [[nodiscard]] const VariableRegistry& variables() const noexcept { return vars_; }
        [[nodiscard]] const ConstraintList& constraints() const noexcept { return constraints_; }
        [[nodiscard]] const std::vector<ModelNode>& children() const noexcept { return children_; }
        [[nodiscard]] const std::vector<Reference>& references() const noexcept { return references_; }

        /// @brief Direct child whose last path segment is @p segment, or nullptr
        [[nodiscard]] const ModelNode* findChild(std::string_view segment) const {
            for (const auto& c : children_) {
                if (!c.path_.empty() && c.path_.leaf() == segment) return &c;
            }
            return nullptr;
        }

        /// @throws std::out_of_range if no direct child has that segment
        [[nodiscard]] const ModelNode& child(std::string_view segment) const {
            const ModelNode* c = findChild(segment);
            if (!c) {
                throw std::out_of_range(std::format(
                    "ModelNode::child: '{}' has no child '{}'", path_.str(), segment));
            }
            return *c;
        }

        /// @brief Own Variable by symbol (throws UnresolvedVariableError)
        [[nodiscard]] const Variable& topvar(std::string_view symbol) const {
            return vars_.at(symbol);
        }

        /// @brief Number of nodes in this subtree, this one included
        [[nodiscard]] std::size_t subtreeSize() const {
            std::size_t n = 1;
            for (const auto& c : children_) n += c.subtreeSize();
            return n;
        }
    };

    namespace model_detail {

        inline bool ownerMatches(const Variable& v, const std::optional<ModelPath>& owner) {
            return !owner || v.owner() == *owner;
        }

        /**
         * @brief Resolution order shared by NodeBuilder and lookup.h:
         *        own Variables first, then every registered reference
         */
        inline const Variable& resolveSymbol(const ModelPath& from, const VariableRegistry& own,
                                             const std::vector<Reference>& refs, std::string_view symbol,
                                             const std::optional<ModelPath>& owner)
        {
            if (const Variable* v = own.find(symbol); v && ownerMatches(*v, owner)) {
                return *v;
            }
            const Variable* hit = nullptr;
            std::vector<std::string> candidates;
            for (const auto& ref : refs) {
                for (const auto& v : ref.variables) {
                    if (v.symbol() == symbol && ownerMatches(v, owner)) {
                        if (!hit || hit->key() != v.key()) {
                            candidates.push_back(v.name());
                        }
                        if (!hit) hit = &v;
                    }
                }
            }
            if (!hit) {
                throw UnresolvedVariableError(std::format(
                    "resolve: no '{}' visible from '{}'{}", symbol, from.str(),
                    owner ? std::format(" under '{}'", owner->str()) : std::string{}));
            }
            if (candidates.size() > 1) {
                std::string list;
                for (const auto& c : candidates) list += (list.empty() ? "" : ", ") + c;
                throw AmbiguousVariableError(std::format(
                    "resolve: '{}' is ambiguous from '{}' ({}); pass an owner path", symbol, from.str(), list));
            }
            return *hit;
        }

    } // namespace model_detail

    // ============================================================================
    // NODE BUILDER
    // ============================================================================

    /**
     * @class NodeBuilder
     * @brief Mutable scope in which one model declares its content
     */
    class NodeBuilder {
        ModelNode node_;
        std::deque<ModelNode> children_;
        std::map<std::string, std::size_t, std::less<>> instances_;
        std::size_t nextLabel_ = 0;
        std::set<std::string, std::less<>> labels_;

        std::string nextSegment(std::string_view base) {
            std::size_t& k = instances_[std::string(base)];
            return force_name::instance(base, k++);
        }

    public:
        NodeBuilder(std::string type, ModelPath path)
            : node_(std::move(type), std::move(path)) {}

        NodeBuilder(const NodeBuilder&) = delete;
        NodeBuilder& operator=(const NodeBuilder&) = delete;

        [[nodiscard]] const ModelPath& path() const noexcept { return node_.path_; }
        [[nodiscard]] const std::string& type() const noexcept { return node_.type_; }

        // --------------------------------------------------------------------
        // Variables
        // --------------------------------------------------------------------

        /// @brief Declare a free (decision) Variable
        Variable var(std::string symbol, std::string_view unit, std::string description) {
            return node_.vars_.declare(std::move(symbol), Unit::parse(unit), std::move(description));
        }

        /// @brief Declare a fixed Variable whose value is given in @p unit
        Variable var(std::string symbol, double value, std::string_view unit, std::string description) {
            return node_.vars_.declare(std::move(symbol), Unit::parse(unit), std::move(description), value);
        }

        /**
         * @brief Declare a fixed Variable from a Quantity, converted into @p unit
         * @throws UnitMismatchError if @p value is not compatible with @p unit
         */
        Variable var(std::string symbol, const Quantity& value, std::string_view unit, std::string description) {
            Unit u = Unit::parse(unit);
            double v = value.in(u);
            return node_.vars_.declare(std::move(symbol), std::move(u), std::move(description), v);
        }

        // --------------------------------------------------------------------
        // Constraints
        // --------------------------------------------------------------------

        /// @brief Add @p c labelled "<path>#<n>"; numbers taken by explicit labels are skipped
        void add(const Constraint& c) {
            std::string label = std::to_string(nextLabel_++);
            while (labels_.contains(label)) label = std::to_string(nextLabel_++);
            labels_.insert(label);
            node_.constraints_.push_back(c.withLabel(force_name::format("{}#{}", node_.path_.str(), label)));
        }

        /**
         * @brief Add @p c labelled "<path>#<label>"
         * @throws DuplicateSymbolError if @p label is already used in this node
         */
        void add(const Constraint& c, std::string_view label) {
            if (labels_.contains(label)) {
                throw DuplicateSymbolError(std::format(
                    "NodeBuilder::add: constraint label '{}#{}' is already in use", node_.path_.str(), label));
            }
            ++nextLabel_;
            labels_.insert(std::string(label));
            node_.constraints_.push_back(c.withLabel(force_name::format("{}#{}", node_.path_.str(), label)));
        }

        void add(const ConstraintList& list) {
            for (const auto& c : list) add(c);
        }

        // --------------------------------------------------------------------
        // Children and references
        // --------------------------------------------------------------------

        /**
         * @brief Build @p model as a child of this node
         * @param model Child model
         * @param name  Segment base replacing the type name (e.g. "Takeoff")
         * @return The built child, valid until finish()
         */
        template<Constrainable M>
        const ModelNode& child(const M& model, std::optional<std::string> name = std::nullopt) {
            std::string segment = nextSegment(name ? std::string_view(*name) : std::string_view(M::type_name));
            NodeBuilder sub(std::string(M::type_name), node_.path_.child(segment));
            model.setup(sub);
            children_.push_back(std::move(sub).finish());
            return children_.back();
        }

        /// @brief Attach an already-built node as a child, keeping its path
        const ModelNode& adopt(ModelNode node) {
            children_.push_back(std::move(node));
            return children_.back();
        }

        /// @brief Register @p other as a source of borrowed Variables for resolve()
        void reference(const ModelNode& other) {
            node_.references_.push_back(Reference{ other.path(), other.type(), other.variables().all() });
        }

        // --------------------------------------------------------------------
        // Lookup
        // --------------------------------------------------------------------

        /// @brief Own Variable by symbol (throws UnresolvedVariableError)
        [[nodiscard]] const Variable& topvar(std::string_view symbol) const {
            return node_.vars_.at(symbol);
        }

        /// @brief Own Variables first, then referenced nodes' Variables
        [[nodiscard]] const Variable& resolve(std::string_view symbol) const {
            return model_detail::resolveSymbol(node_.path_, node_.vars_, node_.references_, symbol, std::nullopt);
        }

        /// @brief resolve() restricted to Variables owned by @p owner
        [[nodiscard]] const Variable& resolve(std::string_view symbol, const ModelPath& owner) const {
            return model_detail::resolveSymbol(node_.path_, node_.vars_, node_.references_, symbol, owner);
        }

        // --------------------------------------------------------------------
        // Completion
        // --------------------------------------------------------------------

        /// @brief Hand over the finished node; the builder is spent afterwards
        ModelNode finish() && {
            node_.children_.reserve(children_.size());
            for (auto& c : children_) node_.children_.push_back(std::move(c));
            children_.clear();
            logger()->debug("built {} '{}': {} variables, {} constraints, {} children",
                node_.type_, node_.path_.str(), node_.vars_.size(), node_.constraints_.size(),
                node_.children_.size());
            return std::move(node_);
        }
    };

    // ============================================================================
    // ROOT CONSTRUCTION
    // ============================================================================

    /**
     * @brief Build @p model as a root node
     * @param name Root segment; defaults to the model's type name
     */
    template<Constrainable M>
    ModelNode build(const M& model, std::optional<std::string> name = std::nullopt) {
        std::string segment = name ? *name : std::string(M::type_name);
        NodeBuilder b(std::string(M::type_name), ModelPath{}.child(segment));
        model.setup(b);
        return std::move(b).finish();
    }

    /**
     * @brief Wrap already-built nodes under a new root without re-pathing them
     *
     * @details Used to combine independently built trees (a vehicle and the
     *          missions flown with it) into one problem.
     */
    inline ModelNode compose(std::string type, std::vector<ModelNode> nodes) {
        ModelPath path = ModelPath{}.child(type);
        ModelNode root(std::move(type), std::move(path));
        root.children_ = std::move(nodes);
        return root;
    }

} // namespace evtol

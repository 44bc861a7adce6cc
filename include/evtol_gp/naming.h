#pragma once
/*
===============================================================================
NAMING SYSTEM — Model paths, qualified Variable names and solver-side labels
===============================================================================

OVERVIEW
--------
Every Variable in a composed problem is identified by the path of the Model
node that owns it plus its local symbol. This header defines those two
building blocks and the string helpers used to print them:

    Study/OnDemandSizingMission/Hover[2]/RotorsAero::T/A
    \__________________ path ________________/  \sym/

KEY COMPONENTS
--------------
• ModelPath       — Ordered node segments joined by '/'
• QualifiedName   — (ModelPath, symbol) pair, globally unique per Variable
• make_name::     — Debug-aware labels for solver rows/columns (empty in release)
• force_name::    — Always-on labels (instance segments, diagnostics)
• naming_detail:: — Validation and string-building internals

NAMING RULES
------------
• Path segments are non-empty and contain neither '/' nor ':'.
• Symbols are non-empty and contain no ':'. They may contain '/', '{', '}'
  and '\' ("T/A", "W_{mission}", "\eta").
• A node type instantiated several times under one parent receives the
  segments "Hover", "Hover[1]", "Hover[2]", ... (see force_name::instance).
• The printed form of a qualified name is "<path>::<symbol>"; since neither
  part can contain ':' except the separator, the printed form is unique and
  can be parsed back with QualifiedName::parse.

BUILD CONFIGURATION
-------------------
EVTOL_DEBUG (or _DEBUG) turns on human-readable names for the Gurobi columns
and rows the solver adapter creates. Qualified Variable names are independent
of the switch: the modeling layer always needs them.

EXCEPTION SAFETY
----------------
• Invalid segments or symbols throw std::invalid_argument
• QualifiedName::parse throws std::invalid_argument on malformed input
• make_name::: No-throw guarantee when naming_disabled()

===============================================================================
*/

#include <string>
#include <string_view>
#include <sstream>
#include <stdexcept>
#include <concepts>
#include <ostream>
#include <utility>
#include <format>
#include <vector>
#include <compare>
#include <functional>

// ============================================================================
// BUILD CONFIGURATION
// ============================================================================
#if defined(EVTOL_DEBUG) || defined(_DEBUG)
inline constexpr bool EVTOL_DEBUG_NAMES = true;
#else
inline constexpr bool EVTOL_DEBUG_NAMES = false;
#endif

namespace evtol {

    /// @brief Returns true if solver-side debug naming is enabled
    [[nodiscard]] constexpr bool naming_enabled() noexcept {
        return EVTOL_DEBUG_NAMES;
    }

    /// @brief Returns true if solver-side debug naming is disabled
    [[nodiscard]] constexpr bool naming_disabled() noexcept {
        return !EVTOL_DEBUG_NAMES;
    }

    // ------------------------------------------------------------------------
    // Internal implementation details
    // ------------------------------------------------------------------------
    namespace naming_detail {

        /**
         * @concept Streamable
         * @brief True if type can be written to std::ostream via operator<<
         */
        template<typename T>
        concept Streamable = requires(std::ostream & os, T && value) {
            { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
        };

        inline constexpr std::string_view kPathSeparator = "/";
        inline constexpr std::string_view kSymbolSeparator = "::";

        inline void check_segment(std::string_view segment) {
            if (segment.empty()) {
                throw std::invalid_argument("ModelPath: empty path segment");
            }
            if (segment.find_first_of("/:") != std::string_view::npos) {
                throw std::invalid_argument(
                    std::format("ModelPath: segment '{}' contains '/' or ':'", segment));
            }
        }

        inline void check_symbol(std::string_view symbol) {
            if (symbol.empty()) {
                throw std::invalid_argument("QualifiedName: empty symbol");
            }
            if (symbol.find(':') != std::string_view::npos) {
                throw std::invalid_argument(
                    std::format("QualifiedName: symbol '{}' contains ':'", symbol));
            }
        }

        template<typename... Args>
        inline std::string concat_impl(Args&&... parts) {
            static_assert((Streamable<Args> && ...),
                "naming: all concat() arguments must be streamable via operator<<");
            std::ostringstream oss;
            ((oss << std::forward<Args>(parts)), ...);
            return oss.str();
        }

        // "Hover" for the first instance, "Hover[k]" afterwards
        inline std::string instance_impl(std::string_view base, std::size_t k) {
            check_segment(base);
            if (k == 0) {
                return std::string(base);
            }
            std::string result;
            result.reserve(base.size() + 6);
            result.append(base).append("[").append(std::to_string(k)).append("]");
            return result;
        }

    } // namespace naming_detail

    // ============================================================================
    // MODEL PATH
    // ============================================================================
    /**
     * @class ModelPath
     * @brief Position of a Model node in the composed tree
     *
     * @details A value type holding the ordered segments from the root node to
     *          the node itself. The empty path denotes "no owner" and is only
     *          used for free-standing test Variables.
     *
     * @example
     *     ModelPath p = ModelPath{}.child("Study").child("Aircraft");
     *     p.str();                          // "Study/Aircraft"
     *     p.child("Battery").depth();       // 3
     *     ModelPath::parse("Study/Aircraft") == p;  // true
     */
    class ModelPath {
        std::vector<std::string> segments_;

    public:
        ModelPath() = default;

        /// @throws std::invalid_argument if any segment is malformed
        explicit ModelPath(std::vector<std::string> segments)
            : segments_(std::move(segments)) {
            for (const auto& s : segments_) {
                naming_detail::check_segment(s);
            }
        }

        /// @brief Parse "A/B[1]/C"; the empty string yields the empty path
        static ModelPath parse(std::string_view text) {
            std::vector<std::string> segments;
            if (text.empty()) {
                return ModelPath{};
            }
            std::size_t start = 0;
            while (true) {
                std::size_t pos = text.find('/', start);
                segments.emplace_back(text.substr(start, pos - start));
                if (pos == std::string_view::npos) break;
                start = pos + 1;
            }
            return ModelPath(std::move(segments));
        }

        /// @brief Path of a child node with the given segment
        [[nodiscard]] ModelPath child(std::string_view segment) const {
            naming_detail::check_segment(segment);
            ModelPath p = *this;
            p.segments_.emplace_back(segment);
            return p;
        }

        /// @brief Path of the parent node (empty path stays empty)
        [[nodiscard]] ModelPath parent() const {
            ModelPath p = *this;
            if (!p.segments_.empty()) {
                p.segments_.pop_back();
            }
            return p;
        }

        [[nodiscard]] const std::vector<std::string>& segments() const noexcept { return segments_; }
        [[nodiscard]] std::size_t depth() const noexcept { return segments_.size(); }
        [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }

        /// @throws std::out_of_range on the empty path
        [[nodiscard]] const std::string& leaf() const {
            if (segments_.empty()) {
                throw std::out_of_range("ModelPath::leaf: empty path");
            }
            return segments_.back();
        }

        /// @brief True if this path equals @p other or is one of its ancestors
        [[nodiscard]] bool isPrefixOf(const ModelPath& other) const noexcept {
            if (segments_.size() > other.segments_.size()) return false;
            for (std::size_t i = 0; i < segments_.size(); ++i) {
                if (segments_[i] != other.segments_[i]) return false;
            }
            return true;
        }

        [[nodiscard]] std::string str() const {
            std::string out;
            for (std::size_t i = 0; i < segments_.size(); ++i) {
                if (i > 0) out.append(naming_detail::kPathSeparator);
                out.append(segments_[i]);
            }
            return out;
        }

        friend bool operator==(const ModelPath&, const ModelPath&) = default;
        friend auto operator<=>(const ModelPath&, const ModelPath&) = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const ModelPath& p) {
        return os << p.str();
    }

    // ============================================================================
    // QUALIFIED NAME
    // ============================================================================
    /**
     * @struct QualifiedName
     * @brief Globally unique identity of a Variable: owner path + local symbol
     *
     * @example
     *     QualifiedName q{ModelPath::parse("Study/Aircraft/Battery"), "C_{eff}"};
     *     q.str();   // "Study/Aircraft/Battery::C_{eff}"
     */
    struct QualifiedName {
        ModelPath owner;
        std::string symbol;

        [[nodiscard]] std::string str() const {
            if (owner.empty()) {
                return symbol;
            }
            std::string out = owner.str();
            out.append(naming_detail::kSymbolSeparator).append(symbol);
            return out;
        }

        /**
         * @brief Parse the printed form back into (path, symbol)
         * @throws std::invalid_argument if the symbol part is empty or malformed
         */
        static QualifiedName parse(std::string_view text) {
            std::size_t pos = text.find(naming_detail::kSymbolSeparator);
            if (pos == std::string_view::npos) {
                naming_detail::check_symbol(text);
                return QualifiedName{ModelPath{}, std::string(text)};
            }
            std::string_view symbol = text.substr(pos + naming_detail::kSymbolSeparator.size());
            naming_detail::check_symbol(symbol);
            return QualifiedName{ModelPath::parse(text.substr(0, pos)), std::string(symbol)};
        }

        friend bool operator==(const QualifiedName&, const QualifiedName&) = default;
        friend auto operator<=>(const QualifiedName&, const QualifiedName&) = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const QualifiedName& q) {
        return os << q.str();
    }

    /// @brief Hash functor for unordered containers keyed by QualifiedName
    struct QualifiedNameHash {
        std::size_t operator()(const QualifiedName& q) const {
            return std::hash<std::string>{}(q.str());
        }
    };

    // ============================================================================
    // make_name IMPLEMENTATION
    // ============================================================================
    namespace make_name {

        template<typename... Args>
        inline std::string concat(Args&&... parts) {
            if (naming_disabled()) {
                return {};
            }
            return naming_detail::concat_impl(std::forward<Args>(parts)...);
        }

        template<typename... Args>
        inline std::string format(std::format_string<Args...> fmt, Args&&... args) {
            if (naming_disabled()) {
                return {};
            }
            return std::format(fmt, std::forward<Args>(args)...);
        }

    } // namespace make_name

    // ============================================================================
    // force_name IMPLEMENTATION
    // ============================================================================
    namespace force_name {

        template<typename... Args>
        inline std::string concat(Args&&... parts) {
            return naming_detail::concat_impl(std::forward<Args>(parts)...);
        }

        /// @brief Instance segment: "Hover" for k == 0, "Hover[k]" otherwise
        inline std::string instance(std::string_view base, std::size_t k) {
            return naming_detail::instance_impl(base, k);
        }

        template<typename... Args>
        inline std::string format(std::format_string<Args...> fmt, Args&&... args) {
            return std::format(fmt, std::forward<Args>(args)...);
        }

    } // namespace force_name

} // namespace evtol

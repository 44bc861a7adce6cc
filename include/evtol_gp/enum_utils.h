#pragma once
/*
===============================================================================
ENUM UTILS — Enumerations with a COUNT sentinel and name tables
===============================================================================

OVERVIEW
--------
Study options that select between model variants (the reserve policy, the
solver presets) are strongly typed enumerations declared with
DECLARE_ENUM_WITH_COUNT. The COUNT sentinel gives the number of enumerators
at compile time, which in turn sizes the name tables used to print and parse
them.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT  — enum class + <Name>_COUNT constant
• EnumArray                — Fixed array indexed by an enum
• enum_size / enum_values  — Compile-time size and enumerator list
• is_valid_enum_value      — Range check excluding COUNT
• enum_from_value          — Checked integral -> enum conversion
• enum_name / enum_parse   — Lookups against a caller-supplied name table

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Reserve, Duration, Distance);

    constexpr EnumArray<Reserve, std::string_view> names = { "Duration", "Distance" };
    enum_name(Reserve::Distance, names);               // "Distance"
    enum_parse<Reserve>("Duration", names);            // Reserve::Duration (optional)

    for (Reserve r : enum_values<Reserve>()) { ... }

EXCEPTION SAFETY
----------------
• enum_from_value throws std::out_of_range for values >= COUNT
• All other utilities are no-throw

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <optional>
#include <stdexcept>
#include <string_view>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT enumerator and a
 *        matching `<Name>_COUNT` constant
 *
 * @example
 *     DECLARE_ENUM_WITH_COUNT(ReservePolicy, FixedDuration, FixedDistance);
 *     // enum class ReservePolicy { FixedDuration, FixedDistance, COUNT };
 *     // static constexpr std::size_t ReservePolicy_COUNT = 2;
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace evtol {

    /// @brief Number of enumerators, COUNT excluded
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    /// @brief std::array indexed by the enumerators of @p Enum
    template<typename Enum, typename T>
    using EnumArray = std::array<T, enum_size<Enum>::value>;

    template<typename Enum>
    constexpr bool is_valid_enum_value(Enum value) noexcept {
        return static_cast<std::size_t>(value) < enum_size<Enum>::value;
    }

    /**
     * @brief Checked conversion from an index
     * @throws std::out_of_range if @p value is not a user enumerator
     */
    template<typename Enum>
    constexpr Enum enum_from_value(std::size_t value) {
        if (value >= enum_size<Enum>::value) {
            throw std::out_of_range(std::format(
                "enum_from_value: {} is out of range (size {})", value, enum_size<Enum>::value));
        }
        return static_cast<Enum>(value);
    }

    /// @brief Every user enumerator, in declaration order
    template<typename Enum>
    constexpr EnumArray<Enum, Enum> enum_values() noexcept {
        EnumArray<Enum, Enum> out{};
        for (std::size_t i = 0; i < out.size(); ++i) out[i] = static_cast<Enum>(i);
        return out;
    }

    /// @brief Name of @p value in @p names ("" for COUNT)
    template<typename Enum>
    constexpr std::string_view enum_name(Enum value, const EnumArray<Enum, std::string_view>& names) noexcept {
        return is_valid_enum_value(value) ? names[static_cast<std::size_t>(value)] : std::string_view{};
    }

    /// @brief Enumerator whose entry in @p names equals @p text
    template<typename Enum>
    constexpr std::optional<Enum> enum_parse(std::string_view text,
                                             const EnumArray<Enum, std::string_view>& names) noexcept {
        for (std::size_t i = 0; i < names.size(); ++i) {
            if (names[i] == text) return static_cast<Enum>(i);
        }
        return std::nullopt;
    }

} // namespace evtol

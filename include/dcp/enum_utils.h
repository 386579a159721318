#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for the DCP DSL
===============================================================================

OVERVIEW
--------
Declares strongly-typed enumerations with a COUNT sentinel and a matching size
constant, plus name tables indexed by enumerator. The lattice values
(Curvature, Sign), the node kind tag and the constraint kind are all declared
through these helpers so that every table keyed by them has its size checked
at compile time.

KEY COMPONENTS
--------------
• DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• EnumArray<Enum, T>: std::array sized by the enumerator count
• enum_size<Enum>: size trait
• is_valid_enum_value(): bounds check against COUNT
• enum_name(): lookup in a name table, "INVALID" for out-of-range values

USAGE EXAMPLES
--------------
    DECLARE_ENUM_WITH_COUNT(Curvature, Constant, Affine, Convex, Concave, Unknown);

    inline constexpr dcp::EnumArray<Curvature, std::string_view> CURVATURE_NAMES = {
        "CONSTANT", "AFFINE", "CONVEX", "CONCAVE", "UNKNOWN"
    };

    std::string_view s = dcp::enum_name(Curvature::Convex, CURVATURE_NAMES);

DEPENDENCIES
------------
• <array>, <cstddef>, <string_view>

THREAD SAFETY
-------------
• Compile-time constants only; no mutable state

EXCEPTION SAFETY
----------------
• No-throw guarantee for all helpers

===============================================================================
*/

#include <array>
#include <cstddef>
#include <string_view>

/**
 * @macro DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel
 *
 * @param Name The name of the enumeration type
 * @param ...  Enumerator identifiers (at least one)
 *
 * @details Expands to:
 *          1. enum class Name { ..., COUNT };
 *          2. static constexpr std::size_t Name##_COUNT
 *
 * @warning Do not list COUNT yourself; values are sequential from 0.
 */
#define DECLARE_ENUM_WITH_COUNT(Name, ...)                                \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace dcp {

    /**
     * @brief Fixed-size array indexed by the enumerators of Enum
     *
     * @tparam Enum Enumeration declared with DECLARE_ENUM_WITH_COUNT
     * @tparam T    Element type
     */
    template<typename Enum, typename T>
    using EnumArray = std::array<T, static_cast<std::size_t>(Enum::COUNT)>;

    /**
     * @brief Number of meaningful enumerators (COUNT excluded)
     *
     * @note Specialize for enumerations that do not use the COUNT convention.
     */
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief True if value is a user-declared enumerator (not COUNT, not out of range)
    template<typename Enum>
    [[nodiscard]] constexpr bool is_valid_enum_value(Enum value) noexcept {
        const auto ival = static_cast<std::size_t>(value);
        return ival < enum_size_v<Enum>;
    }

    /**
     * @brief Looks up the printable name of an enumerator
     *
     * @param value Enumerator to name
     * @param names Table with one entry per enumerator, in declaration order
     * @return names[value], or "INVALID" for COUNT and out-of-range values
     *
     * @noexcept
     */
    template<typename Enum>
    [[nodiscard]] constexpr std::string_view enum_name(
        Enum value, const EnumArray<Enum, std::string_view>& names) noexcept
    {
        if (!is_valid_enum_value(value)) {
            return "INVALID";
        }
        return names[static_cast<std::size_t>(value)];
    }

} // namespace dcp

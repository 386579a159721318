#pragma once
/*
===============================================================================
CURVATURE & SIGN LATTICE — Classification values and DCP composition rules
===============================================================================

OVERVIEW
--------
Curvature and sign are finite lattices:

    CONSTANT ⊂ AFFINE ⊂ {CONVEX, CONCAVE} ⊂ UNKNOWN
    ZERO = POSITIVE ∧ NEGATIVE,  UNKNOWN when neither is provable

A node never stores its curvature or sign. It exposes five structural
predicates, gathered here in a Classification record, and curvature/sign are
derived from them by a fixed priority order. Composite nodes combine the
classifications of their operands with the general DCP composition rule:

    f(g_1, ..., g_k) is convex if f is constant, or f is convex and each g_i is
        affine, or
        convex  where f is increasing in argument i, or
        concave where f is decreasing in argument i.

    (concave symmetrically)

KEY COMPONENTS
--------------
• Curvature, Sign           — enumerations with printable names
• Classification            — hasVariables / convex / concave / positive / negative
• Monotonicity              — how an atom responds to one argument
• composesConvex(), composesConcave() — the per-argument DCP test
• sumSign(), productSign(), negatedSign() — sign propagation

THREAD SAFETY
-------------
• Pure functions over values; no shared state

===============================================================================
*/

#include <span>
#include <string_view>

#include "enum_utils.h"

namespace dcp {

    DECLARE_ENUM_WITH_COUNT(Curvature, Constant, Affine, Convex, Concave, Unknown);
    DECLARE_ENUM_WITH_COUNT(Sign, Zero, Positive, Negative, Unknown);

    inline constexpr EnumArray<Curvature, std::string_view> CURVATURE_NAMES = {
        "CONSTANT", "AFFINE", "CONVEX", "CONCAVE", "UNKNOWN"
    };

    inline constexpr EnumArray<Sign, std::string_view> SIGN_NAMES = {
        "ZERO", "POSITIVE", "NEGATIVE", "UNKNOWN"
    };

    [[nodiscard]] constexpr std::string_view to_string(Curvature c) noexcept {
        return enum_name(c, CURVATURE_NAMES);
    }

    [[nodiscard]] constexpr std::string_view to_string(Sign s) noexcept {
        return enum_name(s, SIGN_NAMES);
    }

    // ========================================================================
    // CLASSIFICATION
    // ========================================================================

    /**
     * @struct Classification
     * @brief Structural predicates of one node
     *
     * @details convex and concave already include the "constant implies both"
     *          rule, so isConvex() of any constant node is true.
     *          positive means provably >= 0, negative provably <= 0.
     */
    struct Classification {
        bool hasVariables = false;
        bool convex = false;
        bool concave = false;
        bool positive = false;
        bool negative = false;

        [[nodiscard]] constexpr bool isZero() const noexcept { return positive && negative; }

        /// No free variables, or identically zero
        [[nodiscard]] constexpr bool isConstant() const noexcept {
            return !hasVariables || isZero();
        }

        [[nodiscard]] constexpr bool isAffine() const noexcept {
            return isConstant() || (convex && concave);
        }

        [[nodiscard]] constexpr bool isDcp() const noexcept { return convex || concave; }

        [[nodiscard]] constexpr Curvature curvature() const noexcept {
            if (isConstant()) return Curvature::Constant;
            if (isAffine())   return Curvature::Affine;
            if (convex)       return Curvature::Convex;
            if (concave)      return Curvature::Concave;
            return Curvature::Unknown;
        }

        [[nodiscard]] constexpr Sign sign() const noexcept {
            if (isZero())  return Sign::Zero;
            if (positive)  return Sign::Positive;
            if (negative)  return Sign::Negative;
            return Sign::Unknown;
        }
    };

    /**
     * @struct Monotonicity
     * @brief Response of an atom to one of its arguments
     *
     * @note Both flags set means the atom does not depend on the argument.
     */
    struct Monotonicity {
        bool increasing = false;
        bool decreasing = false;

        static constexpr Monotonicity increasingIn() noexcept { return { true, false }; }
        static constexpr Monotonicity decreasingIn() noexcept { return { false, true }; }
        static constexpr Monotonicity independentOf() noexcept { return { true, true }; }
        static constexpr Monotonicity none() noexcept { return { false, false }; }
    };

    /// @brief Sign pair produced by sign propagation (positive, negative)
    struct SignBounds {
        bool positive = false;
        bool negative = false;
    };

    // ========================================================================
    // COMPOSITION
    // ========================================================================

    /// @brief Argument keeps a convex atom convex
    [[nodiscard]] constexpr bool composesConvex(const Classification& arg, Monotonicity m) noexcept {
        return arg.isAffine()
            || (arg.convex && m.increasing)
            || (arg.concave && m.decreasing);
    }

    /// @brief Argument keeps a concave atom concave
    [[nodiscard]] constexpr bool composesConcave(const Classification& arg, Monotonicity m) noexcept {
        return arg.isAffine()
            || (arg.concave && m.increasing)
            || (arg.convex && m.decreasing);
    }

    /// @brief Monotonicity of scaling by a constant of the given sign
    [[nodiscard]] constexpr Monotonicity scaledBy(const Classification& coefficient) noexcept {
        return { coefficient.positive, coefficient.negative };
    }

    /// @brief Sign of a sum: positive iff every term is, negative iff every term is
    [[nodiscard]] constexpr SignBounds sumSign(std::span<const Classification> terms) noexcept {
        SignBounds s{ true, true };
        for (const auto& t : terms) {
            s.positive = s.positive && t.positive;
            s.negative = s.negative && t.negative;
        }
        return s;
    }

    /// @brief Sign of a product; a zero factor makes the product zero
    [[nodiscard]] constexpr SignBounds productSign(const Classification& a,
                                                   const Classification& b) noexcept {
        if (a.isZero() || b.isZero()) {
            return { true, true };
        }
        return {
            (a.positive && b.positive) || (a.negative && b.negative),
            (a.positive && b.negative) || (a.negative && b.positive)
        };
    }

    [[nodiscard]] constexpr SignBounds negatedSign(const Classification& a) noexcept {
        return { a.negative, a.positive };
    }

} // namespace dcp

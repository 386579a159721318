#pragma once
/*
===============================================================================
CONFIG — Build-time switches for the DCP DSL
===============================================================================

OVERVIEW
--------
All configuration is resolved by the preprocessor; there is no runtime
settings object and no global mutable state.

    DCP_STRICT_SHAPES      Disable the legacy transpose of 1-D constant arrays
                           in multiply() (see composition.h)
    DCP_FEASIBILITY_TOL    Tolerance used by Constraint::value() and
                           Constraint::violation() (default 1e-6)
    DCP_DEBUG / _DEBUG     Diagnostics reports include node ids

USAGE EXAMPLES
--------------
    // CMake
    target_compile_definitions(my_app PRIVATE DCP_STRICT_SHAPES)

    // Source
    if constexpr (dcp::legacy_vector_transpose()) { ... }

===============================================================================
*/

namespace dcp {

#if defined(DCP_STRICT_SHAPES)
    inline constexpr bool LEGACY_VECTOR_TRANSPOSE = false;
#else
    inline constexpr bool LEGACY_VECTOR_TRANSPOSE = true;
#endif

#if defined(DCP_FEASIBILITY_TOL)
    inline constexpr double FEASIBILITY_TOL = DCP_FEASIBILITY_TOL;
#else
    inline constexpr double FEASIBILITY_TOL = 1e-6;
#endif

#if defined(DCP_DEBUG) || defined(_DEBUG)
    inline constexpr bool DEBUG_REPORTS = true;
#else
    inline constexpr bool DEBUG_REPORTS = false;
#endif

    /// @brief True when 1-D constant arrays are transposed to fit a product
    [[nodiscard]] constexpr bool legacy_vector_transpose() noexcept {
        return LEGACY_VECTOR_TRANSPOSE;
    }

    /// @brief True when diagnostics include node ids
    [[nodiscard]] constexpr bool debug_reports() noexcept {
        return DEBUG_REPORTS;
    }

} // namespace dcp

#pragma once
/*
===============================================================================
DCP C++ DSL — Unified Include Header
===============================================================================

OVERVIEW
--------
Single-include header for the DCP expression DSL. Including this file gives
access to every component needed to build expression graphs from ordinary
C++ arithmetic and to check them against the rules of Disciplined Convex
Programming.

WHAT'S INCLUDED
---------------
• config.h       — Build-time switches (DCP_STRICT_SHAPES, ...)
• enum_utils.h   — Compile-time enum helpers (DECLARE_ENUM_WITH_COUNT)
• shape.h        — Shapes, broadcast and product rules, DimensionMismatch
• errors.h       — DisciplineViolation
• curvature.h    — Curvature / sign lattice and the DCP composition rule
• value.h        — Eigen value domain and Jacobian building blocks
• naming.h       — Printable names
• indexing.h     — Slices, index lists, boolean masks
• expression.h   — Expression nodes, Constraint, Variable/Parameter/Constant
• composition.h  — add, multiply, divide, power, transpose, index, ...
• casting.h      — castToConst for literals
• constraints.h  — equals, leq, geq, psd, ...
• operators.h    — + - * / == <= >= < > >> << sugar
• diagnostics.h  — describe, statistics, DCP violation reports

QUICK START
-----------
    #include <dcp/dcp.h>
    #include <iostream>

    int main() {
        dcp::Variable x(3, 1, "x");
        Eigen::MatrixXd A = Eigen::MatrixXd::Identity(3, 3);

        auto residual = dcp::Constant(A) * x - 1.0;
        auto objective = dcp::power(residual(0, 0), 2);

        std::cout << objective << "\n";                  // power((... * x + -1)[0, 0], 2)
        std::cout << dcp::describe(objective) << "\n";   // Expression(CONVEX, POSITIVE, (1, 1))

        auto c = x >= 0;
        std::cout << c << " dcp=" << c.isDcp() << "\n";
        return 0;
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) with <format>
• Eigen 3.4

NAMESPACE
---------
All components live in `dcp::`. Node payloads and helpers sit in
`dcp::detail` and are not part of the interface.

CONFIGURATION
-------------
• DCP_STRICT_SHAPES: never transpose 1-D constants inside multiply()
• DCP_FEASIBILITY_TOL: tolerance of Constraint::value() (default 1e-6)
• DCP_DEBUG or _DEBUG: diagnostics summaries include node ids

===============================================================================
*/

// ============================================================================
// FOUNDATIONS (no dependencies on the expression graph)
// ============================================================================

#include "config.h"
#include "enum_utils.h"
#include "shape.h"
#include "errors.h"
#include "curvature.h"
#include "value.h"
#include "naming.h"
#include "indexing.h"

// ============================================================================
// EXPRESSION GRAPH
// ============================================================================

// Nodes, constraints and leaves (pulls in composition.h)
#include "expression.h"
#include "composition.h"

// Literal promotion and constraint construction
#include "casting.h"
#include "constraints.h"

// Operator sugar (depends on all of the above)
#include "operators.h"

// ============================================================================
// ANALYSIS
// ============================================================================

#include "diagnostics.h"

/**
 * @namespace dcp
 * @brief Main namespace for all DSL components
 *
 * Core types:
 * - dcp::Expression, dcp::Variable, dcp::Parameter, dcp::Constant
 * - dcp::Constraint, dcp::ConstraintKind
 * - dcp::Shape, dcp::Curvature, dcp::Sign, dcp::Classification
 * - dcp::Slice, dcp::IndexList, dcp::BoolMask, dcp::Key, dcp::Mask
 * - dcp::DisciplineViolation, dcp::DimensionMismatch
 *
 * Free functions:
 * - dcp::add(), dcp::subtract(), dcp::negate(), dcp::multiply(), dcp::divide()
 * - dcp::power(), dcp::transpose(), dcp::index(), dcp::specialIndex()
 * - dcp::castToConst()
 * - dcp::equals(), dcp::leq(), dcp::geq(), dcp::lt(), dcp::gt(), dcp::psd(), dcp::nsd()
 * - dcp::structurallyEqual()
 * - dcp::describe(), dcp::computeStatistics(), dcp::findViolations()
 * - dcp::checkConstraints(), dcp::expressionSummary()
 */

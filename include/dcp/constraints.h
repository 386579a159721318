#pragma once
/*
===============================================================================
CONSTRAINT BUILDER — Equality, inequality and semidefinite relations
===============================================================================

OVERVIEW
--------
Comparison operators end composition: instead of a node they return a
Constraint referencing both operands. The builders below are the only
functions that create constraints; the operators in operators.h wrap them
after casting literals with castToConst().

    equals(a, b)    a == b            Equality(a, b)
    leq(a, b)       a <= b            Inequality(a, b)
    geq(a, b)       a >= b            Inequality(b, a)
    lt(a, b)        a <  b            same as leq (no strict semantics)
    gt(a, b)        a >  b            same as geq
    psd(a, b)       a >> b            PositiveSemidefinite(a, b): a - b is PSD
    nsd(a, b)       a << b            PositiveSemidefinite(b, a)

No curvature requirement is imposed here; Constraint::isDcp() reports it.

USAGE EXAMPLES
--------------
    auto c1 = dcp::leq(x, dcp::Constant(3.0));   // x <= 3
    auto c2 = dcp::psd(X, dcp::Constant(Eigen::MatrixXd::Zero(2, 2)));

    c1.kind();         // ConstraintKind::Inequality
    c1.rhs().value();  // 3

EXCEPTION SAFETY
----------------
• equals / leq / geq / lt / gt throw DimensionMismatch if the shapes do not
  broadcast; the message names the builder and lists the shapes in the
  order they were passed
• psd / nsd throw DimensionMismatch unless both sides are square with equal
  shapes

===============================================================================
*/

#include "expression.h"

namespace dcp {

    [[nodiscard]] inline Constraint equals(const Expression& a, const Expression& b) {
        return Constraint(ConstraintKind::Equality, a, b);
    }

    [[nodiscard]] inline Constraint leq(const Expression& a, const Expression& b) {
        return Constraint(ConstraintKind::Inequality, a, b);
    }

    /// @brief b <= a; shape errors are reported as geq(a, b)
    [[nodiscard]] inline Constraint geq(const Expression& a, const Expression& b) {
        detail::requireConstraintShapes(ConstraintKind::Inequality, "geq", a, b);
        return Constraint(ConstraintKind::Inequality, b, a);
    }

    /// @brief Alias of leq(); strict inequalities are not distinguished
    [[nodiscard]] inline Constraint lt(const Expression& a, const Expression& b) {
        detail::requireConstraintShapes(ConstraintKind::Inequality, "lt", a, b);
        return Constraint(ConstraintKind::Inequality, a, b);
    }

    /// @brief Alias of geq()
    [[nodiscard]] inline Constraint gt(const Expression& a, const Expression& b) {
        detail::requireConstraintShapes(ConstraintKind::Inequality, "gt", a, b);
        return Constraint(ConstraintKind::Inequality, b, a);
    }

    /**
     * @brief a - b is positive semidefinite
     * @throws DimensionMismatch unless a and b are square with equal shapes
     */
    [[nodiscard]] inline Constraint psd(const Expression& a, const Expression& b) {
        return Constraint(ConstraintKind::PositiveSemidefinite, a, b);
    }

    /// @brief b - a is positive semidefinite
    [[nodiscard]] inline Constraint nsd(const Expression& a, const Expression& b) {
        detail::requireConstraintShapes(ConstraintKind::PositiveSemidefinite, "nsd", a, b);
        return Constraint(ConstraintKind::PositiveSemidefinite, b, a);
    }

} // namespace dcp

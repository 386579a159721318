#pragma once
/*
===============================================================================
OPERATORS — Arithmetic and comparison syntax over expressions
===============================================================================

OVERVIEW
--------
Operator sugar over the named functions of composition.h and
constraints.h. Each binary operator requires at least one operand to be an
Expression and casts both with castToConst(), so literals may appear on
either side:

    a + b   add          a == b  equals        a >> b  psd
    a - b   subtract     a <= b  leq           a << b  nsd
    a * b   multiply     a >= b  geq
    a / b   divide       a <  b  lt
    -a      negate       a >  b  gt

Reflected forms keep the written order: 3 <= x is leq(3, x), 3 == x is
equals(3, x).

USAGE EXAMPLES
--------------
    dcp::Variable x(3);
    auto e = 2 * x - 1;
    auto c = e <= 5;
    auto p = X >> Eigen::MatrixXd::Zero(3, 3);

===============================================================================
*/

#include "casting.h"
#include "composition.h"
#include "constraints.h"
#include "expression.h"

namespace dcp {

    /// @brief Two castable operands, at least one of them an expression
    template<typename L, typename R>
    concept ExpressionOperands = Castable<L> && Castable<R>
        && (ExpressionLike<L> || ExpressionLike<R>);

    inline Expression operator-(const Expression& a) {
        return negate(a);
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Expression operator+(const L& a, const R& b) {
        return add(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Expression operator-(const L& a, const R& b) {
        return subtract(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Expression operator*(const L& a, const R& b) {
        return multiply(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Expression operator/(const L& a, const R& b) {
        return divide(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator==(const L& a, const R& b) {
        return equals(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator<=(const L& a, const R& b) {
        return leq(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator>=(const L& a, const R& b) {
        return geq(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator<(const L& a, const R& b) {
        return lt(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator>(const L& a, const R& b) {
        return gt(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator>>(const L& a, const R& b) {
        return psd(castToConst(a), castToConst(b));
    }

    template<typename L, typename R>
        requires ExpressionOperands<L, R>
    Constraint operator<<(const L& a, const R& b) {
        return nsd(castToConst(a), castToConst(b));
    }

} // namespace dcp

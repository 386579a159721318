#pragma once
/*
===============================================================================
CASTING — Promotion of numeric literals to constant nodes
===============================================================================

OVERVIEW
--------
castToConst(x) returns x unchanged when it already is an expression, and
otherwise wraps the literal in a Constant node: shape from the value, sign
from its entries, curvature CONSTANT. Every binary and comparison operator
casts both operands, so composition rules never see raw numbers.

    Accepted literal             Shape        1-D array
    ---------------------------  -----------  ---------
    arithmetic scalar            (1, 1)       no
    dense Eigen matrix / expr    (r, c)       if a compile-time column vector
    std::vector<double>          (n, 1)       yes

USAGE EXAMPLES
--------------
    auto c = dcp::castToConst(5);                       // Constant 5
    auto v = dcp::castToConst(std::vector<double>{1, 2}); // (2, 1), 1-D
    auto e = dcp::castToConst(x);                        // x itself

===============================================================================
*/

#include <concepts>
#include <type_traits>
#include <vector>

#include "expression.h"

namespace dcp {

    /// @brief Any class derived from Expression (Variable, Parameter, Constant, ...)
    template<typename T>
    concept ExpressionLike = std::derived_from<std::remove_cvref_t<T>, Expression>;

    /// @brief Dense Eigen matrices and matrix expressions
    template<typename T>
    concept EigenDense = std::derived_from<std::remove_cvref_t<T>,
        Eigen::MatrixBase<std::remove_cvref_t<T>>>;

    /// @brief Types castToConst() accepts
    template<typename T>
    concept Castable = ExpressionLike<T>
        || std::is_arithmetic_v<std::remove_cvref_t<T>>
        || EigenDense<T>
        || std::same_as<std::remove_cvref_t<T>, std::vector<double>>;

    [[nodiscard]] inline Expression castToConst(const Expression& e) {
        return e;
    }

    template<typename T>
        requires std::is_arithmetic_v<T>
    [[nodiscard]] Expression castToConst(T v) {
        return Constant(static_cast<double>(v));
    }

    template<typename Derived>
    [[nodiscard]] Expression castToConst(const Eigen::MatrixBase<Derived>& m) {
        return Constant(m);
    }

    [[nodiscard]] inline Expression castToConst(const std::vector<double>& v) {
        return Constant(v);
    }

} // namespace dcp

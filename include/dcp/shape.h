#pragma once
/*
===============================================================================
SHAPE — Matrix dimensions and the shape rules of every composition
===============================================================================

OVERVIEW
--------
Every node of an expression graph is a (rows, cols) matrix; scalars are
(1, 1) and column vectors (n, 1). Shape rules are pure functions that either
return the result shape or throw DimensionMismatch naming the operator.

KEY COMPONENTS
--------------
• Shape — (rows, cols) with isScalar / isVector / isMatrix / isSquare
• sumShape()      — broadcast rule of addition and (in)equality constraints
• productShape()  — matrix product with scalar broadcasting
• transposed()    — swapped dimensions
• DimensionMismatch — exception naming the operator and both shapes

EXCEPTION SAFETY
----------------
• Shape construction throws std::invalid_argument for rows < 1 or cols < 1
• Shape rules throw DimensionMismatch; no partial results

===============================================================================
*/

#include <cstddef>
#include <format>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dcp {

    /**
     * @struct Shape
     * @brief (rows, cols) dimensions of a node, both >= 1
     */
    struct Shape {
        int rows = 1;
        int cols = 1;

        constexpr Shape() = default;

        Shape(int r, int c) : rows(r), cols(c) {
            if (r < 1 || c < 1) {
                throw std::invalid_argument(
                    std::format("Shape: dimensions must be positive, got ({}, {})", r, c));
            }
        }

        [[nodiscard]] constexpr int size() const noexcept { return rows * cols; }
        [[nodiscard]] constexpr bool isScalar() const noexcept { return rows == 1 && cols == 1; }
        [[nodiscard]] constexpr bool isVector() const noexcept { return rows == 1 || cols == 1; }
        [[nodiscard]] constexpr bool isMatrix() const noexcept { return rows > 1 && cols > 1; }
        [[nodiscard]] constexpr bool isSquare() const noexcept { return rows == cols; }

        [[nodiscard]] Shape transposed() const { return Shape(cols, rows); }

        [[nodiscard]] std::string str() const { return std::format("({}, {})", rows, cols); }

        friend constexpr bool operator==(const Shape&, const Shape&) = default;
    };

    inline std::ostream& operator<<(std::ostream& os, const Shape& s) {
        return os << s.str();
    }

    // ========================================================================
    // DIMENSION MISMATCH
    // ========================================================================

    /**
     * @class DimensionMismatch
     * @brief Shapes of two operands are incompatible for an operator
     *
     * @details Raised synchronously by composition rules and constraint
     *          builders; the caller never receives a partial node.
     *
     * @example
     *     try { auto e = x + y; }
     *     catch (const dcp::DimensionMismatch& e) {
     *         // e.what() == "add: incompatible dimensions (3, 1) and (2, 1)"
     *     }
     */
    class DimensionMismatch : public std::invalid_argument {
        std::string op_;
        Shape lhs_;
        Shape rhs_;

    public:
        DimensionMismatch(std::string_view op, const Shape& lhs, const Shape& rhs)
            : std::invalid_argument(std::format("{}: incompatible dimensions {} and {}",
                op, lhs.str(), rhs.str())),
              op_(op), lhs_(lhs), rhs_(rhs)
        {
        }

        [[nodiscard]] const std::string& op() const noexcept { return op_; }
        [[nodiscard]] const Shape& lhs() const noexcept { return lhs_; }
        [[nodiscard]] const Shape& rhs() const noexcept { return rhs_; }
    };

    // ========================================================================
    // SHAPE RULES
    // ========================================================================

    /**
     * @brief Result shape of an elementwise sum
     *
     * @details Equal shapes pass through; a scalar broadcasts against any shape.
     *
     * @param op Operator name used in the error message
     * @throws DimensionMismatch if neither rule applies
     */
    inline Shape sumShape(std::string_view op, const Shape& lhs, const Shape& rhs) {
        if (lhs == rhs) {
            return lhs;
        }
        if (lhs.isScalar()) {
            return rhs;
        }
        if (rhs.isScalar()) {
            return lhs;
        }
        throw DimensionMismatch(op, lhs, rhs);
    }

    /**
     * @brief Result shape of a matrix product lhs * rhs
     *
     * @details A scalar on either side scales the other operand; otherwise the
     *          inner dimensions must agree.
     *
     * @throws DimensionMismatch on inner dimension mismatch
     */
    inline Shape productShape(std::string_view op, const Shape& lhs, const Shape& rhs) {
        if (lhs.isScalar()) {
            return rhs;
        }
        if (rhs.isScalar()) {
            return lhs;
        }
        if (lhs.cols != rhs.rows) {
            throw DimensionMismatch(op, lhs, rhs);
        }
        return Shape(lhs.rows, rhs.cols);
    }

} // namespace dcp

#pragma once
/*
===============================================================================
COMPOSITION RULES — Named construction functions for every operator
===============================================================================

OVERVIEW
--------
Each rule receives already-cast operands, validates shapes (DimensionMismatch)
and DCP preconditions (DisciplineViolation), and returns a new node. The
operators in operators.h are thin wrappers over these functions.

    add(a, b), add(terms)   broadcast-compatible shapes; nested sums flatten
    subtract(a, b)          add(a, negate(b))
    negate(a)               convex <-> concave, sign flips
    multiply(a, b)          at least one operand constant
    divide(a, b)            b a nonzero scalar constant
    power(a, p)             finite p; the result must be DCP
    transpose(a)            scalar a is returned unchanged
    index(a, key)           simple keys; special keys forward to specialIndex
    specialIndex(a, key)    index lists and boolean masks

MULTIPLICATION
--------------
The constant operand becomes the coefficient and sets the monotonicity:
positive coefficients keep curvature, negative ones swap it.

    a constant                      -> Multiply(a, b)
    b constant, a or b scalar       -> Multiply(b, a)
    b constant, neither scalar      -> RightMultiply(a, b)

A Constant built from a 1-D array whose row count matches the other
operand's row count, and which is not square, is transposed first (a column
vector used as a row). DCP_STRICT_SHAPES turns this off.

USAGE EXAMPLES
--------------
    auto s = dcp::add(x, y);
    auto q = dcp::power(x, 2);                  // convex
    auto r = dcp::power(dcp::add(x, 1.0), 0.5); // concave, domain x + 1 >= 0
    auto v = dcp::index(X, dcp::Key{ dcp::Slice(0, 2), 1 });

EXCEPTION SAFETY
----------------
• Strong guarantee: operands are never modified; no node on failure
• DimensionMismatch, DisciplineViolation, std::out_of_range,
  std::invalid_argument as documented per function

===============================================================================
*/

#include <cmath>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "expression.h"

namespace dcp {

    namespace compose_detail {

        [[nodiscard]] inline const detail::ConstantLeaf* constantLeaf(const Expression& e) noexcept {
            return std::get_if<detail::ConstantLeaf>(&e.node().payload);
        }

        /// 1-D constant whose length matches the other operand's rows (legacy transpose)
        [[nodiscard]] inline bool needsLegacyTranspose(const Expression& lhs, const Expression& rhs) {
            if constexpr (!legacy_vector_transpose()) {
                return false;
            }
            const auto* leaf = constantLeaf(lhs);
            return leaf != nullptr
                && leaf->oneDim
                && lhs.rows() == rhs.rows()
                && !lhs.shape().isSquare();
        }

    } // namespace compose_detail

    // ============================================================================
    // SUMS
    // ============================================================================

    /**
     * @brief Sum of one or more terms
     *
     * @details Nested sums are flattened into a single n-ary node; a single
     *          term is returned as is.
     *
     * @throws std::invalid_argument if terms is empty
     * @throws DimensionMismatch if the shapes do not broadcast
     */
    inline Expression add(std::span<const Expression> terms) {
        if (terms.empty()) {
            throw std::invalid_argument("add: at least one term required");
        }
        if (terms.size() == 1) {
            return terms.front();
        }

        std::vector<Expression> flat;
        Shape shape = terms.front().shape();
        for (const auto& t : terms) {
            shape = sumShape("add", shape, t.shape());
            if (const auto* sum = std::get_if<detail::AddAtom>(&t.node().payload)) {
                flat.insert(flat.end(), sum->terms.begin(), sum->terms.end());
            }
            else {
                flat.push_back(t);
            }
        }
        return detail::makeNode(shape, detail::AddAtom(std::move(flat)));
    }

    inline Expression add(const std::vector<Expression>& terms) {
        return add(std::span<const Expression>(terms));
    }

    inline Expression add(const Expression& a, const Expression& b) {
        const Expression terms[] = { a, b };
        return add(std::span<const Expression>(terms));
    }

    inline Expression negate(const Expression& a) {
        return detail::makeNode(a.shape(), detail::NegateAtom(a));
    }

    inline Expression subtract(const Expression& a, const Expression& b) {
        sumShape("subtract", a.shape(), b.shape());
        return add(a, negate(b));
    }

    // ============================================================================
    // PRODUCTS
    // ============================================================================

    /**
     * @brief Matrix product a * b (scalar operands scale the other side)
     *
     * @throws DisciplineViolation if neither operand is constant
     * @throws DimensionMismatch if the inner dimensions disagree
     *
     * @example
     *     dcp::multiply(dcp::Constant(-2.0), dcp::power(x, 2));  // concave
     */
    inline Expression multiply(const Expression& a, const Expression& b) {
        const bool aConstant = a.isConstant();
        const bool bConstant = b.isConstant();
        if (!aConstant && !bConstant) {
            throw DisciplineViolation("multiply", "cannot multiply two non-constant expressions");
        }

        if (aConstant) {
            Expression lhs = a;
            if (compose_detail::needsLegacyTranspose(a, b)) {
                lhs = detail::constantExpression(compose_detail::constantLeaf(a)->data.transpose());
            }
            const Shape shape = productShape("multiply", lhs.shape(), b.shape());
            return detail::makeNode(shape, detail::MultiplyAtom(lhs, b));
        }

        const Shape shape = productShape("multiply", a.shape(), b.shape());
        if (a.isScalar() || b.isScalar()) {
            return detail::makeNode(shape, detail::MultiplyAtom(b, a));
        }
        return detail::makeNode(shape, detail::RightMultiplyAtom(a, b));
    }

    /**
     * @brief a / b for a nonzero scalar constant b
     *
     * @throws DisciplineViolation if b is not a scalar constant, or is zero
     */
    inline Expression divide(const Expression& a, const Expression& b) {
        if (!b.isConstant() || !b.isScalar()) {
            throw DisciplineViolation("divide", "can only divide by a scalar constant");
        }
        if (b.isZero()) {
            throw DisciplineViolation("divide", "division by zero");
        }
        if (auto v = b.value(); v && (*v)(0, 0) == 0.0) {
            throw DisciplineViolation("divide", "division by zero");
        }
        return detail::makeNode(a.shape(), detail::DivideAtom(a, b));
    }

    // ============================================================================
    // POWER
    // ============================================================================

    /**
     * @brief Elementwise a^p
     *
     * @details Convex for p <= 0 and p >= 1, concave for 0 <= p <= 1; the
     *          argument must compose accordingly (see PowerAtom). Adds the
     *          domain constraint a >= 0 unless p is 0, 1 or an even integer.
     *
     * @throws std::invalid_argument if p is not finite
     * @throws DisciplineViolation if the result is neither convex nor concave
     */
    inline Expression power(const Expression& a, double p) {
        if (!std::isfinite(p)) {
            throw std::invalid_argument(std::format("power: exponent must be finite, got {}", p));
        }
        Expression result = detail::makeNode(a.shape(), detail::PowerAtom(a, p));
        if (!result.isDcp()) {
            throw DisciplineViolation("power",
                std::format("{} raised to {} is neither convex nor concave",
                    to_string(a.curvature()), naming::scalar(p)));
        }
        return result;
    }

    /**
     * @brief a^p for a scalar constant expression p with a known value
     * @throws DisciplineViolation if p is not a scalar constant with a value
     */
    inline Expression power(const Expression& a, const Expression& p) {
        if (!p.isConstant() || !p.isScalar()) {
            throw DisciplineViolation("power", "exponent must be a scalar constant");
        }
        auto v = p.value();
        if (!v) {
            throw DisciplineViolation("power", "exponent has no value");
        }
        return power(a, (*v)(0, 0));
    }

    // ============================================================================
    // TRANSPOSE & INDEXING
    // ============================================================================

    /// @brief a.T; a scalar is its own transpose and is returned unchanged
    inline Expression transpose(const Expression& a) {
        if (a.isScalar()) {
            return a;
        }
        return detail::makeNode(a.shape().transposed(), detail::TransposeAtom(a));
    }

    /**
     * @brief Selection with advanced index parts
     *
     * @throws DimensionMismatch if two index arrays cannot broadcast
     * @throws std::out_of_range for out-of-bounds entries, wrong mask lengths
     *         or an empty selection
     */
    inline Expression specialIndex(const Expression& a, const Key& key) {
        Selection sel = specialSelection(key, a.shape());
        return detail::makeNode(sel.shape,
            detail::SpecialIndexAtom(a, keyString(key), std::move(sel.flat)));
    }

    /**
     * @brief Selection by a boolean mask of a's shape (row-major order)
     * @throws DimensionMismatch if mask.shape != a.shape
     */
    inline Expression specialIndex(const Expression& a, const Mask& mask) {
        Selection sel = maskSelection(mask, a.shape());
        return detail::makeNode(sel.shape,
            detail::SpecialIndexAtom(a, maskString(mask), std::move(sel.flat)));
    }

    /**
     * @brief Selection by a two-part key
     *
     * @details Integers and slices keep curvature and sign; the result shape
     *          is the number of selected rows by selected columns. Keys with an
     *          IndexList or BoolMask are special and handled by specialIndex().
     *
     * @throws std::out_of_range on out-of-bounds integers or empty selections
     */
    inline Expression index(const Expression& a, const Key& key) {
        if (isSpecial(key)) {
            return specialIndex(a, key);
        }
        const auto [rows, cols] = simpleSelection(key, a.shape());
        return detail::makeNode(Shape(rows.count, cols.count),
            detail::IndexAtom(a, keyString(key), flatPositions(rows, cols, a.rows())));
    }

    inline Expression index(const Expression& a, const KeyPart& row, const KeyPart& col) {
        return index(a, Key{ row, col });
    }

} // namespace dcp

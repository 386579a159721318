#pragma once
/*
===============================================================================
VALUE DOMAIN — Numeric matrices, sign tests and Jacobian building blocks
===============================================================================

OVERVIEW
--------
Numeric storage is delegated to Eigen. Values are dense column-major
Eigen::MatrixXd; gradients are maps from variable id to Eigen::SparseMatrix.
The classification engine never needs these; they back constants, variable
values, value() and gradient().

GRADIENT CONVENTION
-------------------
Expressions are vectorised column-major. The gradient of an (m x n)
expression with respect to a (p x q) variable is the (p*q) x (m*n) sparse
matrix whose entry (i, j) is d vec(expr)_j / d vec(var)_i, i.e. the transpose
of the Jacobian. Chain rule: grad_var(f(g)) = grad_var(g) * local(f, g).

KEY COMPONENTS
--------------
• Matrix, Mask, SparseMatrix, VariableId, Gradient — type aliases
• shapeOf(), allPositive(), allNegative()           — value queries
• broadcastTo()                                      — scalar broadcasting
• identity(), onesRow(), vecRow(), diagonalOf()      — sparse blocks
• transposePermutation(), selectionMatrix(), kron()  — structural Jacobians
• accumulate()                                       — gradient map addition
• minEigenvalue()                                    — PSD checks

DEPENDENCIES
------------
• Eigen 3.4 (Dense, Sparse, Eigenvalues, unsupported KroneckerProduct)

THREAD SAFETY
-------------
• Free functions over values; no shared state

===============================================================================
*/

#include <cstdint>
#include <map>
#include <span>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <unsupported/Eigen/KroneckerProduct>

#include "shape.h"

namespace dcp {

    using Matrix = Eigen::MatrixXd;
    using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;
    using SparseMatrix = Eigen::SparseMatrix<double>;
    using VariableId = std::uint64_t;

    /// Variable id -> (variable size x expression size) block
    using Gradient = std::map<VariableId, SparseMatrix>;

    // ========================================================================
    // VALUE QUERIES
    // ========================================================================

    [[nodiscard]] inline Shape shapeOf(const Matrix& m) {
        return Shape(static_cast<int>(m.rows()), static_cast<int>(m.cols()));
    }

    /// @brief Every entry >= 0
    [[nodiscard]] inline bool allPositive(const Matrix& m) {
        return m.size() > 0 && (m.array() >= 0.0).all();
    }

    /// @brief Every entry <= 0
    [[nodiscard]] inline bool allNegative(const Matrix& m) {
        return m.size() > 0 && (m.array() <= 0.0).all();
    }

    /// @brief Repeats a 1x1 value to the requested shape; other values pass through
    [[nodiscard]] inline Matrix broadcastTo(const Matrix& m, const Shape& s) {
        if (m.rows() == 1 && m.cols() == 1 && !s.isScalar()) {
            return Matrix::Constant(s.rows, s.cols, m(0, 0));
        }
        return m;
    }

    /**
     * @brief Smallest eigenvalue of the symmetric part (M + M^T) / 2
     * @pre m is square
     */
    [[nodiscard]] inline double minEigenvalue(const Matrix& m) {
        const Matrix sym = 0.5 * (m + m.transpose());
        Eigen::SelfAdjointEigenSolver<Matrix> solver(sym, Eigen::EigenvaluesOnly);
        return solver.eigenvalues().minCoeff();
    }

    // ========================================================================
    // SPARSE BUILDING BLOCKS
    // ========================================================================

    [[nodiscard]] inline SparseMatrix identity(int n) {
        SparseMatrix I(n, n);
        I.setIdentity();
        return I;
    }

    /// @brief 1 x n row of ones (scalar argument broadcast into n entries)
    [[nodiscard]] inline SparseMatrix onesRow(int n) {
        std::vector<Eigen::Triplet<double>> t;
        t.reserve(static_cast<std::size_t>(n));
        for (int j = 0; j < n; ++j) {
            t.emplace_back(0, j, 1.0);
        }
        SparseMatrix r(1, n);
        r.setFromTriplets(t.begin(), t.end());
        return r;
    }

    /// @brief 1 x size row holding vec(m) (column-major)
    [[nodiscard]] inline SparseMatrix vecRow(const Matrix& m) {
        const auto n = m.size();
        std::vector<Eigen::Triplet<double>> t;
        t.reserve(static_cast<std::size_t>(n));
        for (Eigen::Index k = 0; k < n; ++k) {
            const double v = m(k % m.rows(), k / m.rows());
            if (v != 0.0) {
                t.emplace_back(0, static_cast<int>(k), v);
            }
        }
        SparseMatrix r(1, static_cast<int>(n));
        r.setFromTriplets(t.begin(), t.end());
        return r;
    }

    /// @brief Diagonal matrix holding vec(entries)
    [[nodiscard]] inline SparseMatrix diagonalOf(const Matrix& entries) {
        const auto n = entries.size();
        std::vector<Eigen::Triplet<double>> t;
        t.reserve(static_cast<std::size_t>(n));
        for (Eigen::Index k = 0; k < n; ++k) {
            t.emplace_back(static_cast<int>(k), static_cast<int>(k),
                entries(k % entries.rows(), k / entries.rows()));
        }
        SparseMatrix d(static_cast<int>(n), static_cast<int>(n));
        d.setFromTriplets(t.begin(), t.end());
        return d;
    }

    /**
     * @brief Permutation mapping vec(A) to vec(A^T)
     *
     * @param arg Shape (m, n) of A
     * @return (mn x mn) matrix P with P(i + j*m, j + i*n) = 1
     */
    [[nodiscard]] inline SparseMatrix transposePermutation(const Shape& arg) {
        const int m = arg.rows;
        const int n = arg.cols;
        std::vector<Eigen::Triplet<double>> t;
        t.reserve(static_cast<std::size_t>(arg.size()));
        for (int j = 0; j < n; ++j) {
            for (int i = 0; i < m; ++i) {
                t.emplace_back(i + j * m, j + i * n, 1.0);
            }
        }
        SparseMatrix p(arg.size(), arg.size());
        p.setFromTriplets(t.begin(), t.end());
        return p;
    }

    /**
     * @brief Selection of flat entries
     *
     * @param argSize Number of entries of the indexed expression
     * @param flat    Column-major positions selected, in result order
     * @return (argSize x flat.size()) matrix S with S(flat[k], k) = 1
     */
    [[nodiscard]] inline SparseMatrix selectionMatrix(int argSize, std::span<const int> flat) {
        std::vector<Eigen::Triplet<double>> t;
        t.reserve(flat.size());
        for (std::size_t k = 0; k < flat.size(); ++k) {
            t.emplace_back(flat[k], static_cast<int>(k), 1.0);
        }
        SparseMatrix s(argSize, static_cast<int>(flat.size()));
        s.setFromTriplets(t.begin(), t.end());
        return s;
    }

    /// @brief Gathers entries of m at column-major positions into a result of shape s
    [[nodiscard]] inline Matrix gather(const Matrix& m, std::span<const int> flat, const Shape& s) {
        Matrix out(s.rows, s.cols);
        for (std::size_t k = 0; k < flat.size(); ++k) {
            const Eigen::Index src = flat[k];
            out(static_cast<Eigen::Index>(k) % s.rows, static_cast<Eigen::Index>(k) / s.rows) =
                m(src % m.rows(), src / m.rows());
        }
        return out;
    }

    [[nodiscard]] inline SparseMatrix toSparse(const Matrix& m) {
        return SparseMatrix(m.sparseView());
    }

    /// @brief Kronecker product of two sparse matrices
    [[nodiscard]] inline SparseMatrix kron(const SparseMatrix& a, const SparseMatrix& b) {
        SparseMatrix k = Eigen::kroneckerProduct(a, b);
        return k;
    }

    /// @brief Adds block into grad[id], creating the entry if needed
    inline void accumulate(Gradient& grad, VariableId id, const SparseMatrix& block) {
        auto it = grad.find(id);
        if (it == grad.end()) {
            grad.emplace(id, block);
        }
        else {
            it->second += block;
        }
    }

} // namespace dcp

#pragma once
/*
===============================================================================
EXPRESSION — Immutable expression-graph nodes and their analysis queries
===============================================================================

OVERVIEW
--------
An Expression is a cheap value handle over an immutable node. Nodes form a
DAG built strictly bottom-up: a node can only reference operands that
already exist, so cycles cannot form. Operands are shared, never copied.

The set of node kinds is closed and held in a std::variant. Every query
dispatches with std::visit, so a new kind that forgets a query does not
compile.

    Leaves      Constant, Parameter, Variable
    Composites  Add, Negate, Multiply, RightMultiply, Divide, Power,
                Transpose, Index, SpecialIndex

ANALYSIS
--------
Classification (curvature and sign) is structural: it never evaluates the
values of variables. It is recomputed on every query by one bottom-up pass
and never cached on the node, which keeps nodes immutable and concurrent
reads safe. Within one query, results are memoized by node id, so a shared
operand is visited once however many parents reach it. Composite payloads supply the atom's own properties:

    atomConvex / atomConcave  curvature of the atom itself
    monotonicity(i)           response to argument i (may depend on signs)
    signFromArgs              sign of the result

and the general DCP composition rule in curvature.h does the rest.

Numeric queries follow the same shape: value() evaluates operands first and
is absent when any operand value is absent; gradient() applies the chain rule
through each payload's local Jacobian blocks; domain() gathers the side
constraints under which the value is defined.

KEY COMPONENTS
--------------
• NodeKind, ConstraintKind       — tags with printable names
• Expression                     — node handle and query surface
• Constraint                     — relation between two expressions
• Variable, Parameter, Constant  — leaf handles
• structurallyEqual()            — semantic equality of two graphs
• variables(), parameters()      — leaves reachable from a node

USAGE EXAMPLES
--------------
    dcp::Variable x(3, 1, "x");
    dcp::Constant c(2.0);

    auto e = c * x + 1.0;
    e.curvature();               // Curvature::Affine
    e.shape();                   // (3, 1)

    x.setValue(Eigen::Vector3d(1, 2, 3));
    auto v = e.value();          // [3, 5, 7]
    auto g = e.gradient();       // {x.id(): 2 * I}

DEPENDENCIES
------------
• Eigen 3.4 — values and Jacobian blocks (see value.h)
• curvature.h, shape.h, indexing.h, naming.h, errors.h

THREAD SAFETY
-------------
• Nodes are immutable; concurrent queries on a shared graph are safe
• Node ids come from an atomic counter
• Variable::setValue / Parameter::setValue mutate a shared value slot and
  require external synchronization, like any other assignment

EXCEPTION SAFETY
----------------
• Queries never throw except on allocation failure
• Leaf constructors throw std::invalid_argument for empty values
• setValue() throws DimensionMismatch on shape mismatch and
  std::invalid_argument when a value contradicts a declared sign

===============================================================================
*/

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <set>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include "config.h"
#include "curvature.h"
#include "enum_utils.h"
#include "errors.h"
#include "indexing.h"
#include "naming.h"
#include "shape.h"
#include "value.h"

namespace dcp {

    DECLARE_ENUM_WITH_COUNT(NodeKind,
        Constant, Parameter, Variable,
        Add, Negate, Multiply, RightMultiply, Divide, Power,
        Transpose, Index, SpecialIndex);

    inline constexpr EnumArray<NodeKind, std::string_view> NODE_KIND_NAMES = {
        "Constant", "Parameter", "Variable",
        "Add", "Negate", "Multiply", "RightMultiply", "Divide", "Power",
        "Transpose", "Index", "SpecialIndex"
    };

    [[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept {
        return enum_name(k, NODE_KIND_NAMES);
    }

    DECLARE_ENUM_WITH_COUNT(ConstraintKind, Equality, Inequality, PositiveSemidefinite);

    inline constexpr EnumArray<ConstraintKind, std::string_view> CONSTRAINT_KIND_NAMES = {
        "Equality", "Inequality", "PositiveSemidefinite"
    };

    [[nodiscard]] constexpr std::string_view to_string(ConstraintKind k) noexcept {
        return enum_name(k, CONSTRAINT_KIND_NAMES);
    }

    class Constraint;

    namespace detail {
        struct Node;

        /// @brief Next value of the process-wide id counter (starts at 1)
        inline std::uint64_t nextId() noexcept {
            static std::atomic<std::uint64_t> counter{ 0 };
            return counter.fetch_add(1, std::memory_order_relaxed) + 1;
        }
    }

    // ============================================================================
    // EXPRESSION
    // ============================================================================
    /**
     * @class Expression
     * @brief Shared handle to one immutable node of the expression graph
     *
     * @details Copying an Expression copies the handle, not the node. Two
     *          handles to the same node have the same id(). Semantic equality
     *          of different nodes is structurallyEqual().
     *
     *          Operators are declared in operators.h; named construction
     *          functions in composition.h.
     */
    class Expression {
    protected:
        std::shared_ptr<const detail::Node> node_;

    public:
        explicit Expression(std::shared_ptr<const detail::Node> node);

        // ---- identity ----------------------------------------------------
        [[nodiscard]] std::uint64_t id() const noexcept;
        [[nodiscard]] NodeKind kind() const noexcept;
        [[nodiscard]] const detail::Node& node() const noexcept { return *node_; }

        /// @brief True if both handles refer to the very same node
        [[nodiscard]] bool sameNode(const Expression& other) const noexcept {
            return node_ == other.node_;
        }

        // ---- shape -------------------------------------------------------
        [[nodiscard]] const Shape& shape() const noexcept;
        [[nodiscard]] int rows() const noexcept { return shape().rows; }
        [[nodiscard]] int cols() const noexcept { return shape().cols; }
        [[nodiscard]] int size() const noexcept { return shape().size(); }
        [[nodiscard]] bool isScalar() const noexcept { return shape().isScalar(); }

        // ---- classification ----------------------------------------------
        /// @brief All five structural predicates, computed in one pass
        [[nodiscard]] Classification classification() const;

        [[nodiscard]] bool isConstant() const { return classification().isConstant(); }
        [[nodiscard]] bool isAffine() const { return classification().isAffine(); }
        [[nodiscard]] bool isConvex() const { return classification().convex; }
        [[nodiscard]] bool isConcave() const { return classification().concave; }
        [[nodiscard]] bool isPositive() const { return classification().positive; }
        [[nodiscard]] bool isNegative() const { return classification().negative; }
        [[nodiscard]] bool isZero() const { return classification().isZero(); }
        [[nodiscard]] bool isDcp() const { return classification().isDcp(); }
        [[nodiscard]] Curvature curvature() const { return classification().curvature(); }
        [[nodiscard]] Sign sign() const { return classification().sign(); }

        // ---- numeric -----------------------------------------------------
        /// @brief Current value, absent if any leaf below lacks one
        [[nodiscard]] std::optional<Matrix> value() const;

        /**
         * @brief Gradient with respect to every variable below this node
         *
         * @return Map variable id -> (variable size x expression size) block,
         *         or nullopt when a value is missing or the point lies outside
         *         the differentiable domain. Constants give an empty map.
         */
        [[nodiscard]] std::optional<Gradient> gradient() const;

        /// @brief Side constraints under which value() is defined
        [[nodiscard]] std::vector<Constraint> domain() const;

        // ---- structure ---------------------------------------------------
        [[nodiscard]] std::string name() const;
        [[nodiscard]] std::vector<Expression> args() const;

        /// @brief Distinct variables below this node, in first-visit order
        [[nodiscard]] std::vector<Expression> variables() const;

        /// @brief Distinct parameters below this node, in first-visit order
        [[nodiscard]] std::vector<Expression> parameters() const;

        // ---- indexing ----------------------------------------------------
        /**
         * @brief x(row, col) with integers, slices, index lists or masks
         * @throws std::out_of_range, DimensionMismatch (see indexing.h)
         */
        [[nodiscard]] Expression operator()(const KeyPart& row, const KeyPart& col) const;

        /**
         * @brief x[part] on a vector; the part applies to the long axis
         * @throws std::out_of_range if the expression is a matrix
         */
        [[nodiscard]] Expression operator[](const KeyPart& part) const;

        /// @brief x[mask] with a boolean mask of the same shape
        [[nodiscard]] Expression operator[](const Mask& mask) const;

        /// @brief Transpose (x.T)
        [[nodiscard]] Expression T() const;
    };

    inline std::ostream& operator<<(std::ostream& os, const Expression& e) {
        return os << e.name();
    }

    // ============================================================================
    // CONSTRAINT
    // ============================================================================
    /**
     * @class Constraint
     * @brief Relation between two expressions: lhs == rhs, lhs <= rhs, lhs >> rhs
     *
     * @details Built by the functions in constraints.h. Equality and
     *          inequality sides must broadcast against each other; both sides
     *          of a PSD relation must be square with equal shapes. No
     *          curvature check happens at construction; isDcp() reports it.
     *
     * @throws DimensionMismatch from the constructor on incompatible shapes
     */
    class Constraint {
        ConstraintKind kind_;
        Expression lhs_;
        Expression rhs_;
        Shape shape_;
        std::uint64_t id_;

    public:
        Constraint(ConstraintKind kind, Expression lhs, Expression rhs);

        [[nodiscard]] ConstraintKind kind() const noexcept { return kind_; }
        [[nodiscard]] const Expression& lhs() const noexcept { return lhs_; }
        [[nodiscard]] const Expression& rhs() const noexcept { return rhs_; }
        [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
        [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

        /// @brief lhs - rhs
        [[nodiscard]] Expression expression() const;

        /**
         * @brief DCP compliance of the relation
         *
         * @details Equality needs an affine difference, inequality a convex one
         *          (convex <= concave), PSD an affine one.
         */
        [[nodiscard]] bool isDcp() const;

        /// @brief Satisfaction at current values within FEASIBILITY_TOL
        [[nodiscard]] std::optional<bool> value() const;

        /**
         * @brief Amount by which the relation is violated (0 when satisfied)
         *
         * @details PSD relations report the negated smallest eigenvalue of the
         *          symmetric part of lhs - rhs.
         */
        [[nodiscard]] std::optional<double> violation() const;

        [[nodiscard]] std::string name() const;
    };

    inline std::ostream& operator<<(std::ostream& os, const Constraint& c) {
        return os << c.name();
    }

    // Defined in composition.h (included at the end of this header).
    inline Expression add(const Expression& a, const Expression& b);
    inline Expression subtract(const Expression& a, const Expression& b);
    inline Expression transpose(const Expression& a);
    inline Expression index(const Expression& a, const Key& key);
    inline Expression specialIndex(const Expression& a, const Mask& mask);

    // ============================================================================
    // NODE PAYLOADS
    // ============================================================================
    namespace detail {

        /// Storage behind the value of a variable or parameter
        struct ValueSlot {
            std::optional<Matrix> value;
        };

        inline Expression constantExpression(const Matrix& value, bool oneDim = false);

        /// Lower binds looser; used to parenthesize operand names
        enum class Precedence { Sum = 1, Product = 2, Unary = 3, Atom = 4 };

        inline Precedence precedenceOf(const Expression& e);

        inline std::string operandName(const Expression& e, Precedence parent, bool strict = false) {
            const auto p = static_cast<int>(precedenceOf(e));
            const auto q = static_cast<int>(parent);
            return naming::parenthesize(e.name(), strict ? p <= q : p < q);
        }

        // ------------------------------------------------------------------------
        // Leaves
        // ------------------------------------------------------------------------

        struct ConstantLeaf {
            static constexpr NodeKind kind = NodeKind::Constant;
            static constexpr bool leaf = true;

            Matrix data;
            bool oneDim = false;    ///< built from a 1-D array (vector)

            Classification classify() const {
                return { false, true, true, allPositive(data), allNegative(data) };
            }
            std::optional<Matrix> value() const { return data; }
            std::optional<Gradient> gradient(VariableId, const Shape&) const { return Gradient{}; }
            std::string render() const { return naming::matrix(data); }
            bool sameAttributes(const ConstantLeaf& o) const {
                return data.rows() == o.data.rows() && data.cols() == o.data.cols() && data == o.data;
            }
        };

        struct ParameterLeaf {
            static constexpr NodeKind kind = NodeKind::Parameter;
            static constexpr bool leaf = true;

            std::string name;
            SignBounds declared;
            std::shared_ptr<ValueSlot> slot;

            Classification classify() const {
                return { false, true, true, declared.positive, declared.negative };
            }
            std::optional<Matrix> value() const { return slot->value; }
            std::optional<Gradient> gradient(VariableId, const Shape&) const { return Gradient{}; }
            std::string render() const { return name; }
            bool sameAttributes(const ParameterLeaf& o) const { return slot == o.slot; }
        };

        struct VariableLeaf {
            static constexpr NodeKind kind = NodeKind::Variable;
            static constexpr bool leaf = true;

            std::string name;
            std::shared_ptr<ValueSlot> slot;

            Classification classify() const { return { true, true, true, false, false }; }
            std::optional<Matrix> value() const { return slot->value; }

            std::optional<Gradient> gradient(VariableId id, const Shape& shape) const {
                if (!slot->value) {
                    return std::nullopt;
                }
                return Gradient{ { id, identity(shape.size()) } };
            }

            std::string render() const { return name; }
            bool sameAttributes(const VariableLeaf& o) const { return slot == o.slot; }
        };

        // ------------------------------------------------------------------------
        // Composites
        // ------------------------------------------------------------------------

        using ArgClasses = std::span<const Classification>;
        using ArgValues = std::span<const Matrix>;
        using LocalBlocks = std::optional<std::vector<SparseMatrix>>;

        /// Defaults shared by every affine atom
        struct AffineAtom {
            static constexpr bool leaf = false;

            bool atomConvex(ArgClasses) const { return true; }
            bool atomConcave(ArgClasses) const { return true; }
            std::vector<Constraint> ownDomain() const { return {}; }
            bool sameAttributes(const AffineAtom&) const { return true; }
        };

        /// Sum of terms; scalar terms broadcast to the result shape
        struct AddAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::Add;

            std::vector<Expression> terms;

            explicit AddAtom(std::vector<Expression> t) : terms(std::move(t)) {}

            std::vector<Expression> args() const { return terms; }
            Monotonicity monotonicity(std::size_t, ArgClasses) const { return Monotonicity::increasingIn(); }
            SignBounds signFromArgs(ArgClasses a) const { return sumSign(a); }

            Matrix evaluate(ArgValues v, const Shape& s) const {
                Matrix total = Matrix::Zero(s.rows, s.cols);
                for (const auto& m : v) {
                    total += broadcastTo(m, s);
                }
                return total;
            }

            LocalBlocks localGradients(ArgValues v, const Shape& s) const {
                std::vector<SparseMatrix> blocks;
                blocks.reserve(v.size());
                for (const auto& m : v) {
                    blocks.push_back(m.size() == 1 && !s.isScalar() ? onesRow(s.size()) : identity(s.size()));
                }
                return blocks;
            }

            std::string render() const {
                std::string s;
                for (std::size_t i = 0; i < terms.size(); ++i) {
                    if (i > 0) s.append(" + ");
                    s.append(terms[i].name());
                }
                return s;
            }
        };

        struct NegateAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::Negate;

            Expression arg;

            explicit NegateAtom(Expression a) : arg(std::move(a)) {}

            std::vector<Expression> args() const { return { arg }; }
            Monotonicity monotonicity(std::size_t, ArgClasses) const { return Monotonicity::decreasingIn(); }
            SignBounds signFromArgs(ArgClasses a) const { return negatedSign(a[0]); }
            Matrix evaluate(ArgValues v, const Shape&) const { return -v[0]; }

            LocalBlocks localGradients(ArgValues, const Shape& s) const {
                return std::vector<SparseMatrix>{ SparseMatrix(-identity(s.size())) };
            }

            std::string render() const { return "-" + operandName(arg, Precedence::Unary); }
        };

        /// Product value with scalar broadcasting on either side
        inline Matrix productValue(const Matrix& a, const Matrix& b) {
            if (a.size() == 1) return a(0, 0) * b;
            if (b.size() == 1) return a * b(0, 0);
            return a * b;
        }

        /**
         * Local blocks of C = A * B:
         *   scalar A:  dA = vec(B)^T,           dB = a I
         *   scalar B:  dA = b I,                dB = vec(A)^T
         *   matrices:  dA = B (x) I_m,          dB = I_n (x) A^T
         */
        inline std::vector<SparseMatrix> productGradients(const Matrix& a, const Matrix& b) {
            if (a.size() == 1) {
                return { vecRow(b), SparseMatrix(a(0, 0) * identity(static_cast<int>(b.size()))) };
            }
            if (b.size() == 1) {
                return { SparseMatrix(b(0, 0) * identity(static_cast<int>(a.size()))), vecRow(a) };
            }
            const int m = static_cast<int>(a.rows());
            const int n = static_cast<int>(b.cols());
            return {
                kron(toSparse(b), identity(m)),
                kron(identity(n), toSparse(Matrix(a.transpose())))
            };
        }

        /// Constant coefficient on the left: lhs * rhs with lhs constant
        struct MultiplyAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::Multiply;

            Expression lhs;
            Expression rhs;

            MultiplyAtom(Expression l, Expression r) : lhs(std::move(l)), rhs(std::move(r)) {}

            std::vector<Expression> args() const { return { lhs, rhs }; }

            Monotonicity monotonicity(std::size_t i, ArgClasses a) const {
                return i == 0 ? Monotonicity::independentOf() : scaledBy(a[0]);
            }

            SignBounds signFromArgs(ArgClasses a) const { return productSign(a[0], a[1]); }
            Matrix evaluate(ArgValues v, const Shape&) const { return productValue(v[0], v[1]); }
            LocalBlocks localGradients(ArgValues v, const Shape&) const { return productGradients(v[0], v[1]); }

            std::string render() const {
                return operandName(lhs, Precedence::Product) + " * " + operandName(rhs, Precedence::Product);
            }
        };

        /// Constant coefficient on the right, neither operand scalar
        struct RightMultiplyAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::RightMultiply;

            Expression lhs;
            Expression rhs;

            RightMultiplyAtom(Expression l, Expression r) : lhs(std::move(l)), rhs(std::move(r)) {}

            std::vector<Expression> args() const { return { lhs, rhs }; }

            Monotonicity monotonicity(std::size_t i, ArgClasses a) const {
                return i == 1 ? Monotonicity::independentOf() : scaledBy(a[1]);
            }

            SignBounds signFromArgs(ArgClasses a) const { return productSign(a[0], a[1]); }
            Matrix evaluate(ArgValues v, const Shape&) const { return productValue(v[0], v[1]); }
            LocalBlocks localGradients(ArgValues v, const Shape&) const { return productGradients(v[0], v[1]); }

            std::string render() const {
                return operandName(lhs, Precedence::Product) + " * " + operandName(rhs, Precedence::Product);
            }
        };

        /// lhs / rhs with rhs a nonzero scalar constant
        struct DivideAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::Divide;

            Expression lhs;
            Expression rhs;

            DivideAtom(Expression l, Expression r) : lhs(std::move(l)), rhs(std::move(r)) {}

            std::vector<Expression> args() const { return { lhs, rhs }; }

            Monotonicity monotonicity(std::size_t i, ArgClasses a) const {
                return i == 1 ? Monotonicity::independentOf() : scaledBy(a[1]);
            }

            // 1/b has the sign of b
            SignBounds signFromArgs(ArgClasses a) const { return productSign(a[0], a[1]); }

            Matrix evaluate(ArgValues v, const Shape&) const { return v[0] / v[1](0, 0); }

            LocalBlocks localGradients(ArgValues v, const Shape&) const {
                const double c = v[1](0, 0);
                if (c == 0.0) {
                    return std::nullopt;
                }
                const Matrix dc = -v[0] / (c * c);
                return std::vector<SparseMatrix>{
                    SparseMatrix((1.0 / c) * identity(static_cast<int>(v[0].size()))),
                    vecRow(dc)
                };
            }

            std::string render() const {
                return operandName(lhs, Precedence::Product) + " / "
                    + operandName(rhs, Precedence::Product, true);
            }
        };

        [[nodiscard]] inline bool isEvenInteger(double p) noexcept {
            return std::floor(p) == p && std::fmod(p, 2.0) == 0.0;
        }

        /**
         * Elementwise power x^p
         *
         *   p <= 0 or p >= 1   convex        0 <= p <= 1   concave
         *   0 < p < 1          increasing    p < 0         decreasing
         *   p > 1, not even    increasing    p even        by the sign of x
         *   p == 0             constant 1, independent of x
         */
        struct PowerAtom {
            static constexpr NodeKind kind = NodeKind::Power;
            static constexpr bool leaf = false;

            Expression arg;
            double p;

            PowerAtom(Expression a, double exponent) : arg(std::move(a)), p(exponent) {}

            std::vector<Expression> args() const { return { arg }; }

            bool atomConvex(ArgClasses) const { return p <= 0.0 || p >= 1.0; }
            bool atomConcave(ArgClasses) const { return p >= 0.0 && p <= 1.0; }

            Monotonicity monotonicity(std::size_t, ArgClasses a) const {
                if (p == 0.0) {
                    return Monotonicity::independentOf();
                }
                if (p < 0.0) {
                    return Monotonicity::decreasingIn();
                }
                if (p <= 1.0 || !isEvenInteger(p)) {
                    return Monotonicity::increasingIn();
                }
                return { a[0].positive, a[0].negative };
            }

            SignBounds signFromArgs(ArgClasses a) const {
                if (p == 1.0) {
                    return { a[0].positive, a[0].negative };
                }
                return { true, false };
            }

            /// x >= 0 is required unless p is 0, 1 or an even integer
            bool restrictsDomain() const {
                return p < 0.0 || (p > 0.0 && p < 1.0) || (p > 1.0 && !isEvenInteger(p));
            }

            std::vector<Constraint> ownDomain() const;

            Matrix evaluate(ArgValues v, const Shape&) const {
                return v[0].array().pow(p).matrix();
            }

            LocalBlocks localGradients(ArgValues v, const Shape&) const {
                const Matrix& x = v[0];
                const int n = static_cast<int>(x.size());
                if (p == 0.0) {
                    return std::vector<SparseMatrix>{ SparseMatrix(n, n) };
                }
                if (p < 1.0 && (x.array() <= 0.0).any()) {
                    return std::nullopt;
                }
                if (p > 1.0 && !isEvenInteger(p) && (x.array() < 0.0).any()) {
                    return std::nullopt;
                }
                const Matrix slope = (p * x.array().pow(p - 1.0)).matrix();
                return std::vector<SparseMatrix>{ diagonalOf(slope) };
            }

            std::string render() const {
                return std::format("power({}, {})", arg.name(), naming::scalar(p));
            }

            bool sameAttributes(const PowerAtom& o) const { return p == o.p; }
        };

        struct TransposeAtom : AffineAtom {
            static constexpr NodeKind kind = NodeKind::Transpose;

            Expression arg;

            explicit TransposeAtom(Expression a) : arg(std::move(a)) {}

            std::vector<Expression> args() const { return { arg }; }
            Monotonicity monotonicity(std::size_t, ArgClasses) const { return Monotonicity::increasingIn(); }
            SignBounds signFromArgs(ArgClasses a) const { return { a[0].positive, a[0].negative }; }
            Matrix evaluate(ArgValues v, const Shape&) const { return v[0].transpose(); }

            LocalBlocks localGradients(ArgValues v, const Shape&) const {
                return std::vector<SparseMatrix>{ transposePermutation(shapeOf(v[0])) };
            }

            std::string render() const { return operandName(arg, Precedence::Atom) + ".T"; }
        };

        /**
         * Selection of entries by flat column-major position. Shared by simple
         * and special indexing; only the construction of positions differs.
         */
        struct SelectionAtom : AffineAtom {
            Expression arg;
            std::string keyText;
            std::vector<int> flat;

            SelectionAtom(Expression a, std::string text, std::vector<int> positions)
                : arg(std::move(a)), keyText(std::move(text)), flat(std::move(positions))
            {
            }

            std::vector<Expression> args() const { return { arg }; }
            Monotonicity monotonicity(std::size_t, ArgClasses) const { return Monotonicity::increasingIn(); }
            SignBounds signFromArgs(ArgClasses a) const { return { a[0].positive, a[0].negative }; }
            Matrix evaluate(ArgValues v, const Shape& s) const { return gather(v[0], flat, s); }

            LocalBlocks localGradients(ArgValues v, const Shape&) const {
                return std::vector<SparseMatrix>{ selectionMatrix(static_cast<int>(v[0].size()), flat) };
            }

            std::string render() const {
                return naming::subscript(operandName(arg, Precedence::Atom), keyText);
            }

            bool sameAttributes(const SelectionAtom& o) const { return flat == o.flat; }
        };

        struct IndexAtom : SelectionAtom {
            static constexpr NodeKind kind = NodeKind::Index;
            using SelectionAtom::SelectionAtom;
        };

        struct SpecialIndexAtom : SelectionAtom {
            static constexpr NodeKind kind = NodeKind::SpecialIndex;
            using SelectionAtom::SelectionAtom;
        };

        using Payload = std::variant<
            ConstantLeaf, ParameterLeaf, VariableLeaf,
            AddAtom, NegateAtom, MultiplyAtom, RightMultiplyAtom, DivideAtom, PowerAtom,
            TransposeAtom, IndexAtom, SpecialIndexAtom>;

        /**
         * @struct Node
         * @brief Id, shape and kind-specific payload; immutable after construction
         */
        struct Node {
            std::uint64_t id;
            Shape shape;
            Payload payload;

            Node(Shape s, Payload p)
                : id(nextId()), shape(s), payload(std::move(p))
            {
            }
        };

        template<typename P>
        Expression makeNode(const Shape& shape, P payload) {
            return Expression(std::make_shared<const Node>(shape, Payload(std::move(payload))));
        }

        // ------------------------------------------------------------------------
        // Dispatch
        // ------------------------------------------------------------------------

        /**
         * Results of one top-level query, keyed by node id. A shared operand
         * is analysed once per query however many parents reach it; nothing
         * outlives the query, so nodes stay free of cached state.
         */
        template<typename T>
        using NodeMemo = std::unordered_map<std::uint64_t, T>;

        using ValueMemo = NodeMemo<std::optional<Matrix>>;
        using GradientMemo = NodeMemo<std::optional<Gradient>>;

        inline Classification classify(const Expression& e, NodeMemo<Classification>& memo);
        inline std::optional<Matrix> evaluate(const Expression& e, ValueMemo& memo);
        inline std::optional<Gradient> differentiate(const Expression& e, ValueMemo& values, GradientMemo& grads);

        /// General DCP composition rule over a composite payload
        template<typename P>
        Classification compose(const P& p, NodeMemo<Classification>& memo) {
            std::vector<Classification> a;
            for (const auto& arg : p.args()) {
                a.push_back(classify(arg, memo));
            }

            Classification c;
            c.hasVariables = std::ranges::any_of(a, [](const Classification& x) { return x.hasVariables; });

            const SignBounds s = p.signFromArgs(a);
            c.positive = s.positive;
            c.negative = s.negative;

            bool convex = p.atomConvex(a);
            bool concave = p.atomConcave(a);
            for (std::size_t i = 0; i < a.size(); ++i) {
                const Monotonicity m = p.monotonicity(i, a);
                convex = convex && composesConvex(a[i], m);
                concave = concave && composesConcave(a[i], m);
            }

            c.convex = c.isConstant() || convex;
            c.concave = c.isConstant() || concave;
            return c;
        }

        template<typename P>
        std::optional<std::vector<Matrix>> argValues(const P& p, ValueMemo& memo) {
            std::vector<Matrix> values;
            for (const auto& a : p.args()) {
                auto v = evaluate(a, memo);
                if (!v) {
                    return std::nullopt;
                }
                values.push_back(std::move(*v));
            }
            return values;
        }

        inline Classification classify(const Expression& e, NodeMemo<Classification>& memo) {
            if (auto it = memo.find(e.id()); it != memo.end()) {
                return it->second;
            }
            const Classification c = std::visit([&memo](const auto& p) -> Classification {
                if constexpr (std::decay_t<decltype(p)>::leaf) {
                    return p.classify();
                }
                else {
                    return compose(p, memo);
                }
            }, e.node().payload);
            memo.emplace(e.id(), c);
            return c;
        }

        inline std::optional<Matrix> evaluate(const Expression& e, ValueMemo& memo) {
            if (auto it = memo.find(e.id()); it != memo.end()) {
                return it->second;
            }
            auto v = std::visit([&e, &memo](const auto& p) -> std::optional<Matrix> {
                if constexpr (std::decay_t<decltype(p)>::leaf) {
                    return p.value();
                }
                else {
                    auto values = argValues(p, memo);
                    if (!values) {
                        return std::nullopt;
                    }
                    return p.evaluate(*values, e.shape());
                }
            }, e.node().payload);
            memo.emplace(e.id(), v);
            return v;
        }

        inline std::optional<Gradient> differentiate(const Expression& e, ValueMemo& values, GradientMemo& grads) {
            if (auto it = grads.find(e.id()); it != grads.end()) {
                return it->second;
            }
            auto g = std::visit([&](const auto& p) -> std::optional<Gradient> {
                if constexpr (std::decay_t<decltype(p)>::leaf) {
                    return p.gradient(e.id(), e.shape());
                }
                else {
                    const std::vector<Expression> args = p.args();

                    std::vector<Gradient> argGrads;
                    argGrads.reserve(args.size());
                    for (const auto& a : args) {
                        auto ag = differentiate(a, values, grads);
                        if (!ag) {
                            return std::nullopt;
                        }
                        argGrads.push_back(std::move(*ag));
                    }

                    auto argVals = argValues(p, values);
                    if (!argVals) {
                        return std::nullopt;
                    }
                    auto local = p.localGradients(*argVals, e.shape());
                    if (!local) {
                        return std::nullopt;
                    }

                    Gradient result;
                    for (std::size_t i = 0; i < args.size(); ++i) {
                        for (const auto& [id, block] : argGrads[i]) {
                            accumulate(result, id, SparseMatrix(block * (*local)[i]));
                        }
                    }
                    return result;
                }
            }, e.node().payload);
            grads.emplace(e.id(), g);
            return g;
        }

        inline std::vector<Expression> argsOf(const Node& n) {
            return std::visit([](const auto& p) -> std::vector<Expression> {
                if constexpr (std::decay_t<decltype(p)>::leaf) {
                    return {};
                }
                else {
                    return p.args();
                }
            }, n.payload);
        }

        inline void collectDomain(const Expression& e,
                                  std::unordered_set<std::uint64_t>& seen,
                                  std::vector<Constraint>& out);

        inline Precedence precedenceOf(const Expression& e) {
            switch (e.kind()) {
            case NodeKind::Add:
                return Precedence::Sum;
            case NodeKind::Multiply:
            case NodeKind::RightMultiply:
            case NodeKind::Divide:
                return Precedence::Product;
            case NodeKind::Negate:
                return Precedence::Unary;
            default:
                return Precedence::Atom;
            }
        }

        /// Collects distinct leaves of type Leaf reachable from e
        template<typename Leaf>
        void collectLeaves(const Expression& e,
                           std::unordered_set<std::uint64_t>& seen,
                           std::vector<Expression>& out)
        {
            if (!seen.insert(e.id()).second) {
                return;
            }
            if (std::holds_alternative<Leaf>(e.node().payload)) {
                out.push_back(e);
                return;
            }
            for (const auto& a : e.args()) {
                collectLeaves<Leaf>(a, seen, out);
            }
        }

    } // namespace detail

    // ============================================================================
    // EXPRESSION — member definitions
    // ============================================================================

    inline Expression::Expression(std::shared_ptr<const detail::Node> node)
        : node_(std::move(node))
    {
        if (!node_) {
            throw std::invalid_argument("Expression: null node");
        }
    }

    inline std::uint64_t Expression::id() const noexcept { return node_->id; }

    inline NodeKind Expression::kind() const noexcept {
        return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kind; }, node_->payload);
    }

    inline const Shape& Expression::shape() const noexcept { return node_->shape; }

    inline Classification Expression::classification() const {
        detail::NodeMemo<Classification> memo;
        return detail::classify(*this, memo);
    }

    inline std::optional<Matrix> Expression::value() const {
        detail::ValueMemo memo;
        return detail::evaluate(*this, memo);
    }

    inline std::optional<Gradient> Expression::gradient() const {
        detail::ValueMemo values;
        detail::GradientMemo grads;
        return detail::differentiate(*this, values, grads);
    }

    inline std::vector<Constraint> Expression::domain() const {
        std::unordered_set<std::uint64_t> seen;
        std::vector<Constraint> out;
        detail::collectDomain(*this, seen, out);
        return out;
    }

    inline std::string Expression::name() const {
        return std::visit([](const auto& p) { return p.render(); }, node_->payload);
    }

    inline std::vector<Expression> Expression::args() const { return detail::argsOf(*node_); }

    inline std::vector<Expression> Expression::variables() const {
        std::unordered_set<std::uint64_t> seen;
        std::vector<Expression> out;
        detail::collectLeaves<detail::VariableLeaf>(*this, seen, out);
        return out;
    }

    inline std::vector<Expression> Expression::parameters() const {
        std::unordered_set<std::uint64_t> seen;
        std::vector<Expression> out;
        detail::collectLeaves<detail::ParameterLeaf>(*this, seen, out);
        return out;
    }

    inline Expression Expression::operator()(const KeyPart& row, const KeyPart& col) const {
        return index(*this, Key{ row, col });
    }

    inline Expression Expression::operator[](const KeyPart& part) const {
        return index(*this, vectorKey(part, shape()));
    }

    inline Expression Expression::operator[](const Mask& mask) const {
        return specialIndex(*this, mask);
    }

    inline Expression Expression::T() const { return transpose(*this); }

    // ============================================================================
    // CONSTRAINT — member definitions
    // ============================================================================

    namespace detail {
        /**
         * Validates the two sides of a relation as the caller wrote them
         *
         * @param op Builder name reported by DimensionMismatch
         * @throws DimensionMismatch on incompatible shapes
         */
        inline void requireConstraintShapes(ConstraintKind kind, std::string_view op,
                                            const Expression& lhs, const Expression& rhs)
        {
            if (kind == ConstraintKind::PositiveSemidefinite) {
                if (!lhs.shape().isSquare() || lhs.shape() != rhs.shape()) {
                    throw DimensionMismatch(op, lhs.shape(), rhs.shape());
                }
                return;
            }
            sumShape(op, lhs.shape(), rhs.shape());
        }

        inline Shape constraintShape(ConstraintKind kind, const Expression& lhs, const Expression& rhs) {
            switch (kind) {
            case ConstraintKind::Equality:
                return sumShape("equals", lhs.shape(), rhs.shape());
            case ConstraintKind::Inequality:
                return sumShape("leq", lhs.shape(), rhs.shape());
            case ConstraintKind::PositiveSemidefinite:
                requireConstraintShapes(kind, "psd", lhs, rhs);
                return lhs.shape();
            default:
                throw std::invalid_argument("Constraint: invalid kind");
            }
        }
    }

    inline Constraint::Constraint(ConstraintKind kind, Expression lhs, Expression rhs)
        : kind_(kind),
          lhs_(std::move(lhs)),
          rhs_(std::move(rhs)),
          shape_(detail::constraintShape(kind_, lhs_, rhs_)),
          id_(detail::nextId())
    {
    }

    inline Expression Constraint::expression() const { return subtract(lhs_, rhs_); }

    inline bool Constraint::isDcp() const {
        const Classification c = expression().classification();
        return kind_ == ConstraintKind::Inequality ? c.convex : c.isAffine();
    }

    inline std::optional<double> Constraint::violation() const {
        auto l = lhs_.value();
        auto r = rhs_.value();
        if (!l || !r) {
            return std::nullopt;
        }
        const Matrix diff = broadcastTo(*l, shape_) - broadcastTo(*r, shape_);

        switch (kind_) {
        case ConstraintKind::Equality:
            return diff.cwiseAbs().maxCoeff();
        case ConstraintKind::Inequality:
            return std::max(diff.maxCoeff(), 0.0);
        case ConstraintKind::PositiveSemidefinite:
            return std::max(-minEigenvalue(diff), 0.0);
        default:
            return std::nullopt;
        }
    }

    inline std::optional<bool> Constraint::value() const {
        auto v = violation();
        if (!v) {
            return std::nullopt;
        }
        return *v <= FEASIBILITY_TOL;
    }

    inline std::string Constraint::name() const {
        std::string_view op = "==";
        if (kind_ == ConstraintKind::Inequality) op = "<=";
        if (kind_ == ConstraintKind::PositiveSemidefinite) op = ">>";
        return std::format("{} {} {}", lhs_.name(), op, rhs_.name());
    }

    // ============================================================================
    // LEAF HANDLES
    // ============================================================================

    /**
     * @class Variable
     * @brief Optimization variable: affine, unknown sign, optional value
     *
     * @details Unnamed variables are called "var<id>". The value slot is shared
     *          by every copy of the handle and every expression using it.
     *
     * @example
     *     dcp::Variable x;             // scalar
     *     dcp::Variable y(3);          // 3 x 1
     *     dcp::Variable X(2, 2, "X");  // 2 x 2
     */
    class Variable : public Expression {
        static std::shared_ptr<const detail::Node> make(int rows, int cols, std::string name) {
            auto node = std::make_shared<detail::Node>(Shape(rows, cols),
                detail::VariableLeaf{ std::move(name), std::make_shared<detail::ValueSlot>() });
            auto& leaf = std::get<detail::VariableLeaf>(node->payload);
            if (leaf.name.empty()) {
                leaf.name = naming::autoName("var", node->id);
            }
            return node;
        }

        const detail::VariableLeaf& leaf() const {
            return std::get<detail::VariableLeaf>(node_->payload);
        }

    public:
        explicit Variable(int rows = 1, int cols = 1, std::string name = {})
            : Expression(make(rows, cols, std::move(name)))
        {
        }

        explicit Variable(std::string name, int rows = 1, int cols = 1)
            : Expression(make(rows, cols, std::move(name)))
        {
        }

        /// @throws DimensionMismatch if the value shape differs from shape()
        void setValue(const Matrix& v) {
            if (shapeOf(v) != shape()) {
                throw DimensionMismatch("value", shape(), shapeOf(v));
            }
            leaf().slot->value = v;
        }

        void setValue(double v) { setValue(Matrix::Constant(1, 1, v)); }

        void clearValue() { leaf().slot->value.reset(); }
    };

    /**
     * @class Parameter
     * @brief Constant placeholder with a declared sign and a mutable value
     *
     * @details Classified as constant; its sign is the declared one,
     *          regardless of the value it currently holds. Unnamed parameters
     *          are called "param<id>".
     */
    class Parameter : public Expression {
        static SignBounds bounds(Sign sign) {
            switch (sign) {
            case Sign::Zero:     return { true, true };
            case Sign::Positive: return { true, false };
            case Sign::Negative: return { false, true };
            default:             return { false, false };
            }
        }

        static std::shared_ptr<const detail::Node> make(int rows, int cols, std::string name, Sign sign) {
            auto node = std::make_shared<detail::Node>(Shape(rows, cols),
                detail::ParameterLeaf{ std::move(name), bounds(sign), std::make_shared<detail::ValueSlot>() });
            auto& leaf = std::get<detail::ParameterLeaf>(node->payload);
            if (leaf.name.empty()) {
                leaf.name = naming::autoName("param", node->id);
            }
            return node;
        }

        const detail::ParameterLeaf& leaf() const {
            return std::get<detail::ParameterLeaf>(node_->payload);
        }

    public:
        Parameter(int rows, int cols, std::string name = {}, Sign sign = Sign::Unknown)
            : Expression(make(rows, cols, std::move(name), sign))
        {
        }

        explicit Parameter(Sign sign = Sign::Unknown, std::string name = {})
            : Expression(make(1, 1, std::move(name), sign))
        {
        }

        /**
         * @throws DimensionMismatch on shape mismatch
         * @throws std::invalid_argument if v contradicts the declared sign
         */
        void setValue(const Matrix& v) {
            if (shapeOf(v) != shape()) {
                throw DimensionMismatch("value", shape(), shapeOf(v));
            }
            const SignBounds& d = leaf().declared;
            if ((d.positive && !allPositive(v)) || (d.negative && !allNegative(v))) {
                throw std::invalid_argument(std::format(
                    "Parameter '{}': value contradicts declared sign {}", leaf().name, to_string(sign())));
            }
            leaf().slot->value = v;
        }

        void setValue(double v) { setValue(Matrix::Constant(1, 1, v)); }

        void clearValue() { leaf().slot->value.reset(); }
    };

    /**
     * @class Constant
     * @brief Numeric literal node; sign comes from its entries
     *
     * @details Column vectors known at compile time (Eigen::VectorXd,
     *          Eigen::Vector3d, ...) and std::vector<double> are recorded as
     *          1-D arrays, shape (n, 1); see multiply() for why that matters.
     *
     * @throws std::invalid_argument for empty values
     */
    class Constant : public Expression {
    public:
        explicit Constant(double v)
            : Expression(detail::constantExpression(Matrix::Constant(1, 1, v)))
        {
        }

        template<typename Derived>
        explicit Constant(const Eigen::MatrixBase<Derived>& m)
            : Expression(detail::constantExpression(Matrix(m), Derived::ColsAtCompileTime == 1))
        {
        }

        explicit Constant(const std::vector<double>& v)
            : Expression(detail::constantExpression(
                Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size())), true))
        {
        }

        /// @brief True if built from a 1-D array
        [[nodiscard]] bool oneDim() const {
            return std::get<detail::ConstantLeaf>(node_->payload).oneDim;
        }
    };

    namespace detail {

        inline Expression constantExpression(const Matrix& value, bool oneDim) {
            if (value.size() == 0) {
                throw std::invalid_argument("Constant: value cannot be empty");
            }
            return makeNode(shapeOf(value), ConstantLeaf{ value, oneDim });
        }

        inline std::vector<Constraint> PowerAtom::ownDomain() const {
            if (!restrictsDomain()) {
                return {};
            }
            return { Constraint(ConstraintKind::Inequality, constantExpression(Matrix::Zero(1, 1)), arg) };
        }

        /// Side constraints below e, each node contributing once
        inline void collectDomain(const Expression& e,
                                  std::unordered_set<std::uint64_t>& seen,
                                  std::vector<Constraint>& out)
        {
            if (!seen.insert(e.id()).second) {
                return;
            }
            std::visit([&](const auto& p) {
                if constexpr (!std::decay_t<decltype(p)>::leaf) {
                    for (const auto& a : p.args()) {
                        collectDomain(a, seen, out);
                    }
                    auto own = p.ownDomain();
                    out.insert(out.end(), std::make_move_iterator(own.begin()), std::make_move_iterator(own.end()));
                }
            }, e.node().payload);
        }

        /// Pairs of node ids already shown to be structurally equal
        using ProvenPairs = std::set<std::pair<std::uint64_t, std::uint64_t>>;

        inline bool equalNodes(const Expression& a, const Expression& b, ProvenPairs& proven);

    } // namespace detail

    // ============================================================================
    // STRUCTURAL EQUALITY
    // ============================================================================

    /**
     * @brief True if both graphs compute the same thing the same way
     *
     * @details Same node, or same kind, same shape, equal attributes (constant
     *          values, exponents, selected positions, the very same variable or
     *          parameter) and structurally equal arguments in order.
     */
    [[nodiscard]] inline bool structurallyEqual(const Expression& a, const Expression& b) {
        detail::ProvenPairs proven;
        return detail::equalNodes(a, b, proven);
    }

    namespace detail {

        inline bool equalNodes(const Expression& a, const Expression& b, ProvenPairs& proven) {
            if (a.sameNode(b) || proven.contains({ a.id(), b.id() })) {
                return true;
            }
            if (a.shape() != b.shape() || a.node().payload.index() != b.node().payload.index()) {
                return false;
            }

            const bool attributes = std::visit([&b](const auto& p) {
                using P = std::decay_t<decltype(p)>;
                return p.sameAttributes(std::get<P>(b.node().payload));
            }, a.node().payload);
            if (!attributes) {
                return false;
            }

            const auto x = a.args();
            const auto y = b.args();
            if (x.size() != y.size()) {
                return false;
            }
            for (std::size_t i = 0; i < x.size(); ++i) {
                if (!equalNodes(x[i], y[i], proven)) {
                    return false;
                }
            }
            proven.emplace(a.id(), b.id());
            return true;
        }

    } // namespace detail

} // namespace dcp

#include "composition.h"

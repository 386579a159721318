/*
===============================================================================
TEST COMPOSITION — Tests for composition.h and the arithmetic operators
===============================================================================

OVERVIEW
--------
Validates each composition rule: shape checks, DCP preconditions and the
curvature / sign of the node it builds.

TEST ORGANIZATION
-----------------
• Section A: Sums and negation
• Section B: Multiplication
• Section C: Division
• Section D: Power
• Section E: Transpose

TEST STRATEGY
-------------
• One scenario per rule, with the violating case next to the valid one
• Curvature checked through curvature() and sign through sign()

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• dcp.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>

#include <dcp/dcp.h>

#include <limits>
#include <stdexcept>
#include <vector>

using dcp::Curvature;
using dcp::NodeKind;
using dcp::Shape;
using dcp::Sign;

// ============================================================================
// SECTION A: SUMS AND NEGATION
// ============================================================================

/**
 * @test Add::ShapesAndFlattening
 * @brief Broadcast rule, flattening of nested sums, single-term identity
 *
 * @covers dcp::add, dcp::subtract
 */
TEST_CASE("A1: Add::ShapesAndFlattening", "[composition][add]")
{
    dcp::Variable x(3, 1, "x");
    dcp::Variable y(3, 1, "y");
    dcp::Variable z(2, 1, "z");

    SECTION("Equal shapes")
    {
        auto e = x + y;
        REQUIRE(e.kind() == NodeKind::Add);
        REQUIRE(e.shape() == Shape(3, 1));
    }

    SECTION("Scalars broadcast")
    {
        REQUIRE((x + 1).shape() == Shape(3, 1));
        REQUIRE((1 - x).shape() == Shape(3, 1));
    }

    SECTION("Incompatible shapes throw")
    {
        REQUIRE_THROWS_AS(x + z, dcp::DimensionMismatch);
        REQUIRE_THROWS_AS(x - z, dcp::DimensionMismatch);
        REQUIRE_THROWS_AS(x + x.T(), dcp::DimensionMismatch);
    }

    SECTION("Nested sums flatten into one node")
    {
        auto e = (x + y) + (x + 1);
        REQUIRE(e.args().size() == 4);
    }

    SECTION("Named n-ary form")
    {
        const std::vector<dcp::Expression> terms = { x, y, x };
        REQUIRE(dcp::add(terms).args().size() == 3);

        const std::vector<dcp::Expression> single = { x };
        REQUIRE(dcp::add(single).sameNode(x));

        REQUIRE_THROWS_AS(dcp::add(std::vector<dcp::Expression>{}), std::invalid_argument);
    }

    SECTION("Subtraction is addition of the negation")
    {
        auto e = x - y;
        REQUIRE(e.kind() == NodeKind::Add);
        REQUIRE(e.args()[1].kind() == NodeKind::Negate);
    }
}

/**
 * @test Add::Curvature
 * @brief Sum of convex terms is convex; mixing convex and concave is not DCP
 *
 * @covers AddAtom classification
 */
TEST_CASE("A2: Add::Curvature", "[composition][add]")
{
    dcp::Variable x("x");
    dcp::Variable y("y");

    auto cvx = dcp::power(x, 2) + dcp::power(y, 2);
    REQUIRE(cvx.curvature() == Curvature::Convex);
    REQUIRE(cvx.sign() == Sign::Positive);

    auto ccv = dcp::power(x, 0.5) + 3 * y;
    REQUIRE(ccv.curvature() == Curvature::Concave);

    auto mixed = dcp::power(x, 2) + dcp::power(y, 0.5);
    REQUIRE(mixed.curvature() == Curvature::Unknown);
    REQUIRE_FALSE(mixed.isDcp());

    SECTION("Sign of a sum")
    {
        REQUIRE((dcp::Constant(2.0) + dcp::Constant(3.0)).sign() == Sign::Positive);
        REQUIRE((dcp::Constant(2.0) + dcp::Constant(-3.0)).sign() == Sign::Unknown);
        REQUIRE((dcp::Constant(-1.0) - dcp::power(x, 2)).sign() == Sign::Negative);
    }
}

/**
 * @test Negate::SwapsCurvatureAndSign
 * @brief Negation swaps convex and concave and flips definite signs
 *
 * @scenario a convex nonnegative, b = -a
 * @given a = power(x, 2)
 * @when Negating
 * @then b is CONCAVE and NEGATIVE
 *
 * @covers dcp::negate
 */
TEST_CASE("A3: Negate::SwapsCurvatureAndSign", "[composition][negate]")
{
    dcp::Variable x("x");
    auto a = dcp::power(x, 2);
    REQUIRE(a.curvature() == Curvature::Convex);
    REQUIRE(a.sign() == Sign::Positive);

    auto b = -a;
    REQUIRE(b.kind() == NodeKind::Negate);
    REQUIRE(b.curvature() == Curvature::Concave);
    REQUIRE(b.sign() == Sign::Negative);

    REQUIRE((-b).curvature() == Curvature::Convex);
    REQUIRE((-x).curvature() == Curvature::Affine);
    REQUIRE((-x).sign() == Sign::Unknown);
    REQUIRE((-dcp::Constant(0.0)).sign() == Sign::Zero);
}

// ============================================================================
// SECTION B: MULTIPLICATION
// ============================================================================

/**
 * @test Multiply::RequiresAConstant
 * @brief Two non-constant operands are rejected
 *
 * @scenario x * y with two variables
 * @given Scalar variables x and y
 * @when Multiplying them
 * @then DisciplineViolation naming multiply
 *
 * @covers dcp::multiply
 */
TEST_CASE("B1: Multiply::RequiresAConstant", "[composition][multiply][error]")
{
    dcp::Variable x("x");
    dcp::Variable y("y");

    REQUIRE_THROWS_AS(x * y, dcp::DisciplineViolation);
    REQUIRE_THROWS_WITH(x * y, "multiply: cannot multiply two non-constant expressions");
    REQUIRE_THROWS_AS(dcp::power(x, 2) * x, dcp::DisciplineViolation);

    SECTION("Parameters count as constants")
    {
        dcp::Parameter p(Sign::Positive, "p");
        REQUIRE_NOTHROW(p * x);
        REQUIRE_NOTHROW(x * p);
    }
}

/**
 * @test Multiply::CanonicalOrder
 * @brief The constant becomes the left coefficient when possible
 *
 * @covers dcp::multiply node selection
 */
TEST_CASE("B2: Multiply::CanonicalOrder", "[composition][multiply]")
{
    dcp::Variable x(3, 1, "x");
    dcp::Variable X(3, 2, "X");

    SECTION("Constant on the left")
    {
        auto e = 2 * x;
        REQUIRE(e.kind() == NodeKind::Multiply);
        REQUIRE(e.args()[0].kind() == NodeKind::Constant);
    }

    SECTION("Scalar constant on the right moves left")
    {
        auto e = x * 2;
        REQUIRE(e.kind() == NodeKind::Multiply);
        REQUIRE(e.args()[0].kind() == NodeKind::Constant);
        REQUIRE(e.args()[1].sameNode(x));
    }

    SECTION("Scalar expression times constant matrix")
    {
        dcp::Variable s("s");
        auto e = s * dcp::Constant(Eigen::MatrixXd::Ones(2, 2));
        REQUIRE(e.kind() == NodeKind::Multiply);
        REQUIRE(e.shape() == Shape(2, 2));
    }

    SECTION("Matrix constant on the right")
    {
        auto e = X * dcp::Constant(Eigen::MatrixXd::Ones(2, 4));
        REQUIRE(e.kind() == NodeKind::RightMultiply);
        REQUIRE(e.shape() == Shape(3, 4));
        REQUIRE(e.curvature() == Curvature::Affine);
    }

    SECTION("Inner dimensions must agree")
    {
        REQUIRE_THROWS_AS(dcp::Constant(Eigen::MatrixXd::Ones(2, 2)) * x, dcp::DimensionMismatch);
        REQUIRE_THROWS_AS(X * dcp::Constant(Eigen::MatrixXd::Ones(3, 3)), dcp::DimensionMismatch);
    }
}

/**
 * @test Multiply::CoefficientSign
 * @brief Positive coefficients keep curvature, negative ones swap it
 *
 * @scenario Scaling convex and affine expressions
 * @given x scalar variable, power(x, 2) convex
 * @when Multiplying by 5, -2 and an unsigned parameter
 * @then 5 keeps, -2 swaps, unknown sign breaks DCP on non-affine arguments
 *
 * @covers MultiplyAtom classification
 */
TEST_CASE("B3: Multiply::CoefficientSign", "[composition][multiply]")
{
    dcp::Variable x("x");
    auto sq = dcp::power(x, 2);

    SECTION("Positive scale keeps curvature")
    {
        auto e = 5 * x;
        REQUIRE(e.curvature() == x.curvature());
        REQUIRE(e.shape() == Shape(1, 1));
        REQUIRE((5 * sq).curvature() == Curvature::Convex);
        REQUIRE((5 * sq).sign() == Sign::Positive);
    }

    SECTION("Negative scale swaps curvature")
    {
        auto e = -2 * sq;
        REQUIRE(e.curvature() == Curvature::Concave);
        REQUIRE(e.sign() == Sign::Negative);
        REQUIRE((sq * -2).curvature() == Curvature::Concave);
    }

    SECTION("Unknown scale of an affine expression stays affine")
    {
        dcp::Parameter p(Sign::Unknown, "p");
        REQUIRE((p * x).curvature() == Curvature::Affine);
    }

    SECTION("Unknown scale of a convex expression is not DCP")
    {
        dcp::Parameter p(Sign::Unknown, "p");
        auto e = p * sq;
        REQUIRE(e.curvature() == Curvature::Unknown);
        REQUIRE_FALSE(e.isDcp());
    }

    SECTION("Matrix coefficients")
    {
        dcp::Variable v(2, 1, "v");
        Eigen::MatrixXd pos(2, 2);
        pos << 1, 2,
               3, 4;
        auto e = dcp::Constant(pos) * dcp::power(v, 2);
        REQUIRE(e.curvature() == Curvature::Convex);
        REQUIRE(e.sign() == Sign::Positive);

        auto mixed = dcp::Constant(Eigen::MatrixXd(pos - Eigen::MatrixXd::Constant(2, 2, 2.5))) * dcp::power(v, 2);
        REQUIRE(mixed.curvature() == Curvature::Unknown);
    }
}

/**
 * @test Multiply::LegacyVectorTranspose
 * @brief A 1-D constant matching the other operand's rows is used as a row
 *
 * @scenario c . x with c a std::vector and x a column variable
 * @given c of length 3 and x of shape (3, 1)
 * @when Building c * x
 * @then The product is (1, 1); a 2-D (3, 1) constant is rejected instead
 *
 * @covers dcp::multiply, DCP_STRICT_SHAPES
 */
TEST_CASE("B4: Multiply::LegacyVectorTranspose", "[composition][multiply][legacy]")
{
    dcp::Variable x(3, 1, "x");
    const std::vector<double> c = { 1.0, 2.0, 3.0 };

    if constexpr (dcp::legacy_vector_transpose()) {
        auto e = c * x;
        REQUIRE(e.shape() == Shape(1, 1));
        REQUIRE(e.args()[0].shape() == Shape(1, 3));

        auto f = dcp::Constant(Eigen::Vector3d(1, 2, 3)) * x;
        REQUIRE(f.shape() == Shape(1, 1));
    }
    else {
        REQUIRE_THROWS_AS(c * x, dcp::DimensionMismatch);
    }

    SECTION("2-D column constants are never transposed")
    {
        REQUIRE_THROWS_AS(dcp::Constant(Eigen::MatrixXd::Ones(3, 1)) * x, dcp::DimensionMismatch);
    }

    SECTION("Square constants are never transposed")
    {
        dcp::Variable s(1, 1, "s");
        auto e = dcp::Constant(std::vector<double>{ 4.0 }) * s;
        REQUIRE(e.shape() == Shape(1, 1));
    }
}

// ============================================================================
// SECTION C: DIVISION
// ============================================================================

/**
 * @test Divide::ScalarConstantOnly
 * @brief The divisor must be a nonzero scalar constant
 *
 * @covers dcp::divide
 */
TEST_CASE("C1: Divide::ScalarConstantOnly", "[composition][divide][error]")
{
    dcp::Variable x(2, 1, "x");
    dcp::Variable y("y");

    REQUIRE_THROWS_AS(x / y, dcp::DisciplineViolation);
    REQUIRE_THROWS_WITH(x / y, "divide: can only divide by a scalar constant");
    REQUIRE_THROWS_AS((x / std::vector<double>{ 1.0, 2.0 }), dcp::DisciplineViolation);
    REQUIRE_THROWS_WITH(x / 0, "divide: division by zero");

    SECTION("Parameter divisors are accepted")
    {
        dcp::Parameter p(Sign::Positive, "p");
        auto e = x / p;
        REQUIRE(e.kind() == NodeKind::Divide);
        REQUIRE(e.shape() == Shape(2, 1));
    }

    SECTION("A parameter holding zero is rejected")
    {
        dcp::Parameter p(Sign::Unknown, "p");
        p.setValue(0.0);
        REQUIRE_THROWS_AS(x / p, dcp::DisciplineViolation);
    }
}

/**
 * @test Divide::Curvature
 * @brief Positive divisors keep curvature, negative ones swap it
 *
 * @covers DivideAtom classification
 */
TEST_CASE("C2: Divide::Curvature", "[composition][divide]")
{
    dcp::Variable x("x");
    auto sq = dcp::power(x, 2);

    REQUIRE((sq / 4).curvature() == Curvature::Convex);
    REQUIRE((sq / 4).sign() == Sign::Positive);
    REQUIRE((sq / -4).curvature() == Curvature::Concave);
    REQUIRE((sq / -4).sign() == Sign::Negative);
    REQUIRE((x / 2).curvature() == Curvature::Affine);
    REQUIRE((dcp::Constant(6.0) / 3).curvature() == Curvature::Constant);
}

// ============================================================================
// SECTION D: POWER
// ============================================================================

/**
 * @test Power::ExponentTable
 * @brief Curvature of x^p for an affine argument across exponent ranges
 *
 * @scenario Power of a scalar variable
 * @given Affine x
 * @when Raising to p in {-1, 0, 0.5, 1, 2, 3}
 * @then Convex outside [0, 1], concave inside, affine at 0 and 1
 *
 * @covers dcp::power, PowerAtom
 */
TEST_CASE("D1: Power::ExponentTable", "[composition][power]")
{
    dcp::Variable x("x");

    REQUIRE(dcp::power(x, -1).curvature() == Curvature::Convex);
    REQUIRE(dcp::power(x, 0).curvature() == Curvature::Affine);
    REQUIRE(dcp::power(x, 0.5).curvature() == Curvature::Concave);
    REQUIRE(dcp::power(x, 1).curvature() == Curvature::Affine);
    REQUIRE(dcp::power(x, 2).curvature() == Curvature::Convex);
    REQUIRE(dcp::power(x, 3).curvature() == Curvature::Convex);

    SECTION("Sign")
    {
        REQUIRE(dcp::power(x, 2).sign() == Sign::Positive);
        REQUIRE(dcp::power(x, 0.5).sign() == Sign::Positive);
        REQUIRE(dcp::power(x, 1).sign() == Sign::Unknown);
        REQUIRE(dcp::power(dcp::power(x, 2), 1).sign() == Sign::Positive);
    }

    SECTION("Kind and shape")
    {
        dcp::Variable v(3, 2, "v");
        auto e = dcp::power(v, 2);
        REQUIRE(e.kind() == NodeKind::Power);
        REQUIRE(e.shape() == Shape(3, 2));
    }
}

/**
 * @test Power::Composition
 * @brief Non-affine arguments must compose with the power's monotonicity
 *
 * @covers PowerAtom::monotonicity
 */
TEST_CASE("D2: Power::Composition", "[composition][power]")
{
    dcp::Variable x("x");

    SECTION("Convex positive argument under an even power")
    {
        REQUIRE(dcp::power(dcp::power(x, 2), 2).curvature() == Curvature::Convex);
    }

    SECTION("Concave negative argument under an even power")
    {
        REQUIRE(dcp::power(-dcp::power(x, 2), 2).curvature() == Curvature::Convex);
    }

    SECTION("Concave argument under a concave power")
    {
        REQUIRE(dcp::power(dcp::power(x, 0.5), 0.5).curvature() == Curvature::Concave);
    }

    SECTION("Concave argument under a negative power")
    {
        REQUIRE(dcp::power(dcp::power(x, 0.5), -1).curvature() == Curvature::Convex);
    }

    SECTION("Non-DCP results are rejected")
    {
        REQUIRE_THROWS_AS(dcp::power(dcp::power(x, 2), 0.5), dcp::DisciplineViolation);
        REQUIRE_THROWS_AS(dcp::power(dcp::power(x, 0.5), 2), dcp::DisciplineViolation);
        REQUIRE_THROWS_AS(dcp::power(dcp::power(x, 2) + dcp::power(x, 0.5), 1), dcp::DisciplineViolation);
    }

    SECTION("Zero exponent accepts convex and concave arguments")
    {
        REQUIRE(dcp::power(dcp::power(x, 2), 0).curvature() == Curvature::Affine);
        REQUIRE(dcp::power(dcp::power(x, 0.5), 0).curvature() == Curvature::Affine);
    }
}

/**
 * @test Power::ExponentValidation
 * @brief Exponents must be finite; expression exponents must be scalar constants with a value
 *
 * @covers dcp::power overloads
 */
TEST_CASE("D3: Power::ExponentValidation", "[composition][power][error]")
{
    dcp::Variable x("x");

    REQUIRE_THROWS_AS(dcp::power(x, std::numeric_limits<double>::infinity()), std::invalid_argument);
    REQUIRE_THROWS_AS(dcp::power(x, std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);

    SECTION("Constant expression exponent")
    {
        auto e = dcp::power(x, dcp::Constant(2.0));
        REQUIRE(e.curvature() == Curvature::Convex);
    }

    SECTION("Variable exponent")
    {
        dcp::Variable y("y");
        REQUIRE_THROWS_WITH(dcp::power(x, y), "power: exponent must be a scalar constant");
    }

    SECTION("Parameter exponent without a value")
    {
        dcp::Parameter p(Sign::Positive, "p");
        REQUIRE_THROWS_WITH(dcp::power(x, p), "power: exponent has no value");

        p.setValue(2.0);
        REQUIRE(dcp::power(x, p).curvature() == Curvature::Convex);
    }
}

// ============================================================================
// SECTION E: TRANSPOSE
// ============================================================================

/**
 * @test Transpose::ShapeAndIdentity
 * @brief Swaps dimensions, keeps curvature and sign, scalars unchanged
 *
 * @scenario Transposing scalars, vectors and matrices twice
 * @given Scalar s, vector x, square matrix X
 * @when Applying transpose
 * @then Scalars return the same node; double transposes restore shape,
 *       curvature and sign
 *
 * @covers dcp::transpose, Expression::T
 */
TEST_CASE("E1: Transpose::ShapeAndIdentity", "[composition][transpose]")
{
    dcp::Variable s("s");
    dcp::Variable x(3, 1, "x");
    dcp::Variable X(2, 2, "X");

    SECTION("Scalar transpose is the same node")
    {
        REQUIRE(s.T().sameNode(s));
        REQUIRE(dcp::transpose(s).sameNode(s));
    }

    SECTION("Vector transpose")
    {
        auto t = x.T();
        REQUIRE(t.kind() == NodeKind::Transpose);
        REQUIRE(t.shape() == Shape(1, 3));
    }

    SECTION("Double transpose restores dimensions, curvature and sign")
    {
        auto a = dcp::power(X, 2);
        auto tt = a.T().T();
        REQUIRE(tt.shape() == a.shape());
        REQUIRE(tt.curvature() == a.curvature());
        REQUIRE(tt.sign() == a.sign());
    }

    SECTION("Concave negative operand")
    {
        auto t = (-dcp::power(x, 2)).T();
        REQUIRE(t.curvature() == Curvature::Concave);
        REQUIRE(t.sign() == Sign::Negative);
    }
}

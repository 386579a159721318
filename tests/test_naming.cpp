/*
===============================================================================
TEST NAMING — Tests for naming.h and expression names
===============================================================================

OVERVIEW
--------
Validates the formatting primitives and the infix names every node renders:
default leaf names, constant values, operator spelling and parenthesization
of lower-precedence operands.

TEST ORGANIZATION
-----------------
• Section A: Formatting primitives
• Section B: Leaf names
• Section C: Composite names

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• naming.h, dcp.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>

#include <dcp/dcp.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// SECTION A: FORMATTING PRIMITIVES
// ============================================================================

/**
 * @test Naming::Primitives
 * @brief concat, autoName, scalar, matrix, subscript, parenthesize
 *
 * @covers dcp::naming
 */
TEST_CASE("A1: Naming::Primitives", "[naming]")
{
    using namespace dcp::naming;

    SECTION("concat streams every part")
    {
        REQUIRE(concat("x", 1, "_", 2.5) == "x1_2.5");
    }

    SECTION("autoName")
    {
        REQUIRE(autoName("var", 7) == "var7");
        REQUIRE_THROWS_AS(autoName("", 7), std::invalid_argument);
    }

    SECTION("scalar uses the shortest round-trip form")
    {
        REQUIRE(scalar(5.0) == "5");
        REQUIRE(scalar(0.25) == "0.25");
        REQUIRE(scalar(-1.5) == "-1.5");
    }

    SECTION("matrix renders row by row")
    {
        Eigen::MatrixXd m(2, 2);
        m << 1, 2,
             3, 4;
        REQUIRE(matrix(m) == "[[1, 2], [3, 4]]");
        REQUIRE(matrix(Eigen::MatrixXd::Constant(1, 1, 3.0)) == "3");
    }

    SECTION("subscript and parenthesize")
    {
        REQUIRE(subscript("x", "0:2, 1") == "x[0:2, 1]");
        REQUIRE(subscript("(X + 1)", "[0, 2], :") == "(X + 1)[[0, 2], :]");
        REQUIRE(parenthesize("a + b", true) == "(a + b)");
        REQUIRE(parenthesize("a", false) == "a");
    }
}

// ============================================================================
// SECTION B: LEAF NAMES
// ============================================================================

/**
 * @test Naming::Leaves
 * @brief Explicit names are kept; unnamed leaves get var<id> / param<id>
 *
 * @covers Variable, Parameter, Constant names
 */
TEST_CASE("B1: Naming::Leaves", "[naming][leaves]")
{
    SECTION("Named leaves")
    {
        dcp::Variable x("x");
        dcp::Parameter p(2, 2, "P");
        REQUIRE(x.name() == "x");
        REQUIRE(p.name() == "P");
    }

    SECTION("Unnamed leaves use their id")
    {
        dcp::Variable v;
        dcp::Parameter q;
        REQUIRE(v.name() == "var" + std::to_string(v.id()));
        REQUIRE(q.name() == "param" + std::to_string(q.id()));
    }

    SECTION("Constants print their value")
    {
        REQUIRE(dcp::Constant(3.0).name() == "3");
        REQUIRE(dcp::Constant(std::vector<double>{ 1.0, 2.0 }).name() == "[[1], [2]]");
    }
}

// ============================================================================
// SECTION C: COMPOSITE NAMES
// ============================================================================

/**
 * @test Naming::Composites
 * @brief Infix rendering with parentheses around looser operands
 *
 * @scenario Sums, products, negation, division, power, transpose, indexing
 * @given Named variables x, y and a matrix variable X
 * @when Rendering composite expressions
 * @then Names read like the source expression
 *
 * @covers Expression::name, operator<<
 */
TEST_CASE("C1: Naming::Composites", "[naming][composites]")
{
    dcp::Variable x("x");
    dcp::Variable y("y");
    dcp::Variable X(3, 3, "X");

    REQUIRE((x + y).name() == "x + y");
    REQUIRE((x - y).name() == "x + -y");
    REQUIRE((2 * x).name() == "2 * x");
    REQUIRE((2 * (x + y)).name() == "2 * (x + y)");
    REQUIRE((-(x + y)).name() == "-(x + y)");
    REQUIRE((x / 4).name() == "x / 4");
    REQUIRE(dcp::power(x, 2).name() == "power(x, 2)");
    REQUIRE(X.T().name() == "X.T");
    REQUIRE((X + 1).T().name() == "(X + 1).T");
    REQUIRE(X(dcp::Slice(0, 2), 1).name() == "X[0:2, 1]");
    REQUIRE(X(dcp::IndexList{ 0, 2 }, dcp::Slice::all()).name() == "X[[0, 2], :]");

    SECTION("Sums flatten")
    {
        REQUIRE((x + y + 1).name() == "x + y + 1");
    }

    SECTION("Stream output prints the name")
    {
        std::ostringstream oss;
        oss << (x + y);
        REQUIRE(oss.str() == "x + y");
    }

    SECTION("Constraints render their relation")
    {
        REQUIRE((x <= 3).name() == "x <= 3");
        REQUIRE((x >= y).name() == "y <= x");
        dcp::Variable Y(3, 3, "Y");
        REQUIRE((X >> Y).name() == "X >> Y");
        REQUIRE((X << Y).name() == "Y >> X");
    }
}

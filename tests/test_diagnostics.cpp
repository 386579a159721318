/*
===============================================================================
TEST DIAGNOSTICS — Tests for diagnostics.h
===============================================================================

OVERVIEW
--------
Validates the read-only analysis helpers: classification strings, graph
statistics, localisation of DCP failures, constraint reports and one-line
summaries.

TEST ORGANIZATION
-----------------
• Section A: Names and describe()
• Section B: Statistics
• Section C: Violations
• Section D: Constraint reports
• Section E: Summaries

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• diagnostics.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>

#include <dcp/dcp.h>

#include <string>
#include <vector>

using dcp::NodeKind;

// ============================================================================
// SECTION A: NAMES AND DESCRIBE
// ============================================================================

/**
 * @test Diagnostics::Describe
 * @brief describe() reports curvature, sign and shape
 *
 * @covers dcp::describe, dcp::curvatureString, dcp::signString
 */
TEST_CASE("A1: Diagnostics::Describe", "[diagnostics][describe]")
{
    dcp::Variable x(3, 1, "x");

    REQUIRE(dcp::curvatureString(dcp::Curvature::Convex) == "CONVEX");
    REQUIRE(dcp::signString(dcp::Sign::Negative) == "NEGATIVE");

    REQUIRE(dcp::describe(x) == "Expression(AFFINE, UNKNOWN, (3, 1))");
    REQUIRE(dcp::describe(dcp::power(x, 2)) == "Expression(CONVEX, POSITIVE, (3, 1))");
    REQUIRE(dcp::describe(dcp::Constant(-1.0)) == "Expression(CONSTANT, NEGATIVE, (1, 1))");
}

// ============================================================================
// SECTION B: STATISTICS
// ============================================================================

/**
 * @test Diagnostics::Statistics
 * @brief Node counts, leaf counts and depth
 *
 * @scenario x + 2 * y
 * @given Scalar variables x and y
 * @when Computing statistics
 * @then 5 nodes, 3 leaves, 2 variables, 1 constant, depth 3
 *
 * @covers dcp::computeStatistics
 */
TEST_CASE("B1: Diagnostics::Statistics", "[diagnostics][stats]")
{
    dcp::Variable x("x");
    dcp::Variable y("y");

    auto stats = dcp::computeStatistics(x + 2 * y);
    REQUIRE(stats.numNodes == 5);
    REQUIRE(stats.numLeaves == 3);
    REQUIRE(stats.numVariables == 2);
    REQUIRE(stats.numConstants == 1);
    REQUIRE(stats.numParameters == 0);
    REQUIRE(stats.depth == 3);
    REQUIRE(stats.kindCounts[static_cast<std::size_t>(NodeKind::Add)] == 1);
    REQUIRE(stats.kindCounts[static_cast<std::size_t>(NodeKind::Multiply)] == 1);

    SECTION("Shared subexpressions are counted once")
    {
        auto sq = dcp::power(x, 2);
        auto e = sq + 3 * sq;
        auto s = dcp::computeStatistics(e);
        REQUIRE(s.numNodes == 5);
        REQUIRE(s.numVariables == 1);
        REQUIRE(s.depth == 4);
    }

    SECTION("A single leaf")
    {
        auto s = dcp::computeStatistics(x);
        REQUIRE(s.numNodes == 1);
        REQUIRE(s.depth == 1);
    }
}

// ============================================================================
// SECTION C: VIOLATIONS
// ============================================================================

/**
 * @test Diagnostics::FindViolations
 * @brief The innermost non-DCP subexpressions are reported with a rule
 *
 * @covers dcp::findViolations
 */
TEST_CASE("C1: Diagnostics::FindViolations", "[diagnostics][violations]")
{
    dcp::Variable x("x");
    dcp::Variable y("y");

    SECTION("DCP expressions have none")
    {
        REQUIRE(dcp::findViolations(dcp::power(x, 2) + 3 * y).empty());
    }

    SECTION("Convex plus concave")
    {
        auto bad = dcp::power(x, 2) + dcp::power(y, 0.5);
        auto v = dcp::findViolations(bad);
        REQUIRE(v.size() == 1);
        REQUIRE(v[0].expression.sameNode(bad));
        REQUIRE(v[0].rule == "sum of convex and concave terms");
    }

    SECTION("Innermost failure inside a larger expression")
    {
        auto bad = dcp::power(x, 2) - dcp::power(x, 2);
        auto outer = 2 * bad + 1;
        auto v = dcp::findViolations(outer);
        REQUIRE(v.size() == 1);
        REQUIRE(v[0].expression.sameNode(bad));
    }

    SECTION("Coefficient of unknown sign")
    {
        dcp::Parameter p(dcp::Sign::Unknown, "p");
        auto bad = p * dcp::power(x, 2);
        auto v = dcp::findViolations(bad);
        REQUIRE(v.size() == 1);
        REQUIRE(v[0].rule == "coefficient of unknown sign scales a non-affine expression");
    }
}

// ============================================================================
// SECTION D: CONSTRAINT REPORTS
// ============================================================================

/**
 * @test Diagnostics::CheckConstraints
 * @brief Counts by kind and collects non-DCP constraints in order
 *
 * @covers dcp::checkConstraints, ConstraintReport
 */
TEST_CASE("D1: Diagnostics::CheckConstraints", "[diagnostics][constraints]")
{
    dcp::Variable x("x");
    dcp::Variable X(2, 2, "X");

    const std::vector<dcp::Constraint> constraints = {
        dcp::power(x, 2) <= 4,
        x == 1,
        dcp::power(x, 2) >= 1,
        X >> Eigen::MatrixXd::Zero(2, 2)
    };

    auto report = dcp::checkConstraints(constraints);
    REQUIRE(report.numEquality == 1);
    REQUIRE(report.numInequality == 2);
    REQUIRE(report.numSemidefinite == 1);
    REQUIRE(report.size() == 4);
    REQUIRE_FALSE(report.allDcp());
    REQUIRE(report.nonDcp.size() == 1);
    REQUIRE(report.nonDcp[0].id() == constraints[2].id());

    SECTION("Empty input")
    {
        auto empty = dcp::checkConstraints(std::vector<dcp::Constraint>{});
        REQUIRE(empty.allDcp());
        REQUIRE(empty.size() == 0);
    }
}

// ============================================================================
// SECTION E: SUMMARIES
// ============================================================================

/**
 * @test Diagnostics::ExpressionSummary
 * @brief One-line summary with kind, classification, shape and counts
 *
 * @covers dcp::expressionSummary
 */
TEST_CASE("E1: Diagnostics::ExpressionSummary", "[diagnostics][summary]")
{
    dcp::Variable x(3, 1, "x");
    dcp::Parameter p(dcp::Sign::Positive, "p");

    const std::string plain = dcp::expressionSummary(dcp::power(x, 2) + 1);
    REQUIRE(plain.starts_with("Add: CONVEX, POSITIVE, (3, 1), 1 vars, 4 nodes"));

    const std::string withParams = dcp::expressionSummary(p * x);
    REQUIRE(withParams.starts_with("Multiply: AFFINE, UNKNOWN, (3, 1), 1 vars, 1 params, 3 nodes"));

    if constexpr (dcp::debug_reports()) {
        REQUIRE(plain.find("[id ") != std::string::npos);
    }
    else {
        REQUIRE(plain.find("[id ") == std::string::npos);
    }
}

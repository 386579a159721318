#pragma once
/*
===============================================================================
DIAGNOSTICS — DCP analysis reports and expression statistics
===============================================================================

Overview
--------
Read-only analysis of expression graphs and constraints. Nothing here prints:
every function returns a string or a plain result struct, and callers decide
where the text goes.

    * Human-readable curvature / sign names and describe()
    * Graph statistics (node counts by kind, depth, leaves)
    * Localisation of DCP failures (innermost non-DCP subexpressions)
    * DCP report for a list of constraints

Design Philosophy
-----------------
1. Free functions over Expression and Constraint
2. Lightweight result structs
3. Optional include: the core headers do not depend on this one

Typical Usage
-------------
    #include <dcp/dcp.h>

    auto e = dcp::power(x, 2) + dcp::power(y, 0.5);
    std::cout << dcp::describe(e) << "\n";
    // Expression(UNKNOWN, POSITIVE, (1, 1))

    for (const auto& v : dcp::findViolations(e)) {
        std::cout << v.expression.name() << ": " << v.rule << "\n";
    }

    auto stats = dcp::computeStatistics(e);
    std::cout << stats.numNodes << " nodes, depth " << stats.depth << "\n";

===============================================================================
*/

#include <algorithm>
#include <format>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config.h"
#include "expression.h"

namespace dcp {

// =============================================================================
// NAMES
// =============================================================================

/// @brief "CONSTANT", "AFFINE", "CONVEX", "CONCAVE" or "UNKNOWN"
inline std::string curvatureString(Curvature c) {
    return std::string(to_string(c));
}

/// @brief "ZERO", "POSITIVE", "NEGATIVE" or "UNKNOWN"
inline std::string signString(Sign s) {
    return std::string(to_string(s));
}

/**
 * @brief Short classification record of an expression
 * @return e.g. "Expression(CONVEX, POSITIVE, (3, 1))"
 */
inline std::string describe(const Expression& e) {
    const Classification c = e.classification();
    return std::format("Expression({}, {}, {})",
        to_string(c.curvature()), to_string(c.sign()), e.shape().str());
}

// =============================================================================
// STATISTICS
// =============================================================================

/**
 * @brief Size and composition of an expression graph
 *
 * @details Shared subexpressions are counted once.
 */
struct ExpressionStatistics {
    int numNodes = 0;       ///< Distinct nodes reachable from the root
    int numLeaves = 0;      ///< Constants, parameters and variables
    int numVariables = 0;   ///< Distinct variables
    int numParameters = 0;  ///< Distinct parameters
    int numConstants = 0;   ///< Constant leaves
    int depth = 0;          ///< Longest root-to-leaf path, in nodes
    EnumArray<NodeKind, int> kindCounts{};  ///< Nodes per kind
};

namespace diag_detail {

    /// Counts each distinct node once and returns its depth (memoized by id)
    inline int walk(const Expression& e, std::unordered_map<std::uint64_t, int>& depths, ExpressionStatistics& s) {
        if (auto it = depths.find(e.id()); it != depths.end()) {
            return it->second;
        }

        int deepest = 0;
        for (const auto& a : e.args()) {
            deepest = std::max(deepest, walk(a, depths, s));
        }

        ++s.numNodes;
        ++s.kindCounts[static_cast<std::size_t>(e.kind())];
        switch (e.kind()) {
        case NodeKind::Variable:  ++s.numVariables;  ++s.numLeaves; break;
        case NodeKind::Parameter: ++s.numParameters; ++s.numLeaves; break;
        case NodeKind::Constant:  ++s.numConstants;  ++s.numLeaves; break;
        default: break;
        }

        depths.emplace(e.id(), deepest + 1);
        return deepest + 1;
    }

    /// Why a node whose arguments are all DCP fails to be DCP
    inline std::string failedRule(const Expression& e) {
        switch (e.kind()) {
        case NodeKind::Add:
            return "sum of convex and concave terms";
        case NodeKind::Multiply:
        case NodeKind::RightMultiply:
        case NodeKind::Divide:
            return "coefficient of unknown sign scales a non-affine expression";
        default:
            return "arguments do not compose";
        }
    }

} // namespace diag_detail

/**
 * @brief Snapshot of graph statistics
 *
 * @example
 *     auto stats = computeStatistics(x + 2 * y);
 *     // stats.numNodes == 5, stats.numVariables == 2, stats.depth == 3
 */
inline ExpressionStatistics computeStatistics(const Expression& e) {
    ExpressionStatistics stats;
    std::unordered_map<std::uint64_t, int> depths;
    stats.depth = diag_detail::walk(e, depths, stats);
    return stats;
}

// =============================================================================
// DCP VIOLATIONS
// =============================================================================

/**
 * @brief A subexpression that breaks the DCP rules although its arguments do not
 */
struct Violation {
    Expression expression;  ///< The offending subexpression
    std::string rule;       ///< Which composition rule failed
};

namespace diag_detail {

    inline void collect(const Expression& e,
                        std::unordered_set<std::uint64_t>& seen,
                        std::vector<Violation>& out)
    {
        if (!seen.insert(e.id()).second || e.isDcp()) {
            return;
        }
        const auto args = e.args();
        const bool innermost = std::ranges::all_of(args, [](const Expression& a) { return a.isDcp(); });
        if (innermost) {
            out.push_back(Violation{ e, failedRule(e) });
            return;
        }
        for (const auto& a : args) {
            collect(a, seen, out);
        }
    }

} // namespace diag_detail

/**
 * @brief Innermost subexpressions with UNKNOWN curvature
 * @return Empty when e is DCP
 */
inline std::vector<Violation> findViolations(const Expression& e) {
    std::vector<Violation> out;
    std::unordered_set<std::uint64_t> seen;
    diag_detail::collect(e, seen, out);
    return out;
}

// =============================================================================
// CONSTRAINT REPORT
// =============================================================================

/**
 * @brief DCP status of a set of constraints
 */
struct ConstraintReport {
    int numEquality = 0;
    int numInequality = 0;
    int numSemidefinite = 0;
    std::vector<Constraint> nonDcp;   ///< Constraints failing isDcp(), in input order

    /// @brief True if every constraint is DCP
    bool allDcp() const { return nonDcp.empty(); }

    /// @brief Total number of constraints inspected
    int size() const { return numEquality + numInequality + numSemidefinite; }
};

inline ConstraintReport checkConstraints(std::span<const Constraint> constraints) {
    ConstraintReport report;
    for (const auto& c : constraints) {
        switch (c.kind()) {
        case ConstraintKind::Equality:             ++report.numEquality;     break;
        case ConstraintKind::Inequality:           ++report.numInequality;   break;
        case ConstraintKind::PositiveSemidefinite: ++report.numSemidefinite; break;
        default: break;
        }
        if (!c.isDcp()) {
            report.nonDcp.push_back(c);
        }
    }
    return report;
}

inline ConstraintReport checkConstraints(const std::vector<Constraint>& constraints) {
    return checkConstraints(std::span<const Constraint>(constraints));
}

// =============================================================================
// SUMMARY
// =============================================================================

/**
 * @brief One-line summary of an expression
 * @return e.g. "Add: CONVEX, POSITIVE, (3, 1), 2 vars, 6 nodes"; node ids are
 *         appended when DCP_DEBUG is defined
 */
inline std::string expressionSummary(const Expression& e) {
    const auto stats = computeStatistics(e);
    std::string result = std::format("{}: {}, {}, {}, {} vars",
        to_string(e.kind()), to_string(e.curvature()), to_string(e.sign()),
        e.shape().str(), stats.numVariables);

    if (stats.numParameters > 0) {
        result += std::format(", {} params", stats.numParameters);
    }
    result += std::format(", {} nodes", stats.numNodes);

    if constexpr (debug_reports()) {
        result += std::format(" [id {}]", e.id());
    }
    return result;
}

} // namespace dcp

/*
================================================================================
EXAMPLE 01: DCP BASICS - Curvature and Sign of Simple Expressions
================================================================================
DIFFICULTY: Beginner
TOPIC: Disciplined Convex Programming analysis

DESCRIPTION
-----------
Builds a handful of scalar expressions from a variable, a parameter and
numeric literals, and prints the curvature and sign the DCP rules derive for
each of them. Then shows the two construction errors: a product of two
variables and a power whose argument does not compose.

EXPRESSIONS
-----------
    5 * x                 affine (positive scale keeps curvature)
    x^2                   convex, nonnegative
    -x^2                  concave, nonpositive
    x^2 + sqrt(y)         neither: convex plus concave
    gamma * x^2           convex if gamma >= 0 is declared
    x * y                 rejected: product of two non-constants
    sqrt(x^2)             rejected: concave power of a convex argument

DSL FEATURES DEMONSTRATED
-------------------------
- dcp::Variable, dcp::Parameter   Leaves with names and declared signs
- Operator sugar + - * /          Literals cast to constants automatically
- dcp::power()                    Elementwise power with DCP checks
- describe(), findViolations()    Diagnostics
- DisciplineViolation             Construction errors

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <string>
#include <dcp/dcp.h>

// ============================================================================
// HELPERS
// ============================================================================
static void report(const std::string& label, const dcp::Expression& e) {
    std::cout << "  " << std::left << std::setw(22) << label
              << std::setw(12) << dcp::curvatureString(e.curvature())
              << std::setw(12) << dcp::signString(e.sign())
              << (e.isDcp() ? "DCP" : "not DCP") << "\n";
}

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: DCP Basics\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // LEAVES
        // ====================================================================
        dcp::Variable x("x");
        dcp::Variable y("y");
        dcp::Parameter gamma(dcp::Sign::Positive, "gamma");

        std::cout << "LEAVES\n";
        std::cout << "------\n";
        std::cout << "  " << x.name() << ": " << dcp::describe(x) << "\n";
        std::cout << "  " << gamma.name() << ": " << dcp::describe(gamma) << "\n\n";

        // ====================================================================
        // COMPOSITIONS
        // ====================================================================
        std::cout << "COMPOSITIONS\n";
        std::cout << "------------\n";
        std::cout << "  " << std::left << std::setw(22) << "expression"
                  << std::setw(12) << "curvature" << std::setw(12) << "sign" << "\n";

        auto sq = dcp::power(x, 2);
        auto mixed = sq + dcp::power(y, 0.5);

        report("5 * x", 5 * x);
        report("x^2", sq);
        report("-x^2", -sq);
        report("x^2 + sqrt(y)", mixed);
        report("gamma * x^2", gamma * sq);
        report("(x^2 + 1) / 2", (sq + 1) / 2);
        std::cout << "\n";

        // ====================================================================
        // WHERE DOES IT FAIL?
        // ====================================================================
        std::cout << "VIOLATIONS IN " << mixed << "\n";
        std::cout << "--------------" << std::string(mixed.name().size(), '-') << "\n";
        for (const auto& v : dcp::findViolations(mixed)) {
            std::cout << "  " << v.expression << ": " << v.rule << "\n";
        }
        std::cout << "\n";

        // ====================================================================
        // CONSTRUCTION ERRORS
        // ====================================================================
        std::cout << "CONSTRUCTION ERRORS\n";
        std::cout << "-------------------\n";

        try {
            auto bad = x * y;
            std::cout << "  unexpected: " << bad << "\n";
        }
        catch (const dcp::DisciplineViolation& e) {
            std::cout << "  x * y       -> " << e.what() << "\n";
        }

        try {
            auto bad = dcp::power(sq, 0.5);
            std::cout << "  unexpected: " << bad << "\n";
        }
        catch (const dcp::DisciplineViolation& e) {
            std::cout << "  sqrt(x^2)   -> " << e.what() << "\n";
        }

        try {
            dcp::Variable v(3, 1, "v");
            auto bad = v + dcp::Variable(2, 1, "w");
            std::cout << "  unexpected: " << bad << "\n";
        }
        catch (const dcp::DimensionMismatch& e) {
            std::cout << "  v + w       -> " << e.what() << "\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

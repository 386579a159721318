/*
================================================================================
EXAMPLE 03: PORTFOLIO CONSTRAINTS - Inequalities and Semidefinite Orderings
================================================================================
DIFFICULTY: Intermediate
TOPIC: Constraint construction and DCP checks

DESCRIPTION
-----------
States the constraints of a small long-only portfolio problem and checks
each one against the DCP rules before handing it to a solver. A covariance
estimate variable is tied to a sample covariance through a semidefinite
ordering. The constraints are then evaluated at a candidate allocation.

MATHEMATICAL MODEL
------------------
Data:
    mu (3)          expected returns
    S  (3 x 3)      sample covariance
    r_min           target return

Variables:
    w (3)           portfolio weights
    Sigma (3 x 3)   covariance estimate

Constraints:
    Budget:     1^T w == 1
    LongOnly:   w >= 0
    Return:     mu^T w >= r_min
    Risk:       sum_i w_i^2 <= 0.5       (convex <= constant)
    Estimate:   Sigma >> S               (Sigma - S positive semidefinite)
    Bad:        sum_i w_i^2 >= 0.1       (not DCP: convex on the large side)

DSL FEATURES DEMONSTRATED
-------------------------
- ==, <=, >=, >>                   Constraint operators
- std::vector<double> coefficients 1-D arrays used as rows
- checkConstraints()               DCP report over a list
- value(), violation()             Feasibility at a candidate point

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <dcp/dcp.h>

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 03: Portfolio Constraints\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        const std::vector<double> mu = { 0.08, 0.12, 0.05 };
        const std::vector<double> ones = { 1.0, 1.0, 1.0 };
        const double rMin = 0.07;

        Eigen::MatrixXd S(3, 3);
        S << 0.10, 0.02, 0.01,
             0.02, 0.20, 0.03,
             0.01, 0.03, 0.05;

        // ====================================================================
        // VARIABLES AND CONSTRAINTS
        // ====================================================================
        dcp::Variable w(3, 1, "w");
        dcp::Variable Sigma(3, 3, "Sigma");

        std::vector<dcp::Expression> squares;
        for (int i = 0; i < 3; ++i) {
            squares.push_back(dcp::power(w[i], 2));
        }
        auto risk = dcp::add(squares);

        const std::vector<std::string> labels = {
            "Budget", "LongOnly", "Return", "Risk", "Estimate", "Bad"
        };
        const std::vector<dcp::Constraint> constraints = {
            ones * w == 1,
            w >= 0,
            mu * w >= rMin,
            risk <= 0.5,
            Sigma >> S,
            risk >= 0.1
        };

        // ====================================================================
        // DCP REPORT
        // ====================================================================
        std::cout << "CONSTRAINTS\n";
        std::cout << "-----------\n";
        for (std::size_t k = 0; k < constraints.size(); ++k) {
            const auto& c = constraints[k];
            std::cout << "  " << std::left << std::setw(10) << labels[k]
                      << std::setw(22) << dcp::to_string(c.kind())
                      << std::setw(10) << c.shape().str()
                      << (c.isDcp() ? "DCP" : "not DCP") << "\n";
        }

        auto report = dcp::checkConstraints(constraints);
        std::cout << "\n" << report.numEquality << " equality, "
                  << report.numInequality << " inequality, "
                  << report.numSemidefinite << " semidefinite\n";
        if (!report.allDcp()) {
            std::cout << "Rejected:\n";
            for (const auto& c : report.nonDcp) {
                std::cout << "  " << c << "\n";
            }
        }
        std::cout << "\n";

        // ====================================================================
        // FEASIBILITY AT A CANDIDATE
        // ====================================================================
        w.setValue(Eigen::Vector3d(0.3, 0.4, 0.3));
        Sigma.setValue(Eigen::MatrixXd(S + 0.01 * Eigen::MatrixXd::Identity(3, 3)));

        std::cout << "CANDIDATE w = (0.3, 0.4, 0.3)\n";
        std::cout << "-----------------------------\n";
        std::cout << std::fixed << std::setprecision(6);
        for (std::size_t k = 0; k < constraints.size(); ++k) {
            const auto& c = constraints[k];
            auto ok = c.value();
            auto amount = c.violation();
            if (!ok || !amount) {
                std::cout << "  " << std::setw(10) << labels[k] << "no value\n";
                continue;
            }
            std::cout << "  " << std::setw(10) << labels[k]
                      << (*ok ? "satisfied" : "violated ")
                      << "  violation = " << *amount << "\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

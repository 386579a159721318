/*
================================================================================
EXAMPLE 02: LEAST SQUARES - Values and Gradients
================================================================================
DIFFICULTY: Intermediate
TOPIC: Numeric evaluation and the chain rule

DESCRIPTION
-----------
Fits a line y = a * t + b to four points. The squared residuals are built as
an expression graph over the variable theta = (a, b); the example checks the
objective is convex, then runs a few steps of gradient descent using the
gradient the graph computes.

MATHEMATICAL MODEL
------------------
Data:
    A (4 x 2)       rows (t_i, 1)
    y (4)           observations

Variables:
    theta (2)       slope and intercept

Objective:
    f(theta) = sum_i (A theta - y)_i^2

Gradient (transposed Jacobian of each residual square, summed):
    grad f = 2 A^T (A theta - y)

DSL FEATURES DEMONSTRATED
-------------------------
- dcp::Constant(Eigen)            Matrix coefficients
- Indexing r[i]                   Entry selection
- value(), gradient()             Numeric evaluation
- setValue()                      Moving the evaluation point

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <vector>
#include <dcp/dcp.h>

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: Least Squares Gradient Descent\n";
    std::cout << "================================================================\n\n";

    try {
        // ====================================================================
        // PROBLEM DATA
        // ====================================================================
        Eigen::MatrixXd A(4, 2);
        A << 0, 1,
             1, 1,
             2, 1,
             3, 1;
        Eigen::VectorXd y(4);
        y << 1.0, 2.9, 5.1, 7.0;

        // ====================================================================
        // BUILD THE OBJECTIVE
        // ====================================================================
        dcp::Variable theta(2, 1, "theta");
        auto residual = dcp::Constant(A) * theta - y;

        std::vector<dcp::Expression> squares;
        for (int i = 0; i < residual.rows(); ++i) {
            squares.push_back(dcp::power(residual[i], 2));
        }
        auto objective = dcp::add(squares);

        std::cout << "Objective: " << dcp::describe(objective) << "\n";
        std::cout << dcp::expressionSummary(objective) << "\n\n";

        // ====================================================================
        // GRADIENT DESCENT
        // ====================================================================
        std::cout << "ITERATIONS\n";
        std::cout << "----------\n";
        std::cout << std::fixed << std::setprecision(4);

        Eigen::VectorXd point = Eigen::VectorXd::Zero(2);
        const double step = 0.02;

        for (int iter = 0; iter <= 200; ++iter) {
            theta.setValue(point);
            auto value = objective.value();
            auto grad = objective.gradient();
            if (!value || !grad) {
                std::cerr << "Evaluation failed at iteration " << iter << "\n";
                return 1;
            }

            const Eigen::VectorXd g = Eigen::MatrixXd(grad->at(theta.id()));
            if (iter % 40 == 0) {
                std::cout << "  iter " << std::setw(3) << iter
                          << "  f = " << std::setw(9) << (*value)(0, 0)
                          << "  a = " << std::setw(7) << point(0)
                          << "  b = " << std::setw(7) << point(1)
                          << "  |grad| = " << g.norm() << "\n";
            }
            point -= step * g;
        }

        // ====================================================================
        // CHECK AGAINST THE NORMAL EQUATIONS
        // ====================================================================
        const Eigen::VectorXd exact = (A.transpose() * A).ldlt().solve(A.transpose() * y);
        std::cout << "\nNormal equations: a = " << exact(0) << ", b = " << exact(1) << "\n";
        std::cout << "Gradient descent: a = " << point(0) << ", b = " << point(1) << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

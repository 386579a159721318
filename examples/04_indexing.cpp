/*
================================================================================
EXAMPLE 04: INDEXING - Slices, Index Lists and Boolean Masks
================================================================================
DIFFICULTY: Beginner
TOPIC: Selecting parts of matrix expressions

DESCRIPTION
-----------
Indexes a 4 x 4 matrix variable in every supported way and prints the
resulting expression name, its shape and, once the variable holds a value,
the selected entries. Finally shows that indexing keeps curvature and sign,
and that out-of-range keys are rejected.

KEYS
----
    X(1, 2)                       single entry            (1, 1)
    X(Slice(0, 2), Slice::all())  first two rows          (2, 4)
    X(Slice({}, {}, -1), 0)       first column reversed   (4, 1)
    X(IndexList{0, 3}, 1)         paired selection        (2, 1)
    X(IndexList{0, 3}, Slice(1, 3)) outer selection       (2, 2)
    X[mask]                       entries where mask      (k, 1)

DSL FEATURES DEMONSTRATED
-------------------------
- dcp::Slice, dcp::IndexList, dcp::BoolMask   Key parts
- Expression::operator() / operator[]         Indexing syntax
- Mask (Eigen boolean array)                  Whole-operand masks

================================================================================
*/

#include <iostream>
#include <iomanip>
#include <string>
#include <dcp/dcp.h>

using dcp::BoolMask;
using dcp::IndexList;
using dcp::Slice;

// ============================================================================
// HELPERS
// ============================================================================
static void show(const dcp::Expression& e) {
    std::cout << "  " << std::left << std::setw(28) << e.name()
              << std::setw(10) << e.shape().str();
    if (auto v = e.value()) {
        std::cout << dcp::naming::matrix(*v);
    }
    std::cout << "\n";
}

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 04: Indexing\n";
    std::cout << "================================================================\n\n";

    try {
        dcp::Variable X(4, 4, "X");

        Eigen::MatrixXd data(4, 4);
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                data(i, j) = 10.0 * i + j;
            }
        }
        X.setValue(data);

        // ====================================================================
        // SIMPLE KEYS
        // ====================================================================
        std::cout << "SIMPLE KEYS\n";
        std::cout << "-----------\n";
        show(X(1, 2));
        show(X(Slice(0, 2), Slice::all()));
        show(X(Slice(std::nullopt, std::nullopt, -1), 0));
        show(X(-1, Slice(1, std::nullopt)));
        std::cout << "\n";

        // ====================================================================
        // SPECIAL KEYS
        // ====================================================================
        std::cout << "SPECIAL KEYS\n";
        std::cout << "------------\n";
        show(X(IndexList{ 0, 3 }, 1));
        show(X(IndexList{ 0, 3 }, Slice(1, 3)));
        show(X(BoolMask{ true, false, true, false }, 2));

        dcp::Mask diagonal = dcp::Mask::Constant(4, 4, false);
        for (int i = 0; i < 4; ++i) {
            diagonal(i, i) = true;
        }
        show(X[diagonal]);
        std::cout << "\n";

        // ====================================================================
        // CLASSIFICATION IS PRESERVED
        // ====================================================================
        std::cout << "CLASSIFICATION\n";
        std::cout << "--------------\n";
        auto sq = dcp::power(X, 2);
        auto corner = -sq(Slice(0, 2), Slice(0, 2));
        std::cout << "  " << corner << ": " << dcp::describe(corner) << "\n\n";

        // ====================================================================
        // ERRORS
        // ====================================================================
        std::cout << "ERRORS\n";
        std::cout << "------\n";
        try {
            show(X(4, 0));
        }
        catch (const std::out_of_range& e) {
            std::cout << "  X(4, 0)        -> " << e.what() << "\n";
        }
        try {
            show(X(IndexList{ 0, 1 }, IndexList{ 0, 1, 2 }));
        }
        catch (const dcp::DimensionMismatch& e) {
            std::cout << "  X([0,1],[0,1,2]) -> " << e.what() << "\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

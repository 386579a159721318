#pragma once
/*
===============================================================================
NAMING — Printable names for leaves, constants and composite expressions
===============================================================================

OVERVIEW
--------
Every node renders itself as a string: variables and parameters by their
symbolic name, constants by their value, composites in infix notation built
from their operands' names. This header holds the formatting primitives those
renderers share.

KEY COMPONENTS
--------------
• naming::concat()      — stream-concatenate any streamable parts
• naming::autoName()    — default leaf names: "var7", "param12"
• naming::scalar()      — shortest round-trip form of a double: "5", "-0.5"
• naming::matrix()      — "[[1, 2], [3, 4]]", scalars as naming::scalar()
• naming::subscript()   — "x[0:2, 1]" from a base name and key text
• naming::parenthesize() — wraps lower-precedence operand names

USAGE EXAMPLES
--------------
    naming::autoName("var", 3);                  // "var3"
    naming::subscript("x", "0:2, 1");            // "x[0:2, 1]"
    naming::matrix(Eigen::Matrix2d::Identity()); // "[[1, 0], [0, 1]]"

THREAD SAFETY
-------------
• All functions are thread-safe; no shared mutable state

EXCEPTION SAFETY
----------------
• Strong guarantee; only allocation failures propagate
• autoName() throws std::invalid_argument on an empty prefix

===============================================================================
*/

#include <concepts>
#include <cstdint>
#include <format>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "value.h"

namespace dcp::naming {

    // ========================================================================
    // CONCEPTS
    // ========================================================================

    /**
     * @concept Streamable
     * @brief True if type can be written to std::ostream via operator<<
     */
    template<typename T>
    concept Streamable = requires(std::ostream & os, T && value) {
        { os << std::forward<T>(value) } -> std::same_as<std::ostream&>;
    };

    // ========================================================================
    // PRIMITIVES
    // ========================================================================

    template<Streamable... Args>
    inline std::string concat(Args&&... parts) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(parts)), ...);
        return oss.str();
    }

    /**
     * @brief Default name of an unnamed leaf
     *
     * @param prefix "var" or "param"
     * @param id     Node id
     * @throws std::invalid_argument if prefix is empty
     */
    inline std::string autoName(std::string_view prefix, std::uint64_t id) {
        if (prefix.empty()) {
            throw std::invalid_argument("naming: prefix cannot be empty");
        }
        return concat(prefix, id);
    }

    /// @brief Shortest representation that round-trips ("5", "0.25", "-1e-08")
    inline std::string scalar(double v) {
        return std::format("{}", v);
    }

    /**
     * @brief Renders a numeric value
     *
     * @details 1x1 values render as a scalar; everything else row by row.
     */
    inline std::string matrix(const Matrix& m) {
        if (m.rows() == 1 && m.cols() == 1) {
            return scalar(m(0, 0));
        }

        std::string result = "[";
        for (Eigen::Index i = 0; i < m.rows(); ++i) {
            if (i > 0) {
                result.append(", ");
            }
            result.append("[");
            for (Eigen::Index j = 0; j < m.cols(); ++j) {
                if (j > 0) {
                    result.append(", ");
                }
                result.append(scalar(m(i, j)));
            }
            result.append("]");
        }
        result.append("]");
        return result;
    }

    /// @brief "base[key]", key as rendered by keyString() or maskString()
    inline std::string subscript(std::string_view base, std::string_view key) {
        return std::format("{}[{}]", base, key);
    }

    inline std::string parenthesize(std::string_view text, bool wrap) {
        if (!wrap) {
            return std::string(text);
        }
        return std::format("({})", text);
    }

} // namespace dcp::naming

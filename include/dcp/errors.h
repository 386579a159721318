#pragma once
/*
===============================================================================
ERRORS — Exceptions raised while composing expressions
===============================================================================

OVERVIEW
--------
Two structural error kinds, both thrown synchronously by the operator that
detects them. Neither has a transient cause, so nothing is retried; the
caller must restructure the expression.

    DisciplineViolation  A curvature or constancy precondition failed
                         (product of two non-constants, division by a
                         non-scalar or non-constant, non-DCP power)
    DimensionMismatch    Operand shapes are incompatible (see shape.h)

Index errors use std::out_of_range and malformed arguments use
std::invalid_argument.

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "shape.h"

namespace dcp {

    /**
     * @class DisciplineViolation
     * @brief A DCP composition rule was broken
     *
     * @details what() reads "<op>: <rule>", e.g.
     *          "multiply: cannot multiply two non-constant expressions".
     */
    class DisciplineViolation : public std::logic_error {
        std::string op_;
        std::string rule_;

    public:
        DisciplineViolation(std::string_view op, std::string_view rule)
            : std::logic_error(std::format("{}: {}", op, rule)),
              op_(op), rule_(rule)
        {
        }

        /// @brief Name of the operator that rejected its operands
        [[nodiscard]] const std::string& op() const noexcept { return op_; }

        /// @brief The rule that was violated
        [[nodiscard]] const std::string& rule() const noexcept { return rule_; }
    };

} // namespace dcp

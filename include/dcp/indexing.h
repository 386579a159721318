#pragma once
/*
===============================================================================
INDEXING — Index keys, slices and their shape-reduction rules
===============================================================================

OVERVIEW
--------
Describes how an expression is indexed. A key has one part per axis; each
part is an integer, a Slice, an IndexList (integer array) or a BoolMask.
Keys made only of integers and slices are "simple" and keep the rectangular
structure of the operand. Keys with an IndexList or BoolMask are "special"
and follow advanced-indexing rules:

    simple         x[i, j], x[a:b, j], x[a:b:s, :]
                   -> (count(row part), count(col part))

    special        both parts advanced (int / IndexList / BoolMask, at least
                   one array): arrays broadcast, result is a column vector
                   -> (broadcast length, 1)

                   one advanced array, one slice: outer selection
                   -> (count(row part), count(col part))

    whole mask     x[mask] with mask.shape == x.shape: true entries in
                   row-major order -> (count(true), 1)

Selections are reported as column-major flat positions of the operand, in
column-major order of the result; value() and gradient() consume them.

KEY COMPONENTS
--------------
• Slice          — start/stop/step with Python semantics (negatives, clamping)
• IndexList      — ordered integer positions (duplicates allowed)
• BoolMask       — per-axis boolean selector
• KeyPart, Key   — one part per axis
• SliceRange     — normalised slice (start, step, count)
• normalizeIndex(), normalizeSlice(), axisPositions()
• isSpecial(), vectorKey()
• partString(), keyString(), maskString()
• simpleSelection(), specialSelection(), maskSelection()

USAGE EXAMPLES
--------------
    dcp::Slice(0, 2)            // 0:2
    dcp::Slice::all()           // :
    dcp::Slice({}, {}, -1)      // ::-1
    dcp::IndexList{0, 2}        // [0, 2]
    dcp::BoolMask{true, false}  // [True, False]

EXCEPTION SAFETY
----------------
• Out-of-bounds integers, empty selections and wrong mask lengths throw
  std::out_of_range
• A zero slice step throws std::invalid_argument
• Index arrays that cannot broadcast throw DimensionMismatch

===============================================================================
*/

#include <algorithm>
#include <format>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "shape.h"
#include "value.h"

namespace dcp {

    // ============================================================================
    // SLICE
    // ============================================================================
    /**
     * @class Slice
     * @brief Python-style slice start:stop:step
     *
     * @details Missing bounds default by direction: [0, dim) for positive steps,
     *          [dim-1, -1) for negative ones. Negative bounds count from the end.
     */
    class Slice {
        std::optional<int> start_;
        std::optional<int> stop_;
        int step_ = 1;

    public:
        Slice() = default;

        /// @throws std::invalid_argument if step == 0
        Slice(std::optional<int> start, std::optional<int> stop, int step = 1)
            : start_(start), stop_(stop), step_(step)
        {
            if (step == 0) {
                throw std::invalid_argument("Slice: step cannot be zero");
            }
        }

        /// @brief The full slice ":"
        static Slice all() { return Slice(); }

        [[nodiscard]] const std::optional<int>& start() const noexcept { return start_; }
        [[nodiscard]] const std::optional<int>& stop() const noexcept { return stop_; }
        [[nodiscard]] int step() const noexcept { return step_; }

        /// @brief "a:b", "a:b:s", ":" (empty bounds omitted)
        [[nodiscard]] std::string str() const {
            std::string result;
            if (start_) result.append(std::to_string(*start_));
            result.append(":");
            if (stop_) result.append(std::to_string(*stop_));
            if (step_ != 1) result.append(":").append(std::to_string(step_));
            return result;
        }

        friend bool operator==(const Slice&, const Slice&) = default;
    };

    // ============================================================================
    // INDEX LIST
    // ============================================================================
    /**
     * @class IndexList
     * @brief Ordered integer positions selected along one axis
     *
     * @details Preserves order and duplicates; negative entries count from
     *          the end of the axis.
     */
    class IndexList {
        std::vector<int> data_;

    public:
        IndexList() = default;

        IndexList(std::initializer_list<int> init)
            : data_(init)
        {
        }

        /// @brief Construct from any input range of integral type
        template<std::ranges::input_range Range>
            requires std::is_integral_v<std::ranges::range_value_t<Range>>
        explicit IndexList(const Range& r)
            : data_(std::ranges::begin(r), std::ranges::end(r))
        {
        }

        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        [[nodiscard]] int size() const noexcept { return static_cast<int>(data_.size()); }
        [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
        int operator[](std::size_t i) const { return data_[i]; }

        friend bool operator==(const IndexList&, const IndexList&) = default;
    };

    // ============================================================================
    // BOOL MASK
    // ============================================================================
    /**
     * @class BoolMask
     * @brief Boolean selector along one axis; its length must equal the axis length
     */
    class BoolMask {
        std::vector<bool> flags_;

    public:
        BoolMask() = default;

        BoolMask(std::initializer_list<bool> init)
            : flags_(init)
        {
        }

        explicit BoolMask(std::vector<bool> flags)
            : flags_(std::move(flags))
        {
        }

        [[nodiscard]] int size() const noexcept { return static_cast<int>(flags_.size()); }
        bool operator[](std::size_t i) const { return flags_[i]; }

        friend bool operator==(const BoolMask&, const BoolMask&) = default;
    };

    // ============================================================================
    // KEYS
    // ============================================================================

    using KeyPart = std::variant<int, Slice, IndexList, BoolMask>;

    /**
     * @struct Key
     * @brief One part per axis: (row part, column part)
     */
    struct Key {
        KeyPart row;
        KeyPart col;

        friend bool operator==(const Key&, const Key&) = default;
    };

    /// @brief True for parts that trigger advanced indexing
    [[nodiscard]] inline bool isAdvanced(const KeyPart& part) noexcept {
        return std::holds_alternative<IndexList>(part) || std::holds_alternative<BoolMask>(part);
    }

    /// @brief True if either part is an IndexList or a BoolMask
    [[nodiscard]] inline bool isSpecial(const Key& key) noexcept {
        return isAdvanced(key.row) || isAdvanced(key.col);
    }

    /// @brief Printable form of one part: "3", "0:2", "[0, 2]", "[True, False]"
    inline std::string partString(const KeyPart& part) {
        return std::visit([](const auto& p) -> std::string {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, int>) {
                return std::to_string(p);
            }
            else if constexpr (std::is_same_v<T, Slice>) {
                return p.str();
            }
            else if constexpr (std::is_same_v<T, IndexList>) {
                std::string s = "[";
                for (int k = 0; k < p.size(); ++k) {
                    if (k > 0) s.append(", ");
                    s.append(std::to_string(p[static_cast<std::size_t>(k)]));
                }
                return s.append("]");
            }
            else {
                std::string s = "[";
                for (int k = 0; k < p.size(); ++k) {
                    if (k > 0) s.append(", ");
                    s.append(p[static_cast<std::size_t>(k)] ? "True" : "False");
                }
                return s.append("]");
            }
        }, part);
    }

    /// @brief Printable form of a whole-operand mask, row by row
    inline std::string maskString(const Mask& mask) {
        std::string s = "[";
        for (Eigen::Index i = 0; i < mask.rows(); ++i) {
            if (i > 0) s.append(", ");
            s.append("[");
            for (Eigen::Index j = 0; j < mask.cols(); ++j) {
                if (j > 0) s.append(", ");
                s.append(mask(i, j) ? "True" : "False");
            }
            s.append("]");
        }
        return s.append("]");
    }

    /// @brief "row, col" as written inside brackets
    inline std::string keyString(const Key& key) {
        return partString(key.row) + ", " + partString(key.col);
    }

    /**
     * @brief Expands a single key part on a vector into a two-part key
     *
     * @details Row vectors (and scalars) index their columns, column vectors
     *          their rows; the other axis is fixed to 0:1.
     *
     * @throws std::out_of_range if shape is a matrix
     */
    inline Key vectorKey(const KeyPart& part, const Shape& shape) {
        if (shape.rows == 1) {
            return Key{ Slice(0, 1), part };
        }
        if (shape.cols == 1) {
            return Key{ part, Slice(0, 1) };
        }
        throw std::out_of_range(
            std::format("index: a single key part needs a vector operand, got shape {}", shape.str()));
    }

    // ============================================================================
    // NORMALISATION
    // ============================================================================

    /**
     * @struct SliceRange
     * @brief Normalised slice: positions start, start + step, ... (count entries)
     */
    struct SliceRange {
        int start = 0;
        int step = 1;
        int count = 0;

        [[nodiscard]] int operator[](int k) const noexcept { return start + k * step; }

        friend bool operator==(const SliceRange&, const SliceRange&) = default;
    };

    /**
     * @brief Resolves a possibly negative index against an axis length
     * @throws std::out_of_range unless -dim <= i < dim
     */
    inline int normalizeIndex(int i, int dim) {
        const int resolved = i < 0 ? i + dim : i;
        if (resolved < 0 || resolved >= dim) {
            throw std::out_of_range(
                std::format("index: position {} out of bounds for axis of length {}", i, dim));
        }
        return resolved;
    }

    /// @brief Python slice.indices(dim) followed by the element count
    inline SliceRange normalizeSlice(const Slice& s, int dim) {
        const int step = s.step();
        int start = 0;
        int stop = 0;

        auto clamp = [&](std::optional<int> v, int fallback, int lo, int hi) {
            if (!v) {
                return fallback;
            }
            int x = *v < 0 ? *v + dim : *v;
            return std::clamp(x, lo, hi);
        };

        if (step > 0) {
            start = clamp(s.start(), 0, 0, dim);
            stop = clamp(s.stop(), dim, 0, dim);
        }
        else {
            start = clamp(s.start(), dim - 1, -1, dim - 1);
            stop = clamp(s.stop(), -1, -1, dim - 1);
        }

        int count = 0;
        if (step > 0 && stop > start) {
            count = (stop - start + step - 1) / step;
        }
        else if (step < 0 && start > stop) {
            count = (start - stop - step - 1) / (-step);
        }
        return SliceRange{ start, step, count };
    }

    /**
     * @brief Positions selected by one key part along an axis of length dim
     *
     * @throws std::out_of_range for out-of-bounds entries or a mask of the wrong length
     */
    inline std::vector<int> axisPositions(const KeyPart& part, int dim) {
        return std::visit([dim](const auto& p) -> std::vector<int> {
            using T = std::decay_t<decltype(p)>;
            std::vector<int> out;
            if constexpr (std::is_same_v<T, int>) {
                out.push_back(normalizeIndex(p, dim));
            }
            else if constexpr (std::is_same_v<T, Slice>) {
                const SliceRange r = normalizeSlice(p, dim);
                out.reserve(static_cast<std::size_t>(r.count));
                for (int k = 0; k < r.count; ++k) {
                    out.push_back(r[k]);
                }
            }
            else if constexpr (std::is_same_v<T, IndexList>) {
                out.reserve(static_cast<std::size_t>(p.size()));
                for (int i : p) {
                    out.push_back(normalizeIndex(i, dim));
                }
            }
            else {
                if (p.size() != dim) {
                    throw std::out_of_range(std::format(
                        "index: boolean mask of length {} for axis of length {}", p.size(), dim));
                }
                for (int k = 0; k < dim; ++k) {
                    if (p[static_cast<std::size_t>(k)]) {
                        out.push_back(k);
                    }
                }
            }
            return out;
        }, part);
    }

    // ============================================================================
    // SELECTIONS
    // ============================================================================

    /**
     * @struct Selection
     * @brief Flat column-major positions of the operand plus the result shape
     */
    struct Selection {
        std::vector<int> flat;
        Shape shape;
    };

    namespace index_detail {

        inline SliceRange simplePart(const KeyPart& part, int dim) {
            if (const int* i = std::get_if<int>(&part)) {
                return SliceRange{ normalizeIndex(*i, dim), 1, 1 };
            }
            return normalizeSlice(std::get<Slice>(part), dim);
        }

        inline void requireNonEmpty(std::size_t n) {
            if (n == 0) {
                throw std::out_of_range("index: selection is empty");
            }
        }

    } // namespace index_detail

    /**
     * @brief Normalised row and column ranges of a simple key
     *
     * @pre !isSpecial(key)
     * @throws std::out_of_range on out-of-bounds integers or empty slices
     */
    inline std::pair<SliceRange, SliceRange> simpleSelection(const Key& key, const Shape& shape) {
        SliceRange rows = index_detail::simplePart(key.row, shape.rows);
        SliceRange cols = index_detail::simplePart(key.col, shape.cols);
        index_detail::requireNonEmpty(static_cast<std::size_t>(rows.count));
        index_detail::requireNonEmpty(static_cast<std::size_t>(cols.count));
        return { rows, cols };
    }

    /// @brief Flat positions of a simple selection, column-major in the result
    inline std::vector<int> flatPositions(const SliceRange& rows, const SliceRange& cols, int operandRows) {
        std::vector<int> flat;
        flat.reserve(static_cast<std::size_t>(rows.count) * static_cast<std::size_t>(cols.count));
        for (int j = 0; j < cols.count; ++j) {
            for (int i = 0; i < rows.count; ++i) {
                flat.push_back(rows[i] + cols[j] * operandRows);
            }
        }
        return flat;
    }

    /**
     * @brief Advanced-indexing selection of a special key
     *
     * @throws DimensionMismatch if two index arrays cannot broadcast
     * @throws std::out_of_range on out-of-bounds entries or an empty selection
     */
    inline Selection specialSelection(const Key& key, const Shape& shape) {
        const std::vector<int> r = axisPositions(key.row, shape.rows);
        const std::vector<int> c = axisPositions(key.col, shape.cols);

        const bool rowSlice = std::holds_alternative<Slice>(key.row);
        const bool colSlice = std::holds_alternative<Slice>(key.col);

        Selection sel;
        if (rowSlice || colSlice) {
            index_detail::requireNonEmpty(r.size());
            index_detail::requireNonEmpty(c.size());
            sel.shape = Shape(static_cast<int>(r.size()), static_cast<int>(c.size()));
            sel.flat.reserve(r.size() * c.size());
            for (int j : c) {
                for (int i : r) {
                    sel.flat.push_back(i + j * shape.rows);
                }
            }
            return sel;
        }

        // Both parts advanced: positions are paired after broadcasting.
        const std::size_t n = r.size();
        const std::size_t m = c.size();
        if (n != m && n != 1 && m != 1) {
            throw DimensionMismatch("index",
                Shape(static_cast<int>(std::max<std::size_t>(n, 1)), 1),
                Shape(static_cast<int>(std::max<std::size_t>(m, 1)), 1));
        }
        const std::size_t len = (n == 1) ? m : n;
        index_detail::requireNonEmpty(len);

        sel.shape = Shape(static_cast<int>(len), 1);
        sel.flat.reserve(len);
        for (std::size_t k = 0; k < len; ++k) {
            const int i = r[n == 1 ? 0 : k];
            const int j = c[m == 1 ? 0 : k];
            sel.flat.push_back(i + j * shape.rows);
        }
        return sel;
    }

    /**
     * @brief Selection of a whole-operand boolean mask
     *
     * @throws DimensionMismatch if the mask shape differs from the operand shape
     * @throws std::out_of_range if no entry is selected
     */
    inline Selection maskSelection(const Mask& mask, const Shape& shape) {
        if (mask.rows() != shape.rows || mask.cols() != shape.cols) {
            throw DimensionMismatch("index", shape,
                Shape(static_cast<int>(std::max<Eigen::Index>(mask.rows(), 1)),
                      static_cast<int>(std::max<Eigen::Index>(mask.cols(), 1))));
        }

        std::vector<int> flat;
        for (int i = 0; i < shape.rows; ++i) {
            for (int j = 0; j < shape.cols; ++j) {
                if (mask(i, j)) {
                    flat.push_back(i + j * shape.rows);
                }
            }
        }
        index_detail::requireNonEmpty(flat.size());

        Selection sel;
        sel.shape = Shape(static_cast<int>(flat.size()), 1);
        sel.flat = std::move(flat);
        return sel;
    }

} // namespace dcp

#pragma once

// Wagner-Fischer edit distance over two arrays, with deep value equality as
// the match predicate, and traceback of the edit script.
// Internal header — not installed.

#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace jsonpatch_cpp::detail {

// Dense (rows x cols) grid of edit distances, row-major.
// d(i, j) = distance between the first i source and first j target elements.
class EditMatrix {
public:
    EditMatrix(std::size_t rows, std::size_t cols)
        : rows_{rows}, cols_{cols}, cells_(rows * cols, 0) {}

    auto operator()(std::size_t i, std::size_t j) -> std::size_t& { return cells_[i * cols_ + j]; }
    auto operator()(std::size_t i, std::size_t j) const -> std::size_t { return cells_[i * cols_ + j]; }

    auto rows() const -> std::size_t { return rows_; }
    auto cols() const -> std::size_t { return cols_; }

    // The full edit distance, d(m, n).
    auto distance() const -> std::size_t { return cells_.back(); }

private:
    std::size_t rows_;
    std::size_t cols_;
    std::vector<std::size_t> cells_;
};

// Build the (m+1) x (n+1) matrix for source (length m) against target (length n).
auto build_edit_matrix(const Array& source, const Array& target) -> EditMatrix;

enum class EditKind : std::uint8_t {
    remove,      // drop source[index]
    add,         // insert target[target_index] at index
    substitute,  // turn source[index] into target[target_index]
};

struct EditStep {
    EditKind kind;
    std::size_t index;         // pointer index: source index for remove/substitute, insertion index for add
    std::size_t target_index;  // meaningful for add and substitute

    auto operator==(const EditStep&) const -> bool = default;
};

// Walk the matrix from (m, n) back to (0, 0). At each cell the first rule
// that holds wins: remove, add, substitute, then keep (a match, not emitted).
// Steps come out in walk order, which is index-descending.
auto traceback(const EditMatrix& d) -> std::vector<EditStep>;

}  // namespace jsonpatch_cpp::detail

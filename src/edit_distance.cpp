#include "edit_distance.hpp"

#include <algorithm>

namespace jsonpatch_cpp::detail {

auto build_edit_matrix(const Array& source, const Array& target) -> EditMatrix {
    const auto m = source.size();
    const auto n = target.size();
    auto d = EditMatrix{m + 1, n + 1};

    for (std::size_t i = 0; i <= m; ++i) d(i, 0) = i;
    for (std::size_t j = 0; j <= n; ++j) d(0, j) = j;

    for (std::size_t i = 1; i <= m; ++i) {
        for (std::size_t j = 1; j <= n; ++j) {
            if (equals(source[i - 1], target[j - 1])) {
                d(i, j) = d(i - 1, j - 1);
            } else {
                d(i, j) = std::min({d(i - 1, j - 1), d(i - 1, j), d(i, j - 1)}) + 1;
            }
        }
    }
    return d;
}

auto traceback(const EditMatrix& d) -> std::vector<EditStep> {
    auto steps = std::vector<EditStep>{};
    steps.reserve(d.distance());

    auto i = d.rows() - 1;
    auto j = d.cols() - 1;
    while (i > 0 || j > 0) {
        if (i > 0 && d(i - 1, j) + 1 == d(i, j)) {
            steps.push_back(EditStep{.kind = EditKind::remove, .index = i - 1, .target_index = 0});
            --i;
        } else if (j > 0 && d(i, j - 1) + 1 == d(i, j)) {
            steps.push_back(EditStep{.kind = EditKind::add, .index = i, .target_index = j - 1});
            --j;
        } else if (i > 0 && j > 0 && d(i - 1, j - 1) + 1 == d(i, j)) {
            steps.push_back(EditStep{.kind = EditKind::substitute, .index = i - 1, .target_index = j - 1});
            --i;
            --j;
        } else if (i > 0 && j > 0 && d(i - 1, j - 1) == d(i, j)) {
            --i;
            --j;
        } else {
            // Unreachable for a matrix built by build_edit_matrix().
            break;
        }
    }
    return steps;
}

}  // namespace jsonpatch_cpp::detail

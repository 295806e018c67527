#include <jsonpatch-cpp/operation.hpp>

#include <algorithm>

namespace jsonpatch_cpp {

void sort_by_path(Patch& patch) {
    std::ranges::stable_sort(patch, {}, &Operation::path);
}

}  // namespace jsonpatch_cpp

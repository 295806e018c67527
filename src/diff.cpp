#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include "edit_distance.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <string>
#include <thread>
#include <variant>

namespace jsonpatch_cpp {

namespace {

// The pointer of the value currently being compared. One buffer per diff
// call: entering a child appends "/<escaped token>", leaving truncates.
class PathBuffer {
public:
    auto push(std::string_view key) -> std::size_t {
        auto mark = buffer_.size();
        buffer_ += '/';
        append_escaped(buffer_, key);
        return mark;
    }

    auto push(std::size_t index) -> std::size_t {
        auto mark = buffer_.size();
        auto digits = std::array<char, 24>{};
        auto res = std::to_chars(digits.data(), digits.data() + digits.size(), index);
        buffer_ += '/';
        buffer_.append(digits.data(), res.ptr);
        return mark;
    }

    void pop(std::size_t mark) { buffer_.resize(mark); }

    auto str() const -> const std::string& { return buffer_; }

private:
    std::string buffer_;
};

// Null is compatible only with null; scalars of any kind with each other.
auto kinds_compatible(Kind a, Kind b) -> bool {
    switch (a) {
        case Kind::object:
            return b == Kind::object;
        case Kind::array:
            return b == Kind::array;
        case Kind::boolean:
        case Kind::number:
        case Kind::string:
            return b == Kind::boolean || b == Kind::number || b == Kind::string;
        case Kind::null:
            return b == Kind::null;
    }
    return false;
}

class Differ {
public:
    Differ(const DiffOptions& options, Patch& out)
        : options_{options}, out_{out} {}

    void diff_values(const Value& a, const Value& b) {
        if (a.is_null() && b.is_null()) return;

        if (!kinds_compatible(a.kind(), b.kind())) {
            // Also overwrites an explicit null on either side.
            out_.push_back(make_replace(path_.str(), b));
            return;
        }

        std::visit(overload{
            [&](const Object& x) { diff_objects(x, std::get<Object>(b.inner)); },
            [&](const Array& x) { diff_arrays(x, std::get<Array>(b.inner)); },
            [&](const auto&) {
                if (!equals(a, b)) {
                    out_.push_back(make_replace(path_.str(), b));
                }
            },
        }, a.inner);
    }

private:
    void diff_objects(const Object& a, const Object& b) {
        for (const auto& [key, bv] : b) {
            auto mark = path_.push(key);
            auto it = a.find(key);
            if (it == a.end()) {
                out_.push_back(make_add(path_.str(), bv));
            } else {
                diff_values(it->second, bv);
            }
            path_.pop(mark);
        }
        for (const auto& [key, av] : a) {
            if (!b.contains(key)) {
                auto mark = path_.push(key);
                out_.push_back(make_remove(path_.str()));
                path_.pop(mark);
            }
        }
    }

    void diff_arrays(const Array& a, const Array& b) {
        if (is_simple_array(a, options_.classification) &&
            is_simple_array(b, options_.classification)) {
            diff_simple_arrays(a, b);
            return;
        }

        const auto n = std::min(a.size(), b.size());
        // Trailing removals go last-first so the earlier indices stay valid.
        for (auto i = a.size(); i > n; --i) {
            auto mark = path_.push(i - 1);
            out_.push_back(make_remove(path_.str()));
            path_.pop(mark);
        }
        for (auto i = n; i < b.size(); ++i) {
            auto mark = path_.push(i);
            out_.push_back(make_add(path_.str(), b[i]));
            path_.pop(mark);
        }
        for (std::size_t i = 0; i < n; ++i) {
            auto mark = path_.push(i);
            diff_values(a[i], b[i]);
            path_.pop(mark);
        }
    }

    void diff_simple_arrays(const Array& a, const Array& b) {
        const auto matrix = detail::build_edit_matrix(a, b);
        for (const auto& step : detail::traceback(matrix)) {
            auto mark = path_.push(step.index);
            switch (step.kind) {
                case detail::EditKind::remove:
                    out_.push_back(make_remove(path_.str()));
                    break;
                case detail::EditKind::add:
                    out_.push_back(make_add(path_.str(), b[step.target_index]));
                    break;
                case detail::EditKind::substitute:
                    if (a[step.index].is_scalar()) {
                        out_.push_back(make_replace(path_.str(), b[step.target_index]));
                    } else {
                        diff_values(a[step.index], b[step.target_index]);
                    }
                    break;
            }
            path_.pop(mark);
        }
    }

    const DiffOptions& options_;
    Patch& out_;
    PathBuffer path_;
};

}  // anonymous namespace

auto is_simple_array(const Array& array, ArrayClassification policy) -> bool {
    for (const auto& element : array) {
        switch (element.kind()) {
            case Kind::boolean:
            case Kind::number:
            case Kind::string:
                continue;
            case Kind::object: {
                auto flat = is_flat_object(std::get<Object>(element.inner));
                if (policy == ArrayClassification::first_object_decides) return flat;
                if (!flat) return false;
                continue;
            }
            case Kind::null:
            case Kind::array:
                return false;
        }
    }
    return true;
}

auto create_patch(const Value& source, const Value& target,
                  const DiffOptions& options) -> Patch {
    auto patch = Patch{};
    auto differ = Differ{options, patch};
    differ.diff_values(source, target);
    return patch;
}

auto create_patches(std::span<const DocumentPair> pairs,
                    unsigned int num_threads,
                    const DiffOptions& options) -> std::vector<Patch> {
    auto results = std::vector<Patch>(pairs.size());
    auto diff_one = [&](std::size_t i) {
        results[i] = create_patch(pairs[i].source, pairs[i].target, options);
    };

    if (num_threads == 0) {
        num_threads = std::max(std::thread::hardware_concurrency(), 1u);
    }
    if (num_threads == 1 || pairs.size() < 2) {
        for (std::size_t i = 0; i < pairs.size(); ++i) diff_one(i);
        return results;
    }

    auto pool = detail::ThreadPool{static_cast<unsigned int>(
        std::min<std::size_t>(num_threads, pairs.size()))};
    pool.parallel_for(pairs.size(), diff_one);
    return results;
}

}  // namespace jsonpatch_cpp

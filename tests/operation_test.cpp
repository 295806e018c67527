#include <jsonpatch-cpp/operation.hpp>

#include <gtest/gtest.h>

using namespace jsonpatch_cpp;

TEST(OpType, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(OpType::add),     "add");
    EXPECT_EQ(to_string_view(OpType::remove),  "remove");
    EXPECT_EQ(to_string_view(OpType::replace), "replace");
}

TEST(Operation, factories_set_value_presence) {
    const auto add = make_add("/a", 1);
    const auto remove = make_remove("/a");
    const auto replace = make_replace("/a", Null{});

    EXPECT_EQ(add.op, OpType::add);
    ASSERT_TRUE(add.value.has_value());
    EXPECT_EQ(*add.value, Value{1});

    EXPECT_EQ(remove.op, OpType::remove);
    EXPECT_FALSE(remove.value.has_value());

    // An explicit null is a present value.
    EXPECT_EQ(replace.op, OpType::replace);
    ASSERT_TRUE(replace.value.has_value());
    EXPECT_TRUE(replace.value->is_null());
}

TEST(Operation, equality_detects_different_fields) {
    const auto base = make_replace("/a", "x");

    EXPECT_EQ(base, make_replace("/a", "x"));
    EXPECT_NE(base, make_replace("/b", "x"));
    EXPECT_NE(base, make_replace("/a", "y"));
    EXPECT_NE(base, make_add("/a", "x"));
}

TEST(SortByPath, orders_by_path_string) {
    auto patch = Patch{
        make_remove("/c"),
        make_add("/a", 1),
        make_replace("/b/0", 2),
    };
    sort_by_path(patch);

    ASSERT_EQ(patch.size(), 3u);
    EXPECT_EQ(patch[0].path, "/a");
    EXPECT_EQ(patch[1].path, "/b/0");
    EXPECT_EQ(patch[2].path, "/c");
}

TEST(SortByPath, is_stable_for_equal_paths) {
    auto patch = Patch{
        make_add("/0", "second"),
        make_add("/0", "first"),
    };
    sort_by_path(patch);

    EXPECT_EQ(*patch[0].value, Value{"second"});
    EXPECT_EQ(*patch[1].value, Value{"first"});
}

#include <jsonpatch-cpp/value.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jsonpatch_cpp;

// -- Kind ---------------------------------------------------------------------

TEST(Kind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(Kind::null),    "null");
    EXPECT_EQ(to_string_view(Kind::boolean), "boolean");
    EXPECT_EQ(to_string_view(Kind::number),  "number");
    EXPECT_EQ(to_string_view(Kind::string),  "string");
    EXPECT_EQ(to_string_view(Kind::object),  "object");
    EXPECT_EQ(to_string_view(Kind::array),   "array");
}

// -- Construction -------------------------------------------------------------

TEST(Value, default_is_null) {
    const auto v = Value{};
    EXPECT_EQ(v.kind(), Kind::null);
    EXPECT_TRUE(v.is_null());
    EXPECT_FALSE(v.is_scalar());
}

TEST(Value, constructors_select_expected_kind) {
    EXPECT_EQ(Value{Null{}}.kind(), Kind::null);
    EXPECT_EQ(Value{true}.kind(), Kind::boolean);
    EXPECT_EQ(Value{42}.kind(), Kind::number);
    EXPECT_EQ(Value{std::int64_t{-7}}.kind(), Kind::number);
    EXPECT_EQ(Value{2.5}.kind(), Kind::number);
    EXPECT_EQ(Value{"hello"}.kind(), Kind::string);
    EXPECT_EQ(Value{std::string{"hello"}}.kind(), Kind::string);
    EXPECT_EQ(Value{Object{}}.kind(), Kind::object);
    EXPECT_EQ(Value{Array{}}.kind(), Kind::array);
}

TEST(Value, integers_are_stored_as_double) {
    const auto v = Value{3};
    ASSERT_NE(v.get_if<double>(), nullptr);
    EXPECT_DOUBLE_EQ(*v.get_if<double>(), 3.0);
    EXPECT_EQ(v.get_if<std::string>(), nullptr);
}

TEST(Value, scalar_predicate) {
    EXPECT_TRUE(Value{false}.is_scalar());
    EXPECT_TRUE(Value{0}.is_scalar());
    EXPECT_TRUE(Value{""}.is_scalar());
    EXPECT_FALSE(Value{}.is_scalar());
    EXPECT_FALSE(Value{Object{}}.is_scalar());
    EXPECT_FALSE(Value{Array{}}.is_scalar());
}

// -- Equality -----------------------------------------------------------------

TEST(Equals, null_equals_null) {
    EXPECT_TRUE(equals(Value{}, Value{Null{}}));
}

TEST(Equals, same_kind_scalars) {
    EXPECT_TRUE(equals(Value{1}, Value{1.0}));
    EXPECT_FALSE(equals(Value{1}, Value{2}));
    EXPECT_TRUE(equals(Value{"x"}, Value{"x"}));
    EXPECT_FALSE(equals(Value{"x"}, Value{"y"}));
    EXPECT_TRUE(equals(Value{true}, Value{true}));
    EXPECT_FALSE(equals(Value{true}, Value{false}));
}

TEST(Equals, different_kinds_are_never_equal) {
    EXPECT_FALSE(equals(Value{1}, Value{"1"}));
    EXPECT_FALSE(equals(Value{true}, Value{1}));
    EXPECT_FALSE(equals(Value{}, Value{false}));
    EXPECT_FALSE(equals(Value{Object{}}, Value{Array{}}));
}

TEST(Equals, objects_compare_key_sets_and_values) {
    const auto a = Value{Object{{"a", 1}, {"b", "x"}}};
    const auto b = Value{Object{{"b", "x"}, {"a", 1}}};
    const auto c = Value{Object{{"a", 1}, {"b", "y"}}};
    const auto d = Value{Object{{"a", 1}}};
    const auto e = Value{Object{{"a", 1}, {"c", "x"}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_NE(d, a);
    EXPECT_NE(a, e);
}

TEST(Equals, missing_key_is_not_equal_to_null_member) {
    const auto with_null = Value{Object{{"a", Null{}}}};
    const auto empty = Value{Object{}};
    EXPECT_NE(with_null, empty);
    EXPECT_EQ(with_null, (Value{Object{{"a", Null{}}}}));
}

TEST(Equals, arrays_are_order_sensitive) {
    const auto a = Value{Array{1, 2, 3}};
    EXPECT_EQ(a, (Value{Array{1, 2, 3}}));
    EXPECT_NE(a, (Value{Array{3, 2, 1}}));
    EXPECT_NE(a, (Value{Array{1, 2}}));
}

TEST(Equals, nested_structures) {
    const auto a = Value{Object{
        {"spec", Object{{"ports", Array{80, 443}}, {"tls", true}}},
    }};
    auto b = a;
    EXPECT_EQ(a, b);

    std::get<Array>(std::get<Object>(std::get<Object>(b.inner).at("spec").inner).at("ports").inner)
        .push_back(8080);
    EXPECT_NE(a, b);
}

// -- Flat objects -------------------------------------------------------------

TEST(FlatObject, scalars_and_nulls_are_flat) {
    EXPECT_TRUE(is_flat_object(Object{}));
    EXPECT_TRUE(is_flat_object(Object{{"a", 1}, {"b", "x"}, {"c", true}, {"d", Null{}}}));
}

TEST(FlatObject, nested_containers_are_not_flat) {
    EXPECT_FALSE(is_flat_object(Object{{"a", Object{}}}));
    EXPECT_FALSE(is_flat_object(Object{{"a", 1}, {"b", Array{}}}));
}

//! # JSON Value Tests

#include "json/json_formatter.hpp"
#include "json/json_value.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <variant>

using namespace jsonfmt::json;

TEST(JsonValueTest, TypeQueries) {
    EXPECT_TRUE(JsonValue().is_null());
    EXPECT_TRUE(JsonValue(nullptr).is_null());
    EXPECT_TRUE(JsonValue(true).is_bool());
    EXPECT_TRUE(JsonValue(1.5).is_number());
    EXPECT_TRUE(JsonValue(7).is_number());
    EXPECT_TRUE(JsonValue("s").is_string());
    EXPECT_TRUE(JsonValue(JsonArray{}).is_array());
    EXPECT_TRUE(JsonValue(JsonObject{}).is_object());
}

TEST(JsonValueTest, IntegersStoredAsDouble) {
    EXPECT_DOUBLE_EQ(JsonValue(7).as_number(), 7.0);
}

TEST(JsonValueTest, WrongAccessorThrows) {
    JsonValue value(true);
    EXPECT_THROW((void)value.as_string(), std::bad_variant_access);
    EXPECT_THROW(value.push(JsonValue()), std::bad_variant_access);
}

TEST(JsonValueTest, PushAndAdd) {
    JsonValue arr(JsonArray{});
    arr.push(JsonValue(1));
    arr.push(JsonValue(2));
    EXPECT_EQ(arr.size(), 2u);

    JsonValue obj(JsonObject{});
    obj.add("k", JsonValue("v"));
    obj.add("k", JsonValue("w"));
    EXPECT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.get("k")->as_string(), "v");
}

TEST(JsonValueTest, GetOnMissingKeyOrNonObject) {
    JsonValue obj(JsonObject{});
    EXPECT_EQ(obj.get("missing"), nullptr);
    EXPECT_EQ(JsonValue(1).get("a"), nullptr);
}

TEST(JsonValueTest, ScalarSizeIsZero) {
    EXPECT_EQ(JsonValue("abc").size(), 0u);
}

TEST(JsonValueTest, CloneIsDeep) {
    JsonArray inner;
    inner.emplace_back(1.0);
    JsonObject obj;
    obj.emplace_back("list", JsonValue(std::move(inner)));
    JsonValue original(std::move(obj));

    JsonValue copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.as_object_mut()[0].second.push(JsonValue(2.0));
    EXPECT_NE(copy, original);
    EXPECT_EQ(original.get("list")->size(), 1u);
}

TEST(JsonValueTest, EqualityIsStructural) {
    EXPECT_EQ(JsonValue(), JsonValue(nullptr));
    EXPECT_NE(JsonValue(1.0), JsonValue(true));
    EXPECT_NE(JsonValue("1"), JsonValue(1.0));
    EXPECT_NE(JsonValue(JsonArray{}), JsonValue(JsonObject{}));
}

TEST(JsonValueTest, ObjectEqualityIsOrderSensitive) {
    JsonObject ab;
    ab.emplace_back("a", JsonValue(1));
    ab.emplace_back("b", JsonValue(2));
    JsonObject ba;
    ba.emplace_back("b", JsonValue(2));
    ba.emplace_back("a", JsonValue(1));

    EXPECT_NE(JsonValue(std::move(ab)), JsonValue(std::move(ba)));
}

TEST(JsonValueTest, NanIsNotEqualToItself) {
    JsonValue nan(std::numeric_limits<double>::quiet_NaN());
    EXPECT_NE(nan, nan.clone());
}

#include "densejson/core/value.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace densejson::core {
namespace {

using namespace std::chrono_literals;

TEST(ValueTest, ReportsTypeNames) {
    EXPECT_EQ(Value{}.type_name(), "null");
    EXPECT_EQ(Value{true}.type_name(), "boolean");
    EXPECT_EQ(Value{17}.type_name(), "integer");
    EXPECT_EQ(Value{1.5}.type_name(), "float");
    EXPECT_EQ(Value{"text"}.type_name(), "string");
    EXPECT_EQ(Value{Date{2023y / 1 / 1}}.type_name(), "date");
    EXPECT_EQ(Value{Decimal{"1.10"}}.type_name(), "decimal");
    EXPECT_EQ(Value::list({1}).type_name(), "list");
    EXPECT_EQ(Value::tuple({1}).type_name(), "tuple");
    EXPECT_EQ(Value::set({1}).type_name(), "set");
    EXPECT_EQ(Value::object({{"a", 1}}).type_name(), "mapping");
    EXPECT_EQ(Value{Foreign{"Widget"}}.type_name(), "Widget");
}

TEST(ValueTest, RepeatedKeysKeepFirstPositionAndLastValue) {
    const auto v = Value::object({{"a", 1}, {"b", 2}, {"a", 3}});
    const auto& members = v.as_object();
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].key, "a");
    EXPECT_EQ(members[0].value, Value{3});
    EXPECT_EQ(members[1].key, "b");
}

TEST(ValueTest, SetDropsDuplicates) {
    const auto v = Value::set({1, 2, 1, 3, 2});
    EXPECT_EQ(v.as_array().size(), 3U);
    EXPECT_EQ(v.sequence_kind(), SequenceKind::Set);
}

TEST(ValueTest, EqualityIsStructuralAndOrderSensitive) {
    EXPECT_EQ(Value::object({{"a", 1}, {"b", Value::list({2, 3})}}),
              Value::object({{"a", 1}, {"b", Value::list({2, 3})}}));
    EXPECT_NE(Value::object({{"a", 1}, {"b", 2}}), Value::object({{"b", 2}, {"a", 1}}));
    EXPECT_NE(Value{1}, Value{1.0});
    EXPECT_NE(Value::list({1, 2}), Value::tuple({1, 2}));
    EXPECT_NE(Value{Decimal{"1.0"}}, Value{"1.0"});
}

TEST(ValueTest, FindLooksUpMappingKeysOnly) {
    const auto v = Value::object({{"a", 1}});
    ASSERT_NE(v.find("a"), nullptr);
    EXPECT_EQ(*v.find("a"), Value{1});
    EXPECT_EQ(v.find("z"), nullptr);
    EXPECT_EQ(Value::list({"a"}).find("a"), nullptr);
}

TEST(ValueTest, AccessorsRejectOtherKinds) {
    EXPECT_THROW((void)Value{1}.as_string(), std::logic_error);
    EXPECT_THROW((void)Value{"x"}.as_array(), std::logic_error);
    EXPECT_THROW((void)Value::list({}).as_object(), std::logic_error);
    EXPECT_EQ(Value{Foreign{"Widget"}}.as_foreign().type_name, "Widget");
}

} // namespace
} // namespace densejson::core

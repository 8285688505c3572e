#include "densejson/core/field_filter.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace densejson::core {
namespace {

const std::vector<std::string> kTerms{"b", "c"};

TEST(FieldFilterTest, KeepsMatchingMembers) {
    const auto documents = Value::list({
            Value::object({{"a", 1}, {"b", 2}, {"c", 3}}),
            Value::object({{"b", 3}, {"c", 4}, {"d", 5}}),
            Value::object({{"c", 5}, {"d", 6}, {"e", 7}}),
    });
    const auto selected = select_fields_like(documents, kTerms);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, Value::list({
            Value::object({{"b", 2}, {"c", 3}}),
            Value::object({{"b", 3}, {"c", 4}}),
            Value::object({{"c", 5}}),
    }));
}

TEST(FieldFilterTest, DropsMappingsWithoutMatches) {
    const auto documents = Value::list({
            Value::object({{"a", 1}, {"b", 2}, {"c", 3}}),
            Value::object({{"b", 3}, {"c", 4}, {"d", 5}}),
            Value::object({{"d", 6}, {"e", 7}}),
    });
    const auto selected = select_fields_like(documents, kTerms);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, Value::list({
            Value::object({{"b", 2}, {"c", 3}}),
            Value::object({{"b", 3}, {"c", 4}}),
    }));
}

TEST(FieldFilterTest, MatchesSubstrings) {
    const auto documents = Value::list({Value::object({{"created_at", 1}, {"updated_at", 2}, {"id", 3}})});
    const std::vector<std::string> terms{"_at"};
    EXPECT_EQ(select_fields_like(documents, terms),
              Value::list({Value::object({{"created_at", 1}, {"updated_at", 2}})}));
}

TEST(FieldFilterTest, RejectsNonMappingInput) {
    const auto not_a_list = select_fields_like(Value::object({{"b", 1}}), kTerms);
    ASSERT_FALSE(not_a_list.has_value());
    EXPECT_EQ(not_a_list.error().type_name, "mapping");

    const auto bad_element = select_fields_like(Value::list({Value::object({{"b", 1}}), 2}), kTerms);
    ASSERT_FALSE(bad_element.has_value());
    EXPECT_EQ(bad_element.error().type_name, "integer");
}

} // namespace
} // namespace densejson::core

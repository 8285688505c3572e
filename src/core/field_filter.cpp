#include "densejson/core/field_filter.hpp"

#include <algorithm>
#include <utility>

namespace densejson::core {

namespace {

bool key_matches(const std::string& key, std::span<const std::string> terms) {
    return std::any_of(terms.begin(), terms.end(),
                       [&](const std::string& term) { return key.find(term) != std::string::npos; });
}

} // namespace

std::expected<Value, TypeError> select_fields_like(const Value& documents, std::span<const std::string> terms) {
    if (!documents.is_array()) {
        return std::unexpected(TypeError{
                .type_name = documents.type_name(),
                .message = "expected a sequence of mappings, got '" + documents.type_name() + "'"});
    }

    Value::Array selected;
    for (const auto& document : documents.as_array()) {
        if (!document.is_object()) {
            return std::unexpected(TypeError{
                    .type_name = document.type_name(),
                    .message = "expected a mapping element, got '" + document.type_name() + "'"});
        }
        Value::Object matching;
        for (const auto& member : document.as_object()) {
            if (key_matches(member.key, terms)) {
                matching.push_back(member);
            }
        }
        if (!matching.empty()) {
            selected.emplace_back(std::move(matching));
        }
    }
    return Value{std::move(selected)};
}

} // namespace densejson::core

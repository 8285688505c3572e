#pragma once

#include "densejson/core/errors.hpp"
#include "densejson/core/path.hpp"
#include "densejson/core/value.hpp"

#include <expected>
#include <string_view>
#include <utility>

namespace densejson::core {

// Read-only view over a list or mapping.
//
//   auto obj = Accessor::create(Value::object({{"a", 1}, {"b", Value::object({{"c", 2}})}}));
//   obj->get("a");        // 1
//   obj->resolve("b/c");  // 2
//
// get() reads one level only and hands back the child as-is; deeper reads
// go through resolve(). Unlike the free resolve(), Accessor::resolve() also
// indexes into strings by code point.
class Accessor {
public:
    static std::expected<Accessor, TypeError> create(Value root);

    [[nodiscard]] const Value& root() const noexcept { return root_; }

    [[nodiscard]] bool has(std::string_view name) const noexcept { return root_.find(name) != nullptr; }

    [[nodiscard]] std::expected<Value, AttributeError> get(std::string_view name) const;

    [[nodiscard]] std::expected<Value, PathError> resolve(std::string_view path) const;

private:
    explicit Accessor(Value root) : root_{std::move(root)} {}

    Value root_;
};

} // namespace densejson::core

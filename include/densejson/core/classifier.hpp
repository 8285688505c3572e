#pragma once

#include "densejson/core/errors.hpp"
#include "densejson/core/value.hpp"

#include <expected>

namespace densejson::core {

enum class Shape {
    Atomic,             // scalar, including null and the renders-as-text kinds
    OnelinerCompound,   // container whose immediate children are all atomic
    ExpandableCompound  // container with at least one container child
};

// Foreign values fail with a TypeError carrying their type name.
[[nodiscard]] std::expected<bool, TypeError> is_atomic(const Value& v);

// Only immediate children are inspected; grandchildren are classified
// when the layout engine reaches them.
[[nodiscard]] std::expected<Shape, TypeError> classify(const Value& v);

[[nodiscard]] inline bool is_oneliner(Shape shape) noexcept { return shape != Shape::ExpandableCompound; }

} // namespace densejson::core

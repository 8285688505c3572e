#include "densejson/core/classifier.hpp"

namespace densejson::core {

namespace {

TypeError unsupported(const Value& v) {
    return TypeError{.type_name = v.type_name(), .message = "Unsupported type: " + v.type_name()};
}

template <typename Range, typename Project>
std::expected<bool, TypeError> all_atomic(const Range& children, Project project) {
    // Stops at the first container child; later siblings are checked when rendered.
    for (const auto& child : children) {
        auto atomic = is_atomic(project(child));
        if (!atomic.has_value() || !atomic.value()) {
            return atomic;
        }
    }
    return true;
}

} // namespace

std::expected<bool, TypeError> is_atomic(const Value& v) {
    switch (v.type()) {
        case Value::Type::Null:
        case Value::Type::Boolean:
        case Value::Type::Integer:
        case Value::Type::Number:
        case Value::Type::String:
        case Value::Type::Date:
        case Value::Type::DateTime:
        case Value::Type::Decimal:
            return true;
        case Value::Type::Array:
        case Value::Type::Object:
            return false;
        case Value::Type::Foreign:
            return std::unexpected(unsupported(v));
    }
    return std::unexpected(unsupported(v));
}

std::expected<Shape, TypeError> classify(const Value& v) {
    auto atomic = is_atomic(v);
    if (!atomic.has_value()) {
        return std::unexpected(atomic.error());
    }
    if (atomic.value()) {
        return Shape::Atomic;
    }

    const auto children_atomic =
        v.is_array() ? all_atomic(v.as_array(), [](const Value& e) -> const Value& { return e; })
                     : all_atomic(v.as_object(), [](const Value::ObjectMember& m) -> const Value& { return m.value; });
    if (!children_atomic.has_value()) {
        return std::unexpected(children_atomic.error());
    }
    return children_atomic.value() ? Shape::OnelinerCompound : Shape::ExpandableCompound;
}

} // namespace densejson::core

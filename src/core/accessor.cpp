#include "densejson/core/accessor.hpp"

#include <string>
#include <utility>

namespace densejson::core {

std::expected<Accessor, TypeError> Accessor::create(Value root) {
    if (!root.is_container()) {
        const std::string type_name = root.type_name();
        return std::unexpected(TypeError{
                .type_name = type_name,
                .message = "Accessor: expected list or dict, got '" + type_name + "'"});
    }
    return Accessor{std::move(root)};
}

std::expected<Value, AttributeError> Accessor::get(std::string_view name) const {
    if (const Value* found = root_.find(name); found != nullptr) {
        return *found;
    }
    return std::unexpected(AttributeError{
            .name = std::string{name},
            .message = "'" + root_.type_name() + "' root has no attribute '" + std::string{name} + "'"});
}

std::expected<Value, PathError> Accessor::resolve(std::string_view path) const {
    return core::resolve(root_, path, StringIndexing::Allowed);
}

} // namespace densejson::core

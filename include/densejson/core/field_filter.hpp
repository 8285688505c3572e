#pragma once

#include "densejson/core/errors.hpp"
#include "densejson/core/value.hpp"

#include <expected>
#include <span>
#include <string>

namespace densejson::core {

// Keeps, per mapping in `documents`, the members whose key contains any of
// `terms`; mappings with no such member are dropped. Returns a new list.
[[nodiscard]] std::expected<Value, TypeError> select_fields_like(const Value& documents,
                                                                 std::span<const std::string> terms);

} // namespace densejson::core

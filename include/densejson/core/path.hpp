#pragma once

#include "densejson/core/errors.hpp"
#include "densejson/core/value.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace densejson::core {

// "data/0/name" -> {"data", "0", "name"}; "" -> {""}.
[[nodiscard]] std::vector<std::string> split_path(std::string_view path);

// Non-empty and all ASCII digits. Values beyond size_t saturate, so they
// never index anything.
[[nodiscard]] std::optional<std::size_t> parse_index(std::string_view segment) noexcept;

enum class StringIndexing { Disallowed, Allowed };

// Walks `root` segment by segment. A numeric segment indexes a list or tuple
// cursor; any other cursor takes it as a mapping key. With
// StringIndexing::Allowed a numeric segment also selects the n-th code point
// of a string cursor. Sets are never indexed.
//
// On failure the error carries the unconsumed segments rejoined with '/' and
// the value the walk stood on.
[[nodiscard]] std::expected<Value, PathError> resolve(const Value& root, std::string_view path,
                                                      StringIndexing strings = StringIndexing::Disallowed);

} // namespace densejson::core

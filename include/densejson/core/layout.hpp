#pragma once

#include "densejson/core/document.hpp"
#include "densejson/core/errors.hpp"
#include "densejson/core/value.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace densejson::core {

struct RenderOptions {
    std::uint32_t indent_width{4};
};

struct OptionsError {
    std::string message;
};

// Dense JSON layout: containers whose children are all scalars stay on one
// line, everything else opens one indentation level per nesting level.
//
//   {
//       "a": 1,
//       "b": [2, 3],
//       "c": {"d": 4}
//   }
//
// Output is all-or-nothing: the first unsupported value anywhere in the tree
// fails the whole render.
[[nodiscard]] std::expected<std::string, TypeError> render(const Value& value, const RenderOptions& options = {});

// Parse typed options from a configuration document: {"indent": 0..16}.
std::expected<RenderOptions, OptionsError> parse_render_options(const Document& doc);

} // namespace densejson::core

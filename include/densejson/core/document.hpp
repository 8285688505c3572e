#pragma once

#include "densejson/core/value.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace densejson::core {

struct ParseError {
    std::string message;
    std::size_t offset{};
};

class Document {
public:
    static constexpr std::size_t kMaxDepth = 1000;

    Document();
    explicit Document(Value root);

    [[nodiscard]] const Value& root() const noexcept;

    static std::expected<Document, ParseError> from_string(std::string_view source);
    static std::expected<Document, ParseError> from_file(std::string_view path);

private:
    Value root_;
};

} // namespace densejson::core

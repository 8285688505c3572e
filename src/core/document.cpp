#include "densejson/core/document.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace densejson::core {

namespace {

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

constexpr bool is_blank(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

// Recursive-descent reader over one JSON text. Every failure carries the
// byte offset where reading stopped.
class Reader {
public:
    using Result = std::expected<Value, ParseError>;

    explicit Reader(std::string_view text) : text_{text} {}

    Result document() {
        auto root = element();
        if (!root) {
            return root;
        }
        skip_blanks();
        if (pos_ != text_.size()) {
            return fail("Trailing characters after JSON document");
        }
        return root;
    }

private:
    [[nodiscard]] char current() const noexcept { return pos_ < text_.size() ? text_[pos_] : '\0'; }

    bool accept(char c) noexcept {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_blanks() noexcept {
        while (pos_ < text_.size() && is_blank(text_[pos_])) {
            ++pos_;
        }
    }

    // Consumes a run of digits; false when there was none.
    bool digits() noexcept {
        const std::size_t start = pos_;
        while (is_digit(current())) {
            ++pos_;
        }
        return pos_ != start;
    }

    [[nodiscard]] std::unexpected<ParseError> fail(std::string message) const {
        return fail(std::move(message), pos_);
    }

    [[nodiscard]] static std::unexpected<ParseError> fail(std::string message, std::size_t at) {
        return std::unexpected(ParseError{.message = std::move(message), .offset = at});
    }

    Result element() {
        skip_blanks();
        switch (current()) {
            case '{': return mapping();
            case '[': return sequence();
            case '"': {
                auto s = text();
                if (!s) {
                    return std::unexpected(std::move(s.error()));
                }
                return Value{std::move(*s)};
            }
            case 't': return keyword("true", Value{true});
            case 'f': return keyword("false", Value{false});
            case 'n': return keyword("null", Value{nullptr});
            case '\0':
                if (pos_ == text_.size()) {
                    return fail("Unexpected end of input");
                }
                return fail("Invalid JSON token");
            default:
                if (current() == '-' || is_digit(current())) {
                    return number();
                }
                return fail("Invalid JSON token");
        }
    }

    Result keyword(std::string_view word, Value value) {
        if (text_.substr(pos_, word.size()) != word) {
            return fail("Invalid literal");
        }
        pos_ += word.size();
        return value;
    }

    std::expected<void, ParseError> descend() {
        if (++depth_ > Document::kMaxDepth) {
            return fail("Maximum nesting depth exceeded");
        }
        return {};
    }

    Result sequence() {
        if (auto entered = descend(); !entered) {
            return std::unexpected(std::move(entered.error()));
        }
        ++pos_;
        Value::Array items;
        skip_blanks();
        if (!accept(']')) {
            do {
                auto item = element();
                if (!item) {
                    return item;
                }
                items.push_back(std::move(*item));
                skip_blanks();
            } while (accept(','));
            if (!accept(']')) {
                return fail("Expected ',' or ']' in array");
            }
        }
        --depth_;
        return Value{std::move(items)};
    }

    Result mapping() {
        if (auto entered = descend(); !entered) {
            return std::unexpected(std::move(entered.error()));
        }
        ++pos_;
        Value::Object members;
        skip_blanks();
        if (!accept('}')) {
            do {
                skip_blanks();
                if (current() != '"') {
                    return fail("Expected string key in object");
                }
                auto key = text();
                if (!key) {
                    return std::unexpected(std::move(key.error()));
                }
                skip_blanks();
                if (!accept(':')) {
                    return fail("Expected ':' after object key");
                }
                auto member = element();
                if (!member) {
                    return member;
                }
                members.push_back(Value::ObjectMember{std::move(*key), std::move(*member)});
                skip_blanks();
            } while (accept(','));
            if (!accept('}')) {
                return fail("Expected ',' or '}' in object");
            }
        }
        --depth_;
        return Value{std::move(members)};
    }

    Result number() {
        const std::size_t start = pos_;
        bool integral = true;
        accept('-');
        if (!accept('0') && !digits()) {
            return fail("Invalid number literal");
        }
        if (accept('.')) {
            integral = false;
            if (!digits()) {
                return fail("Invalid fractional component");
            }
        }
        if (accept('e') || accept('E')) {
            integral = false;
            if (!accept('+')) {
                accept('-');
            }
            if (!digits()) {
                return fail("Invalid exponent component");
            }
        }

        const char* first = text_.data() + start;
        const char* last = text_.data() + pos_;
        if (integral) {
            std::int64_t integer{};
            if (std::from_chars(first, last, integer).ec == std::errc{}) {
                return Value{integer};
            }
            // Beyond 64 bits: keep the magnitude as a double.
        }
        double number{};
        if (std::from_chars(first, last, number).ec != std::errc{}) {
            return fail("Failed to parse numeric literal", start);
        }
        return Value{number};
    }

    std::expected<std::uint32_t, ParseError> hex4() {
        std::uint32_t code{};
        const char* first = text_.data() + pos_;
        const char* last = text_.data() + std::min(pos_ + 4, text_.size());
        const auto [end, ec] = std::from_chars(first, last, code, 16);
        if (ec != std::errc{} || end != first + 4) {
            return fail("Invalid unicode escape");
        }
        pos_ += 4;
        return code;
    }

    std::expected<void, ParseError> unicode_escape(std::string& out) {
        auto unit = hex4();
        if (!unit) {
            return std::unexpected(std::move(unit.error()));
        }
        std::uint32_t code_point = *unit;
        if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
            return fail("Unpaired surrogate in unicode escape");
        }
        if (code_point >= 0xD800 && code_point <= 0xDBFF) {
            if (!accept('\\') || !accept('u')) {
                return fail("Unpaired surrogate in unicode escape");
            }
            auto low = hex4();
            if (!low) {
                return std::unexpected(std::move(low.error()));
            }
            if (*low < 0xDC00 || *low > 0xDFFF) {
                return fail("Unpaired surrogate in unicode escape");
            }
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
        }
        append_utf8(out, code_point);
        return {};
    }

    std::expected<std::string, ParseError> text() {
        ++pos_; // opening quote
        std::string out;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("Invalid control character in string", pos_ - 1);
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            const char escaped = current();
            ++pos_;
            switch (escaped) {
                case '"':
                case '\\':
                case '/': out.push_back(escaped); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u':
                    if (auto decoded = unicode_escape(out); !decoded) {
                        return std::unexpected(std::move(decoded.error()));
                    }
                    break;
                default:
                    return fail("Unsupported escape sequence");
            }
        }
        return fail("Unterminated string literal");
    }

    std::string_view text_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

} // namespace

Document::Document() = default;
Document::Document(Value root) : root_{std::move(root)} {}

const Value& Document::root() const noexcept {
    return root_;
}

std::expected<Document, ParseError> Document::from_string(std::string_view source) {
    auto root = Reader{source}.document();
    if (!root) {
        return std::unexpected(std::move(root.error()));
    }
    return Document{std::move(*root)};
}

std::expected<Document, ParseError> Document::from_file(std::string_view path) {
    namespace fs = std::filesystem;
    const fs::path file_path{path};
    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        return std::unexpected(ParseError{.message = "Unable to open '" + file_path.string() + "'", .offset = 0});
    }
    // Directories and devices open fine but have no size to read.
    if (!fs::is_regular_file(file_path, ec)) {
        return std::unexpected(
                ParseError{.message = "Failed to read '" + file_path.string() + "': not a regular file", .offset = 0});
    }
    std::ifstream file{file_path, std::ios::binary | std::ios::ate};
    if (!file) {
        return std::unexpected(ParseError{.message = "Unable to open '" + file_path.string() + "'", .offset = 0});
    }
    const std::streamoff size = file.tellg();
    if (size < 0) {
        return std::unexpected(ParseError{.message = "Failed to read '" + file_path.string() + "'", .offset = 0});
    }
    std::string content(static_cast<std::size_t>(size), '\0');
    file.seekg(0, std::ios::beg);
    file.read(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        return std::unexpected(ParseError{.message = "Failed to read '" + file_path.string() + "'", .offset = 0});
    }
    return from_string(content);
}

} // namespace densejson::core

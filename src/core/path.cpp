#include "densejson/core/path.hpp"

#include "densejson/core/json_writer.hpp"

#include <charconv>
#include <limits>
#include <utility>

namespace densejson::core {

namespace {

// The n-th UTF-8 code point of `s`, as its own string.
std::optional<std::string> code_point_at(const std::string& s, std::size_t n) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (seen++ == n) {
            std::size_t end = i + 1;
            while (end < s.size() && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
                ++end;
            }
            return s.substr(i, end - i);
        }
    }
    return std::nullopt;
}

PathError path_error(const std::vector<std::string>& segments, std::size_t failed, const Value& cursor) {
    std::string remainder;
    for (std::size_t i = failed; i < segments.size(); ++i) {
        if (i != failed) remainder += '/';
        remainder += segments[i];
    }
    std::string message = "Invalid path '" + remainder + "' for remaining object " + describe(cursor);
    return PathError{.remainder = std::move(remainder), .failed_at = cursor, .message = std::move(message)};
}

} // namespace

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        const std::size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            segments.emplace_back(path.substr(start));
            return segments;
        }
        segments.emplace_back(path.substr(start, slash - start));
        start = slash + 1;
    }
}

std::optional<std::size_t> parse_index(std::string_view segment) noexcept {
    if (segment.empty()) {
        return std::nullopt;
    }
    for (const char c : segment) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    std::size_t index{};
    const auto conversion = std::from_chars(segment.data(), segment.data() + segment.size(), index);
    if (conversion.ec == std::errc::result_out_of_range) {
        return std::numeric_limits<std::size_t>::max();
    }
    return index;
}

std::expected<Value, PathError> resolve(const Value& root, std::string_view path, StringIndexing strings) {
    const std::vector<std::string> segments = split_path(path);
    const Value* cursor = &root;
    // Holds a code point picked out of a string; it is not part of the tree.
    std::optional<Value> picked;

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];
        const auto index = parse_index(segment);
        const Value* next = nullptr;

        if (index.has_value() && cursor->is_array() && cursor->sequence_kind() != SequenceKind::Set) {
            const auto& elements = cursor->as_array();
            if (*index < elements.size()) {
                next = &elements[*index];
            }
        } else if (index.has_value() && strings == StringIndexing::Allowed && cursor->is_string()) {
            if (auto character = code_point_at(cursor->as_string(), *index); character.has_value()) {
                picked = Value{std::move(*character)};
                next = &*picked;
            }
        } else if (cursor->is_object()) {
            next = cursor->find(segment);
        }

        if (next == nullptr) {
            return std::unexpected(path_error(segments, i, *cursor));
        }
        cursor = next;
    }
    return *cursor;
}

} // namespace densejson::core

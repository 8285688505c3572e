#include "densejson/core/layout.hpp"

#include "densejson/core/classifier.hpp"
#include "densejson/core/json_writer.hpp"

#include <utility>

namespace densejson::core {

namespace {

constexpr std::int64_t kMaxIndentWidth = 16;

class LayoutEngine {
public:
    LayoutEngine(std::string& out, const RenderOptions& options) : out_{out}, unit_(options.indent_width, ' ') {}

    // `is_element` is false for list elements, which carry their own indent;
    // mapping values and the top-level value start right where they are placed.
    std::expected<void, TypeError> emit(const Value& v, const std::string& indent, bool is_element) {
        auto shape = classify(v);
        if (!shape.has_value()) {
            return std::unexpected(shape.error());
        }
        if (!is_element) {
            out_ += indent;
        }
        if (is_oneliner(shape.value())) {
            JsonWriter writer{out_};
            return writer.write(v);
        }

        const std::string next = indent + unit_;
        if (v.is_object()) {
            out_ += "{\n";
            bool first = true;
            for (const auto& member : v.as_object()) {
                if (!first) out_ += ",\n";
                first = false;
                out_ += next;
                out_ += '"';
                JsonWriter::escape_to(out_, member.key);
                out_ += "\": ";
                if (auto child = emit(member.value, next, true); !child) {
                    return child;
                }
            }
            out_ += '\n';
            out_ += indent;
            out_ += '}';
            return {};
        }

        out_ += "[\n";
        bool first = true;
        for (const auto& element : v.as_array()) {
            if (!first) out_ += ",\n";
            first = false;
            if (auto child = emit(element, next, false); !child) {
                return child;
            }
        }
        out_ += '\n';
        out_ += indent;
        out_ += ']';
        return {};
    }

private:
    std::string& out_;
    std::string unit_;
};

} // namespace

std::expected<std::string, TypeError> render(const Value& value, const RenderOptions& options) {
    std::string out;
    LayoutEngine engine{out, options};
    if (auto rendered = engine.emit(value, std::string{}, false); !rendered) {
        return std::unexpected(std::move(rendered.error()));
    }
    return out;
}

std::expected<RenderOptions, OptionsError> parse_render_options(const Document& doc) {
    const Value& root = doc.root();
    if (!root.is_object()) {
        return std::unexpected(OptionsError{.message = "Configuration root must be a mapping, got " + root.type_name()});
    }

    RenderOptions options{};
    if (const Value* indent = root.find("indent"); indent != nullptr) {
        if (!indent->is_integer()) {
            return std::unexpected(OptionsError{.message = "'indent' must be an integer, got " + indent->type_name()});
        }
        const std::int64_t width = indent->as_integer();
        if (width < 0 || width > kMaxIndentWidth) {
            return std::unexpected(OptionsError{.message = "'indent' must be between 0 and 16, got " + std::to_string(width)});
        }
        options.indent_width = static_cast<std::uint32_t>(width);
    }
    return options;
}

} // namespace densejson::core

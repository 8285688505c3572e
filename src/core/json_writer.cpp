#include "densejson/core/json_writer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace densejson::core {

void JsonWriter::value(std::int64_t v) {
    std::array<char, 32> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v);
    out_.append(buffer.data(), result.ptr);
}

void JsonWriter::value(double v) { out_ += format_double(v); }

void JsonWriter::value(const Date& v) { string(format_date(v)); }

void JsonWriter::value(const DateTime& v) { string(format_date_time(v)); }

std::expected<void, TypeError> JsonWriter::write(const Value& v) {
    switch (v.type()) {
        case Value::Type::Null:
            null();
            return {};
        case Value::Type::Boolean:
            value(v.as_boolean());
            return {};
        case Value::Type::Integer:
            value(v.as_integer());
            return {};
        case Value::Type::Number:
            value(v.as_number());
            return {};
        case Value::Type::String:
            value(std::string_view{v.as_string()});
            return {};
        case Value::Type::Date:
            value(v.as_date());
            return {};
        case Value::Type::DateTime:
            value(v.as_date_time());
            return {};
        case Value::Type::Decimal:
            value(v.as_decimal());
            return {};
        case Value::Type::Array: {
            out_ += '[';
            bool first = true;
            for (const auto& element : v.as_array()) {
                if (!first) out_ += ", ";
                first = false;
                if (auto written = write(element); !written) {
                    return written;
                }
            }
            out_ += ']';
            return {};
        }
        case Value::Type::Object: {
            out_ += '{';
            bool first = true;
            for (const auto& member : v.as_object()) {
                if (!first) out_ += ", ";
                first = false;
                string(member.key);
                out_ += ": ";
                if (auto written = write(member.value); !written) {
                    return written;
                }
            }
            out_ += '}';
            return {};
        }
        case Value::Type::Foreign:
            if (mode_ == Mode::Describe) {
                out_ += '<';
                out_ += v.type_name();
                out_ += '>';
                return {};
            }
            return std::unexpected(TypeError{.type_name = v.type_name(), .message = "Unsupported type: " + v.type_name()});
    }
    return {};
}

void JsonWriter::escape_to(std::string& out, std::string_view s) {
    for (const char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::array<char, 8> code{};
                    std::snprintf(code.data(), code.size(), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += code.data();
                } else {
                    out += c;
                }
                break;
        }
    }
}

std::string format_double(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "Infinity" : "-Infinity";
    }

    // Shortest scientific form, e.g. "-1.2345e+02", then re-laid out.
    std::array<char, 64> buffer{};
    const auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v, std::chars_format::scientific);
    const std::string_view scientific{buffer.data(), static_cast<std::size_t>(result.ptr - buffer.data())};

    const std::size_t e_pos = scientific.find('e');
    std::string_view mantissa = scientific.substr(0, e_pos);
    const int exponent = std::atoi(std::string{scientific.substr(e_pos + 1)}.c_str());

    std::string sign;
    if (!mantissa.empty() && mantissa.front() == '-') {
        sign = "-";
        mantissa.remove_prefix(1);
    }
    std::string digits;
    for (const char c : mantissa) {
        if (c != '.') digits += c;
    }

    if (exponent < -4 || exponent >= 16) {
        std::string text = sign + digits.substr(0, 1);
        if (digits.size() > 1) {
            text += '.';
            text += digits.substr(1);
        }
        text += 'e';
        text += exponent < 0 ? '-' : '+';
        const int magnitude = std::abs(exponent);
        if (magnitude < 10) text += '0';
        text += std::to_string(magnitude);
        return text;
    }

    if (exponent < 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
    }
    const auto integral = static_cast<std::size_t>(exponent) + 1;
    if (digits.size() <= integral) {
        return sign + digits + std::string(integral - digits.size(), '0') + ".0";
    }
    return sign + digits.substr(0, integral) + "." + digits.substr(integral);
}

std::string format_date(const Date& v) {
    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(), buffer.size(), "%04d-%02u-%02u", static_cast<int>(v.year()),
                  static_cast<unsigned>(v.month()), static_cast<unsigned>(v.day()));
    return buffer.data();
}

std::string format_date_time(const DateTime& v) {
    const auto day_point = std::chrono::floor<std::chrono::days>(v);
    const std::chrono::hh_mm_ss time_of_day{v - day_point};

    std::string text = format_date(Date{day_point});
    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(), buffer.size(), " %02d:%02d:%02d", static_cast<int>(time_of_day.hours().count()),
                  static_cast<int>(time_of_day.minutes().count()), static_cast<int>(time_of_day.seconds().count()));
    text += buffer.data();
    if (const auto micros = time_of_day.subseconds().count(); micros != 0) {
        std::snprintf(buffer.data(), buffer.size(), ".%06lld", static_cast<long long>(micros));
        text += buffer.data();
    }
    text += "+00:00";
    return text;
}

std::string describe(const Value& v) {
    std::string out;
    JsonWriter writer{out, JsonWriter::Mode::Describe};
    // Describe mode accepts every value kind.
    [[maybe_unused]] const auto written = writer.write(v);
    return out;
}

} // namespace densejson::core

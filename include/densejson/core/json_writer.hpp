#pragma once

#include "densejson/core/errors.hpp"
#include "densejson/core/value.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace densejson::core {

// Single-line JSON writer using ", " and ": " separators.
// Dates, datetimes and decimals are written as quoted text.

class JsonWriter {
public:
    enum class Mode { Strict, Describe };

    explicit JsonWriter(std::string& out, Mode mode = Mode::Strict) : out_{out}, mode_{mode} {}

    void null() { out_ += "null"; }
    void value(bool v) { out_ += v ? "true" : "false"; }
    void value(std::int64_t v);
    void value(double v);
    void value(std::string_view v) { string(v); }
    void value(const Date& v);
    void value(const DateTime& v);
    void value(const Decimal& v) { string(v.text); }

    // Writes `v` and everything below it. In Strict mode a Foreign value fails
    // the write; in Describe mode it is written as `<type>`.
    std::expected<void, TypeError> write(const Value& v);

    static void escape_to(std::string& out, std::string_view s);

private:
    void string(std::string_view s) {
        out_ += '"';
        escape_to(out_, s);
        out_ += '"';
    }

    std::string& out_;
    Mode mode_{Mode::Strict};
};

// Shortest round-trip text of a double, with ".0" kept on integral values
// and exponent form outside [1e-4, 1e16).
std::string format_double(double v);

std::string format_date(const Date& v);
std::string format_date_time(const DateTime& v);

// Best-effort one-line rendering for diagnostics; never fails.
std::string describe(const Value& v);

} // namespace densejson::core

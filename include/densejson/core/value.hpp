#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace densejson::core {

// Canonical decimal text of an arbitrary-precision number, e.g. "123.45".
struct Decimal {
    std::string text;

    friend bool operator==(const Decimal&, const Decimal&) = default;
};

// Stand-in for a host value of a kind this library cannot render.
struct Foreign {
    std::string type_name;

    friend bool operator==(const Foreign&, const Foreign&) = default;
};

using Date = std::chrono::year_month_day;
using DateTime = std::chrono::sys_time<std::chrono::microseconds>;

enum class SequenceKind { List, Tuple, Set };

class Value {
public:
    enum class Type { Null, Boolean, Integer, Number, String, Date, DateTime, Decimal, Array, Object, Foreign };

    struct ObjectMember;

    using Array = std::vector<Value>;

    using Object = std::vector<ObjectMember>;

    Value();
    Value(std::nullptr_t);
    Value(bool boolean);
    Value(int integer);
    Value(std::int64_t integer);
    Value(double number);
    Value(const char* string);
    Value(std::string string);
    Value(Date date);
    Value(DateTime date_time);
    Value(Decimal decimal);
    Value(Foreign foreign);
    explicit Value(Array array, SequenceKind kind = SequenceKind::List);
    explicit Value(Object object);

    static Value list(std::initializer_list<Value> elements);
    static Value tuple(std::initializer_list<Value> elements);
    static Value set(std::initializer_list<Value> elements);
    static Value object(std::initializer_list<ObjectMember> members);

    [[nodiscard]] Type type() const noexcept;
    [[nodiscard]] SequenceKind sequence_kind() const noexcept;
    [[nodiscard]] std::string type_name() const;

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_boolean() const noexcept;
    [[nodiscard]] bool is_integer() const noexcept;
    [[nodiscard]] bool is_number() const noexcept;
    [[nodiscard]] bool is_string() const noexcept;
    [[nodiscard]] bool is_array() const noexcept;
    [[nodiscard]] bool is_object() const noexcept;
    [[nodiscard]] bool is_foreign() const noexcept;
    // Array or Object.
    [[nodiscard]] bool is_container() const noexcept;

    [[nodiscard]] bool as_boolean() const;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Date& as_date() const;
    [[nodiscard]] const DateTime& as_date_time() const;
    [[nodiscard]] const Decimal& as_decimal() const;
    [[nodiscard]] const Foreign& as_foreign() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] const Object& as_object() const;

    [[nodiscard]] const Value* find(std::string_view key) const;

    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    Type type_{Type::Null};
    SequenceKind sequence_kind_{SequenceKind::List};
    bool boolean_{false};
    std::int64_t integer_{0};
    double number_{0.0};
    std::string string_;
    Date date_{};
    DateTime date_time_{};
    Decimal decimal_;
    Foreign foreign_;
    Array array_;
    Object object_;
};

struct Value::ObjectMember {
    std::string key;
    Value value;

    friend bool operator==(const ObjectMember&, const ObjectMember&) = default;
};

} // namespace densejson::core

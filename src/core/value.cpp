#include "densejson/core/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace densejson::core {

namespace {

// Repeated keys keep their first position and take the last value.
Value::Object unique_members(Value::Object members) {
    Value::Object result;
    result.reserve(members.size());
    for (auto& member : members) {
        auto existing = std::find_if(result.begin(), result.end(),
                                     [&](const Value::ObjectMember& m) { return m.key == member.key; });
        if (existing != result.end()) {
            existing->value = std::move(member.value);
        } else {
            result.push_back(std::move(member));
        }
    }
    return result;
}

Value::Array unique_elements(Value::Array elements) {
    Value::Array result;
    result.reserve(elements.size());
    for (auto& element : elements) {
        if (std::find(result.begin(), result.end(), element) == result.end()) {
            result.push_back(std::move(element));
        }
    }
    return result;
}

} // namespace

Value::Value() = default;
Value::Value(std::nullptr_t) : type_{Type::Null} {}
Value::Value(bool boolean) : type_{Type::Boolean}, boolean_{boolean} {}
Value::Value(int integer) : type_{Type::Integer}, integer_{integer} {}
Value::Value(std::int64_t integer) : type_{Type::Integer}, integer_{integer} {}
Value::Value(double number) : type_{Type::Number}, number_{number} {}
Value::Value(const char* string) : type_{Type::String}, string_{string} {}
Value::Value(std::string string) : type_{Type::String}, string_{std::move(string)} {}
Value::Value(Date date) : type_{Type::Date}, date_{date} {}
Value::Value(DateTime date_time) : type_{Type::DateTime}, date_time_{date_time} {}
Value::Value(Decimal decimal) : type_{Type::Decimal}, decimal_{std::move(decimal)} {}
Value::Value(Foreign foreign) : type_{Type::Foreign}, foreign_{std::move(foreign)} {}
Value::Value(Array array, SequenceKind kind)
    : type_{Type::Array},
      sequence_kind_{kind},
      array_{kind == SequenceKind::Set ? unique_elements(std::move(array)) : std::move(array)} {}
Value::Value(Object object) : type_{Type::Object}, object_{unique_members(std::move(object))} {}

Value Value::list(std::initializer_list<Value> elements) {
    return Value{Array{elements}, SequenceKind::List};
}

Value Value::tuple(std::initializer_list<Value> elements) {
    return Value{Array{elements}, SequenceKind::Tuple};
}

Value Value::set(std::initializer_list<Value> elements) {
    return Value{Array{elements}, SequenceKind::Set};
}

Value Value::object(std::initializer_list<ObjectMember> members) {
    return Value{Object{members}};
}

Value::Type Value::type() const noexcept { return type_; }
SequenceKind Value::sequence_kind() const noexcept { return sequence_kind_; }

std::string Value::type_name() const {
    switch (type_) {
        case Type::Null: return "null";
        case Type::Boolean: return "boolean";
        case Type::Integer: return "integer";
        case Type::Number: return "float";
        case Type::String: return "string";
        case Type::Date: return "date";
        case Type::DateTime: return "datetime";
        case Type::Decimal: return "decimal";
        case Type::Array:
            switch (sequence_kind_) {
                case SequenceKind::List: return "list";
                case SequenceKind::Tuple: return "tuple";
                case SequenceKind::Set: return "set";
            }
            return "list";
        case Type::Object: return "mapping";
        case Type::Foreign: return foreign_.type_name;
    }
    return "unknown";
}

bool Value::is_null() const noexcept { return type_ == Type::Null; }
bool Value::is_boolean() const noexcept { return type_ == Type::Boolean; }
bool Value::is_integer() const noexcept { return type_ == Type::Integer; }
bool Value::is_number() const noexcept { return type_ == Type::Number; }
bool Value::is_string() const noexcept { return type_ == Type::String; }
bool Value::is_array() const noexcept { return type_ == Type::Array; }
bool Value::is_object() const noexcept { return type_ == Type::Object; }
bool Value::is_foreign() const noexcept { return type_ == Type::Foreign; }
bool Value::is_container() const noexcept { return is_array() || is_object(); }

bool Value::as_boolean() const {
    if (!is_boolean()) {
        throw std::logic_error("value is not a boolean");
    }
    return boolean_;
}

std::int64_t Value::as_integer() const {
    if (!is_integer()) {
        throw std::logic_error("value is not an integer");
    }
    return integer_;
}

double Value::as_number() const {
    if (!is_number()) {
        throw std::logic_error("value is not a float");
    }
    return number_;
}

const std::string& Value::as_string() const {
    if (!is_string()) {
        throw std::logic_error("value is not a string");
    }
    return string_;
}

const Date& Value::as_date() const {
    if (type_ != Type::Date) {
        throw std::logic_error("value is not a date");
    }
    return date_;
}

const DateTime& Value::as_date_time() const {
    if (type_ != Type::DateTime) {
        throw std::logic_error("value is not a datetime");
    }
    return date_time_;
}

const Decimal& Value::as_decimal() const {
    if (type_ != Type::Decimal) {
        throw std::logic_error("value is not a decimal");
    }
    return decimal_;
}

const Foreign& Value::as_foreign() const {
    if (!is_foreign()) {
        throw std::logic_error("value is not a foreign object");
    }
    return foreign_;
}

const Value::Array& Value::as_array() const {
    if (!is_array()) {
        throw std::logic_error("value is not a sequence");
    }
    return array_;
}

const Value::Object& Value::as_object() const {
    if (!is_object()) {
        throw std::logic_error("value is not a mapping");
    }
    return object_;
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type_ != rhs.type_) {
        return false;
    }
    switch (lhs.type_) {
        case Value::Type::Null: return true;
        case Value::Type::Boolean: return lhs.boolean_ == rhs.boolean_;
        case Value::Type::Integer: return lhs.integer_ == rhs.integer_;
        case Value::Type::Number: return lhs.number_ == rhs.number_;
        case Value::Type::String: return lhs.string_ == rhs.string_;
        case Value::Type::Decimal: return lhs.decimal_ == rhs.decimal_;
        case Value::Type::Foreign: return lhs.foreign_ == rhs.foreign_;
        case Value::Type::Date: return lhs.date_ == rhs.date_;
        case Value::Type::DateTime: return lhs.date_time_ == rhs.date_time_;
        case Value::Type::Array:
            return lhs.sequence_kind_ == rhs.sequence_kind_ && lhs.array_ == rhs.array_;
        case Value::Type::Object: return lhs.object_ == rhs.object_;
    }
    return false;
}

} // namespace densejson::core

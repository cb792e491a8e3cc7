#include "ark/value.h"
#include "ark/error.h"
#include <cmath>
#include <sstream>

namespace ark {

// -- Static factories --

Value Value::nil() { return Value(); }

Value Value::boolean(bool b) {
    Value v;
    v.data_ = b;
    return v;
}

Value Value::integer(int64_t i) {
    Value v;
    v.data_ = i;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.data_ = std::move(s);
    return v;
}

bool Value::isIntegralFloat() const {
    auto* p = std::get_if<double>(&data_);
    return p && std::isfinite(*p) && std::trunc(*p) == *p;
}

// -- Accessors --

bool Value::asBool() const {
    if (auto* p = std::get_if<bool>(&data_)) return *p;
    throw ValueTypeError("Value is not a bool, got " + typeName());
}

int64_t Value::asInt() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return *p;
    throw ValueTypeError("Value is not an int, got " + typeName());
}

double Value::asFloat() const {
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw ValueTypeError("Value is not a float, got " + typeName());
}

double Value::asNumber() const {
    if (auto* p = std::get_if<int64_t>(&data_)) return static_cast<double>(*p);
    if (auto* p = std::get_if<double>(&data_)) return *p;
    throw ValueTypeError("Value is not numeric, got " + typeName());
}

const std::string& Value::asString() const {
    if (auto* p = std::get_if<std::string>(&data_)) return *p;
    throw ValueTypeError("Value is not a string, got " + typeName());
}

// -- Equality --

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) return false;

    switch (type()) {
        case Type::Nil: return true;
        case Type::Bool: return asBool() == other.asBool();
        case Type::Int: return asInt() == other.asInt();
        case Type::Float: return asFloat() == other.asFloat();
        case Type::String: return asString() == other.asString();
    }
    return false;
}

// -- Display --

std::string Value::typeName() const {
    switch (type()) {
        case Type::Nil: return "nil";
        case Type::Bool: return "bool";
        case Type::Int: return "int";
        case Type::Float: return "float";
        case Type::String: return "string";
    }
    return "unknown";
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Nil: return "nil";
        case Type::Bool: return asBool() ? "true" : "false";
        case Type::Int: return std::to_string(asInt());
        case Type::Float: {
            std::ostringstream oss;
            oss << asFloat();
            return oss.str();
        }
        case Type::String: return asString();
    }
    return "<unknown>";
}

// -- Column helpers --

Column stringColumn(const std::vector<std::string>& values) {
    Column column;
    column.reserve(values.size());
    for (auto& s : values) column.push_back(Value::string(s));
    return column;
}

Column integerColumn(const std::vector<int64_t>& values) {
    Column column;
    column.reserve(values.size());
    for (auto i : values) column.push_back(Value::integer(i));
    return column;
}

} // namespace ark

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ark {

/// A single cell of a key table.
class Value {
public:
    enum class Type : std::size_t {
        Nil = 0,
        Bool,
        Int,
        Float,
        String
    };

    /// Default constructs nil.
    Value() : data_(std::monostate{}) {}

    // -- Static factories --
    static Value nil();
    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value number(double d);
    static Value string(std::string s);

    // -- Type queries --
    Type type() const { return static_cast<Type>(data_.index()); }
    bool isNil() const { return type() == Type::Nil; }
    bool isBool() const { return type() == Type::Bool; }
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumeric() const { return isInt() || isFloat(); }
    bool isString() const { return type() == Type::String; }

    /// True for a float holding a whole number, e.g. 3.0.
    bool isIntegralFloat() const;

    // -- Accessors (throw ValueTypeError on type mismatch) --
    bool asBool() const;
    int64_t asInt() const;
    double asFloat() const;
    double asNumber() const;  // works for int or float
    const std::string& asString() const;

    // -- Equality (no cross-type numeric equality: 1 != 1.0) --
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -- Display --
    std::string toString() const;
    std::string typeName() const;

private:
    using Variant = std::variant<
        std::monostate,  // Nil
        bool,            // Bool
        int64_t,         // Int
        double,          // Float
        std::string      // String
    >;
    Variant data_;
};

/// One column of a key table. Rows are formed across equal-length columns.
using Column = std::vector<Value>;

/// Build a column of string values.
Column stringColumn(const std::vector<std::string>& values);

/// Build a column of integer values.
Column integerColumn(const std::vector<int64_t>& values);

} // namespace ark

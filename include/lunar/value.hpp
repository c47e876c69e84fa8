#pragma once

#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace lunar {

class Object;
class StringObject;
class TableObject;
class ClosureObject;
class NativeFunctionObject;
class ThreadObject;
class UserDataObject;

enum class ValueType : std::uint8_t {
    Nil,
    Boolean,
    Integer,
    Float,
    String,
    Table,
    Function,
    Thread,
    UserData
};

struct Value {
    ValueType type{ValueType::Nil};
    union {
        bool boolean;
        std::int64_t integer;
        double number;
        Object* object;
    };

    Value() : type(ValueType::Nil), integer(0) {}

    static Value Nil() { return {}; }
    static Value Boolean(bool v) {
        Value out;
        out.type = ValueType::Boolean;
        out.boolean = v;
        return out;
    }
    static Value Integer(std::int64_t v) {
        Value out;
        out.type = ValueType::Integer;
        out.integer = v;
        return out;
    }
    static Value Float(double v) {
        Value out;
        out.type = ValueType::Float;
        out.number = v;
        return out;
    }
    static Value Ref(ValueType kind, Object* ptr) {
        if (!ptr) {
            return {};
        }
        Value out;
        out.type = kind;
        out.object = ptr;
        return out;
    }
    static Value String(Object* ptr) { return Ref(ValueType::String, ptr); }
    static Value Table(Object* ptr) { return Ref(ValueType::Table, ptr); }
    static Value Function(Object* ptr) { return Ref(ValueType::Function, ptr); }
    static Value Thread(Object* ptr) { return Ref(ValueType::Thread, ptr); }
    static Value UserData(Object* ptr) { return Ref(ValueType::UserData, ptr); }

    bool isNil() const { return type == ValueType::Nil; }
    bool isBoolean() const { return type == ValueType::Boolean; }
    bool isInteger() const { return type == ValueType::Integer; }
    bool isFloat() const { return type == ValueType::Float; }
    bool isNumber() const { return type == ValueType::Integer || type == ValueType::Float; }
    bool isString() const { return type == ValueType::String; }
    bool isTable() const { return type == ValueType::Table; }
    bool isFunction() const { return type == ValueType::Function; }
    bool isThread() const { return type == ValueType::Thread; }
    bool isUserData() const { return type == ValueType::UserData; }
    bool isObject() const { return type >= ValueType::String; }

    // Only nil and false are falsy.
    bool isFalsy() const { return type == ValueType::Nil || (type == ValueType::Boolean && !boolean); }
    bool isTruthy() const { return !isFalsy(); }

    bool asBoolean() const {
        if (!isBoolean()) {
            throw std::runtime_error("Value is not boolean");
        }
        return boolean;
    }

    std::int64_t asInteger() const {
        if (!isInteger()) {
            throw std::runtime_error("Value is not integer");
        }
        return integer;
    }

    double asFloat() const {
        if (!isFloat()) {
            throw std::runtime_error("Value is not float");
        }
        return number;
    }

    // Integer or float widened to double.
    double asNumber() const {
        if (isInteger()) {
            return static_cast<double>(integer);
        }
        return asFloat();
    }

    Object* asObject() const {
        if (!isObject()) {
            throw std::runtime_error("Value is not a heap reference");
        }
        return object;
    }

    StringObject& asString() const;
    TableObject& asTable() const;
    ThreadObject& asThread() const;
    UserDataObject& asUserData() const;
    ClosureObject* asClosure() const;
    NativeFunctionObject* asNative() const;
};

bool floatToInteger(double value, std::int64_t& out);

// Raw equality: numbers by mathematical value, everything else by identity.
// Strings are interned, so identity equals content equality.
inline bool rawEquals(const Value& a, const Value& b) {
    if (a.type == b.type) {
        switch (a.type) {
        case ValueType::Nil:
            return true;
        case ValueType::Boolean:
            return a.boolean == b.boolean;
        case ValueType::Integer:
            return a.integer == b.integer;
        case ValueType::Float:
            return a.number == b.number;
        default:
            return a.object == b.object;
        }
    }
    if (a.isInteger() && b.isFloat()) {
        std::int64_t i = 0;
        return floatToInteger(b.number, i) && i == a.integer;
    }
    if (a.isFloat() && b.isInteger()) {
        std::int64_t i = 0;
        return floatToInteger(a.number, i) && i == b.integer;
    }
    return false;
}

// Hash and equality over normalized table keys (integral floats already
// converted to integers, nil and NaN rejected).
struct ValueKeyHash {
    std::size_t operator()(const Value& v) const noexcept {
        switch (v.type) {
        case ValueType::Boolean:
            return v.boolean ? 0x9e3779b9u : 0x7f4a7c15u;
        case ValueType::Integer:
            return std::hash<std::int64_t>{}(v.integer);
        case ValueType::Float:
            return std::hash<double>{}(v.number);
        case ValueType::Nil:
            return 0;
        default:
            return std::hash<const void*>{}(v.object);
        }
    }
};

struct ValueKeyEqual {
    bool operator()(const Value& a, const Value& b) const noexcept {
        if (a.type != b.type) {
            return false;
        }
        switch (a.type) {
        case ValueType::Nil:
            return true;
        case ValueType::Boolean:
            return a.boolean == b.boolean;
        case ValueType::Integer:
            return a.integer == b.integer;
        case ValueType::Float:
            return a.number == b.number;
        default:
            return a.object == b.object;
        }
    }
};

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace lunar

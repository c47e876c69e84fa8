#include "lunar/value.hpp"
#include "lunar/type_system.hpp"
#include "lunar/value_ops.hpp"

#include <cmath>

namespace lunar {

bool floatToInteger(double value, std::int64_t& out) {
    if (std::floor(value) != value) {
        return false;
    }
    if (value >= -9223372036854775808.0 && value < 9223372036854775808.0) {
        out = static_cast<std::int64_t>(value);
        return true;
    }
    return false;
}

StringObject& Value::asString() const {
    if (!isString()) {
        throw std::runtime_error("Value is not string");
    }
    return static_cast<StringObject&>(*object);
}

TableObject& Value::asTable() const {
    if (!isTable()) {
        throw std::runtime_error("Value is not table");
    }
    return static_cast<TableObject&>(*object);
}

ThreadObject& Value::asThread() const {
    if (!isThread()) {
        throw std::runtime_error("Value is not thread");
    }
    return static_cast<ThreadObject&>(*object);
}

UserDataObject& Value::asUserData() const {
    if (!isUserData()) {
        throw std::runtime_error("Value is not userdata");
    }
    return static_cast<UserDataObject&>(*object);
}

ClosureObject* Value::asClosure() const {
    if (!isFunction()) {
        throw std::runtime_error("Value is not function");
    }
    return dynamic_cast<ClosureObject*>(object);
}

NativeFunctionObject* Value::asNative() const {
    if (!isFunction()) {
        throw std::runtime_error("Value is not function");
    }
    return dynamic_cast<NativeFunctionObject*>(object);
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << toDisplayString(value);
}

} // namespace lunar

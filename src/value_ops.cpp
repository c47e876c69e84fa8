#include "lunar/value_ops.hpp"
#include "lunar/type_system.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace lunar {

namespace {

constexpr double kTwoPow63 = 9223372036854775808.0;

std::string_view trim(std::string_view text) {
    const char* spaces = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(spaces);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(spaces);
    return text.substr(first, last - first + 1);
}

int digitValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    return 99;
}

std::optional<double> parseFloat(const std::string& text) {
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::int64_t wrapAdd(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
}

std::int64_t wrapSub(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b));
}

std::int64_t wrapMul(std::int64_t a, std::int64_t b) {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b));
}

std::int64_t shiftLeft(std::int64_t x, std::int64_t n) {
    if (n <= -64 || n >= 64) {
        return 0;
    }
    const auto bits = static_cast<std::uint64_t>(x);
    if (n >= 0) {
        return static_cast<std::int64_t>(bits << n);
    }
    return static_cast<std::int64_t>(bits >> -n);
}

std::int64_t integerMod(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw std::runtime_error("attempt to perform 'n%0'");
    }
    if (b == -1) {
        return 0;
    }
    std::int64_t m = a % b;
    if (m != 0 && (m ^ b) < 0) {
        m += b;
    }
    return m;
}

std::int64_t integerFloorDiv(std::int64_t a, std::int64_t b) {
    if (b == 0) {
        throw std::runtime_error("attempt to perform 'n//0'");
    }
    if (b == -1) {
        return wrapSub(0, a);
    }
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a ^ b) < 0)) {
        q -= 1;
    }
    return q;
}

double floatMod(double a, double b) {
    double m = std::fmod(a, b);
    if ((m > 0) ? b < 0 : (m < 0 && b != m)) {
        m += b;
    }
    return m;
}

// Exact comparisons between an integer and a float.
bool intLessFloat(std::int64_t i, double f) {
    if (std::isnan(f)) {
        return false;
    }
    if (f >= kTwoPow63) {
        return true;
    }
    if (f <= -kTwoPow63) {
        return false;
    }
    return i < static_cast<std::int64_t>(std::ceil(f));
}

bool intLessEqualFloat(std::int64_t i, double f) {
    if (std::isnan(f)) {
        return false;
    }
    if (f >= kTwoPow63) {
        return true;
    }
    if (f < -kTwoPow63) {
        return false;
    }
    return i <= static_cast<std::int64_t>(std::floor(f));
}

bool floatLessInt(double f, std::int64_t i) {
    if (std::isnan(f)) {
        return false;
    }
    if (f >= kTwoPow63) {
        return false;
    }
    if (f < -kTwoPow63) {
        return true;
    }
    return static_cast<std::int64_t>(std::floor(f)) < i;
}

bool floatLessEqualInt(double f, std::int64_t i) {
    if (std::isnan(f)) {
        return false;
    }
    if (f >= kTwoPow63) {
        return false;
    }
    if (f <= -kTwoPow63) {
        return true;
    }
    return static_cast<std::int64_t>(std::ceil(f)) <= i;
}

} // namespace

bool isBitwise(ArithOp op) {
    switch (op) {
    case ArithOp::BAnd:
    case ArithOp::BOr:
    case ArithOp::BXor:
    case ArithOp::Shl:
    case ArithOp::Shr:
    case ArithOp::BNot:
        return true;
    default:
        return false;
    }
}

std::optional<Value> parseNumber(std::string_view text) {
    const std::string_view body = trim(text);
    if (body.empty()) {
        return std::nullopt;
    }

    std::size_t pos = 0;
    bool negative = false;
    if (body[pos] == '+' || body[pos] == '-') {
        negative = body[pos] == '-';
        ++pos;
    }

    const bool hex = body.size() > pos + 1 && body[pos] == '0' && (body[pos + 1] == 'x' || body[pos + 1] == 'X');
    if (hex) {
        const std::string_view digits = body.substr(pos + 2);
        if (digits.find_first_of(".pP") != std::string_view::npos) {
            auto value = parseFloat(std::string(body));
            if (!value) {
                return std::nullopt;
            }
            return Value::Float(*value);
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        std::uint64_t accumulated = 0;
        for (char c : digits) {
            const int digit = digitValue(c);
            if (digit >= 16) {
                return std::nullopt;
            }
            accumulated = accumulated * 16 + static_cast<std::uint64_t>(digit);
        }
        if (negative) {
            accumulated = 0 - accumulated;
        }
        return Value::Integer(static_cast<std::int64_t>(accumulated));
    }

    bool isFloat = false;
    bool sawDigit = false;
    for (std::size_t i = pos; i < body.size(); ++i) {
        const char c = body[i];
        if (c >= '0' && c <= '9') {
            sawDigit = true;
        } else if (c == '.' || c == 'e' || c == 'E') {
            isFloat = true;
        } else if (c != '+' && c != '-') {
            return std::nullopt;
        }
    }
    if (!sawDigit) {
        return std::nullopt;
    }

    const std::string owned(body);
    if (!isFloat) {
        errno = 0;
        char* end = nullptr;
        const long long value = std::strtoll(owned.c_str(), &end, 10);
        if (end == owned.c_str() + owned.size() && errno != ERANGE) {
            return Value::Integer(static_cast<std::int64_t>(value));
        }
    }
    auto value = parseFloat(owned);
    if (!value) {
        return std::nullopt;
    }
    return Value::Float(*value);
}

std::optional<std::int64_t> parseInteger(std::string_view text, int base) {
    if (base < 2 || base > 36) {
        return std::nullopt;
    }
    const std::string_view body = trim(text);
    std::size_t pos = 0;
    bool negative = false;
    if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
        negative = body[0] == '-';
        pos = 1;
    }
    if (pos >= body.size()) {
        return std::nullopt;
    }
    std::uint64_t accumulated = 0;
    for (std::size_t i = pos; i < body.size(); ++i) {
        const int digit = digitValue(body[i]);
        if (digit >= base) {
            return std::nullopt;
        }
        accumulated = accumulated * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(digit);
    }
    if (negative) {
        accumulated = 0 - accumulated;
    }
    return static_cast<std::int64_t>(accumulated);
}

std::optional<Value> toNumber(const Value& value) {
    if (value.isNumber()) {
        return value;
    }
    if (value.isString()) {
        return parseNumber(value.asString().text());
    }
    return std::nullopt;
}

std::optional<std::int64_t> toInteger(const Value& value) {
    auto number = toNumber(value);
    if (!number) {
        return std::nullopt;
    }
    if (number->isInteger()) {
        return number->integer;
    }
    std::int64_t out = 0;
    if (floatToInteger(number->number, out)) {
        return out;
    }
    return std::nullopt;
}

std::optional<double> toFloat(const Value& value) {
    auto number = toNumber(value);
    if (!number) {
        return std::nullopt;
    }
    return number->asNumber();
}

ArithStatus arithmetic(ArithOp op, const Value& lhs, const Value& rhs, Value& out) {
    const bool unary = op == ArithOp::Unm || op == ArithOp::BNot;
    auto a = toNumber(lhs);
    auto b = unary ? a : toNumber(rhs);
    if (!a || !b) {
        return ArithStatus::NotNumbers;
    }

    if (isBitwise(op)) {
        auto x = toInteger(*a);
        auto y = toInteger(*b);
        if (!x || !y) {
            return ArithStatus::NoIntegerRepresentation;
        }
        switch (op) {
        case ArithOp::BAnd:
            out = Value::Integer(*x & *y);
            break;
        case ArithOp::BOr:
            out = Value::Integer(*x | *y);
            break;
        case ArithOp::BXor:
            out = Value::Integer(*x ^ *y);
            break;
        case ArithOp::Shl:
            out = Value::Integer(shiftLeft(*x, *y));
            break;
        case ArithOp::Shr:
            out = Value::Integer(*y == INT64_MIN ? 0 : shiftLeft(*x, -*y));
            break;
        default:
            out = Value::Integer(~*x);
            break;
        }
        return ArithStatus::Ok;
    }

    if (op == ArithOp::Unm) {
        out = a->isInteger() ? Value::Integer(wrapSub(0, a->integer)) : Value::Float(-a->number);
        return ArithStatus::Ok;
    }

    if (op == ArithOp::Div) {
        out = Value::Float(a->asNumber() / b->asNumber());
        return ArithStatus::Ok;
    }
    if (op == ArithOp::Pow) {
        out = Value::Float(std::pow(a->asNumber(), b->asNumber()));
        return ArithStatus::Ok;
    }

    if (a->isInteger() && b->isInteger()) {
        const std::int64_t x = a->integer;
        const std::int64_t y = b->integer;
        switch (op) {
        case ArithOp::Add:
            out = Value::Integer(wrapAdd(x, y));
            break;
        case ArithOp::Sub:
            out = Value::Integer(wrapSub(x, y));
            break;
        case ArithOp::Mul:
            out = Value::Integer(wrapMul(x, y));
            break;
        case ArithOp::Mod:
            out = Value::Integer(integerMod(x, y));
            break;
        case ArithOp::IDiv:
            out = Value::Integer(integerFloorDiv(x, y));
            break;
        default:
            return ArithStatus::NotNumbers;
        }
        return ArithStatus::Ok;
    }

    const double x = a->asNumber();
    const double y = b->asNumber();
    switch (op) {
    case ArithOp::Add:
        out = Value::Float(x + y);
        break;
    case ArithOp::Sub:
        out = Value::Float(x - y);
        break;
    case ArithOp::Mul:
        out = Value::Float(x * y);
        break;
    case ArithOp::Mod:
        out = Value::Float(floatMod(x, y));
        break;
    case ArithOp::IDiv:
        out = Value::Float(std::floor(x / y));
        break;
    default:
        return ArithStatus::NotNumbers;
    }
    return ArithStatus::Ok;
}

std::optional<bool> rawLessThan(const Value& lhs, const Value& rhs) {
    if (lhs.isInteger() && rhs.isInteger()) {
        return lhs.integer < rhs.integer;
    }
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isFloat() && rhs.isFloat()) {
            return lhs.number < rhs.number;
        }
        if (lhs.isInteger()) {
            return intLessFloat(lhs.integer, rhs.number);
        }
        return floatLessInt(lhs.number, rhs.integer);
    }
    if (lhs.isString() && rhs.isString()) {
        return lhs.asString().text() < rhs.asString().text();
    }
    return std::nullopt;
}

std::optional<bool> rawLessEqual(const Value& lhs, const Value& rhs) {
    if (lhs.isInteger() && rhs.isInteger()) {
        return lhs.integer <= rhs.integer;
    }
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isFloat() && rhs.isFloat()) {
            return lhs.number <= rhs.number;
        }
        if (lhs.isInteger()) {
            return intLessEqualFloat(lhs.integer, rhs.number);
        }
        return floatLessEqualInt(lhs.number, rhs.integer);
    }
    if (lhs.isString() && rhs.isString()) {
        return lhs.asString().text() <= rhs.asString().text();
    }
    return std::nullopt;
}

std::string numberToString(const Value& number) {
    if (number.isInteger()) {
        return std::to_string(number.integer);
    }
    const double value = number.asFloat();
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    if (std::isnan(value)) {
        return std::signbit(value) ? "-nan" : "nan";
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.14g", value);
    std::string text(buffer);
    if (text.find_first_not_of("-0123456789") == std::string::npos) {
        text += ".0";
    }
    return text;
}

const char* typeName(const Value& value) {
    switch (value.type) {
    case ValueType::Nil:
        return "nil";
    case ValueType::Boolean:
        return "boolean";
    case ValueType::Integer:
    case ValueType::Float:
        return "number";
    case ValueType::String:
        return "string";
    case ValueType::Table:
        return "table";
    case ValueType::Function:
        return "function";
    case ValueType::Thread:
        return "thread";
    case ValueType::UserData:
        return "userdata";
    }
    return "nil";
}

std::string toDisplayString(const Value& value) {
    switch (value.type) {
    case ValueType::Nil:
        return "nil";
    case ValueType::Boolean:
        return value.boolean ? "true" : "false";
    case ValueType::Integer:
    case ValueType::Float:
        return numberToString(value);
    default:
        return value.object->getType().__str__(*value.object);
    }
}

} // namespace lunar

#pragma once

#include "lunar/value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lunar {

enum class ArithOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Pow,
    IDiv,
    BAnd,
    BOr,
    BXor,
    Shl,
    Shr,
    Unm,
    BNot
};

enum class ArithStatus : std::uint8_t {
    Ok,
    NotNumbers,
    NoIntegerRepresentation
};

bool isBitwise(ArithOp op);

// Numeric value of a number or a numeric string.
std::optional<Value> toNumber(const Value& value);
// Exact integer value of an integer, an integral float or such a string.
std::optional<std::int64_t> toInteger(const Value& value);
std::optional<double> toFloat(const Value& value);

// Parses Lua numerals: decimal integers and floats, hex integers (wrapping)
// and hex floats, with surrounding whitespace.
std::optional<Value> parseNumber(std::string_view text);
std::optional<std::int64_t> parseInteger(std::string_view text, int base);

// Numeric part of arithmetic, coercing strings. Integer division and modulo
// by zero throw std::runtime_error. Unary ops ignore `rhs`.
ArithStatus arithmetic(ArithOp op, const Value& lhs, const Value& rhs, Value& out);

// Number/number and string/string ordering; nullopt when not comparable.
std::optional<bool> rawLessThan(const Value& lhs, const Value& rhs);
std::optional<bool> rawLessEqual(const Value& lhs, const Value& rhs);

std::string numberToString(const Value& number);
const char* typeName(const Value& value);
// tostring without metamethods.
std::string toDisplayString(const Value& value);

} // namespace lunar

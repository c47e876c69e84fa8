#pragma once

#include "lunar/value.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace lunar {

struct TracebackEntry {
    std::string function;
    std::string source;
    std::int32_t line{0};
};

std::vector<std::string> formatTraceback(const std::vector<TracebackEntry>& traceback);

// A script-level error carrying an arbitrary Value. Recoverable by
// protected calls.
class ScriptError : public std::runtime_error {
public:
    ScriptError(Value value, const std::string& description);

    const Value& value() const { return value_; }

private:
    Value value_;
};

// Misuse of the coroutine or executor protocol. Never unwinds script frames.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Heap exhaustion. The heap and every executor over it are unusable afterwards.
class FatalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidTableKey : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class StackOverflow : public std::runtime_error {
public:
    StackOverflow() : std::runtime_error("stack overflow") {}
};

} // namespace lunar

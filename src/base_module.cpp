#include "lunar/runtime.hpp"
#include "lunar/stdlib.hpp"
#include "lunar/type_system.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace lunar {

namespace {

const Value& argAt(const std::vector<Value>& args, std::size_t index) {
    static const Value nil;
    return index < args.size() ? args[index] : nil;
}

[[noreturn]] void badArgument(std::size_t position, const char* function, const std::string& message) {
    throw std::runtime_error("bad argument #" + std::to_string(position) + " to '" + function + "' (" + message + ")");
}

void checkAny(const std::vector<Value>& args, std::size_t index, const char* function) {
    if (index >= args.size()) {
        badArgument(index + 1, function, "value expected");
    }
}

TableObject& checkTable(const std::vector<Value>& args, std::size_t index, const char* function) {
    const Value& value = argAt(args, index);
    if (!value.isTable()) {
        badArgument(index + 1, function, std::string("table expected, got ") + typeName(value));
    }
    return value.asTable();
}

std::int64_t checkInteger(const std::vector<Value>& args, std::size_t index, const char* function) {
    const Value& value = argAt(args, index);
    if (auto integer = toInteger(value)) {
        return *integer;
    }
    if (toNumber(value)) {
        badArgument(index + 1, function, "number has no integer representation");
    }
    badArgument(index + 1, function, std::string("number expected, got ") + typeName(value));
}

std::vector<Value> tail(std::vector<Value>& args, std::size_t from) {
    if (from >= args.size()) {
        return {};
    }
    return std::vector<Value>(args.begin() + static_cast<std::ptrdiff_t>(from), args.end());
}

Handle<TableObject> metatableOf(const Value& value) {
    if (value.isTable()) {
        return value.asTable().metatable();
    }
    if (value.isUserData()) {
        return value.asUserData().metatable();
    }
    return {};
}

// ============================================================================
// Errors and protected calls
// ============================================================================

CallbackResult impl_assert(CallContext& ctx, std::vector<Value> args) {
    checkAny(args, 0, "assert");
    if (args[0].isTruthy()) {
        return CallbackResult::Return(std::move(args));
    }
    if (args.size() >= 2) {
        throw ScriptError(args[1], ctx.toString(args[1]));
    }
    throw std::runtime_error("assertion failed!");
}

CallbackResult impl_error(CallContext& ctx, std::vector<Value> args) {
    Value error = argAt(args, 0);
    const std::int64_t level = args.size() >= 2 ? checkInteger(args, 1, "error") : 1;
    if (error.isString() && level > 0) {
        error = ctx.createString(ctx.where(static_cast<int>(level)) + error.asString().text());
    }
    throw ScriptError(error, ctx.toString(error));
}

CallbackResult impl_pcall(CallContext&, std::vector<Value> args) {
    checkAny(args, 0, "pcall");
    const Value function = args[0];
    return CallbackResult::Call(
        function,
        tail(args, 1),
        [](CallContext&, CallOutcome outcome, std::vector<Value> results, std::vector<Value>) {
            if (outcome == CallOutcome::Errored) {
                return CallbackResult::Return({Value::Boolean(false), argAt(results, 0)});
            }
            results.insert(results.begin(), Value::Boolean(true));
            return CallbackResult::Return(std::move(results));
        },
        true);
}

// The message handler runs after the failed call has been unwound.
CallbackResult impl_xpcall(CallContext&, std::vector<Value> args) {
    if (args.size() < 2) {
        badArgument(2, "xpcall", "value expected");
    }
    const Value function = args[0];
    const Value handler = args[1];
    return CallbackResult::Call(
        function,
        tail(args, 2),
        [](CallContext&, CallOutcome outcome, std::vector<Value> results, std::vector<Value> stash) {
            if (outcome == CallOutcome::Returned) {
                results.insert(results.begin(), Value::Boolean(true));
                return CallbackResult::Return(std::move(results));
            }
            return CallbackResult::Call(
                stash.at(0),
                {argAt(results, 0)},
                [](CallContext&, CallOutcome, std::vector<Value> handled, std::vector<Value>) {
                    return CallbackResult::Return({Value::Boolean(false), argAt(handled, 0)});
                },
                true);
        },
        true,
        {handler});
}

// ============================================================================
// Conversions
// ============================================================================

CallbackResult impl_type(CallContext& ctx, std::vector<Value> args) {
    checkAny(args, 0, "type");
    return CallbackResult::Return({ctx.createString(typeName(args[0]))});
}

CallbackResult impl_tostring(CallContext& ctx, std::vector<Value> args) {
    checkAny(args, 0, "tostring");
    const Value value = args[0];
    const Value handler = ctx.metafield(value, "__tostring");
    if (handler.isNil()) {
        return CallbackResult::Return({ctx.createString(ctx.toString(value))});
    }
    return CallbackResult::Call(
        handler,
        {value},
        [](CallContext&, CallOutcome, std::vector<Value> results, std::vector<Value>) {
            const Value& text = argAt(results, 0);
            if (!text.isString()) {
                throw std::runtime_error("'__tostring' must return a string");
            }
            return CallbackResult::Return({text});
        });
}

CallbackResult impl_tonumber(CallContext& ctx, std::vector<Value> args) {
    if (argAt(args, 1).isNil()) {
        checkAny(args, 0, "tonumber");
        const Value& value = args[0];
        if (value.isNumber()) {
            return CallbackResult::Return({value});
        }
        if (value.isString()) {
            if (auto number = parseNumber(value.asString().text())) {
                return CallbackResult::Return({*number});
            }
        }
        return CallbackResult::Return({Value::Nil()});
    }

    const std::int64_t base = checkInteger(args, 1, "tonumber");
    if (base < 2 || base > 36) {
        badArgument(2, "tonumber", "base out of range");
    }
    const Value& text = argAt(args, 0);
    if (!text.isString()) {
        badArgument(1, "tonumber", std::string("string expected, got ") + ctx.typeName(text));
    }
    if (auto integer = parseInteger(text.asString().text(), static_cast<int>(base))) {
        return CallbackResult::Return({Value::Integer(*integer)});
    }
    return CallbackResult::Return({Value::Nil()});
}

CallbackResult impl_select(CallContext&, std::vector<Value> args) {
    const Value& selector = argAt(args, 0);
    const auto top = static_cast<std::int64_t>(args.size());
    if (selector.isString() && selector.asString().text() == "#") {
        return CallbackResult::Return({Value::Integer(top - 1)});
    }
    std::int64_t n = checkInteger(args, 0, "select");
    if (n < 0) {
        n = top + n;
    } else if (n > top) {
        n = top;
    }
    if (n < 1) {
        badArgument(1, "select", "index out of range");
    }
    return CallbackResult::Return(tail(args, static_cast<std::size_t>(n)));
}

// ============================================================================
// Raw access and metatables
// ============================================================================

CallbackResult impl_rawget(CallContext&, std::vector<Value> args) {
    TableObject& table = checkTable(args, 0, "rawget");
    return CallbackResult::Return({table.get(argAt(args, 1))});
}

CallbackResult impl_rawset(CallContext& ctx, std::vector<Value> args) {
    TableObject& table = checkTable(args, 0, "rawset");
    checkAny(args, 2, "rawset");
    table.set(ctx.heap(), args[1], args[2]);
    return CallbackResult::Return({args[0]});
}

CallbackResult impl_rawequal(CallContext&, std::vector<Value> args) {
    checkAny(args, 1, "rawequal");
    return CallbackResult::Return({Value::Boolean(rawEquals(args[0], args[1]))});
}

CallbackResult impl_rawlen(CallContext&, std::vector<Value> args) {
    const Value& value = argAt(args, 0);
    if (value.isTable()) {
        return CallbackResult::Return({Value::Integer(value.asTable().length())});
    }
    if (value.isString()) {
        return CallbackResult::Return({Value::Integer(static_cast<std::int64_t>(value.asString().size()))});
    }
    badArgument(1, "rawlen", "table or string expected");
}

CallbackResult impl_setmetatable(CallContext& ctx, std::vector<Value> args) {
    checkTable(args, 0, "setmetatable");
    const Value& metatable = argAt(args, 1);
    if (!metatable.isNil() && !metatable.isTable()) {
        badArgument(2, "setmetatable", "nil or table expected");
    }
    if (!ctx.metafield(args[0], "__metatable").isNil()) {
        throw std::runtime_error("cannot change a protected metatable");
    }
    ctx.setMetatable(args[0], metatable);
    return CallbackResult::Return({args[0]});
}

CallbackResult impl_getmetatable(CallContext& ctx, std::vector<Value> args) {
    checkAny(args, 0, "getmetatable");
    Handle<TableObject> metatable = metatableOf(args[0]);
    if (!metatable) {
        return CallbackResult::Return({Value::Nil()});
    }
    const Value guard = metatable->get(ctx.createString("__metatable"));
    if (!guard.isNil()) {
        return CallbackResult::Return({guard});
    }
    return CallbackResult::Return({Value::Table(metatable.get())});
}

// ============================================================================
// Iteration
// ============================================================================

CallbackResult impl_next(CallContext&, std::vector<Value> args) {
    TableObject& table = checkTable(args, 0, "next");
    const NextEntry entry = table.next(argAt(args, 1));
    switch (entry.status) {
    case NextStatus::Found:
        return CallbackResult::Return({entry.key, entry.value});
    case NextStatus::Last:
        return CallbackResult::Return({Value::Nil()});
    case NextStatus::NotFound:
        break;
    }
    throw std::runtime_error("invalid key to 'next'");
}

// upvalues[0]: the `next` function.
CallbackResult impl_pairs(CallContext& ctx, std::vector<Value> args) {
    checkTable(args, 0, "pairs");
    return CallbackResult::Return({ctx.upvalues().at(0), args[0], Value::Nil()});
}

CallbackResult impl_ipairsStep(CallContext&, std::vector<Value> args) {
    TableObject& table = checkTable(args, 0, "ipairs");
    const std::int64_t index = checkInteger(args, 1, "ipairs") + 1;
    const Value value = table.get(index);
    if (value.isNil()) {
        return CallbackResult::Return({Value::Nil()});
    }
    return CallbackResult::Return({Value::Integer(index), value});
}

// upvalues[0]: the stateless ipairs step function.
CallbackResult impl_ipairs(CallContext& ctx, std::vector<Value> args) {
    checkTable(args, 0, "ipairs");
    return CallbackResult::Return({ctx.upvalues().at(0), args[0], Value::Integer(0)});
}

// ============================================================================
// Misc
// ============================================================================

CallbackResult impl_print(CallContext& ctx, std::vector<Value> args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            std::cout << '\t';
        }
        std::cout << ctx.toString(args[i]);
    }
    std::cout << '\n';
    return CallbackResult::Return();
}

// Collection never runs inside a native call; "collect" and "step" are
// serviced at the next safe point.
CallbackResult impl_collectgarbage(CallContext& ctx, std::vector<Value> args) {
    const Value& option = argAt(args, 0);
    const std::string name = option.isNil() ? "collect" : ctx.toString(option);
    if (name == "collect") {
        ctx.heap().requestFullCollection();
        return CallbackResult::Return({Value::Integer(0)});
    }
    if (name == "count") {
        return CallbackResult::Return({Value::Integer(static_cast<std::int64_t>(ctx.heap().objectCount()))});
    }
    if (name == "step") {
        ctx.heap().requestFullCollection();
        return CallbackResult::Return({Value::Boolean(true)});
    }
    if (name == "isrunning") {
        return CallbackResult::Return({Value::Boolean(true)});
    }
    badArgument(1, "collectgarbage", "invalid option '" + name + "'");
}

} // namespace

// ============================================================================
// Binding Registration
// ============================================================================

void bindBaseModule(Runtime& runtime) {
    runtime.registerFunction("assert", impl_assert);
    runtime.registerFunction("error", impl_error);
    runtime.registerFunction("pcall", impl_pcall);
    runtime.registerFunction("xpcall", impl_xpcall);
    runtime.registerFunction("type", impl_type);
    runtime.registerFunction("tostring", impl_tostring);
    runtime.registerFunction("tonumber", impl_tonumber);
    runtime.registerFunction("select", impl_select);
    runtime.registerFunction("rawget", impl_rawget);
    runtime.registerFunction("rawset", impl_rawset);
    runtime.registerFunction("rawequal", impl_rawequal);
    runtime.registerFunction("rawlen", impl_rawlen);
    runtime.registerFunction("setmetatable", impl_setmetatable);
    runtime.registerFunction("getmetatable", impl_getmetatable);
    runtime.registerFunction("next", impl_next);
    runtime.registerFunction("print", impl_print);
    runtime.registerFunction("collectgarbage", impl_collectgarbage);

    const Value next = runtime.getGlobal("next");
    runtime.setGlobal("pairs", runtime.createFunction("pairs", impl_pairs, {next}));
    const Value ipairsStep = runtime.createFunction("ipairs_step", impl_ipairsStep);
    runtime.setGlobal("ipairs", runtime.createFunction("ipairs", impl_ipairs, {ipairsStep}));
    runtime.setGlobal("_G", runtime.globals());
}

void openStandardLibrary(Runtime& runtime) {
    bindBaseModule(runtime);
    bindCoroutineModule(runtime);
    bindMathModule(runtime);
}

} // namespace lunar

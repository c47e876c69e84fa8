// Template implementations for binding.hpp

#pragma once

#include "lunar/value_ops.hpp"

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

namespace lunar {

namespace detail {

template <typename T>
struct TypeConverter;

template <>
struct TypeConverter<std::int64_t> {
    static std::int64_t fromValue(CallContext& ctx, const Value& val) {
        if (auto integer = toInteger(val)) {
            return *integer;
        }
        if (toNumber(val)) {
            throw std::runtime_error("number has no integer representation");
        }
        throw std::runtime_error("number expected, got " + ctx.typeName(val));
    }
    static Value toValue(CallContext&, std::int64_t val) {
        return Value::Integer(val);
    }
};

template <>
struct TypeConverter<double> {
    static double fromValue(CallContext& ctx, const Value& val) {
        if (auto number = toFloat(val)) {
            return *number;
        }
        throw std::runtime_error("number expected, got " + ctx.typeName(val));
    }
    static Value toValue(CallContext&, double val) {
        return Value::Float(val);
    }
};

template <>
struct TypeConverter<bool> {
    static bool fromValue(CallContext&, const Value& val) {
        return val.isTruthy();
    }
    static Value toValue(CallContext&, bool val) {
        return Value::Boolean(val);
    }
};

template <>
struct TypeConverter<std::string> {
    static std::string fromValue(CallContext& ctx, const Value& val) {
        if (val.isString() || val.isNumber()) {
            return ctx.toString(val);
        }
        throw std::runtime_error("string expected, got " + ctx.typeName(val));
    }
    static Value toValue(CallContext& ctx, const std::string& val) {
        return ctx.createString(val);
    }
};

template <>
struct TypeConverter<Value> {
    static Value fromValue(CallContext&, const Value& val) {
        return val;
    }
    static Value toValue(CallContext&, const Value& val) {
        return val;
    }
};

// Missing trailing arguments read as nil.
template <typename... Args, std::size_t... Is>
std::tuple<Args...> unpackArgs(CallContext& ctx,
                               const std::string& name,
                               const std::vector<Value>& args,
                               std::index_sequence<Is...>) {
    auto convert = [&](auto tag, std::size_t index) {
        using T = typename decltype(tag)::type;
        const Value arg = index < args.size() ? args[index] : Value::Nil();
        try {
            return TypeConverter<T>::fromValue(ctx, arg);
        } catch (const std::runtime_error& error) {
            throw std::runtime_error("bad argument #" + std::to_string(index + 1) + " to '" + name + "' (" +
                                     error.what() + ")");
        }
    };
    return std::tuple<Args...>{convert(std::type_identity<Args>{}, Is)...};
}

template <typename R, typename... Args>
struct FunctionWrapper {
    using FuncType = std::function<R(Args...)>;

    static CallbackResult invoke(CallContext& ctx,
                                 const std::string& name,
                                 const std::vector<Value>& args,
                                 const FuncType& func) {
        auto argTuple = unpackArgs<std::decay_t<Args>...>(ctx, name, args, std::index_sequence_for<Args...>{});
        if constexpr (std::is_void_v<R>) {
            std::apply(func, argTuple);
            return CallbackResult::Return();
        } else {
            R result = std::apply(func, argTuple);
            return CallbackResult::Return({TypeConverter<std::decay_t<R>>::toValue(ctx, result)});
        }
    }
};

template <typename R, typename... Args>
NativeFunction wrapFunction(std::string name, std::function<R(Args...)> func) {
    return [name = std::move(name), func = std::move(func)](CallContext& ctx, std::vector<Value> args) {
        return FunctionWrapper<R, Args...>::invoke(ctx, name, args, func);
    };
}

} // namespace detail

template <typename F>
NativeFunction makeNativeFunction(std::string name, F&& function) {
    // Deduce the signature through std::function's deduction guides.
    using FuncType = decltype(std::function{std::forward<F>(function)});
    return detail::wrapFunction(std::move(name), FuncType(std::forward<F>(function)));
}

} // namespace lunar

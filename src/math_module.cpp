#include "lunar/runtime.hpp"
#include "lunar/stdlib.hpp"
#include "lunar/value_ops.hpp"

#include <cmath>
#include <functional>
#include <limits>
#include <memory>
#include <numbers>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

namespace lunar {

namespace {

using MathResult = std::optional<std::vector<Value>>;
using MathFunction = std::function<MathResult(CallContext&, const std::vector<Value>&)>;

// Every math function reports unusable arguments the same way.
NativeFunction mathFunction(std::string name, MathFunction function) {
    return [name = std::move(name), function = std::move(function)](CallContext& ctx, std::vector<Value> args) {
        MathResult result = function(ctx, args);
        if (!result) {
            throw std::runtime_error("bad argument to " + name);
        }
        return CallbackResult::Return(std::move(*result));
    };
}

std::optional<double> numberAt(const std::vector<Value>& args, std::size_t index) {
    if (index >= args.size()) {
        return std::nullopt;
    }
    return toFloat(args[index]);
}

std::optional<std::int64_t> integerAt(const std::vector<Value>& args, std::size_t index) {
    if (index >= args.size()) {
        return std::nullopt;
    }
    return toInteger(args[index]);
}

// Integral results of floor/ceil come back as integers when they fit.
Value integralOrFloat(double value) {
    std::int64_t integer = 0;
    if (floatToInteger(value, integer)) {
        return Value::Integer(integer);
    }
    return Value::Float(value);
}

MathFunction unary(double (*operation)(double)) {
    return [operation](CallContext&, const std::vector<Value>& args) -> MathResult {
        auto x = numberAt(args, 0);
        if (!x) {
            return std::nullopt;
        }
        return std::vector<Value>{Value::Float(operation(*x))};
    };
}

MathResult impl_abs(CallContext&, const std::vector<Value>& args) {
    if (args.empty()) {
        return std::nullopt;
    }
    if (args[0].isInteger()) {
        const std::int64_t value = args[0].integer;
        return std::vector<Value>{
            Value::Integer(value < 0 ? static_cast<std::int64_t>(0u - static_cast<std::uint64_t>(value)) : value)};
    }
    auto x = toFloat(args[0]);
    if (!x) {
        return std::nullopt;
    }
    return std::vector<Value>{Value::Float(std::fabs(*x))};
}

MathResult impl_atan(CallContext&, const std::vector<Value>& args) {
    auto y = numberAt(args, 0);
    if (!y) {
        return std::nullopt;
    }
    if (args.size() >= 2 && !args[1].isNil()) {
        auto x = numberAt(args, 1);
        if (!x) {
            return std::nullopt;
        }
        return std::vector<Value>{Value::Float(std::atan2(*y, *x))};
    }
    return std::vector<Value>{Value::Float(std::atan(*y))};
}

MathResult impl_floor(CallContext&, const std::vector<Value>& args) {
    if (!args.empty() && args[0].isInteger()) {
        return std::vector<Value>{args[0]};
    }
    auto x = numberAt(args, 0);
    if (!x) {
        return std::nullopt;
    }
    return std::vector<Value>{integralOrFloat(std::floor(*x))};
}

MathResult impl_ceil(CallContext&, const std::vector<Value>& args) {
    if (!args.empty() && args[0].isInteger()) {
        return std::vector<Value>{args[0]};
    }
    auto x = numberAt(args, 0);
    if (!x) {
        return std::nullopt;
    }
    return std::vector<Value>{integralOrFloat(std::ceil(*x))};
}

// Result takes the sign of the dividend.
MathResult impl_fmod(CallContext&, const std::vector<Value>& args) {
    auto a = numberAt(args, 0);
    auto b = numberAt(args, 1);
    if (!a || !b) {
        return std::nullopt;
    }
    return std::vector<Value>{Value::Float(std::fmod(*a, *b))};
}

MathResult impl_log(CallContext&, const std::vector<Value>& args) {
    auto x = numberAt(args, 0);
    if (!x) {
        return std::nullopt;
    }
    if (args.size() < 2 || args[1].isNil()) {
        return std::vector<Value>{Value::Float(std::log(*x))};
    }
    auto base = numberAt(args, 1);
    if (!base) {
        return std::nullopt;
    }
    if (*base == 2.0) {
        return std::vector<Value>{Value::Float(std::log2(*x))};
    }
    if (*base == 10.0) {
        return std::vector<Value>{Value::Float(std::log10(*x))};
    }
    return std::vector<Value>{Value::Float(std::log(*x) / std::log(*base))};
}

MathResult extremum(const std::vector<Value>& args, bool wantMax) {
    if (args.empty()) {
        return std::nullopt;
    }
    Value best = args[0];
    if (!best.isNumber()) {
        return std::nullopt;
    }
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto less = wantMax ? rawLessThan(best, args[i]) : rawLessThan(args[i], best);
        if (!less || !args[i].isNumber()) {
            return std::nullopt;
        }
        if (*less) {
            best = args[i];
        }
    }
    return std::vector<Value>{best};
}

MathResult impl_max(CallContext&, const std::vector<Value>& args) {
    return extremum(args, true);
}

MathResult impl_min(CallContext&, const std::vector<Value>& args) {
    return extremum(args, false);
}

// Integral part truncated toward zero, then the fractional part.
MathResult impl_modf(CallContext&, const std::vector<Value>& args) {
    auto x = numberAt(args, 0);
    if (!x) {
        return std::nullopt;
    }
    if (std::isinf(*x)) {
        return std::vector<Value>{Value::Float(*x), Value::Float(0.0)};
    }
    double integral = 0.0;
    const double fraction = std::modf(*x, &integral);
    return std::vector<Value>{integralOrFloat(integral), Value::Float(fraction)};
}

MathResult impl_tointeger(CallContext&, const std::vector<Value>& args) {
    if (args.empty()) {
        return std::nullopt;
    }
    if (args[0].isNumber()) {
        if (auto integer = toInteger(args[0])) {
            return std::vector<Value>{Value::Integer(*integer)};
        }
    }
    return std::vector<Value>{Value::Nil()};
}

MathResult impl_type(CallContext& ctx, const std::vector<Value>& args) {
    if (args.empty()) {
        return std::nullopt;
    }
    if (args[0].isInteger()) {
        return std::vector<Value>{ctx.createString("integer")};
    }
    if (args[0].isFloat()) {
        return std::vector<Value>{ctx.createString("float")};
    }
    return std::vector<Value>{Value::Nil()};
}

MathResult impl_ult(CallContext&, const std::vector<Value>& args) {
    auto a = integerAt(args, 0);
    auto b = integerAt(args, 1);
    if (!a || !b) {
        return std::nullopt;
    }
    return std::vector<Value>{Value::Boolean(static_cast<std::uint64_t>(*a) < static_cast<std::uint64_t>(*b))};
}

using Generator = std::shared_ptr<std::mt19937_64>;

MathFunction makeRandom(Generator generator) {
    return [generator](CallContext&, const std::vector<Value>& args) -> MathResult {
        if (args.empty()) {
            return std::vector<Value>{Value::Float(std::uniform_real_distribution<double>(0.0, 1.0)(*generator))};
        }
        auto first = integerAt(args, 0);
        if (!first) {
            return std::nullopt;
        }
        std::int64_t low = 1;
        std::int64_t high = *first;
        if (args.size() >= 2) {
            auto second = integerAt(args, 1);
            if (!second) {
                return std::nullopt;
            }
            low = *first;
            high = *second;
        }
        if (low > high) {
            throw std::runtime_error("bad argument to random (interval is empty)");
        }
        return std::vector<Value>{Value::Integer(std::uniform_int_distribution<std::int64_t>(low, high)(*generator))};
    };
}

MathFunction makeRandomSeed(Generator generator) {
    return [generator](CallContext&, const std::vector<Value>& args) -> MathResult {
        auto seed = integerAt(args, 0);
        if (!seed) {
            return std::nullopt;
        }
        generator->seed(static_cast<std::uint64_t>(*seed));
        return std::vector<Value>{};
    };
}

double degrees(double radians) {
    return radians * (180.0 / std::numbers::pi);
}

double radians(double degrees) {
    return degrees * (std::numbers::pi / 180.0);
}

} // namespace

void bindMathModule(Runtime& runtime) {
    auto bind = [&runtime](const std::string& name, MathFunction function) {
        runtime.bindModuleFunction("math", name, mathFunction(name, std::move(function)));
    };

    bind("abs", impl_abs);
    bind("acos", unary([](double x) { return std::acos(x); }));
    bind("asin", unary([](double x) { return std::asin(x); }));
    bind("atan", impl_atan);
    bind("ceil", impl_ceil);
    bind("cos", unary([](double x) { return std::cos(x); }));
    bind("deg", unary(degrees));
    bind("exp", unary([](double x) { return std::exp(x); }));
    bind("floor", impl_floor);
    bind("fmod", impl_fmod);
    bind("log", impl_log);
    bind("log10", unary([](double x) { return std::log10(x); }));
    bind("max", impl_max);
    bind("min", impl_min);
    bind("modf", impl_modf);
    bind("rad", unary(radians));
    bind("sin", unary([](double x) { return std::sin(x); }));
    bind("sqrt", unary([](double x) { return std::sqrt(x); }));
    bind("tan", unary([](double x) { return std::tan(x); }));
    bind("tointeger", impl_tointeger);
    bind("type", impl_type);
    bind("ult", impl_ult);

    auto generator = std::make_shared<std::mt19937_64>(std::random_device{}());
    bind("random", makeRandom(generator));
    bind("randomseed", makeRandomSeed(generator));

    runtime.setModuleField("math", "huge", Value::Float(std::numeric_limits<double>::infinity()));
    runtime.setModuleField("math", "pi", Value::Float(std::numbers::pi));
    runtime.setModuleField("math", "maxinteger", Value::Integer(std::numeric_limits<std::int64_t>::max()));
    runtime.setModuleField("math", "mininteger", Value::Integer(std::numeric_limits<std::int64_t>::min()));
}

} // namespace lunar

#include "lunar/runtime.hpp"
#include "lunar/stdlib.hpp"
#include "lunar/type_system.hpp"

#include <stdexcept>
#include <string>

namespace lunar {

namespace {

ThreadObject& checkCoroutine(const std::vector<Value>& args, const char* function) {
    if (args.empty() || !args[0].isThread()) {
        throw std::runtime_error(std::string("bad argument #1 to '") + function + "' (coroutine expected)");
    }
    return args[0].asThread();
}

std::vector<Value> rest(std::vector<Value>& args) {
    if (args.size() <= 1) {
        return {};
    }
    return std::vector<Value>(args.begin() + 1, args.end());
}

CallbackResult impl_create(CallContext& ctx, std::vector<Value> args) {
    if (args.empty() || !args[0].isFunction()) {
        throw std::runtime_error("bad argument #1 to 'create' (function expected)");
    }
    return CallbackResult::Return({ctx.createThread(args[0])});
}

CallbackResult impl_resume(CallContext&, std::vector<Value> args) {
    checkCoroutine(args, "resume");
    const Value thread = args[0];
    return CallbackResult::Resume(thread, rest(args));
}

CallbackResult impl_yield(CallContext&, std::vector<Value> args) {
    return CallbackResult::Yield(std::move(args));
}

CallbackResult impl_status(CallContext& ctx, std::vector<Value> args) {
    ThreadObject& thread = checkCoroutine(args, "status");
    if (&thread == &ctx.thread()) {
        return CallbackResult::Return({ctx.createString("running")});
    }
    return CallbackResult::Return({ctx.createString(threadStatusName(thread.status()))});
}

// upvalues[0]: the wrapped coroutine.
CallbackResult impl_wrapStep(CallContext& ctx, std::vector<Value> args) {
    return CallbackResult::Resume(ctx.upvalues().at(0), std::move(args), ResumeMode::Wrap);
}

CallbackResult impl_wrap(CallContext& ctx, std::vector<Value> args) {
    if (args.empty() || !args[0].isFunction()) {
        throw std::runtime_error("bad argument #1 to 'wrap' (function expected)");
    }
    const Value thread = ctx.createThread(args[0]);
    return CallbackResult::Return({ctx.createFunction("wrap", impl_wrapStep, {thread})});
}

CallbackResult impl_running(CallContext& ctx, std::vector<Value>) {
    return CallbackResult::Return({ctx.currentThread(), Value::Boolean(!ctx.thread().isCoroutine())});
}

CallbackResult impl_isyieldable(CallContext& ctx, std::vector<Value>) {
    return CallbackResult::Return({Value::Boolean(ctx.isYieldable())});
}

} // namespace

void bindCoroutineModule(Runtime& runtime) {
    runtime.bindModuleFunction("coroutine", "create", impl_create);
    runtime.bindModuleFunction("coroutine", "resume", impl_resume);
    runtime.bindModuleFunction("coroutine", "yield", impl_yield);
    runtime.bindModuleFunction("coroutine", "status", impl_status);
    runtime.bindModuleFunction("coroutine", "wrap", impl_wrap);
    runtime.bindModuleFunction("coroutine", "running", impl_running);
    runtime.bindModuleFunction("coroutine", "isyieldable", impl_isyieldable);
}

} // namespace lunar

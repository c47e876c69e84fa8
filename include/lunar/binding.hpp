#pragma once

#include "lunar/handle.hpp"
#include "lunar/value.hpp"

#include <any>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace lunar {

class CallContext;
class Heap;
class NativeFunctionObject;
class ThreadObject;
class VirtualMachine;
struct CallbackResult;

enum class CallOutcome : std::uint8_t {
    Returned,
    Errored
};

// Standard resumes report (true, values...) or (false, error) like
// coroutine.resume; Wrap resumes return the values or re-raise the error.
enum class ResumeMode : std::uint8_t {
    Standard,
    Wrap
};

// A native callback. Errors are raised by throwing ScriptError (any Value) or
// any std::exception (converted to a string error with position).
using NativeFunction = std::function<CallbackResult(CallContext& context, std::vector<Value> args)>;

// Runs after a call requested through CallbackResult::Call finishes. The
// stash travels with the suspended frame and is traced by the collector;
// continuations must not capture Values themselves.
using Continuation = std::function<CallbackResult(CallContext& context,
                                                  CallOutcome outcome,
                                                  std::vector<Value> results,
                                                  std::vector<Value> stash)>;

struct CallbackResult {
    enum class Kind : std::uint8_t {
        Return,
        Yield,
        Call,
        TailCall,
        Resume
    };

    Kind kind{Kind::Return};
    std::vector<Value> values;
    // Callee for Call and TailCall, coroutine for Resume.
    Value target;
    Continuation then;
    bool isProtected{false};
    std::vector<Value> stash;
    ResumeMode mode{ResumeMode::Standard};

    static CallbackResult Return(std::vector<Value> values = {});
    static CallbackResult Yield(std::vector<Value> values = {});
    static CallbackResult Call(Value function,
                               std::vector<Value> args,
                               Continuation then,
                               bool isProtected = false,
                               std::vector<Value> stash = {});
    static CallbackResult TailCall(Value function, std::vector<Value> args);
    static CallbackResult Resume(Value thread, std::vector<Value> args, ResumeMode mode = ResumeMode::Standard);
};

// What a native callback sees of the machine while it runs.
class CallContext {
public:
    CallContext(VirtualMachine& vm, ThreadObject& thread, NativeFunctionObject* native);

    Heap& heap();
    Value globals();

    Value createString(std::string_view text);
    Value createTable(std::size_t arrayHint = 0, std::size_t hashHint = 0);
    Value createFunction(std::string name, NativeFunction function, std::vector<Value> upvalues = {});
    Value createThread(const Value& body);
    Value createUserData(std::any payload);

    // Raw conversions; metamethods are not consulted.
    std::string toString(const Value& value);
    std::string typeName(const Value& value);
    // Looks up a metatable field such as "__tostring"; nil when absent.
    Value metafield(const Value& value, std::string_view event);
    void setMetatable(const Value& value, const Value& metatable);

    ThreadObject& thread() { return thread_; }
    Value currentThread();
    bool isYieldable() const;
    // Upvalues of the running native function.
    std::vector<Value>& upvalues();
    const std::string& functionName() const;

    // "source:line:" of the script frame `level` levels up, or "".
    std::string where(int level);

    // Synchronous reentrant call. Yielding inside it raises an error.
    std::vector<Value> call(const Value& function, std::vector<Value> args);

    VirtualMachine& vm() { return vm_; }

private:
    VirtualMachine& vm_;
    ThreadObject& thread_;
    NativeFunctionObject* native_;
};

// Wraps a plain C++ callable such as `double(double, double)` as a native
// function. Arguments and the result go through detail::TypeConverter.
template <typename F>
NativeFunction makeNativeFunction(std::string name, F&& function);

} // namespace lunar

#include "lunar/binding.inl"

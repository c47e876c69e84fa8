#include "lunar/binding.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system.hpp"
#include "lunar/vm.hpp"

#include <stdexcept>

namespace lunar {

// ============================================================================
// CallbackResult
// ============================================================================

CallbackResult CallbackResult::Return(std::vector<Value> values) {
    CallbackResult result;
    result.kind = Kind::Return;
    result.values = std::move(values);
    return result;
}

CallbackResult CallbackResult::Yield(std::vector<Value> values) {
    CallbackResult result;
    result.kind = Kind::Yield;
    result.values = std::move(values);
    return result;
}

CallbackResult CallbackResult::Call(Value function,
                                    std::vector<Value> args,
                                    Continuation then,
                                    bool isProtected,
                                    std::vector<Value> stash) {
    CallbackResult result;
    result.kind = Kind::Call;
    result.target = function;
    result.values = std::move(args);
    result.then = std::move(then);
    result.isProtected = isProtected;
    result.stash = std::move(stash);
    return result;
}

CallbackResult CallbackResult::TailCall(Value function, std::vector<Value> args) {
    CallbackResult result;
    result.kind = Kind::TailCall;
    result.target = function;
    result.values = std::move(args);
    return result;
}

CallbackResult CallbackResult::Resume(Value thread, std::vector<Value> args, ResumeMode mode) {
    CallbackResult result;
    result.kind = Kind::Resume;
    result.target = thread;
    result.values = std::move(args);
    result.mode = mode;
    return result;
}

// ============================================================================
// CallContext
// ============================================================================

CallContext::CallContext(VirtualMachine& vm, ThreadObject& thread, NativeFunctionObject* native)
    : vm_(vm), thread_(thread), native_(native) {}

Heap& CallContext::heap() {
    return vm_.heap();
}

Value CallContext::globals() {
    return Value::Table(vm_.globals().get());
}

Value CallContext::createString(std::string_view text) {
    return Value::String(vm_.heap().intern(text).get());
}

Value CallContext::createTable(std::size_t arrayHint, std::size_t hashHint) {
    return Value::Table(vm_.heap().allocate<TableObject>(arrayHint, hashHint).get());
}

Value CallContext::createFunction(std::string name, NativeFunction function, std::vector<Value> upvalues) {
    return Value::Function(
        vm_.heap().allocate<NativeFunctionObject>(std::move(name), std::move(function), std::move(upvalues)).get());
}

Value CallContext::createThread(const Value& body) {
    return Value::Thread(vm_.newThread(body, true).get());
}

Value CallContext::createUserData(std::any payload) {
    return Value::UserData(vm_.heap().allocate<UserDataObject>(std::move(payload)).get());
}

std::string CallContext::toString(const Value& value) {
    return toDisplayString(value);
}

std::string CallContext::typeName(const Value& value) {
    return lunar::typeName(value);
}

Value CallContext::metafield(const Value& value, std::string_view event) {
    Handle<TableObject> metatable;
    if (value.isTable()) {
        metatable = value.asTable().metatable();
    } else if (value.isUserData()) {
        metatable = value.asUserData().metatable();
    }
    if (!metatable) {
        return Value::Nil();
    }
    return metatable->get(createString(event));
}

void CallContext::setMetatable(const Value& value, const Value& metatable) {
    Handle<TableObject> table;
    if (metatable.isTable()) {
        table = Handle<TableObject>(&metatable.asTable());
    } else if (!metatable.isNil()) {
        throw std::runtime_error("metatable must be a table or nil");
    }
    if (value.isTable()) {
        value.asTable().setMetatable(vm_.heap(), table);
    } else if (value.isUserData()) {
        value.asUserData().setMetatable(vm_.heap(), table);
    } else {
        throw std::runtime_error(std::string("cannot set the metatable of a ") + lunar::typeName(value) + " value");
    }
}

Value CallContext::currentThread() {
    return Value::Thread(&thread_);
}

bool CallContext::isYieldable() const {
    return thread_.isCoroutine() && !thread_.inNativeCall();
}

std::vector<Value>& CallContext::upvalues() {
    if (!native_) {
        throw std::runtime_error("no native function is running");
    }
    return native_->upvalues();
}

const std::string& CallContext::functionName() const {
    static const std::string anonymous = "?";
    return native_ ? native_->name() : anonymous;
}

std::string CallContext::where(int level) {
    return vm_.where(thread_, level);
}

std::vector<Value> CallContext::call(const Value& function, std::vector<Value> args) {
    return vm_.callNested(thread_, function, std::move(args));
}

} // namespace lunar

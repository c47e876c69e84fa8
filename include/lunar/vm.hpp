#pragma once

#include "lunar/binding.hpp"
#include "lunar/bytecode.hpp"
#include "lunar/call_stack.hpp"
#include "lunar/error.hpp"
#include "lunar/handle.hpp"
#include "lunar/type_system/thread_type.hpp"
#include "lunar/value_ops.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lunar {

class Heap;
class StringObject;
class TableObject;
class ThreadObject;

enum class MetaEvent : std::uint8_t {
    Index,
    NewIndex,
    Call,
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
    BNot,
    Concat,
    Len,
    Eq,
    Lt,
    Le,
    ToString,
    Metatable,
    Count
};

const char* metaEventName(MetaEvent event);

enum class RunSignal : std::uint8_t {
    OutOfFuel,
    Finished,
    Yielded,
    Errored,
    ResumeRequested
};

// Executor-level CPU budget. Execution continues while the balance is
// positive; an overdraft carries into the next refill.
struct Fuel {
    std::int64_t balance{0};
    std::int64_t consumed{0};

    bool exhausted() const { return balance <= 0; }
    void consume(std::int64_t amount) {
        balance -= amount;
        consumed += amount;
    }
    void refill(std::int64_t amount) { balance += amount; }
};

// The dispatch loop. Runs the top frame of one thread instruction by
// instruction until fuel runs out or control has to leave the thread
// (finish, yield, unrecovered error, resume request).
class VirtualMachine {
public:
    VirtualMachine(Heap& heap, Handle<TableObject> globals, std::size_t maxFrames);
    ~VirtualMachine();

    VirtualMachine(const VirtualMachine&) = delete;
    VirtualMachine& operator=(const VirtualMachine&) = delete;

    RunSignal execute(ThreadObject& thread, Fuel& fuel);

    // Calls the thread body with its transfer values as arguments.
    void start(ThreadObject& thread);
    // Continues a suspended thread; its transfer values become the results
    // of the yield it is suspended in.
    void resume(ThreadObject& thread);
    // Delivers the outcome of a child coroutine to the ResumeWait frame on
    // top of `thread`.
    void completeResume(ThreadObject& thread, ThreadSignal outcome, std::vector<Value> values, const Value& error);

    // Reentrant call used by CallContext::call.
    std::vector<Value> callNested(ThreadObject& thread, const Value& function, std::vector<Value> args);

    Value metamethod(const Value& value, MetaEvent event) const;
    Handle<StringObject> eventName(MetaEvent event) const;

    Handle<ThreadObject> newThread(const Value& body, bool isCoroutine);
    std::string where(ThreadObject& thread, int level) const;
    std::vector<TracebackEntry> captureTraceback(const ThreadObject& thread) const;

    Heap& heap() { return heap_; }
    Handle<TableObject> globals() const { return globals_; }
    std::size_t maxFrames() const { return maxFrames_; }

private:
    void runInstruction(ThreadObject& thread);
    void step(ThreadObject& thread, const Instruction& instruction);
    void collectAtSafePoint();
    void createClosure(ThreadObject& thread, std::size_t frameIndex, std::int32_t dest, std::int32_t childIndex);
    void yieldThread(ThreadObject& thread, std::vector<Value> values, const ReturnTarget& target);

    // Follows `__call` until a function is reached, prepending each callee to args.
    Value resolveCallable(Value function, std::vector<Value>& args) const;
    void callValue(ThreadObject& thread, Value function, std::vector<Value> args, const ReturnTarget& target);
    void invokeNative(ThreadObject& thread, NativeFunctionObject& native, std::vector<Value> args, const ReturnTarget& target);
    void applyCallbackResult(ThreadObject& thread, NativeFunctionObject* native, CallbackResult result, const ReturnTarget& target);
    void deliverResults(ThreadObject& thread, const ReturnTarget& target, std::vector<Value> values);
    void returnFromFrame(ThreadObject& thread, std::vector<Value> values);

    std::optional<Value> index(ThreadObject& thread, Value object, const Value& key, const ReturnTarget& target);
    void newIndex(ThreadObject& thread, Value object, const Value& key, const Value& value);
    std::optional<Value> arith(ThreadObject& thread, ArithOp op, const Value& lhs, const Value& rhs, const ReturnTarget& target);
    std::optional<bool> compare(ThreadObject& thread, OpCode op, const Value& lhs, const Value& rhs, const ReturnTarget& target);
    std::optional<Value> length(ThreadObject& thread, const Value& value, const ReturnTarget& target);
    void concatFold(ThreadObject& thread, std::int32_t dest, std::int32_t begin, std::int32_t cursor, Value accumulated);

    void raise(ThreadObject& thread, Value error, std::vector<TracebackEntry> traceback);
    Value positionedError(ThreadObject& thread, const std::string& message);

    template <typename Fn>
    void guarded(ThreadObject& thread, Fn&& action);

    Heap& heap_;
    Handle<TableObject> globals_;
    std::size_t maxFrames_;
    Fuel* activeFuel_{nullptr};
    std::array<Handle<StringObject>, static_cast<std::size_t>(MetaEvent::Count)> eventNames_;
};

} // namespace lunar

#pragma once

#include "lunar/call_stack.hpp"
#include "lunar/error.hpp"
#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lunar {

enum class ThreadStatus : std::uint8_t {
    NotStarted,
    Running,
    Suspended,
    Normal,
    Dead
};

// Set by the interpreter when control has to leave the dispatch loop.
enum class ThreadSignal : std::uint8_t {
    None,
    Finished,
    Yielded,
    Errored,
    ResumeRequested
};

const char* threadStatusName(ThreadStatus status);

// A coroutine or the main thread of an executor: an independent call stack
// plus the values in flight between it and its resumer.
class ThreadObject : public Object {
public:
    ThreadObject(Value body, std::size_t maxFrames, bool isCoroutine);

    const Type& getType() const override;
    void trace(Heap& heap) const override;
    bool retraceAtAtomic() const override { return true; }

    CallStack& stack() { return stack_; }
    const CallStack& stack() const { return stack_; }
    const Value& body() const { return body_; }
    bool isCoroutine() const { return isCoroutine_; }

    ThreadStatus status() const { return status_; }
    void setStatus(ThreadStatus status) { status_ = status; }

    ThreadSignal signal() const { return signal_; }
    void raiseSignal(ThreadSignal signal) { signal_ = signal; }
    ThreadSignal takeSignal();

    // Arguments on start or resume, results on yield or return.
    std::vector<Value>& transfer() { return transfer_; }
    std::vector<Value> takeTransfer();
    void setTransfer(std::vector<Value> values) { transfer_ = std::move(values); }

    const Value& error() const { return error_; }
    const std::vector<TracebackEntry>& traceback() const { return traceback_; }
    void setError(Value error, std::vector<TracebackEntry> traceback);

    Handle<ThreadObject> resumeTarget() const { return resumeTarget_; }
    void setResumeTarget(Handle<ThreadObject> target) { resumeTarget_ = target; }

    // Stack heights of active reentrant CallContext::call runs.
    std::vector<std::size_t>& boundaries() { return boundaries_; }
    bool inNativeCall() const { return !boundaries_.empty(); }
    std::size_t unwindFloor() const { return boundaries_.empty() ? 0 : boundaries_.back(); }

private:
    CallStack stack_;
    Value body_;
    bool isCoroutine_;
    ThreadStatus status_{ThreadStatus::NotStarted};
    ThreadSignal signal_{ThreadSignal::None};
    std::vector<Value> transfer_;
    Value error_;
    std::vector<TracebackEntry> traceback_;
    Handle<ThreadObject> resumeTarget_;
    std::vector<std::size_t> boundaries_;
};

class ThreadType : public Type {
public:
    static const ThreadType& instance();
    const char* name() const override;
};

} // namespace lunar

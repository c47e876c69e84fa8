#pragma once

#include "lunar/error.hpp"
#include "lunar/handle.hpp"
#include "lunar/value.hpp"
#include "lunar/vm.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lunar {

class Heap;
class Runtime;
class ThreadObject;

enum class StepStatus : std::uint8_t {
    Pending,
    Finished,
    Yielded,
    Errored
};

// Values in a result are not rooted; use or root them before the next step
// of any executor on the same heap.
struct StepResult {
    StepStatus status{StepStatus::Pending};
    std::vector<Value> values;
    Value error;
    std::string message;
    std::vector<TracebackEntry> traceback;
    bool protocolViolation{false};
};

// Drives one thread (and the coroutines it resumes) in fuel-bounded steps.
// Over a function the executor owns a fresh main thread; over a coroutine it
// resumes it once, until it yields, returns or fails.
class Executor {
public:
    Executor(Runtime& runtime, const Value& function, std::vector<Value> args);
    // Throws ProtocolError when the coroutine cannot be resumed.
    Executor(Runtime& runtime, Handle<ThreadObject> coroutine, std::vector<Value> args);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    StepResult step(std::int64_t fuel);

    bool isCompleted() const { return completed_; }
    std::int64_t fuelUsed() const { return fuel_.consumed; }
    Handle<ThreadObject> thread() const { return chain_.front(); }

private:
    void launch(ThreadObject& thread);
    StepResult finish(RunSignal signal);

    VirtualMachine& vm_;
    Heap& heap_;
    // Root thread first, then each coroutine it is waiting on.
    std::vector<Handle<ThreadObject>> chain_;
    Fuel fuel_;
    bool started_{false};
    bool completed_{false};
    bool fatal_{false};
};

} // namespace lunar

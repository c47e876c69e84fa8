#pragma once

#include "lunar/binding.hpp"
#include "lunar/bytecode.hpp"
#include "lunar/executor.hpp"
#include "lunar/heap.hpp"
#include "lunar/vm.hpp"

#include <any>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lunar {

struct RuntimeOptions {
    std::size_t maxFrames{100000};
    GcOptions gc;
    bool openStandardLibrary{true};
};

enum class ResumeStatus : std::uint8_t {
    Returned,
    Yielded,
    Errored
};

struct ResumeResult {
    ResumeStatus status{ResumeStatus::Returned};
    std::vector<Value> values;
    Value error;
    std::string message;
    std::vector<TracebackEntry> traceback;
    bool protocolViolation{false};
};

// Owns a heap, its globals table and the interpreter over them. Independent
// runtimes share nothing.
class Runtime {
public:
    explicit Runtime(RuntimeOptions options = {});
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // Instantiates a main chunk as a closure. Its first upvalue is the
    // environment (the globals table unless given).
    Value load(std::shared_ptr<const Prototype> prototype);
    Value load(std::shared_ptr<const Prototype> prototype, const Value& environment);

    std::unique_ptr<Executor> newExecutor(const Value& function, std::vector<Value> args = {});
    std::unique_ptr<Executor> newExecutor(Handle<ThreadObject> coroutine, std::vector<Value> args = {});

    // Resumes a coroutine to its next yield, return or error, with unbounded
    // fuel. Misuse yields a result flagged protocolViolation.
    ResumeResult resume(const Value& thread, std::vector<Value> args = {});
    // Runs a function to completion on a fresh main thread.
    StepResult call(const Value& function, std::vector<Value> args = {});

    Value createString(std::string_view text);
    Value createTable(std::size_t arrayHint = 0, std::size_t hashHint = 0);
    Value createFunction(std::string name, NativeFunction function, std::vector<Value> upvalues = {});
    Value createThread(const Value& body);
    Value createUserData(std::any payload);
    // Tables and userdata only; nil clears.
    void setMetatable(const Value& value, const Value& metatable);

    Value globals() const;
    void setGlobal(std::string_view name, const Value& value);
    Value getGlobal(std::string_view name);
    void registerFunction(const std::string& name, NativeFunction function);

    // Library tables such as `math`: a global table created on first use.
    Value defineModule(const std::string& moduleName);
    void bindModuleFunction(const std::string& moduleName, const std::string& exportName, NativeFunction function);
    void setModuleField(const std::string& moduleName, const std::string& fieldName, const Value& value);

    template <typename F>
    void bind(const std::string& name, F&& function) {
        registerFunction(name, makeNativeFunction(name, std::forward<F>(function)));
    }

    // Host-held values stay alive while rooted. Roots are counted.
    void addRoot(const Value& value);
    void removeRoot(const Value& value);

    std::string toString(const Value& value) const;

    Heap& heap() { return heap_; }
    VirtualMachine& vm() { return vm_; }
    const RuntimeOptions& options() const { return options_; }

private:
    RuntimeOptions options_;
    Heap heap_;
    VirtualMachine vm_;
};

} // namespace lunar

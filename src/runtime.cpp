#include "lunar/runtime.hpp"
#include "lunar/stdlib.hpp"
#include "lunar/type_system.hpp"

#include <stdexcept>

namespace lunar {

namespace {

constexpr std::int64_t kUnboundedFuelSlice = std::int64_t{1} << 20;

} // namespace

Runtime::Runtime(RuntimeOptions options)
    : options_(options),
      heap_(options.gc),
      vm_(heap_, heap_.allocate<TableObject>(), options.maxFrames) {
    if (options_.openStandardLibrary) {
        openStandardLibrary(*this);
    }
}

Runtime::~Runtime() = default;

Value Runtime::load(std::shared_ptr<const Prototype> prototype) {
    return load(std::move(prototype), globals());
}

Value Runtime::load(std::shared_ptr<const Prototype> prototype, const Value& environment) {
    if (!prototype) {
        throw std::runtime_error("Runtime::load: missing prototype");
    }
    const std::size_t upvalueCount = prototype->upvalues.size();
    Handle<PrototypeObject> proto = instantiatePrototype(heap_, std::move(prototype));

    std::vector<Handle<UpvalueObject>> upvalues;
    upvalues.reserve(upvalueCount);
    for (std::size_t i = 0; i < upvalueCount; ++i) {
        upvalues.push_back(heap_.allocate<UpvalueObject>(i == 0 ? environment : Value::Nil()));
    }
    return Value::Function(heap_.allocate<ClosureObject>(proto, std::move(upvalues)).get());
}

std::unique_ptr<Executor> Runtime::newExecutor(const Value& function, std::vector<Value> args) {
    return std::make_unique<Executor>(*this, function, std::move(args));
}

std::unique_ptr<Executor> Runtime::newExecutor(Handle<ThreadObject> coroutine, std::vector<Value> args) {
    return std::make_unique<Executor>(*this, coroutine, std::move(args));
}

ResumeResult Runtime::resume(const Value& thread, std::vector<Value> args) {
    ResumeResult result;
    try {
        if (!thread.isThread()) {
            throw ProtocolError(std::string("cannot resume a ") + typeName(thread) + " value");
        }
        Executor executor(*this, Handle<ThreadObject>(&thread.asThread()), std::move(args));
        StepResult step;
        do {
            step = executor.step(kUnboundedFuelSlice);
        } while (step.status == StepStatus::Pending);

        switch (step.status) {
        case StepStatus::Yielded:
            result.status = ResumeStatus::Yielded;
            break;
        case StepStatus::Errored:
            result.status = ResumeStatus::Errored;
            break;
        default:
            result.status = ResumeStatus::Returned;
            break;
        }
        result.values = std::move(step.values);
        result.error = step.error;
        result.message = std::move(step.message);
        result.traceback = std::move(step.traceback);
        result.protocolViolation = step.protocolViolation;
    } catch (const ProtocolError& error) {
        result.status = ResumeStatus::Errored;
        result.protocolViolation = true;
        result.message = error.what();
        result.error = createString(result.message);
    }
    return result;
}

StepResult Runtime::call(const Value& function, std::vector<Value> args) {
    Executor executor(*this, function, std::move(args));
    StepResult step;
    do {
        step = executor.step(kUnboundedFuelSlice);
    } while (step.status == StepStatus::Pending);
    return step;
}

Value Runtime::createString(std::string_view text) {
    return Value::String(heap_.intern(text).get());
}

Value Runtime::createTable(std::size_t arrayHint, std::size_t hashHint) {
    return Value::Table(heap_.allocate<TableObject>(arrayHint, hashHint).get());
}

Value Runtime::createFunction(std::string name, NativeFunction function, std::vector<Value> upvalues) {
    return Value::Function(
        heap_.allocate<NativeFunctionObject>(std::move(name), std::move(function), std::move(upvalues)).get());
}

Value Runtime::createThread(const Value& body) {
    return Value::Thread(vm_.newThread(body, true).get());
}

Value Runtime::createUserData(std::any payload) {
    return Value::UserData(heap_.allocate<UserDataObject>(std::move(payload)).get());
}

void Runtime::setMetatable(const Value& value, const Value& metatable) {
    Handle<TableObject> table;
    if (metatable.isTable()) {
        table = Handle<TableObject>(&metatable.asTable());
    } else if (!metatable.isNil()) {
        throw std::runtime_error("metatable must be a table or nil");
    }
    if (value.isTable()) {
        value.asTable().setMetatable(heap_, table);
    } else if (value.isUserData()) {
        value.asUserData().setMetatable(heap_, table);
    } else {
        throw std::runtime_error(std::string("cannot set the metatable of a ") + typeName(value) + " value");
    }
}

Value Runtime::globals() const {
    return Value::Table(vm_.globals().get());
}

void Runtime::setGlobal(std::string_view name, const Value& value) {
    vm_.globals()->set(heap_, createString(name), value);
}

Value Runtime::getGlobal(std::string_view name) {
    return vm_.globals()->get(createString(name));
}

void Runtime::registerFunction(const std::string& name, NativeFunction function) {
    setGlobal(name, createFunction(name, std::move(function)));
}

Value Runtime::defineModule(const std::string& moduleName) {
    Value existing = getGlobal(moduleName);
    if (existing.isTable()) {
        return existing;
    }
    if (!existing.isNil()) {
        throw std::runtime_error("Global name already used by a non-table value: " + moduleName);
    }
    Value module = createTable();
    setGlobal(moduleName, module);
    return module;
}

void Runtime::bindModuleFunction(const std::string& moduleName,
                                 const std::string& exportName,
                                 NativeFunction function) {
    setModuleField(moduleName, exportName, createFunction(exportName, std::move(function)));
}

void Runtime::setModuleField(const std::string& moduleName, const std::string& fieldName, const Value& value) {
    Value module = defineModule(moduleName);
    module.asTable().set(heap_, createString(fieldName), value);
}

void Runtime::addRoot(const Value& value) {
    heap_.addRoot(value);
}

void Runtime::removeRoot(const Value& value) {
    heap_.removeRoot(value);
}

std::string Runtime::toString(const Value& value) const {
    return toDisplayString(value);
}

} // namespace lunar

#include "lunar/vm.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace lunar {

namespace {

constexpr int kMaxMetaChain = 100;
constexpr double kTwoPow63 = 9223372036854775808.0;

constexpr std::array<const char*, static_cast<std::size_t>(MetaEvent::Count)> kEventNames = {
    "__index", "__newindex", "__call",   "__add", "__sub", "__mul", "__div",      "__mod",
    "__pow",   "__idiv",     "__band",   "__bor", "__bxor", "__shl", "__shr",     "__unm",
    "__bnot",  "__concat",   "__len",    "__eq",  "__lt",  "__le",  "__tostring", "__metatable"};

MetaEvent arithEvent(ArithOp op) {
    switch (op) {
    case ArithOp::Add: return MetaEvent::Add;
    case ArithOp::Sub: return MetaEvent::Sub;
    case ArithOp::Mul: return MetaEvent::Mul;
    case ArithOp::Div: return MetaEvent::Div;
    case ArithOp::Mod: return MetaEvent::Mod;
    case ArithOp::Pow: return MetaEvent::Pow;
    case ArithOp::IDiv: return MetaEvent::IDiv;
    case ArithOp::BAnd: return MetaEvent::BAnd;
    case ArithOp::BOr: return MetaEvent::BOr;
    case ArithOp::BXor: return MetaEvent::BXor;
    case ArithOp::Shl: return MetaEvent::Shl;
    case ArithOp::Shr: return MetaEvent::Shr;
    case ArithOp::Unm: return MetaEvent::Unm;
    case ArithOp::BNot: return MetaEvent::BNot;
    }
    return MetaEvent::Add;
}

ArithOp arithOpFor(OpCode op) {
    switch (op) {
    case OpCode::Add: return ArithOp::Add;
    case OpCode::Sub: return ArithOp::Sub;
    case OpCode::Mul: return ArithOp::Mul;
    case OpCode::Div: return ArithOp::Div;
    case OpCode::Mod: return ArithOp::Mod;
    case OpCode::Pow: return ArithOp::Pow;
    case OpCode::IDiv: return ArithOp::IDiv;
    case OpCode::BAnd: return ArithOp::BAnd;
    case OpCode::BOr: return ArithOp::BOr;
    case OpCode::BXor: return ArithOp::BXor;
    case OpCode::Shl: return ArithOp::Shl;
    case OpCode::Shr: return ArithOp::Shr;
    case OpCode::Unm: return ArithOp::Unm;
    case OpCode::BNot: return ArithOp::BNot;
    default: break;
    }
    throw std::logic_error(std::string("not an arithmetic opcode: ") + opCodeName(op));
}

std::string concatPiece(const Value& value) {
    return value.isString() ? value.asString().text() : numberToString(value);
}

bool concatenable(const Value& value) {
    return value.isString() || value.isNumber();
}

void jump(Frame& frame, std::int64_t offset) {
    frame.pc = static_cast<std::size_t>(static_cast<std::int64_t>(frame.pc) + offset);
}

std::vector<Value> registerRange(const Frame& frame, std::int32_t from, std::size_t count) {
    std::vector<Value> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(frame.registers.at(static_cast<std::size_t>(from) + i));
    }
    return values;
}

// Operand count for B-style "0 means up to top" encodings.
std::size_t countToTop(const Frame& frame, std::int32_t from, std::int32_t encoded) {
    if (encoded != 0) {
        return static_cast<std::size_t>(encoded - 1);
    }
    const auto base = static_cast<std::size_t>(from);
    return frame.top > base ? frame.top - base : 0;
}

// Lua 5.4 forlimit: clips a float limit to the integer range. Returns false
// when the loop must not run at all.
bool integerForLimit(const Value& limit, std::int64_t init, std::int64_t step, std::int64_t& out) {
    if (limit.isInteger()) {
        out = limit.integer;
    } else {
        double f = limit.asNumber();
        if (std::isnan(f)) {
            return false;
        }
        if (step > 0) {
            f = std::floor(f);
            if (f >= kTwoPow63) {
                out = std::numeric_limits<std::int64_t>::max();
            } else if (f < -kTwoPow63) {
                return false;
            } else {
                out = static_cast<std::int64_t>(f);
            }
        } else {
            f = std::ceil(f);
            if (f < -kTwoPow63) {
                out = std::numeric_limits<std::int64_t>::min();
            } else if (f >= kTwoPow63) {
                return false;
            } else {
                out = static_cast<std::int64_t>(f);
            }
        }
    }
    return step > 0 ? init <= out : init >= out;
}

} // namespace

const char* metaEventName(MetaEvent event) {
    const auto index = static_cast<std::size_t>(event);
    return index < kEventNames.size() ? kEventNames[index] : "?";
}

VirtualMachine::VirtualMachine(Heap& heap, Handle<TableObject> globals, std::size_t maxFrames)
    : heap_(heap), globals_(globals), maxFrames_(maxFrames) {
    heap_.addRoot(globals_.get());
    for (std::size_t i = 0; i < eventNames_.size(); ++i) {
        eventNames_[i] = heap_.intern(kEventNames[i]);
        heap_.addRoot(eventNames_[i].get());
    }
}

VirtualMachine::~VirtualMachine() {
    for (const auto& name : eventNames_) {
        if (name) {
            heap_.removeRoot(name.get());
        }
    }
    heap_.removeRoot(globals_.get());
}

Handle<StringObject> VirtualMachine::eventName(MetaEvent event) const {
    return eventNames_.at(static_cast<std::size_t>(event));
}

Value VirtualMachine::metamethod(const Value& value, MetaEvent event) const {
    Handle<TableObject> metatable;
    if (value.isTable()) {
        metatable = value.asTable().metatable();
    } else if (value.isUserData()) {
        metatable = value.asUserData().metatable();
    }
    if (!metatable) {
        return Value::Nil();
    }
    return metatable->get(Value::String(eventName(event).get()));
}

Handle<ThreadObject> VirtualMachine::newThread(const Value& body, bool isCoroutine) {
    return heap_.allocate<ThreadObject>(body, maxFrames_, isCoroutine);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

RunSignal VirtualMachine::execute(ThreadObject& thread, Fuel& fuel) {
    struct FuelScope {
        Fuel*& slot;
        Fuel* saved;
        ~FuelScope() { slot = saved; }
    } scope{activeFuel_, activeFuel_};
    activeFuel_ = &fuel;

    while (true) {
        switch (thread.takeSignal()) {
        case ThreadSignal::None:
            break;
        case ThreadSignal::Finished:
            return RunSignal::Finished;
        case ThreadSignal::Yielded:
            return RunSignal::Yielded;
        case ThreadSignal::Errored:
            return RunSignal::Errored;
        case ThreadSignal::ResumeRequested:
            return RunSignal::ResumeRequested;
        }
        if (fuel.exhausted()) {
            return RunSignal::OutOfFuel;
        }
        collectAtSafePoint();
        runInstruction(thread);
    }
}

void VirtualMachine::collectAtSafePoint() {
    if (heap_.takeFullCollectionRequest()) {
        heap_.collectFull();
        return;
    }
    if (heap_.shouldCollect()) {
        heap_.collect(heap_.options().sliceBudgetObjects);
    }
}

void VirtualMachine::runInstruction(ThreadObject& thread) {
    CallStack& stack = thread.stack();
    if (stack.empty() || stack.top().kind != FrameKind::Script) {
        throw ProtocolError("thread has no script frame to run");
    }
    Frame& frame = stack.top();
    const Prototype& proto = frame.closure->prototype();
    if (frame.pc >= proto.code.size()) {
        guarded(thread, [&] { returnFromFrame(thread, {}); });
        return;
    }
    const Instruction instruction = proto.code[frame.pc++];
    if (activeFuel_) {
        activeFuel_->consume(instructionCost(instruction.op));
    }
    guarded(thread, [&] { step(thread, instruction); });
}

void VirtualMachine::step(ThreadObject& thread, const Instruction& ins) {
    CallStack& stack = thread.stack();
    const std::size_t frameIndex = stack.size() - 1;
    ClosureObject& closure = *stack.top().closure;
    const PrototypeObject& proto = *closure.proto();

    // Frames may move when calls push new ones; always re-fetch.
    auto frame = [&]() -> Frame& { return stack.at(frameIndex); };
    auto R = [&](std::int32_t index) -> Value& { return frame().registers.at(static_cast<std::size_t>(index)); };
    auto K = [&](std::int32_t index) -> const Value& { return proto.constants().at(static_cast<std::size_t>(index)); };
    auto RK = [&](std::int32_t operand) -> Value {
        return isConstantOperand(operand) ? K(constantIndex(operand)) : R(operand);
    };

    const std::int32_t a = ins.a;
    const std::int32_t b = ins.b;
    const std::int32_t c = ins.c;

    switch (ins.op) {
    case OpCode::Move:
        R(a) = R(b);
        break;
    case OpCode::LoadK:
        R(a) = K(b);
        break;
    case OpCode::LoadBool:
        R(a) = Value::Boolean(b != 0);
        if (c != 0) {
            ++frame().pc;
        }
        break;
    case OpCode::LoadNil:
        for (std::int32_t i = 0; i <= b; ++i) {
            R(a + i) = Value::Nil();
        }
        break;
    case OpCode::GetUpval:
        R(a) = closure.upvalue(static_cast<std::size_t>(b))->get();
        break;
    case OpCode::SetUpval:
        closure.upvalue(static_cast<std::size_t>(b))->set(heap_, R(a));
        break;
    case OpCode::GetTabUp: {
        const Value table = closure.upvalue(static_cast<std::size_t>(b))->get();
        if (auto value = index(thread, table, RK(c), ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    }
    case OpCode::SetTabUp:
        newIndex(thread, closure.upvalue(static_cast<std::size_t>(a))->get(), RK(b), RK(c));
        break;
    case OpCode::GetTable:
        if (auto value = index(thread, R(b), RK(c), ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    case OpCode::SetTable:
        newIndex(thread, R(a), RK(b), RK(c));
        break;
    case OpCode::NewTable:
        R(a) = Value::Table(heap_.allocate<TableObject>(static_cast<std::size_t>(b), static_cast<std::size_t>(c)).get());
        break;
    case OpCode::Self: {
        const Value object = R(b);
        const Value key = RK(c);
        R(a + 1) = object;
        if (auto value = index(thread, object, key, ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    }
    case OpCode::Add:
    case OpCode::Sub:
    case OpCode::Mul:
    case OpCode::Div:
    case OpCode::Mod:
    case OpCode::Pow:
    case OpCode::IDiv:
    case OpCode::BAnd:
    case OpCode::BOr:
    case OpCode::BXor:
    case OpCode::Shl:
    case OpCode::Shr:
        if (auto value = arith(thread, arithOpFor(ins.op), RK(b), RK(c), ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    case OpCode::Unm:
    case OpCode::BNot: {
        const Value operand = R(b);
        if (auto value = arith(thread, arithOpFor(ins.op), operand, operand, ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    }
    case OpCode::Not:
        R(a) = Value::Boolean(R(b).isFalsy());
        break;
    case OpCode::Len:
        if (auto value = length(thread, R(b), ReturnTarget::Registers(a, 1))) {
            R(a) = *value;
        }
        break;
    case OpCode::Concat:
        concatFold(thread, a, b, c - 1, R(c));
        break;
    case OpCode::Jmp:
        if (a > 0) {
            stack.closeUpvalues(heap_, frameIndex, static_cast<std::size_t>(a - 1));
        }
        jump(frame(), b);
        break;
    case OpCode::Eq:
    case OpCode::Lt:
    case OpCode::Le: {
        const bool expected = a != 0;
        auto result = compare(thread, ins.op, RK(b), RK(c), ReturnTarget::Compare(expected));
        if (result && *result != expected) {
            ++frame().pc;
        }
        break;
    }
    case OpCode::Test:
        if (R(a).isTruthy() != (c != 0)) {
            ++frame().pc;
        }
        break;
    case OpCode::TestSet: {
        const Value value = R(b);
        if (value.isTruthy() == (c != 0)) {
            R(a) = value;
        } else {
            ++frame().pc;
        }
        break;
    }
    case OpCode::Call: {
        const Value function = R(a);
        std::vector<Value> args = registerRange(frame(), a + 1, countToTop(frame(), a + 1, b));
        callValue(thread, function, std::move(args), ReturnTarget::Registers(a, c - 1));
        break;
    }
    case OpCode::TailCall: {
        std::vector<Value> args = registerRange(frame(), a + 1, countToTop(frame(), a + 1, b));
        // Resolved before the pop so a bad callee is reported at this frame.
        const Value function = resolveCallable(R(a), args);
        Frame finished = stack.popFrame(heap_);
        callValue(thread, function, std::move(args), finished.returnTarget);
        break;
    }
    case OpCode::Return:
        returnFromFrame(thread, registerRange(frame(), a, countToTop(frame(), a, b)));
        break;
    case OpCode::ForPrep: {
        const Value init = R(a);
        const Value limit = R(a + 1);
        const Value increment = R(a + 2);
        if (init.isInteger() && increment.isInteger()) {
            const std::int64_t first = init.integer;
            const std::int64_t delta = increment.integer;
            if (delta == 0) {
                throw std::runtime_error("'for' step is zero");
            }
            if (!limit.isNumber()) {
                throw std::runtime_error("'for' limit must be a number");
            }
            std::int64_t last = 0;
            if (!integerForLimit(limit, first, delta, last)) {
                jump(frame(), static_cast<std::int64_t>(b) + 1);
                break;
            }
            // Iteration count, so the loop never overflows the control variable.
            const std::uint64_t count = delta > 0
                ? (static_cast<std::uint64_t>(last) - static_cast<std::uint64_t>(first)) / static_cast<std::uint64_t>(delta)
                : (static_cast<std::uint64_t>(first) - static_cast<std::uint64_t>(last)) /
                      (static_cast<std::uint64_t>(-(delta + 1)) + 1u);
            R(a + 1) = Value::Integer(static_cast<std::int64_t>(count));
            R(a + 3) = init;
            break;
        }
        if (!init.isNumber()) {
            throw std::runtime_error("'for' initial value must be a number");
        }
        if (!limit.isNumber()) {
            throw std::runtime_error("'for' limit must be a number");
        }
        if (!increment.isNumber()) {
            throw std::runtime_error("'for' step must be a number");
        }
        const double first = init.asNumber();
        const double last = limit.asNumber();
        const double delta = increment.asNumber();
        if (delta == 0) {
            throw std::runtime_error("'for' step is zero");
        }
        const bool runs = delta > 0 ? first <= last : last <= first;
        if (!runs) {
            jump(frame(), static_cast<std::int64_t>(b) + 1);
            break;
        }
        R(a) = Value::Float(first);
        R(a + 1) = Value::Float(last);
        R(a + 2) = Value::Float(delta);
        R(a + 3) = Value::Float(first);
        break;
    }
    case OpCode::ForLoop: {
        if (R(a + 2).isInteger()) {
            auto count = static_cast<std::uint64_t>(R(a + 1).integer);
            if (count > 0) {
                R(a + 1) = Value::Integer(static_cast<std::int64_t>(count - 1));
                const auto next = static_cast<std::int64_t>(static_cast<std::uint64_t>(R(a).integer) +
                                                            static_cast<std::uint64_t>(R(a + 2).integer));
                R(a) = Value::Integer(next);
                R(a + 3) = Value::Integer(next);
                jump(frame(), -(static_cast<std::int64_t>(b) + 1));
            }
            break;
        }
        const double delta = R(a + 2).asNumber();
        const double next = R(a).asNumber() + delta;
        const double last = R(a + 1).asNumber();
        if (delta > 0 ? next <= last : last <= next) {
            R(a) = Value::Float(next);
            R(a + 3) = Value::Float(next);
            jump(frame(), -(static_cast<std::int64_t>(b) + 1));
        }
        break;
    }
    case OpCode::TForCall: {
        const Value iterator = R(a);
        std::vector<Value> args{R(a + 1), R(a + 2)};
        callValue(thread, iterator, std::move(args), ReturnTarget::Registers(a + 4, c));
        break;
    }
    case OpCode::TForLoop: {
        const Value control = R(a + 4);
        if (!control.isNil()) {
            R(a + 2) = control;
            jump(frame(), b);
        }
        break;
    }
    case OpCode::SetList: {
        const Value target = R(a);
        if (!target.isTable()) {
            throw std::runtime_error("SETLIST on a non-table value");
        }
        TableObject& table = target.asTable();
        const std::size_t count = b == 0 ? countToTop(frame(), a + 1, 0) : static_cast<std::size_t>(b);
        for (std::size_t i = 1; i <= count; ++i) {
            table.set(heap_, Value::Integer(static_cast<std::int64_t>(c) + static_cast<std::int64_t>(i)),
                      R(a + static_cast<std::int32_t>(i)));
        }
        break;
    }
    case OpCode::Closure:
        createClosure(thread, frameIndex, a, b);
        break;
    case OpCode::VarArg: {
        const std::vector<Value> varargs = frame().varargs;
        const auto base = static_cast<std::size_t>(a);
        if (b == 0) {
            Frame& current = frame();
            if (current.registers.size() < base + varargs.size()) {
                current.registers.resize(base + varargs.size());
            }
            std::copy(varargs.begin(), varargs.end(), current.registers.begin() + static_cast<std::ptrdiff_t>(base));
            current.top = base + varargs.size();
        } else {
            for (std::size_t i = 0; i + 1 < static_cast<std::size_t>(b); ++i) {
                R(a + static_cast<std::int32_t>(i)) = i < varargs.size() ? varargs[i] : Value::Nil();
            }
        }
        break;
    }
    case OpCode::Close:
        stack.closeUpvalues(heap_, frameIndex, static_cast<std::size_t>(a));
        break;
    case OpCode::Yield:
        yieldThread(thread, registerRange(frame(), a, countToTop(frame(), a, b)), ReturnTarget::Registers(a, c - 1));
        break;
    }
}

void VirtualMachine::createClosure(ThreadObject& thread,
                                   std::size_t frameIndex,
                                   std::int32_t dest,
                                   std::int32_t childIndex) {
    CallStack& stack = thread.stack();
    Handle<ClosureObject> parent = stack.at(frameIndex).closure;
    Handle<PrototypeObject> child = parent->proto()->child(static_cast<std::size_t>(childIndex));
    const Prototype& proto = child->prototype();

    std::vector<Handle<UpvalueObject>> upvalues;
    upvalues.reserve(proto.upvalues.size());
    for (const auto& descriptor : proto.upvalues) {
        if (descriptor.fromParentLocal) {
            upvalues.push_back(stack.findOrCreateUpvalue(heap_, Handle<ThreadObject>(&thread), frameIndex, descriptor.index));
        } else {
            upvalues.push_back(parent->upvalue(descriptor.index));
        }
    }
    Handle<ClosureObject> closure = heap_.allocate<ClosureObject>(child, std::move(upvalues));
    stack.at(frameIndex).registers.at(static_cast<std::size_t>(dest)) = Value::Function(closure.get());
}

// ---------------------------------------------------------------------------
// Calls and returns
// ---------------------------------------------------------------------------

Value VirtualMachine::resolveCallable(Value function, std::vector<Value>& args) const {
    for (int depth = 0; depth < kMaxMetaChain; ++depth) {
        if (function.isFunction()) {
            return function;
        }
        Value handler = metamethod(function, MetaEvent::Call);
        if (handler.isNil()) {
            throw std::runtime_error(std::string("attempt to call a ") + typeName(function) + " value");
        }
        args.insert(args.begin(), function);
        function = handler;
    }
    throw std::runtime_error("'__call' chain too long; possible loop");
}

void VirtualMachine::callValue(ThreadObject& thread,
                               Value function,
                               std::vector<Value> args,
                               const ReturnTarget& target) {
    function = resolveCallable(function, args);
    if (ClosureObject* closure = function.asClosure()) {
        thread.stack().pushFrame(Handle<ClosureObject>(closure), std::move(args), target);
        return;
    }
    NativeFunctionObject* native = function.asNative();
    if (!native) {
        throw std::runtime_error("attempt to call an unknown function object");
    }
    invokeNative(thread, *native, std::move(args), target);
}

void VirtualMachine::invokeNative(ThreadObject& thread,
                                  NativeFunctionObject& native,
                                  std::vector<Value> args,
                                  const ReturnTarget& target) {
    CallContext context(*this, thread, &native);
    CallbackResult result = native.function()(context, std::move(args));
    applyCallbackResult(thread, &native, std::move(result), target);
}

void VirtualMachine::applyCallbackResult(ThreadObject& thread,
                                         NativeFunctionObject* native,
                                         CallbackResult result,
                                         const ReturnTarget& target) {
    switch (result.kind) {
    case CallbackResult::Kind::Return:
        deliverResults(thread, target, std::move(result.values));
        return;
    case CallbackResult::Kind::TailCall:
        callValue(thread, result.target, std::move(result.values), target);
        return;
    case CallbackResult::Kind::Yield:
        yieldThread(thread, std::move(result.values), target);
        return;
    case CallbackResult::Kind::Call: {
        if (!result.then) {
            throw std::runtime_error("native call request without a continuation");
        }
        Frame frame;
        frame.kind = FrameKind::Continuation;
        frame.returnTarget = target;
        frame.native = Handle<NativeFunctionObject>(native);
        frame.continuation = std::move(result.then);
        frame.isProtected = result.isProtected;
        frame.stash = std::move(result.stash);
        thread.stack().pushNativeFrame(std::move(frame));
        callValue(thread, result.target, std::move(result.values), ReturnTarget::Native());
        return;
    }
    case CallbackResult::Kind::Resume: {
        if (thread.inNativeCall()) {
            throw std::runtime_error("attempt to resume a coroutine across a native call boundary");
        }
        if (!result.target.isThread()) {
            throw std::runtime_error(std::string("attempt to resume a ") + typeName(result.target) + " value");
        }
        ThreadObject& child = result.target.asThread();
        const bool resumable = child.isCoroutine() &&
            (child.status() == ThreadStatus::NotStarted || child.status() == ThreadStatus::Suspended);
        if (!resumable) {
            const std::string message = child.status() == ThreadStatus::Dead
                ? "cannot resume dead coroutine"
                : "cannot resume non-suspended coroutine";
            if (result.mode == ResumeMode::Wrap) {
                throw std::runtime_error(message);
            }
            deliverResults(thread, target, {Value::Boolean(false), Value::String(heap_.intern(message).get())});
            return;
        }
        Frame frame;
        frame.kind = FrameKind::ResumeWait;
        frame.returnTarget = target;
        frame.native = Handle<NativeFunctionObject>(native);
        frame.resumeMode = result.mode;
        thread.stack().pushNativeFrame(std::move(frame));
        child.setTransfer(std::move(result.values));
        thread.setResumeTarget(Handle<ThreadObject>(&child));
        thread.raiseSignal(ThreadSignal::ResumeRequested);
        return;
    }
    }
}

void VirtualMachine::yieldThread(ThreadObject& thread, std::vector<Value> values, const ReturnTarget& target) {
    if (!thread.isCoroutine()) {
        throw ProtocolError("attempt to yield from outside a coroutine");
    }
    if (thread.inNativeCall()) {
        throw std::runtime_error("attempt to yield across a native call boundary");
    }
    Frame point;
    point.kind = FrameKind::YieldPoint;
    point.returnTarget = target;
    thread.stack().pushNativeFrame(std::move(point));
    thread.setTransfer(std::move(values));
    thread.setStatus(ThreadStatus::Suspended);
    thread.raiseSignal(ThreadSignal::Yielded);
}

void VirtualMachine::deliverResults(ThreadObject& thread, const ReturnTarget& target, std::vector<Value> values) {
    switch (target.kind) {
    case ReturnKind::Registers: {
        Frame& frame = thread.stack().top();
        const auto dest = static_cast<std::size_t>(target.dest);
        if (target.want < 0) {
            if (frame.registers.size() < dest + values.size()) {
                frame.registers.resize(dest + values.size());
            }
            std::copy(values.begin(), values.end(), frame.registers.begin() + static_cast<std::ptrdiff_t>(dest));
            frame.top = dest + values.size();
        } else {
            for (std::size_t i = 0; i < static_cast<std::size_t>(target.want); ++i) {
                frame.registers.at(dest + i) = i < values.size() ? values[i] : Value::Nil();
            }
        }
        return;
    }
    case ReturnKind::Compare: {
        const bool truthy = !values.empty() && values.front().isTruthy();
        if (truthy != target.expected) {
            ++thread.stack().top().pc;
        }
        return;
    }
    case ReturnKind::Concat:
        concatFold(thread, target.dest, target.begin, target.cursor, values.empty() ? Value::Nil() : values.front());
        return;
    case ReturnKind::Native: {
        Frame frame = thread.stack().popFrame(heap_);
        if (frame.kind != FrameKind::Continuation) {
            throw ProtocolError("native results delivered without a continuation frame");
        }
        CallContext context(*this, thread, frame.native.get());
        CallbackResult result = frame.continuation(context, CallOutcome::Returned, std::move(values), std::move(frame.stash));
        applyCallbackResult(thread, frame.native.get(), std::move(result), frame.returnTarget);
        return;
    }
    case ReturnKind::Boundary:
        thread.setTransfer(std::move(values));
        thread.raiseSignal(ThreadSignal::Finished);
        return;
    case ReturnKind::Exit:
        thread.setTransfer(std::move(values));
        thread.setStatus(ThreadStatus::Dead);
        thread.raiseSignal(ThreadSignal::Finished);
        return;
    }
}

void VirtualMachine::returnFromFrame(ThreadObject& thread, std::vector<Value> values) {
    Frame frame = thread.stack().popFrame(heap_);
    deliverResults(thread, frame.returnTarget, std::move(values));
}

void VirtualMachine::start(ThreadObject& thread) {
    thread.setStatus(ThreadStatus::Running);
    std::vector<Value> args = thread.takeTransfer();
    guarded(thread, [&] { callValue(thread, thread.body(), std::move(args), ReturnTarget::Exit()); });
}

void VirtualMachine::resume(ThreadObject& thread) {
    thread.setStatus(ThreadStatus::Running);
    std::vector<Value> values = thread.takeTransfer();
    if (thread.stack().empty() || thread.stack().top().kind != FrameKind::YieldPoint) {
        throw ProtocolError("coroutine is not suspended at a yield");
    }
    guarded(thread, [&] {
        Frame point = thread.stack().popFrame(heap_);
        deliverResults(thread, point.returnTarget, std::move(values));
    });
}

void VirtualMachine::completeResume(ThreadObject& thread,
                                    ThreadSignal outcome,
                                    std::vector<Value> values,
                                    const Value& error) {
    if (thread.stack().empty() || thread.stack().top().kind != FrameKind::ResumeWait) {
        throw ProtocolError("no pending resume on this thread");
    }
    thread.setResumeTarget({});
    guarded(thread, [&] {
        Frame wait = thread.stack().popFrame(heap_);
        std::vector<Value> results;
        if (wait.resumeMode == ResumeMode::Standard) {
            if (outcome == ThreadSignal::Errored) {
                results = {Value::Boolean(false), error};
            } else {
                results.reserve(values.size() + 1);
                results.push_back(Value::Boolean(true));
                results.insert(results.end(), values.begin(), values.end());
            }
        } else {
            if (outcome == ThreadSignal::Errored) {
                throw ScriptError(error, toDisplayString(error));
            }
            results = std::move(values);
        }
        deliverResults(thread, wait.returnTarget, std::move(results));
    });
}

std::vector<Value> VirtualMachine::callNested(ThreadObject& thread, const Value& function, std::vector<Value> args) {
    std::vector<std::size_t>& boundaries = thread.boundaries();
    boundaries.push_back(thread.stack().size());
    struct BoundaryScope {
        std::vector<std::size_t>& boundaries;
        ~BoundaryScope() { boundaries.pop_back(); }
    } scope{boundaries};

    callValue(thread, function, std::move(args), ReturnTarget::Boundary());
    while (true) {
        switch (thread.takeSignal()) {
        case ThreadSignal::None:
            runInstruction(thread);
            break;
        case ThreadSignal::Finished:
            return thread.takeTransfer();
        case ThreadSignal::Errored: {
            const Value error = thread.error();
            throw ScriptError(error, toDisplayString(error));
        }
        case ThreadSignal::Yielded:
        case ThreadSignal::ResumeRequested:
            throw ProtocolError("thread left a native call boundary");
        }
    }
}

// ---------------------------------------------------------------------------
// Metamethod-aware operations. A nullopt result means a metamethod call was
// scheduled and its result will be delivered to `target`.
// ---------------------------------------------------------------------------

std::optional<Value> VirtualMachine::index(ThreadObject& thread,
                                           Value object,
                                           const Value& key,
                                           const ReturnTarget& target) {
    for (int depth = 0; depth < kMaxMetaChain; ++depth) {
        Value handler;
        if (object.isTable()) {
            const Value raw = object.asTable().get(key);
            if (!raw.isNil()) {
                return raw;
            }
            handler = metamethod(object, MetaEvent::Index);
            if (handler.isNil()) {
                return raw;
            }
        } else {
            handler = metamethod(object, MetaEvent::Index);
            if (handler.isNil()) {
                throw std::runtime_error(std::string("attempt to index a ") + typeName(object) + " value");
            }
        }
        if (handler.isFunction()) {
            callValue(thread, handler, {object, key}, target);
            return std::nullopt;
        }
        object = handler;
    }
    throw std::runtime_error("'__index' chain too long; possible loop");
}

void VirtualMachine::newIndex(ThreadObject& thread, Value object, const Value& key, const Value& value) {
    for (int depth = 0; depth < kMaxMetaChain; ++depth) {
        Value handler;
        if (object.isTable()) {
            TableObject& table = object.asTable();
            if (!table.get(key).isNil()) {
                table.set(heap_, key, value);
                return;
            }
            handler = metamethod(object, MetaEvent::NewIndex);
            if (handler.isNil()) {
                table.set(heap_, key, value);
                return;
            }
        } else {
            handler = metamethod(object, MetaEvent::NewIndex);
            if (handler.isNil()) {
                throw std::runtime_error(std::string("attempt to index a ") + typeName(object) + " value");
            }
        }
        if (handler.isFunction()) {
            callValue(thread, handler, {object, key, value}, ReturnTarget::Registers(0, 0));
            return;
        }
        object = handler;
    }
    throw std::runtime_error("'__newindex' chain too long; possible loop");
}

std::optional<Value> VirtualMachine::arith(ThreadObject& thread,
                                           ArithOp op,
                                           const Value& lhs,
                                           const Value& rhs,
                                           const ReturnTarget& target) {
    Value out;
    const ArithStatus status = arithmetic(op, lhs, rhs, out);
    if (status == ArithStatus::Ok) {
        return out;
    }
    const MetaEvent event = arithEvent(op);
    Value handler = metamethod(lhs, event);
    if (handler.isNil()) {
        handler = metamethod(rhs, event);
    }
    if (!handler.isNil()) {
        callValue(thread, handler, {lhs, rhs}, target);
        return std::nullopt;
    }
    if (status == ArithStatus::NoIntegerRepresentation) {
        throw std::runtime_error("number has no integer representation");
    }
    const Value& culprit = toNumber(lhs) ? rhs : lhs;
    if (isBitwise(op)) {
        throw std::runtime_error(std::string("attempt to perform bitwise operation on a ") + typeName(culprit) + " value");
    }
    throw std::runtime_error(std::string("attempt to perform arithmetic on a ") + typeName(culprit) + " value");
}

std::optional<bool> VirtualMachine::compare(ThreadObject& thread,
                                            OpCode op,
                                            const Value& lhs,
                                            const Value& rhs,
                                            const ReturnTarget& target) {
    if (op == OpCode::Eq) {
        if (rawEquals(lhs, rhs)) {
            return true;
        }
        if (lhs.type != rhs.type || !(lhs.isTable() || lhs.isUserData())) {
            return false;
        }
        Value handler = metamethod(lhs, MetaEvent::Eq);
        if (handler.isNil()) {
            handler = metamethod(rhs, MetaEvent::Eq);
        }
        if (handler.isNil()) {
            return false;
        }
        callValue(thread, handler, {lhs, rhs}, target);
        return std::nullopt;
    }

    const std::optional<bool> raw = op == OpCode::Lt ? rawLessThan(lhs, rhs) : rawLessEqual(lhs, rhs);
    if (raw) {
        return raw;
    }
    const MetaEvent event = op == OpCode::Lt ? MetaEvent::Lt : MetaEvent::Le;
    Value handler = metamethod(lhs, event);
    if (handler.isNil()) {
        handler = metamethod(rhs, event);
    }
    if (!handler.isNil()) {
        callValue(thread, handler, {lhs, rhs}, target);
        return std::nullopt;
    }
    const std::string left = typeName(lhs);
    const std::string right = typeName(rhs);
    if (left == right) {
        throw std::runtime_error("attempt to compare two " + left + " values");
    }
    throw std::runtime_error("attempt to compare " + left + " with " + right);
}

std::optional<Value> VirtualMachine::length(ThreadObject& thread, const Value& value, const ReturnTarget& target) {
    if (value.isString()) {
        return Value::Integer(static_cast<std::int64_t>(value.asString().size()));
    }
    const Value handler = metamethod(value, MetaEvent::Len);
    if (!handler.isNil()) {
        callValue(thread, handler, {value, value}, target);
        return std::nullopt;
    }
    if (value.isTable()) {
        return Value::Integer(value.asTable().length());
    }
    throw std::runtime_error(std::string("attempt to get length of a ") + typeName(value) + " value");
}

// Folds registers cursor..begin into `accumulated`, right to left, storing
// the final value in dest.
void VirtualMachine::concatFold(ThreadObject& thread,
                                std::int32_t dest,
                                std::int32_t begin,
                                std::int32_t cursor,
                                Value accumulated) {
    Frame& frame = thread.stack().top();
    for (std::int32_t i = cursor; i >= begin; --i) {
        const Value left = frame.registers.at(static_cast<std::size_t>(i));
        if (concatenable(left) && concatenable(accumulated)) {
            accumulated = Value::String(heap_.intern(concatPiece(left) + concatPiece(accumulated)).get());
            continue;
        }
        Value handler = metamethod(left, MetaEvent::Concat);
        if (handler.isNil()) {
            handler = metamethod(accumulated, MetaEvent::Concat);
        }
        if (handler.isNil()) {
            const Value& culprit = concatenable(left) ? accumulated : left;
            throw std::runtime_error(std::string("attempt to concatenate a ") + typeName(culprit) + " value");
        }
        callValue(thread, handler, {left, accumulated}, ReturnTarget::Concat(dest, begin, i - 1));
        return;
    }
    frame.registers.at(static_cast<std::size_t>(dest)) = accumulated;
}

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

template <typename Fn>
void VirtualMachine::guarded(ThreadObject& thread, Fn&& action) {
    try {
        action();
    } catch (const FatalError&) {
        throw;
    } catch (const ProtocolError&) {
        throw;
    } catch (const ScriptError& error) {
        raise(thread, error.value(), captureTraceback(thread));
    } catch (const std::exception& error) {
        raise(thread, positionedError(thread, error.what()), captureTraceback(thread));
    }
}

// Unwinds to the nearest protected continuation above the unwind floor and
// hands it the error; otherwise the thread stops with the error.
void VirtualMachine::raise(ThreadObject& thread, Value error, std::vector<TracebackEntry> traceback) {
    CallStack& stack = thread.stack();
    const std::size_t floor = thread.unwindFloor();
    while (stack.size() > floor) {
        if (stack.top().kind != FrameKind::Continuation || !stack.top().isProtected) {
            stack.popFrame(heap_);
            continue;
        }
        Frame frame = stack.popFrame(heap_);
        try {
            CallContext context(*this, thread, frame.native.get());
            CallbackResult result = frame.continuation(context, CallOutcome::Errored, {error}, std::move(frame.stash));
            applyCallbackResult(thread, frame.native.get(), std::move(result), frame.returnTarget);
            return;
        } catch (const FatalError&) {
            throw;
        } catch (const ProtocolError&) {
            throw;
        } catch (const ScriptError& next) {
            error = next.value();
            traceback = captureTraceback(thread);
        } catch (const std::exception& next) {
            error = positionedError(thread, next.what());
            traceback = captureTraceback(thread);
        }
    }
    thread.setError(error, std::move(traceback));
    if (!thread.inNativeCall()) {
        thread.setStatus(ThreadStatus::Dead);
    }
    thread.raiseSignal(ThreadSignal::Errored);
}

Value VirtualMachine::positionedError(ThreadObject& thread, const std::string& message) {
    return Value::String(heap_.intern(where(thread, 1) + message).get());
}

std::string VirtualMachine::where(ThreadObject& thread, int level) const {
    const CallStack& stack = thread.stack();
    int seen = 0;
    for (std::size_t i = stack.size(); i-- > 0;) {
        const Frame& frame = stack.at(i);
        if (frame.kind != FrameKind::Script) {
            continue;
        }
        if (++seen < level) {
            continue;
        }
        const Prototype& proto = frame.closure->prototype();
        if (frame.pc == 0 || frame.pc > proto.lineInfo.size()) {
            return {};
        }
        const std::string source = proto.source.empty() ? "?" : proto.source;
        return source + ":" + std::to_string(proto.lineInfo[frame.pc - 1]) + ": ";
    }
    return {};
}

std::vector<TracebackEntry> VirtualMachine::captureTraceback(const ThreadObject& thread) const {
    std::vector<TracebackEntry> traceback;
    const CallStack& stack = thread.stack();
    for (std::size_t i = stack.size(); i-- > 0;) {
        const Frame& frame = stack.at(i);
        switch (frame.kind) {
        case FrameKind::Script: {
            const Prototype& proto = frame.closure->prototype();
            TracebackEntry entry;
            entry.function = proto.name.empty() ? "?" : proto.name;
            entry.source = proto.source.empty() ? "?" : proto.source;
            if (frame.pc > 0 && frame.pc <= proto.lineInfo.size()) {
                entry.line = proto.lineInfo[frame.pc - 1];
            }
            traceback.push_back(std::move(entry));
            break;
        }
        case FrameKind::Continuation:
        case FrameKind::ResumeWait:
            traceback.push_back({frame.native ? frame.native->name() : std::string("?"), "[native]", 0});
            break;
        case FrameKind::YieldPoint:
            break;
        }
    }
    return traceback;
}

} // namespace lunar

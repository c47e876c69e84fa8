#include "lunar/call_stack.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system/closure_type.hpp"
#include "lunar/type_system/native_function_type.hpp"
#include "lunar/type_system/thread_type.hpp"
#include "lunar/type_system/upvalue_type.hpp"

#include <algorithm>

namespace lunar {

CallStack::CallStack(std::size_t maxFrames)
    : maxFrames_(std::max<std::size_t>(1, maxFrames)) {}

std::size_t CallStack::pushFrame(Handle<ClosureObject> closure, std::vector<Value> args, ReturnTarget target) {
    if (frames_.size() >= maxFrames_) {
        throw StackOverflow();
    }
    const Prototype& proto = closure->prototype();

    Frame frame;
    frame.kind = FrameKind::Script;
    frame.closure = closure;
    frame.returnTarget = target;
    frame.registers.assign(std::max<std::size_t>(proto.registerCount, proto.paramCount), Value::Nil());
    const std::size_t fixed = std::min<std::size_t>(args.size(), proto.paramCount);
    std::copy_n(args.begin(), fixed, frame.registers.begin());
    if (proto.isVararg && args.size() > fixed) {
        frame.varargs.assign(args.begin() + static_cast<std::ptrdiff_t>(fixed), args.end());
    }
    frame.top = proto.registerCount;

    frames_.push_back(std::move(frame));
    return frames_.size() - 1;
}

std::size_t CallStack::pushNativeFrame(Frame frame) {
    if (frames_.size() >= maxFrames_) {
        throw StackOverflow();
    }
    frames_.push_back(std::move(frame));
    return frames_.size() - 1;
}

Frame CallStack::popFrame(Heap& heap) {
    if (frames_.empty()) {
        throw std::runtime_error("CallStack::popFrame on an empty stack");
    }
    closeUpvalues(heap, frames_.size() - 1, 0);
    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    return frame;
}

Handle<UpvalueObject> CallStack::findOrCreateUpvalue(Heap& heap,
                                                     Handle<ThreadObject> owner,
                                                     std::size_t frameIndex,
                                                     std::size_t slot) {
    Frame& frame = frames_.at(frameIndex);
    for (const auto& upvalue : frame.openUpvalues) {
        if (upvalue->slot() == slot) {
            return upvalue;
        }
    }
    Handle<UpvalueObject> created = heap.allocate<UpvalueObject>(owner, frameIndex, slot);
    frames_.at(frameIndex).openUpvalues.push_back(created);
    return created;
}

void CallStack::closeUpvalues(Heap& heap, std::size_t frameIndex, std::size_t fromSlot) {
    auto& open = frames_.at(frameIndex).openUpvalues;
    auto keep = std::partition(open.begin(), open.end(), [fromSlot](const Handle<UpvalueObject>& upvalue) {
        return upvalue->slot() < fromSlot;
    });
    for (auto it = keep; it != open.end(); ++it) {
        (*it)->close(heap);
    }
    open.erase(keep, open.end());
}

void CallStack::trace(Heap& heap) const {
    for (const auto& frame : frames_) {
        heap.markObject(frame.closure.get());
        heap.markObject(frame.native.get());
        for (const auto& value : frame.registers) {
            heap.markValue(value);
        }
        for (const auto& value : frame.varargs) {
            heap.markValue(value);
        }
        for (const auto& upvalue : frame.openUpvalues) {
            heap.markObject(upvalue.get());
        }
        for (const auto& value : frame.stash) {
            heap.markValue(value);
        }
    }
}

} // namespace lunar

#pragma once

#include "lunar/binding.hpp"
#include "lunar/handle.hpp"
#include "lunar/value.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lunar {

class ClosureObject;
class Heap;
class NativeFunctionObject;
class ThreadObject;
class UpvalueObject;

enum class FrameKind : std::uint8_t {
    Script,
    // Native waiting for a call it requested; runs its continuation next.
    Continuation,
    // Native waiting for a coroutine it resumed.
    ResumeWait,
    // Suspension point of a yielded coroutine.
    YieldPoint
};

// Where the results of a finished frame go.
enum class ReturnKind : std::uint8_t {
    // Caller registers dest.., `want` values (-1: all, sets top).
    Registers,
    // Truthiness of the first result decides a conditional skip.
    Compare,
    // Result continues a concatenation of registers begin..cursor.
    Concat,
    // Result feeds the continuation frame below.
    Native,
    // Ends a reentrant CallContext::call.
    Boundary,
    // Ends the thread.
    Exit
};

struct ReturnTarget {
    ReturnKind kind{ReturnKind::Exit};
    std::int32_t dest{0};
    std::int32_t want{-1};
    std::int32_t begin{0};
    std::int32_t cursor{0};
    bool expected{false};

    static ReturnTarget Registers(std::int32_t dest, std::int32_t want) {
        ReturnTarget target;
        target.kind = ReturnKind::Registers;
        target.dest = dest;
        target.want = want;
        return target;
    }
    static ReturnTarget Compare(bool expected) {
        ReturnTarget target;
        target.kind = ReturnKind::Compare;
        target.expected = expected;
        return target;
    }
    static ReturnTarget Concat(std::int32_t dest, std::int32_t begin, std::int32_t cursor) {
        ReturnTarget target;
        target.kind = ReturnKind::Concat;
        target.dest = dest;
        target.begin = begin;
        target.cursor = cursor;
        return target;
    }
    static ReturnTarget Native() {
        ReturnTarget target;
        target.kind = ReturnKind::Native;
        return target;
    }
    static ReturnTarget Boundary() {
        ReturnTarget target;
        target.kind = ReturnKind::Boundary;
        return target;
    }
    static ReturnTarget Exit() { return {}; }
};

struct Frame {
    FrameKind kind{FrameKind::Script};
    ReturnTarget returnTarget;

    // Script frames.
    Handle<ClosureObject> closure;
    std::size_t pc{0};
    std::vector<Value> registers;
    std::vector<Value> varargs;
    std::size_t top{0};
    std::vector<Handle<UpvalueObject>> openUpvalues;

    // Native frames.
    Handle<NativeFunctionObject> native;
    Continuation continuation;
    bool isProtected{false};
    ResumeMode resumeMode{ResumeMode::Standard};
    std::vector<Value> stash;
};

// Activation records of one thread, oldest first. Lives inside the thread
// object on the heap, never on the native stack.
class CallStack {
public:
    explicit CallStack(std::size_t maxFrames);

    // Throws StackOverflow once maxFrames frames are live.
    std::size_t pushFrame(Handle<ClosureObject> closure, std::vector<Value> args, ReturnTarget target);
    std::size_t pushNativeFrame(Frame frame);
    // Closes the frame's open upvalues, then removes it.
    Frame popFrame(Heap& heap);

    Handle<UpvalueObject> findOrCreateUpvalue(Heap& heap,
                                              Handle<ThreadObject> owner,
                                              std::size_t frameIndex,
                                              std::size_t slot);
    void closeUpvalues(Heap& heap, std::size_t frameIndex, std::size_t fromSlot);

    Frame& top() { return frames_.back(); }
    const Frame& top() const { return frames_.back(); }
    Frame& at(std::size_t index) { return frames_.at(index); }
    const Frame& at(std::size_t index) const { return frames_.at(index); }
    std::size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    std::size_t maxFrames() const { return maxFrames_; }

    void trace(Heap& heap) const;

private:
    std::vector<Frame> frames_;
    std::size_t maxFrames_;
};

} // namespace lunar

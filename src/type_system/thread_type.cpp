#include "lunar/type_system/thread_type.hpp"
#include "lunar/heap.hpp"

namespace lunar {

const char* threadStatusName(ThreadStatus status) {
    switch (status) {
    case ThreadStatus::NotStarted:
    case ThreadStatus::Suspended:
        return "suspended";
    case ThreadStatus::Running:
        return "running";
    case ThreadStatus::Normal:
        return "normal";
    case ThreadStatus::Dead:
        return "dead";
    }
    return "dead";
}

ThreadObject::ThreadObject(Value body, std::size_t maxFrames, bool isCoroutine)
    : stack_(maxFrames), body_(body), isCoroutine_(isCoroutine) {}

const Type& ThreadObject::getType() const {
    return ThreadType::instance();
}

void ThreadObject::trace(Heap& heap) const {
    heap.markValue(body_);
    heap.markValue(error_);
    heap.markObject(resumeTarget_.get());
    for (const auto& value : transfer_) {
        heap.markValue(value);
    }
    stack_.trace(heap);
}

ThreadSignal ThreadObject::takeSignal() {
    const ThreadSignal signal = signal_;
    signal_ = ThreadSignal::None;
    return signal;
}

std::vector<Value> ThreadObject::takeTransfer() {
    std::vector<Value> values = std::move(transfer_);
    transfer_.clear();
    return values;
}

void ThreadObject::setError(Value error, std::vector<TracebackEntry> traceback) {
    error_ = error;
    traceback_ = std::move(traceback);
}

const ThreadType& ThreadType::instance() {
    static const ThreadType type;
    return type;
}

const char* ThreadType::name() const {
    return "thread";
}

} // namespace lunar

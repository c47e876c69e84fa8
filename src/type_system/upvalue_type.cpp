#include "lunar/type_system/upvalue_type.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system/thread_type.hpp"

namespace lunar {

UpvalueObject::UpvalueObject(Handle<ThreadObject> thread, std::size_t frameIndex, std::size_t slot)
    : thread_(thread), frameIndex_(frameIndex), slot_(slot) {}

UpvalueObject::UpvalueObject(Value closedValue)
    : closed_(closedValue) {}

const Type& UpvalueObject::getType() const {
    return UpvalueType::instance();
}

void UpvalueObject::trace(Heap& heap) const {
    heap.markObject(thread_.get());
    heap.markValue(closed_);
}

Value UpvalueObject::get() const {
    if (thread_) {
        return thread_->stack().at(frameIndex_).registers.at(slot_);
    }
    return closed_;
}

void UpvalueObject::set(Heap& heap, const Value& value) {
    if (thread_) {
        // Registers are re-scanned when marking ends; no barrier needed.
        thread_->stack().at(frameIndex_).registers.at(slot_) = value;
        return;
    }
    closed_ = value;
    heap.writeBarrier(*this, value);
}

void UpvalueObject::close(Heap& heap) {
    if (!thread_) {
        return;
    }
    closed_ = thread_->stack().at(frameIndex_).registers.at(slot_);
    thread_ = Handle<ThreadObject>();
    heap.writeBarrier(*this, closed_);
}

const UpvalueType& UpvalueType::instance() {
    static const UpvalueType type;
    return type;
}

const char* UpvalueType::name() const {
    return "upvalue";
}

} // namespace lunar

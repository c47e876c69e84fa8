#pragma once

#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"

#include <cstddef>

namespace lunar {

class ThreadObject;

// Shared cell for a captured local. While open it aliases a register of a
// live frame; closing copies the register value into the cell. Every closure
// capturing the same register of the same frame holds the same cell.
class UpvalueObject : public Object {
public:
    UpvalueObject(Handle<ThreadObject> thread, std::size_t frameIndex, std::size_t slot);
    explicit UpvalueObject(Value closedValue);

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    bool isOpen() const { return static_cast<bool>(thread_); }
    std::size_t frameIndex() const { return frameIndex_; }
    std::size_t slot() const { return slot_; }

    Value get() const;
    void set(Heap& heap, const Value& value);
    void close(Heap& heap);

private:
    Handle<ThreadObject> thread_;
    std::size_t frameIndex_{0};
    std::size_t slot_{0};
    Value closed_;
};

class UpvalueType : public Type {
public:
    static const UpvalueType& instance();
    const char* name() const override;
};

} // namespace lunar

#pragma once

#include "lunar/error.hpp"
#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"
#include "lunar/value.hpp"

#include <cstdint>
#include <memory>
#include <new>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lunar {

class StringObject;

enum class GcPhase : std::uint8_t {
    Idle,
    Mark,
    Sweep
};

struct GcOptions {
    // A cycle starts once this many objects were allocated since the last one,
    // or pausePercent of the surviving object count, whichever is larger.
    std::size_t pauseObjects{256};
    std::size_t pausePercent{100};
    // Work units (objects traced or swept) per safe point.
    std::size_t sliceBudgetObjects{16};
    // 0 means unlimited.
    std::size_t maxObjects{0};
};

struct GcStats {
    std::size_t cyclesCompleted{0};
    std::size_t objectsFreed{0};
    std::size_t objectsAllocated{0};
};

// Heap owns every collectable object. Collection is incremental tri-color
// mark & sweep: roots and newly allocated objects start gray, traced objects
// turn black, and whatever is still white when marking ends is freed.
class Heap {
public:
    explicit Heap(GcOptions options = {});
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    template <typename T, typename... Args>
    Handle<T> allocate(Args&&... args) {
        ensureCapacity();
        std::unique_ptr<T> object;
        try {
            object = std::make_unique<T>(std::forward<Args>(args)...);
        } catch (const std::bad_alloc&) {
            fail("not enough memory");
        }
        T* raw = object.get();
        adopt(std::move(object));
        return Handle<T>(raw);
    }

    // Equal contents always share one string object.
    Handle<StringObject> intern(std::string_view text);

    // Must be called after storing a reference into an object the collector
    // may already have traced.
    void writeBarrier(Object& container);
    void writeBarrier(Object& container, const Value& stored);

    // Performs up to workUnits of marking or sweeping, starting a cycle if
    // none is running. Returns true when a cycle completed during the call.
    bool collect(std::size_t workUnits);
    // Finishes the cycle in progress, then runs one complete cycle.
    // Returns the number of objects freed.
    std::size_t collectFull();
    bool shouldCollect() const;

    // Collection requested by a script; serviced at the next safe point.
    void requestFullCollection() { fullCollectionRequested_ = true; }
    bool takeFullCollectionRequest();

    void addRoot(Object* object);
    void removeRoot(Object* object);
    void addRoot(const Value& value);
    void removeRoot(const Value& value);

    // Called from Object::trace implementations.
    void markObject(const Object* object);
    void markValue(const Value& value);

    bool contains(const Object* object) const;
    std::size_t objectCount() const { return objects_.size(); }
    GcPhase phase() const { return phase_; }
    const GcStats& stats() const { return stats_; }
    const GcOptions& options() const { return options_; }
    void setOptions(const GcOptions& options);
    bool isFatal() const { return fatal_; }

private:
    void ensureCapacity();
    [[noreturn]] void fail(const std::string& reason);
    void adopt(std::unique_ptr<Object> object);
    void shade(Object* object);
    void beginCycle();
    void markRoots();
    void finishMarking();
    void sweepOne();
    void finishCycle();

    GcOptions options_;
    GcStats stats_;
    GcPhase phase_{GcPhase::Idle};
    bool fatal_{false};
    bool fullCollectionRequested_{false};
    std::uint64_t nextObjectId_{1};
    std::size_t allocatedSinceCycle_{0};
    std::size_t threshold_{0};

    std::unordered_map<std::uint64_t, std::unique_ptr<Object>> objects_;
    std::unordered_map<const Object*, std::uint64_t> objectIds_;
    std::unordered_map<std::string_view, StringObject*> strings_;
    std::unordered_map<Object*, std::size_t> roots_;

    std::vector<Object*> grayQueue_;
    std::vector<Object*> grayAgain_;
    std::vector<std::uint64_t> sweepList_;
    std::size_t sweepCursor_{0};
};

} // namespace lunar

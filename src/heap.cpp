#include "lunar/heap.hpp"
#include "lunar/error_logger.hpp"
#include "lunar/type_system/string_type.hpp"

#include <algorithm>
#include <limits>

namespace lunar {

Heap::Heap(GcOptions options)
    : options_(options), threshold_(std::max<std::size_t>(1, options.pauseObjects)) {}

Heap::~Heap() {
    strings_.clear();
    roots_.clear();
    grayQueue_.clear();
    grayAgain_.clear();
    objectIds_.clear();
    objects_.clear();
}

void Heap::setOptions(const GcOptions& options) {
    options_ = options;
    threshold_ = std::max<std::size_t>(1, options.pauseObjects);
}

void Heap::ensureCapacity() {
    if (fatal_) {
        throw FatalError("heap is unusable after a fatal allocation failure");
    }
    if (options_.maxObjects > 0 && objects_.size() >= options_.maxObjects) {
        fail("object limit of " + std::to_string(options_.maxObjects) + " reached");
    }
}

void Heap::fail(const std::string& reason) {
    fatal_ = true;
    ErrorLogger::instance().addContext("live objects", std::to_string(objects_.size()));
    ErrorLogger::instance().addContext("gc cycles", std::to_string(stats_.cyclesCompleted));
    LUNAR_LOG_ERROR("heap exhausted: " + reason);
    throw FatalError("not enough memory: " + reason);
}

void Heap::adopt(std::unique_ptr<Object> object) {
    Object* raw = object.get();
    const std::uint64_t id = nextObjectId_++;
    raw->objectId_ = id;
    if (phase_ == GcPhase::Mark) {
        raw->color_ = GcColor::Gray;
        grayQueue_.push_back(raw);
    } else {
        raw->color_ = GcColor::White;
    }
    objectIds_.emplace(raw, id);
    objects_.emplace(id, std::move(object));
    ++allocatedSinceCycle_;
    ++stats_.objectsAllocated;
}

Handle<StringObject> Heap::intern(std::string_view text) {
    auto it = strings_.find(text);
    if (it != strings_.end()) {
        StringObject* existing = it->second;
        // Still in the sweep list but about to be freed; keep it.
        if (phase_ == GcPhase::Sweep && existing->color_ == GcColor::White) {
            existing->color_ = GcColor::Black;
        }
        return Handle<StringObject>(existing);
    }
    Handle<StringObject> created = allocate<StringObject>(std::string(text));
    strings_.emplace(std::string_view(created->text()), created.get());
    return created;
}

void Heap::writeBarrier(Object& container) {
    if (phase_ != GcPhase::Mark || container.color_ != GcColor::Black) {
        return;
    }
    container.color_ = GcColor::Gray;
    grayQueue_.push_back(&container);
}

void Heap::writeBarrier(Object& container, const Value& stored) {
    if (stored.isObject()) {
        writeBarrier(container);
    }
}

void Heap::addRoot(Object* object) {
    if (!object) {
        return;
    }
    ++roots_[object];
    if (phase_ == GcPhase::Mark) {
        shade(object);
    }
}

void Heap::removeRoot(Object* object) {
    auto it = roots_.find(object);
    if (it == roots_.end()) {
        return;
    }
    if (--it->second == 0) {
        roots_.erase(it);
    }
}

void Heap::addRoot(const Value& value) {
    if (value.isObject()) {
        addRoot(value.object);
    }
}

void Heap::removeRoot(const Value& value) {
    if (value.isObject()) {
        removeRoot(value.object);
    }
}

void Heap::shade(Object* object) {
    if (object && object->color_ == GcColor::White) {
        object->color_ = GcColor::Gray;
        grayQueue_.push_back(object);
    }
}

void Heap::markObject(const Object* object) {
    if (phase_ != GcPhase::Mark) {
        return;
    }
    // Colours are collector-owned state; tracing works on const views.
    shade(const_cast<Object*>(object));
}

void Heap::markValue(const Value& value) {
    if (value.isObject()) {
        markObject(value.object);
    }
}

bool Heap::contains(const Object* object) const {
    return objectIds_.find(object) != objectIds_.end();
}

bool Heap::shouldCollect() const {
    return phase_ != GcPhase::Idle || allocatedSinceCycle_ >= threshold_;
}

bool Heap::takeFullCollectionRequest() {
    const bool requested = fullCollectionRequested_;
    fullCollectionRequested_ = false;
    return requested;
}

void Heap::markRoots() {
    for (const auto& [object, count] : roots_) {
        (void)count;
        shade(object);
    }
}

void Heap::beginCycle() {
    grayQueue_.clear();
    grayAgain_.clear();
    sweepList_.clear();
    sweepCursor_ = 0;
    for (auto& [id, object] : objects_) {
        (void)id;
        object->color_ = GcColor::White;
    }
    phase_ = GcPhase::Mark;
    markRoots();
}

void Heap::finishMarking() {
    markRoots();
    for (Object* object : grayAgain_) {
        object->trace(*this);
    }
    grayAgain_.clear();
    while (!grayQueue_.empty()) {
        Object* object = grayQueue_.back();
        grayQueue_.pop_back();
        object->color_ = GcColor::Black;
        object->trace(*this);
    }

    sweepList_.reserve(objects_.size());
    for (const auto& [id, object] : objects_) {
        (void)object;
        sweepList_.push_back(id);
    }
    sweepCursor_ = 0;
    phase_ = GcPhase::Sweep;
}

void Heap::sweepOne() {
    const std::uint64_t id = sweepList_[sweepCursor_++];
    auto it = objects_.find(id);
    if (it == objects_.end() || it->second->color_ != GcColor::White) {
        return;
    }
    Object* object = it->second.get();
    if (auto* text = dynamic_cast<StringObject*>(object)) {
        strings_.erase(std::string_view(text->text()));
    }
    objectIds_.erase(object);
    objects_.erase(it);
    ++stats_.objectsFreed;
}

void Heap::finishCycle() {
    phase_ = GcPhase::Idle;
    sweepList_.clear();
    sweepCursor_ = 0;
    ++stats_.cyclesCompleted;
    allocatedSinceCycle_ = 0;
    threshold_ = std::max<std::size_t>(
        std::max<std::size_t>(1, options_.pauseObjects),
        objects_.size() / 100 * options_.pausePercent);
}

bool Heap::collect(std::size_t workUnits) {
    if (phase_ == GcPhase::Idle) {
        beginCycle();
    }

    std::size_t budget = workUnits == 0 ? 1 : workUnits;
    while (budget > 0) {
        if (phase_ == GcPhase::Mark) {
            if (!grayQueue_.empty()) {
                Object* object = grayQueue_.back();
                grayQueue_.pop_back();
                object->color_ = GcColor::Black;
                object->trace(*this);
                if (object->retraceAtAtomic()) {
                    grayAgain_.push_back(object);
                }
            } else {
                finishMarking();
            }
            --budget;
            continue;
        }

        if (phase_ == GcPhase::Sweep) {
            if (sweepCursor_ >= sweepList_.size()) {
                finishCycle();
                return true;
            }
            sweepOne();
            --budget;
            continue;
        }

        break;
    }
    return false;
}

std::size_t Heap::collectFull() {
    const std::size_t freedBefore = stats_.objectsFreed;
    const std::size_t unbounded = std::numeric_limits<std::size_t>::max();
    while (phase_ != GcPhase::Idle) {
        collect(unbounded);
    }
    collect(unbounded);
    return stats_.objectsFreed - freedBefore;
}

} // namespace lunar

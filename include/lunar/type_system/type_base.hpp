#pragma once

#include "lunar/value.hpp"

#include <cstdint>
#include <string>

namespace lunar {

class Heap;
class Object;

enum class GcColor : std::uint8_t {
    White,
    Gray,
    Black
};

class Type {
public:
    virtual ~Type() = default;
    virtual const char* name() const = 0;
    // Default rendering is "<name>: 0x<object id>".
    virtual std::string __str__(const Object& self) const;
};

class Object {
public:
    virtual ~Object() = default;
    virtual const Type& getType() const = 0;
    // Report every heap reference held by this object to the collector.
    virtual void trace(Heap& heap) const { (void)heap; }
    // Objects whose references change without write barriers (threads) are
    // traced again in the atomic step that ends marking.
    virtual bool retraceAtAtomic() const { return false; }

    std::uint64_t objectId() const { return objectId_; }
    GcColor color() const { return color_; }

private:
    friend class Heap;

    std::uint64_t objectId_{0};
    GcColor color_{GcColor::White};
};

} // namespace lunar

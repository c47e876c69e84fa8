#pragma once

#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"

#include <any>

namespace lunar {

class TableObject;

// Opaque host payload with an optional metatable.
class UserDataObject : public Object {
public:
    explicit UserDataObject(std::any payload);

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    std::any& payload() { return payload_; }
    const std::any& payload() const { return payload_; }

    Handle<TableObject> metatable() const { return metatable_; }
    void setMetatable(Heap& heap, Handle<TableObject> metatable);

private:
    std::any payload_;
    Handle<TableObject> metatable_;
};

class UserDataType : public Type {
public:
    static const UserDataType& instance();
    const char* name() const override;
};

} // namespace lunar

#include "lunar/type_system/userdata_type.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system/table_type.hpp"

namespace lunar {

UserDataObject::UserDataObject(std::any payload)
    : payload_(std::move(payload)) {}

const Type& UserDataObject::getType() const {
    return UserDataType::instance();
}

void UserDataObject::trace(Heap& heap) const {
    heap.markObject(metatable_.get());
}

void UserDataObject::setMetatable(Heap& heap, Handle<TableObject> metatable) {
    metatable_ = metatable;
    if (metatable) {
        heap.writeBarrier(*this);
    }
}

const UserDataType& UserDataType::instance() {
    static const UserDataType type;
    return type;
}

const char* UserDataType::name() const {
    return "userdata";
}

} // namespace lunar

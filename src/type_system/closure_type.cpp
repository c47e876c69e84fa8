#include "lunar/type_system/closure_type.hpp"
#include "lunar/heap.hpp"
#include "lunar/type_system/string_type.hpp"
#include "lunar/type_system/upvalue_type.hpp"

namespace lunar {

PrototypeObject::PrototypeObject(std::shared_ptr<const Prototype> prototype)
    : prototype_(std::move(prototype)) {
    if (!prototype_) {
        throw std::runtime_error("PrototypeObject requires a prototype");
    }
}

const Type& PrototypeObject::getType() const {
    return PrototypeType::instance();
}

void PrototypeObject::trace(Heap& heap) const {
    for (const auto& constant : constants_) {
        heap.markValue(constant);
    }
    for (const auto& child : children_) {
        heap.markObject(child.get());
    }
}

Handle<PrototypeObject> instantiatePrototype(Heap& heap, std::shared_ptr<const Prototype> prototype) {
    Handle<PrototypeObject> proto = heap.allocate<PrototypeObject>(std::move(prototype));
    const Prototype& source = proto->prototype();

    proto->constants_.reserve(source.constants.size());
    for (const auto& constant : source.constants) {
        switch (constant.kind) {
        case ConstantKind::Nil:
            proto->constants_.push_back(Value::Nil());
            break;
        case ConstantKind::Boolean:
            proto->constants_.push_back(Value::Boolean(constant.boolean));
            break;
        case ConstantKind::Integer:
            proto->constants_.push_back(Value::Integer(constant.integer));
            break;
        case ConstantKind::Float:
            proto->constants_.push_back(Value::Float(constant.number));
            break;
        case ConstantKind::String:
            proto->constants_.push_back(Value::String(heap.intern(constant.text).get()));
            break;
        }
    }

    proto->children_.reserve(source.prototypes.size());
    for (const auto& child : source.prototypes) {
        proto->children_.push_back(instantiatePrototype(heap, child));
    }
    heap.writeBarrier(*proto);
    return proto;
}

ClosureObject::ClosureObject(Handle<PrototypeObject> proto, std::vector<Handle<UpvalueObject>> upvalues)
    : proto_(proto), upvalues_(std::move(upvalues)) {}

const Type& ClosureObject::getType() const {
    return FunctionType::instance();
}

void ClosureObject::trace(Heap& heap) const {
    heap.markObject(proto_.get());
    for (const auto& upvalue : upvalues_) {
        heap.markObject(upvalue.get());
    }
}

const PrototypeType& PrototypeType::instance() {
    static const PrototypeType type;
    return type;
}

const char* PrototypeType::name() const {
    return "proto";
}

const FunctionType& FunctionType::instance() {
    static const FunctionType type;
    return type;
}

const char* FunctionType::name() const {
    return "function";
}

} // namespace lunar

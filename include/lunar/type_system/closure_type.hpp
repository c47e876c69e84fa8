#pragma once

#include "lunar/bytecode.hpp"
#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"

#include <memory>
#include <vector>

namespace lunar {

class UpvalueObject;

// Heap-resident view of a compiled Prototype: constants materialized as
// Values (strings interned) and nested prototypes instantiated.
class PrototypeObject : public Object {
public:
    explicit PrototypeObject(std::shared_ptr<const Prototype> prototype);

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    const Prototype& prototype() const { return *prototype_; }
    const std::vector<Value>& constants() const { return constants_; }
    Handle<PrototypeObject> child(std::size_t index) const { return children_.at(index); }

private:
    friend Handle<PrototypeObject> instantiatePrototype(Heap& heap, std::shared_ptr<const Prototype> prototype);

    std::shared_ptr<const Prototype> prototype_;
    std::vector<Value> constants_;
    std::vector<Handle<PrototypeObject>> children_;
};

Handle<PrototypeObject> instantiatePrototype(Heap& heap, std::shared_ptr<const Prototype> prototype);

class ClosureObject : public Object {
public:
    ClosureObject(Handle<PrototypeObject> proto, std::vector<Handle<UpvalueObject>> upvalues);

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    Handle<PrototypeObject> proto() const { return proto_; }
    const Prototype& prototype() const { return proto_->prototype(); }
    Handle<UpvalueObject> upvalue(std::size_t index) const { return upvalues_.at(index); }
    std::size_t upvalueCount() const { return upvalues_.size(); }

private:
    Handle<PrototypeObject> proto_;
    std::vector<Handle<UpvalueObject>> upvalues_;
};

class PrototypeType : public Type {
public:
    static const PrototypeType& instance();
    const char* name() const override;
};

class FunctionType : public Type {
public:
    static const FunctionType& instance();
    const char* name() const override;
};

} // namespace lunar

#pragma once

#include "lunar/binding.hpp"
#include "lunar/type_system/type_base.hpp"

#include <string>
#include <vector>

namespace lunar {

class NativeFunctionObject : public Object {
public:
    NativeFunctionObject(std::string name, NativeFunction function, std::vector<Value> upvalues = {});

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    const std::string& name() const { return name_; }
    const NativeFunction& function() const { return function_; }
    // Traced storage for state the callback keeps between calls.
    std::vector<Value>& upvalues() { return upvalues_; }
    const std::vector<Value>& upvalues() const { return upvalues_; }

private:
    std::string name_;
    NativeFunction function_;
    std::vector<Value> upvalues_;
};

class NativeFunctionType : public Type {
public:
    static const NativeFunctionType& instance();
    const char* name() const override;
    std::string __str__(const Object& self) const override;
};

} // namespace lunar

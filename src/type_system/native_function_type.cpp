#include "lunar/type_system/native_function_type.hpp"
#include "lunar/heap.hpp"

namespace lunar {

NativeFunctionObject::NativeFunctionObject(std::string name, NativeFunction function, std::vector<Value> upvalues)
    : name_(std::move(name)), function_(std::move(function)), upvalues_(std::move(upvalues)) {
    if (!function_) {
        throw std::runtime_error("Native function '" + name_ + "' has no callback");
    }
}

const Type& NativeFunctionObject::getType() const {
    return NativeFunctionType::instance();
}

void NativeFunctionObject::trace(Heap& heap) const {
    for (const auto& value : upvalues_) {
        heap.markValue(value);
    }
}

const NativeFunctionType& NativeFunctionType::instance() {
    static const NativeFunctionType type;
    return type;
}

const char* NativeFunctionType::name() const {
    return "function";
}

std::string NativeFunctionType::__str__(const Object& self) const {
    return Type::__str__(self) + " [native " + static_cast<const NativeFunctionObject&>(self).name() + "]";
}

} // namespace lunar

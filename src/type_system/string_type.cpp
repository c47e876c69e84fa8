#include "lunar/type_system/string_type.hpp"

#include <functional>

namespace lunar {

StringObject::StringObject(std::string text)
    : text_(std::move(text)), hash_(std::hash<std::string>{}(text_)) {}

const Type& StringObject::getType() const {
    return StringType::instance();
}

const StringType& StringType::instance() {
    static const StringType type;
    return type;
}

const char* StringType::name() const {
    return "string";
}

std::string StringType::__str__(const Object& self) const {
    return static_cast<const StringObject&>(self).text();
}

} // namespace lunar

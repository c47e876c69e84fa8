#include "lunar/type_system/type_base.hpp"

#include <cstdio>

namespace lunar {

std::string Type::__str__(const Object& self) const {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), ": 0x%08llx",
                  static_cast<unsigned long long>(self.objectId()));
    return std::string(name()) + buffer;
}

} // namespace lunar

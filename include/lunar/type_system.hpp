#pragma once

#include "lunar/type_system/closure_type.hpp"
#include "lunar/type_system/native_function_type.hpp"
#include "lunar/type_system/string_type.hpp"
#include "lunar/type_system/table_type.hpp"
#include "lunar/type_system/thread_type.hpp"
#include "lunar/type_system/type_base.hpp"
#include "lunar/type_system/upvalue_type.hpp"
#include "lunar/type_system/userdata_type.hpp"

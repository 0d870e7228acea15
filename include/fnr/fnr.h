#ifndef FNR_H
#define FNR_H

// Norwegian identity number library - Main include header
// Include this file to access validation and generation

#include "fnr/types.h"
#include "fnr/control_digits.h"
#include "fnr/validator.h"
#include "fnr/generator.h"

namespace fnr {

// Library version
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace fnr

#endif // FNR_H

// include/core/Version.hpp
#pragma once

namespace core {

#ifndef TRITFACTOR_VERSION_STRING
#define TRITFACTOR_VERSION_STRING "0.3.0"
#endif

inline constexpr const char* TRITFACTOR_VERSION = TRITFACTOR_VERSION_STRING;

} // namespace core

// include/util/PathUtils.hpp
#pragma once
#include <string>

namespace util {

// Directory of the running executable. Throws std::runtime_error.
std::string getExecutableDir();

} // namespace util

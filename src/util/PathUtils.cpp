// src/util/PathUtils.cpp
#include "util/PathUtils.hpp"

#include <unistd.h>
#include <stdexcept>

namespace util {

std::string getExecutableDir() {
    char buffer[1024];

    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer)-1);
    if (len == -1)
        throw std::runtime_error("Cannot get executable path (Linux).");
    buffer[len] = '\0';

    std::string fullPath(buffer);
    auto slash = fullPath.find_last_of('/');
    return slash == std::string::npos ? std::string(".") : fullPath.substr(0, slash);
}

} // namespace util

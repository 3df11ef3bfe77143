// include/util/StringUtils.hpp
#pragma once
#include <string>
#include <vector>

namespace util {

std::vector<std::string> split(const std::string& s, char sep);
std::string trim(const std::string& s);

} // namespace util

#include "util/StringUtils.hpp"
#include <cctype>

namespace util {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t i = 0, j;
    while ((j = s.find(sep, i)) != std::string::npos) {
        out.push_back(s.substr(i, j-i));
        i = j+1;
    }
    out.push_back(s.substr(i));
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

} // namespace util

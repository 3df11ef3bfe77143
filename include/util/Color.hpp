#ifndef UTIL_COLOR_HPP
#define UTIL_COLOR_HPP

#include <unistd.h>

namespace util {
    namespace Color {
        constexpr const char* RESET       = "\033[0m";
        constexpr const char* RED         = "\033[31m";
        constexpr const char* GREEN       = "\033[32m";
        constexpr const char* YELLOW      = "\033[33m";
        constexpr const char* CYAN        = "\033[36m";
        constexpr const char* BOLD_GREEN  = "\033[1;32m";

        // escape codes only when stdout is a terminal
        inline const char* use(const char* code) {
            static const bool tty = ::isatty(STDOUT_FILENO) != 0;
            return tty ? code : "";
        }
    }
}

#endif // UTIL_COLOR_HPP

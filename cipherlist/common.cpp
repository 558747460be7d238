#include "cipherlist/common.hpp"

#include <fmt/ostream.h>

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace cipherlist {

void unreachable(const char* msg) {
    if (msg) {
        fmt::print(std::cerr, "Unreachable code executed: {}.\n", msg);
    } else {
        fmt::print(std::cerr, "Unreachable code executed.\n");
    }
    std::cerr.flush();
    std::abort();
}

void assertion_failed_impl(const char* file, int line,
                           const char* condition, const char* message)
{
    if (message && std::strlen(message) > 0) {
        fmt::print(std::cerr, "Assertion `{}` failed: {}.\n", condition, message);
    } else {
        fmt::print(std::cerr, "Assertion `{}` failed.\n", condition);
    }
    fmt::print(std::cerr, "    (in {}:{})\n", file, line);
    std::cerr.flush();
    std::abort();
}

} // namespace cipherlist

#ifndef COMMON_COMMON_HPP
#define COMMON_COMMON_HPP

#include <fmt/ostream.h>

#include <exception>
#include <iostream>

/// Thrown to leave `main` early with the given exit code.
class exit_main {
public:
    int code = 0;

    exit_main(int code = 0): code(code) {}
};

/// Calls the function f and returns its result, which should be an int.
/// An `exit_main` exception ends the program with its exit code,
/// other exceptions are reported on stderr and end the program with code 1.
template<typename Func>
int cli_main(Func&& f) {
    try {
        return f();
    } catch (const exit_main& e) {
        return e.code;
    } catch (const std::exception& e) {
        fmt::print(std::cerr, "Fatal: {}.\n", e.what());
        return 1;
    }
}

#endif // COMMON_COMMON_HPP

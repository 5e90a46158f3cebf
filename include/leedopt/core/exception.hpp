#pragma once

#include <stdexcept>
#include <string>

namespace leedopt {

    // Base of every error raised by the library
    class Error : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
    };

    // Invalid user input: configuration keys and values, missing reference
    // files, solver executables that cannot be found or executed.
    class InputError : public Error {
        public:
            using Error::Error;
    };

    // Solver output that cannot be turned into an R-factor
    class ResultError : public Error {
        public:
            using Error::Error;
    };

} // namespace leedopt

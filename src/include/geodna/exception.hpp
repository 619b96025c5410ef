#pragma once

#include <stdexcept>
#include <string>

namespace geodna {

/** @class Exception
 *  @brief Base of every error raised by the GeoDNA library
 */
class Exception : public std::invalid_argument {
public:
    explicit Exception(const std::string &message) : std::invalid_argument(message) {}
};

/// Empty code, bad hemisphere marker, or a character outside the alphabet.
class InvalidCodeException : public Exception {
public:
    explicit InvalidCodeException(const std::string &message) : Exception(message) {}
};

/// Precision below 1.
class InvalidPrecisionException : public Exception {
public:
    explicit InvalidPrecisionException(const std::string &message) : Exception(message) {}
};

/// Non-finite coordinates, bad radius, unreadable WKT.
class InvalidInputException : public Exception {
public:
    explicit InvalidInputException(const std::string &message) : Exception(message) {}
};

} // namespace geodna

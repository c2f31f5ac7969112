#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace lshpp {

/**
 * @brief Category of a failure raised by the index or one of its components.
 *
 * A missing bucket is not an error: storage backends report it as an empty optional and the
 * index treats it as a bucket without members.
 */
enum class ErrorKind {
    kInvalidParameter,  // bad construction arguments
    kDimensionMismatch, // vector length differs from the configured dim
    kBackendFault,      // storage operation failed unexpectedly
    kUnbound,           // operation on an index without a hash family
};

const char* to_string(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Throw kDimensionMismatch unless got == expected.
 */
void check_dimension(std::size_t got, int expected);

} // namespace lshpp

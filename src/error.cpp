#include <lshpp/error.hpp>

#include <string>

using namespace std;

namespace lshpp {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::kInvalidParameter:
        return "invalid_parameter";
    case ErrorKind::kDimensionMismatch:
        return "dimension_mismatch";
    case ErrorKind::kBackendFault:
        return "backend_fault";
    case ErrorKind::kUnbound:
        return "unbound";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const string& message)
    : runtime_error(string(to_string(kind)) + ": " + message), kind_(kind) {}

void check_dimension(size_t got, int expected) {
    if (got != static_cast<size_t>(expected)) {
        throw Error(ErrorKind::kDimensionMismatch, "expected a vector of length " +
                                                       std::to_string(expected) + ", got " +
                                                       std::to_string(got));
    }
}

} // namespace lshpp

#include <lshpp/error.hpp>
#include <lshpp/params.hpp>

#include <cmath>
#include <string>

using namespace std;

namespace lshpp {

namespace {

[[noreturn]] void invalid(const string& what, const string& got) {
    throw Error(ErrorKind::kInvalidParameter, what + ", got " + got);
}

} // namespace

void LSHParams::validate() const {
    if (dim <= 0) {
        invalid("dim must be positive", std::to_string(dim));
    }
    if (n_projections <= 0) {
        invalid("n_projections must be positive", std::to_string(n_projections));
    }
    if (n_hash_tables <= 0) {
        invalid("n_hash_tables must be positive", std::to_string(n_hash_tables));
    }
}

void L2Params::validate() const {
    if (!(r > 0.0f) || !isfinite(r)) {
        invalid("r must be positive", std::to_string(r));
    }
}

void MIPSParams::validate() const {
    L2Params{r}.validate();
    if (!(U > 0.0f && U < 1.0f)) {
        invalid("U must lie in (0, 1)", std::to_string(U));
    }
    if (m <= 0) {
        invalid("m must be positive", std::to_string(m));
    }
    if (!(max_norm > 0.0f) || !isfinite(max_norm)) {
        invalid("max_norm must be positive", std::to_string(max_norm));
    }
}

} // namespace lshpp

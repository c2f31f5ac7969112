#include <lshpp/types.hpp>

namespace lshpp {

std::size_t SignatureHash::operator()(const Signature& sig) const {
    // https://stackoverflow.com/questions/20511347/a-good-hash-function-for-a-vector/72073933#72073933
    std::size_t seed = sig.size();
    for (int32_t v : sig) {
        uint32_t x = static_cast<uint32_t>(v);
        x = ((x >> 16) ^ x) * 0x45d9f3b;
        x = ((x >> 16) ^ x) * 0x45d9f3b;
        x = (x >> 16) ^ x;
        seed ^= x + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

} // namespace lshpp

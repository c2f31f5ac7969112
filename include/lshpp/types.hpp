#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <vector>

namespace lshpp {

/**
 * @brief A stored vector. Identity for delete purposes is value equality.
 */
using DataPoint = std::vector<float>;

/**
 * @brief Hash output of one hasher for one vector, one integer per projection. Used as the
 * bucket key within a single hash table.
 */
using Signature = std::vector<int32_t>;

/**
 * @brief Position of a vector in the global point store.
 */
using PointIndex = uint32_t;

/**
 * @brief Point indices sharing one signature within one hash table.
 */
using Bucket = std::unordered_set<PointIndex>;

/**
 * @brief Hash function for Signature.
 */
struct SignatureHash {
    std::size_t operator()(const Signature& sig) const;
};

} // namespace lshpp

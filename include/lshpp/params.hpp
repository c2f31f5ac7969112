#pragma once

#include <cstdint>

namespace lshpp {

/**
 * @brief Structural LSH parameters, fixed for the lifetime of an index.
 */
struct LSHParams {
    /**
     * @brief The number of projections (hash functions) per hash table, i.e. the signature
     * length. This parameter corresponds to an AND-amplification of the locality-sensitive
     * family. A higher value decreases the probability of finding a candidate neighbor.
     * Corresponds to 'r' in the amplified probability (1 - (1 - p^r)^b).
     */
    int n_projections;

    /**
     * @brief The number of hash tables. This parameter corresponds to an OR-amplification of
     * the locality-sensitive family. A higher value increases the probability of finding
     * a candidate neighbor. Corresponds to 'b' in the amplified probability (1 - (1 - p^r)^b).
     */
    int n_hash_tables;

    /**
     * @brief Dimensionality of every stored and queried vector.
     */
    int dim;

    /**
     * @brief Seed of the generator the per-table hasher seeds are drawn from. 0 seeds it from
     * std::random_device instead.
     */
    uint64_t seed = 0;

    /**
     * @brief Throw kInvalidParameter unless all counts are positive.
     */
    void validate() const;
};

/**
 * @brief L2 (p-stable) hash family parameters.
 */
struct L2Params {
    /**
     * @brief Quantization width of the projections. Larger values put vectors that are further
     * apart into the same bucket.
     */
    float r;

    void validate() const;
};

/**
 * @brief Asymmetric maximum inner product hash family parameters (L2-ALSH).
 */
struct MIPSParams {
    /**
     * @brief Quantization width of the underlying L2 hasher.
     */
    float r;

    /**
     * @brief Norm bound in (0, 1). Stored vectors are rescaled so their norm is at most U.
     */
    float U;

    /**
     * @brief Number of norm terms appended by the asymmetric transforms.
     */
    int m;

    /**
     * @brief Largest norm of the data that will be stored. Vectors are divided by it before
     * rescaling by U.
     */
    float max_norm = 1.0f;

    void validate() const;
};

} // namespace lshpp

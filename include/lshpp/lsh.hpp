#pragma once

#include <lshpp/hash.hpp>
#include <lshpp/params.hpp>
#include <lshpp/table/memory_table.hpp>
#include <lshpp/table/sqlite_table.hpp>
#include <lshpp/types.hpp>

#include <cstdint>
#include <iostream>
#include <random>
#include <utility>
#include <vector>

namespace lshpp {

/**
 * @class LSH
 * @brief Locality-sensitive hashing index over n_hash_tables (hasher, table) pairs that share
 * one dimensionality and one global point store.
 *
 * A vector collides with a query when both hash to the same signature in at least one table;
 * query results are the union of the colliding buckets over all tables.
 *
 * The index is not synchronized. Callers sharing an instance must serialize store and delete
 * calls against each other and against queries.
 *
 * @tparam Hasher L2, SignRandomProjections or MIPS.
 * @tparam Storage MemoryTable or SqliteTable.
 */
template <typename Hasher, typename Storage = MemoryTable> class LSH {
public:
    /**
     * @brief Initialize an index from already sampled hashers. Use Builder to sample them from
     * a seed.
     * @param params Structural parameters.
     * @param hashers One hasher per table, each of dimension params.dim.
     * @param storage Backend with params.n_hash_tables tables.
     * @throws Error(kInvalidParameter) if the hasher count, hasher dimensions or table count
     * do not match params.
     */
    LSH(const LSHParams& params, std::vector<Hasher> hashers, Storage storage);

    /**
     * @brief Store a single vector: append it to the point store once and insert its index
     * into the matching bucket of every table.
     * @throws Error(kDimensionMismatch) if v.size() != dim. Nothing is stored.
     * @throws Error(kBackendFault) if the backend fails.
     */
    void store_vec(const DataPoint& v);

    /**
     * @brief Store multiple vectors in order. Storage capacity is increased once up front.
     * @throws Error(kDimensionMismatch) if any vector has the wrong length. Nothing is stored.
     * @throws Error(kBackendFault) if the backend fails. Vectors before the failing one stay
     * stored.
     */
    void store_vecs(const std::vector<DataPoint>& vs);

    /**
     * @brief Query all buckets in the hash tables. The union of the matching buckets over the
     * hash tables is returned, in no particular order.
     * @param v Query vector.
     * @return Candidate neighbor vectors.
     */
    std::vector<DataPoint> query_bucket(const DataPoint& v) const;

    /**
     * @brief Like query_bucket, but returns indices in the global point store.
     */
    std::vector<PointIndex> query_bucket_ids(const DataPoint& v) const;

    /**
     * @brief Remove v from the bucket it hashes to in every table. The point store keeps its
     * slot, so memory is not freed. Deleting a vector that was never stored is a no-op.
     */
    void delete_vec(const DataPoint& v);

    /**
     * @brief Write bucket occupancy of the storage backend to os.
     */
    void describe(std::ostream& os = std::cout) const;

    int n_hash_tables() const { return params_.n_hash_tables; }
    int n_projections() const { return params_.n_projections; }
    int dim() const { return params_.dim; }
    uint64_t seed() const { return params_.seed; }
    const std::vector<Hasher>& hashers() const { return hashers_; }
    const Storage& storage() const { return storage_; }

private:
    LSHParams params_;
    std::vector<Hasher> hashers_;
    Storage storage_;

    Bucket bucket_union(const DataPoint& v) const;

    /**
     * @brief Template for query methods.
     * @tparam ResultType Either PointIndex for query_bucket_ids or DataPoint for query_bucket.
     */
    template <typename ResultType> std::vector<ResultType> query_impl(const DataPoint& v) const;
};

template <typename Hasher> using LshMem = LSH<Hasher, MemoryTable>;
template <typename Hasher> using LshSql = LSH<Hasher, SqliteTable>;

/**
 * @class Builder
 * @brief Collects the structural parameters and seed of an index, then binds it to a hash
 * family.
 *
 *     auto lsh = Builder(n_projections, n_hash_tables, dim).seed(1).srp();
 *
 * Binding draws one 64-bit seed per table, in table order, from std::mt19937_64 seeded with
 * the index seed (or from std::random_device if the seed is 0). Hasher i samples its
 * projections from std::mt19937_64 seeded with the i-th draw. A nonzero seed therefore
 * reproduces the whole index.
 */
class Builder {
public:
    /**
     * @brief Initialize the builder.
     * @param n_projections Hash length. Every projection creates one hashed integer.
     * @param n_hash_tables Increases the chance of finding the closest neighbors at a
     * performance and space cost.
     * @param dim Dimensions of the data points.
     * @throws Error(kInvalidParameter) if any value is not positive.
     */
    Builder(int n_projections, int n_hash_tables, int dim);

    /**
     * @brief Set the index seed. Only affects family selections made afterwards.
     * @param seed Seed of the hasher seed generator. 0 draws it from std::random_device.
     */
    Builder& seed(uint64_t seed);

    /**
     * @brief Set the MIPS norm bound to the largest norm in sample. Only affects mips()
     * selections made afterwards.
     */
    Builder& fit(const std::vector<DataPoint>& sample);

    /**
     * @brief Bind to the L2 family with quantization width r.
     */
    LSH<L2> l2(float r) const { return l2(r, MemoryTable(params_.n_hash_tables)); }

    template <typename Storage> LSH<L2, Storage> l2(float r, Storage storage) const {
        L2Params{r}.validate();
        auto hashers = sample_hashers<L2>([&](uint64_t s) {
            return L2(params_.dim, r, params_.n_projections, s);
        });
        return LSH<L2, Storage>(params_, std::move(hashers), std::move(storage));
    }

    /**
     * @brief Bind to the sign random projections family.
     */
    LSH<SignRandomProjections> srp() const { return srp(MemoryTable(params_.n_hash_tables)); }

    template <typename Storage> LSH<SignRandomProjections, Storage> srp(Storage storage) const {
        auto hashers = sample_hashers<SignRandomProjections>([&](uint64_t s) {
            return SignRandomProjections(params_.n_projections, params_.dim, s);
        });
        return LSH<SignRandomProjections, Storage>(params_, std::move(hashers),
                                                   std::move(storage));
    }

    /**
     * @brief Bind to the asymmetric MIPS family.
     * @param r Quantization width.
     * @param U Norm bound in (0, 1).
     * @param m Number of norm terms appended by the transforms.
     */
    LSH<MIPS> mips(float r, float U, int m) const {
        return mips(r, U, m, MemoryTable(params_.n_hash_tables));
    }

    template <typename Storage>
    LSH<MIPS, Storage> mips(float r, float U, int m, Storage storage) const {
        MIPSParams{r, U, m, max_norm_}.validate();
        auto hashers = sample_hashers<MIPS>([&](uint64_t s) {
            return MIPS(params_.dim, r, U, m, params_.n_projections, s, max_norm_);
        });
        return LSH<MIPS, Storage>(params_, std::move(hashers), std::move(storage));
    }

    const LSHParams& params() const { return params_; }

private:
    LSHParams params_;
    float max_norm_ = 1.0f;

    template <typename Hasher, typename MakeHasher>
    std::vector<Hasher> sample_hashers(MakeHasher make_hasher) const {
        std::mt19937_64 rng(params_.seed == 0 ? std::random_device{}() : params_.seed);
        std::vector<Hasher> hashers;
        hashers.reserve(params_.n_hash_tables);
        for (int i = 0; i < params_.n_hash_tables; ++i) {
            hashers.push_back(make_hasher(rng()));
        }
        return hashers;
    }
};

extern template class LSH<L2, MemoryTable>;
extern template class LSH<L2, SqliteTable>;
extern template class LSH<SignRandomProjections, MemoryTable>;
extern template class LSH<SignRandomProjections, SqliteTable>;
extern template class LSH<MIPS, MemoryTable>;
extern template class LSH<MIPS, SqliteTable>;

} // namespace lshpp

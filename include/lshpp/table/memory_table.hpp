#pragma once

#include <lshpp/types.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lshpp {

/**
 * @class MemoryTable
 * @brief In-memory storage backend: per hash table a map of signature -> bucket, plus one
 * growable point store shared by all tables.
 */
class MemoryTable {
public:
    using TableType = std::unordered_map<Signature, Bucket, SignatureHash>;

    /**
     * @brief Initialize n_hash_tables empty tables.
     * @throws Error(kInvalidParameter) if n_hash_tables is not positive.
     */
    explicit MemoryTable(int n_hash_tables);

    /**
     * @brief Record the vector and signature lengths of the index using this table.
     * @throws Error(kInvalidParameter) if the table was already bound to different lengths.
     */
    void bind_shape(int dim, int n_projections);

    /**
     * @brief Append a vector to the point store.
     * @return The global index of the appended vector.
     */
    PointIndex push_point(const DataPoint& v);

    /**
     * @brief Insert idx into the bucket of hash in table table_id. Inserting an index that is
     * already a member is a no-op.
     * @throws Error(kBackendFault) if table_id is out of range.
     */
    void put(const Signature& hash, PointIndex idx, int table_id);

    /**
     * @brief Members of the bucket of hash in table table_id, or nullopt if there is no such
     * bucket.
     */
    std::optional<Bucket> query_bucket(const Signature& hash, int table_id) const;

    /**
     * @brief Remove every index whose vector equals v from the bucket of hash in table
     * table_id. Removing a vector that is not in the bucket is a no-op.
     */
    void remove(const Signature& hash, const DataPoint& v, int table_id);

    /**
     * @brief Reserve room in the point store for size more vectors.
     */
    void increase_storage(std::size_t size);

    void commit() {}

    /**
     * @brief Resolve a global index to its vector.
     * @throws Error(kBackendFault) if idx was never returned by push_point.
     */
    const DataPoint& index_to_point(PointIndex idx) const;

    /**
     * @brief Write bucket occupancy of every table to os.
     */
    void describe(std::ostream& os = std::cout) const;

    std::size_t n_points() const { return points_.size(); }
    int n_hash_tables() const { return static_cast<int>(tables_.size()); }

private:
    std::vector<TableType> tables_;
    std::vector<DataPoint> points_;
    int dim_ = 0;
    int n_projections_ = 0;

    void check_table(int table_id) const;
};

} // namespace lshpp

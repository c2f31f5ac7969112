#include <lshpp/error.hpp>
#include <lshpp/table/memory_table.hpp>

#include <algorithm>
#include <limits>
#include <string>

using namespace std;

namespace lshpp {

MemoryTable::MemoryTable(int n_hash_tables) {
    if (n_hash_tables <= 0) {
        throw Error(ErrorKind::kInvalidParameter,
                    "n_hash_tables must be positive, got " + std::to_string(n_hash_tables));
    }
    tables_.resize(n_hash_tables);
}

void MemoryTable::bind_shape(int dim, int n_projections) {
    if (dim_ != 0 && (dim_ != dim || n_projections_ != n_projections)) {
        throw Error(ErrorKind::kInvalidParameter,
                    "table is bound to dim " + std::to_string(dim_) + " and " +
                        std::to_string(n_projections_) + " projections, requested dim " +
                        std::to_string(dim) + " and " + std::to_string(n_projections) +
                        " projections");
    }
    dim_ = dim;
    n_projections_ = n_projections;
}

void MemoryTable::check_table(int table_id) const {
    if (table_id < 0 || table_id >= n_hash_tables()) {
        throw Error(ErrorKind::kBackendFault,
                    "hash table " + std::to_string(table_id) + " does not exist");
    }
}

PointIndex MemoryTable::push_point(const DataPoint& v) {
    if (points_.size() > numeric_limits<PointIndex>::max()) {
        throw Error(ErrorKind::kBackendFault, "point store is full");
    }
    points_.push_back(v);
    return static_cast<PointIndex>(points_.size() - 1);
}

void MemoryTable::put(const Signature& hash, PointIndex idx, int table_id) {
    check_table(table_id);
    tables_[table_id][hash].insert(idx);
}

optional<Bucket> MemoryTable::query_bucket(const Signature& hash, int table_id) const {
    check_table(table_id);
    const TableType& t = tables_[table_id];
    auto it = t.find(hash);
    if (it == t.end()) {
        return nullopt;
    }
    return it->second;
}

void MemoryTable::remove(const Signature& hash, const DataPoint& v, int table_id) {
    check_table(table_id);
    TableType& t = tables_[table_id];
    auto it = t.find(hash);
    if (it == t.end()) {
        return;
    }

    Bucket& bucket = it->second;
    for (auto idx = bucket.begin(); idx != bucket.end();) {
        if (points_[*idx] == v) {
            idx = bucket.erase(idx);
        } else {
            ++idx;
        }
    }
    if (bucket.empty()) {
        t.erase(it);
    }
}

void MemoryTable::increase_storage(size_t size) {
    points_.reserve(points_.size() + size);
}

const DataPoint& MemoryTable::index_to_point(PointIndex idx) const {
    if (idx >= points_.size()) {
        throw Error(ErrorKind::kBackendFault, "point " + std::to_string(idx) + " does not exist");
    }
    return points_[idx];
}

void MemoryTable::describe(ostream& os) const {
    os << "MemoryTable: " << n_hash_tables() << " hash tables, " << points_.size()
       << " points" << endl;

    for (int i = 0; i < n_hash_tables(); ++i) {
        size_t n_entries = 0;
        size_t largest = 0;
        for (const auto& [signature, bucket] : tables_[i]) {
            n_entries += bucket.size();
            largest = max(largest, bucket.size());
        }
        os << "  table " << i << ": " << tables_[i].size() << " buckets, " << n_entries
           << " entries, largest bucket " << largest << endl;
    }
}

} // namespace lshpp

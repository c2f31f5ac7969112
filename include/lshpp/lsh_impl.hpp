#pragma once

// Member definitions of LSH. src/lsh.cpp instantiates them for the bundled hashers and
// backends; include this header to instantiate LSH for other Hasher or Storage types.

#include <lshpp/error.hpp>
#include <lshpp/lsh.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace lshpp {

template <typename Hasher, typename Storage>
LSH<Hasher, Storage>::LSH(const LSHParams& params, std::vector<Hasher> hashers, Storage storage)
    : params_(params), hashers_(std::move(hashers)), storage_(std::move(storage)) {
    params_.validate();
    if (static_cast<int>(hashers_.size()) != params_.n_hash_tables) {
        throw Error(ErrorKind::kInvalidParameter,
                    "expected " + std::to_string(params_.n_hash_tables) + " hashers, got " +
                        std::to_string(hashers_.size()));
    }
    if (storage_.n_hash_tables() != params_.n_hash_tables) {
        throw Error(ErrorKind::kInvalidParameter,
                    "expected storage with " + std::to_string(params_.n_hash_tables) +
                        " tables, got " + std::to_string(storage_.n_hash_tables()));
    }
    for (const Hasher& hasher : hashers_) {
        if (hasher.dim() != params_.dim || hasher.n_projections() != params_.n_projections) {
            throw Error(ErrorKind::kInvalidParameter,
                        "hasher shape does not match the index parameters");
        }
    }
    storage_.bind_shape(params_.dim, params_.n_projections);
}

template <typename Hasher, typename Storage>
void LSH<Hasher, Storage>::store_vec(const DataPoint& v) {
    check_dimension(v.size(), params_.dim);

    // hash first, a failing hasher must not leave an orphan point
    std::vector<Signature> hashes;
    hashes.reserve(hashers_.size());
    for (const Hasher& hasher : hashers_) {
        hashes.push_back(hasher.hash_vec_put(v));
    }

    PointIndex idx = storage_.push_point(v);
    for (int i = 0; i < params_.n_hash_tables; ++i) {
        storage_.put(hashes[i], idx, i);
    }
}

template <typename Hasher, typename Storage>
void LSH<Hasher, Storage>::store_vecs(const std::vector<DataPoint>& vs) {
    for (const DataPoint& v : vs) {
        check_dimension(v.size(), params_.dim);
    }
    auto start_time = std::chrono::high_resolution_clock::now();

    storage_.increase_storage(vs.size());
    try {
        for (const DataPoint& v : vs) {
            store_vec(v);
        }
    } catch (...) {
        // keep the vectors stored so far and close the batch
        storage_.commit();
        throw;
    }
    storage_.commit();

    auto end_time = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> store_time = end_time - start_time;
    std::clog << "Store completed in " << store_time.count() << " sec (" << vs.size()
              << " vectors)" << std::endl;
}

template <typename Hasher, typename Storage>
Bucket LSH<Hasher, Storage>::bucket_union(const DataPoint& v) const {
    check_dimension(v.size(), params_.dim);

    Bucket candidates;
    for (int i = 0; i < params_.n_hash_tables; ++i) {
        Signature hash = hashers_[i].hash_vec_query(v);

        // a missing bucket contributes no candidates
        std::optional<Bucket> bucket = storage_.query_bucket(hash, i);
        if (bucket) {
            candidates.insert(bucket->begin(), bucket->end());
        }
    }
    return candidates;
}

template <typename Hasher, typename Storage>
template <typename ResultType>
std::vector<ResultType> LSH<Hasher, Storage>::query_impl(const DataPoint& v) const {
    Bucket candidates = bucket_union(v);

    std::vector<ResultType> results;
    results.reserve(candidates.size());
    if constexpr (std::is_same_v<ResultType, PointIndex>) {
        results.assign(candidates.begin(), candidates.end());
    } else { // std::is_same_v<ResultType, DataPoint>
        for (PointIndex idx : candidates) {
            results.push_back(storage_.index_to_point(idx));
        }
    }
    return results;
}

template <typename Hasher, typename Storage>
std::vector<DataPoint> LSH<Hasher, Storage>::query_bucket(const DataPoint& v) const {
    return query_impl<DataPoint>(v);
}

template <typename Hasher, typename Storage>
std::vector<PointIndex> LSH<Hasher, Storage>::query_bucket_ids(const DataPoint& v) const {
    return query_impl<PointIndex>(v);
}

template <typename Hasher, typename Storage>
void LSH<Hasher, Storage>::delete_vec(const DataPoint& v) {
    check_dimension(v.size(), params_.dim);

    // the query hash finds the bucket a query for v would look in
    for (int i = 0; i < params_.n_hash_tables; ++i) {
        Signature hash = hashers_[i].hash_vec_query(v);
        storage_.remove(hash, v, i);
    }
}

template <typename Hasher, typename Storage>
void LSH<Hasher, Storage>::describe(std::ostream& os) const {
    storage_.describe(os);
}

} // namespace lshpp

#pragma once

#include <lshpp/lsh.hpp>
#include <lshpp/types.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace lshpp {

/**
 * @class Index
 * @brief Type-erased LSH index for language bindings: one constructor per hash family and
 * the per-instance operations, with failures reported as lshpp::Error.
 *
 * A default-constructed Index is unbound; every operation on it throws Error(kUnbound).
 */
class Index {
public:
    Index() = default;

    /**
     * @brief L2 index. An empty db_path keeps the tables in memory, otherwise they are
     * stored in the SQLite database at db_path.
     */
    static Index l2(int n_projections, int n_hash_tables, int dim, float r, uint64_t seed,
                    const std::string& db_path = "");

    static Index mips(int n_projections, int n_hash_tables, int dim, float r, float U, int m,
                      uint64_t seed, const std::string& db_path = "");

    /**
     * @brief MIPS index whose norm bound is the largest norm in sample.
     */
    static Index mips(int n_projections, int n_hash_tables, int dim, float r, float U, int m,
                      uint64_t seed, const std::vector<DataPoint>& sample,
                      const std::string& db_path = "");

    static Index srp(int n_projections, int n_hash_tables, int dim, uint64_t seed,
                     const std::string& db_path = "");

    void store_vec(const DataPoint& v);
    void store_vecs(const std::vector<DataPoint>& vs);
    std::vector<DataPoint> query_bucket(const DataPoint& v) const;
    std::vector<PointIndex> query_bucket_idx(const DataPoint& v) const;
    void delete_vec(const DataPoint& v);
    void describe(std::ostream& os = std::cout) const;

    bool bound() const { return !std::holds_alternative<std::monostate>(lsh_); }

    /**
     * @brief "l2", "mips", "srp" or "unbound".
     */
    std::string family() const;

private:
    using LshVariant =
        std::variant<std::monostate, LshMem<L2>, LshSql<L2>, LshMem<MIPS>, LshSql<MIPS>,
                     LshMem<SignRandomProjections>, LshSql<SignRandomProjections>>;

    LshVariant lsh_;

    template <typename Lsh> explicit Index(Lsh lsh) : lsh_(std::move(lsh)) {}

    template <typename Fn> decltype(auto) dispatch(Fn&& fn);
    template <typename Fn> decltype(auto) dispatch(Fn&& fn) const;
};

} // namespace lshpp

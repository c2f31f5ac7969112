#include <lshpp/error.hpp>
#include <lshpp/index.hpp>

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

using namespace std;

namespace lshpp {

namespace {

template <typename T, typename Hasher>
constexpr bool is_lsh_of_v = is_same_v<T, LshMem<Hasher>> || is_same_v<T, LshSql<Hasher>>;

} // namespace

template <typename Fn> decltype(auto) Index::dispatch(Fn&& fn) {
    using Result = invoke_result_t<Fn, LshMem<L2>&>;
    return visit(
        [&](auto& lsh) -> Result {
            if constexpr (is_same_v<decay_t<decltype(lsh)>, monostate>) {
                throw Error(ErrorKind::kUnbound, "index is not bound to a hash family");
            } else {
                return fn(lsh);
            }
        },
        lsh_);
}

template <typename Fn> decltype(auto) Index::dispatch(Fn&& fn) const {
    using Result = invoke_result_t<Fn, const LshMem<L2>&>;
    return visit(
        [&](const auto& lsh) -> Result {
            if constexpr (is_same_v<decay_t<decltype(lsh)>, monostate>) {
                throw Error(ErrorKind::kUnbound, "index is not bound to a hash family");
            } else {
                return fn(lsh);
            }
        },
        lsh_);
}

Index Index::l2(int n_projections, int n_hash_tables, int dim, float r, uint64_t seed,
                const string& db_path) {
    Builder builder(n_projections, n_hash_tables, dim);
    builder.seed(seed);
    L2Params{r}.validate();

    if (db_path.empty()) {
        return Index(builder.l2(r));
    }
    return Index(builder.l2(r, SqliteTable(n_hash_tables, db_path)));
}

Index Index::mips(int n_projections, int n_hash_tables, int dim, float r, float U, int m,
                  uint64_t seed, const string& db_path) {
    return mips(n_projections, n_hash_tables, dim, r, U, m, seed, {}, db_path);
}

Index Index::mips(int n_projections, int n_hash_tables, int dim, float r, float U, int m,
                  uint64_t seed, const vector<DataPoint>& sample, const string& db_path) {
    Builder builder(n_projections, n_hash_tables, dim);
    builder.seed(seed);
    if (!sample.empty()) {
        builder.fit(sample);
    }
    MIPSParams{r, U, m}.validate();

    if (db_path.empty()) {
        return Index(builder.mips(r, U, m));
    }
    return Index(builder.mips(r, U, m, SqliteTable(n_hash_tables, db_path)));
}

Index Index::srp(int n_projections, int n_hash_tables, int dim, uint64_t seed,
                 const string& db_path) {
    Builder builder(n_projections, n_hash_tables, dim);
    builder.seed(seed);

    if (db_path.empty()) {
        return Index(builder.srp());
    }
    return Index(builder.srp(SqliteTable(n_hash_tables, db_path)));
}

void Index::store_vec(const DataPoint& v) {
    dispatch([&](auto& lsh) { lsh.store_vec(v); });
}

void Index::store_vecs(const vector<DataPoint>& vs) {
    dispatch([&](auto& lsh) { lsh.store_vecs(vs); });
}

vector<DataPoint> Index::query_bucket(const DataPoint& v) const {
    return dispatch([&](const auto& lsh) { return lsh.query_bucket(v); });
}

vector<PointIndex> Index::query_bucket_idx(const DataPoint& v) const {
    return dispatch([&](const auto& lsh) { return lsh.query_bucket_ids(v); });
}

void Index::delete_vec(const DataPoint& v) {
    dispatch([&](auto& lsh) { lsh.delete_vec(v); });
}

void Index::describe(ostream& os) const {
    dispatch([&](const auto& lsh) { lsh.describe(os); });
}

string Index::family() const {
    return visit(
        [](const auto& lsh) -> string {
            using T = decay_t<decltype(lsh)>;
            if constexpr (is_lsh_of_v<T, L2>) {
                return "l2";
            } else if constexpr (is_lsh_of_v<T, MIPS>) {
                return "mips";
            } else if constexpr (is_lsh_of_v<T, SignRandomProjections>) {
                return "srp";
            } else {
                return "unbound";
            }
        },
        lsh_);
}

} // namespace lshpp

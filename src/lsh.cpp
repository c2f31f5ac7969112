#include <lshpp/error.hpp>
#include <lshpp/lsh.hpp>
#include <lshpp/lsh_impl.hpp>

#include <vector>

using namespace std;

namespace lshpp {

// ================== LSH ==================

template class LSH<L2, MemoryTable>;
template class LSH<L2, SqliteTable>;
template class LSH<SignRandomProjections, MemoryTable>;
template class LSH<SignRandomProjections, SqliteTable>;
template class LSH<MIPS, MemoryTable>;
template class LSH<MIPS, SqliteTable>;

// ================== Builder ==================

Builder::Builder(int n_projections, int n_hash_tables, int dim)
    : params_{n_projections, n_hash_tables, dim} {
    params_.validate();
}

Builder& Builder::seed(uint64_t seed) {
    params_.seed = seed;
    return *this;
}

Builder& Builder::fit(const vector<DataPoint>& sample) {
    for (const DataPoint& v : sample) {
        check_dimension(v.size(), params_.dim);
    }
    float max_norm = MIPS::max_norm_of(sample);
    if (!(max_norm > 0.0f)) {
        throw Error(ErrorKind::kInvalidParameter, "cannot fit to a sample without nonzero vectors");
    }
    max_norm_ = max_norm;
    return *this;
}

} // namespace lshpp

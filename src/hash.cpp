#include <lshpp/error.hpp>
#include <lshpp/hash.hpp>
#include <lshpp/params.hpp>

#include <Eigen/Dense>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

using namespace Eigen;
using namespace std;

namespace lshpp {

namespace {

/**
 * @brief Sample a rows x cols matrix of independent N(0, 1) entries.
 */
MatrixXf generate_random_projections(int rows, int cols, mt19937_64& rng) {
    normal_distribution<float> normal_dist(0.0f, 1.0f);
    MatrixXf random_vecs(rows, cols);

    for (int i = 0; i < rows; ++i) {
        for (int j = 0; j < cols; ++j) {
            random_vecs(i, j) = normal_dist(rng);
        }
    }
    return random_vecs;
}

Signature to_signature(const VectorXi& h) {
    return Signature(h.data(), h.data() + h.size());
}

Map<const VectorXf> as_eigen(const DataPoint& v) {
    return Map<const VectorXf>(v.data(), static_cast<Eigen::Index>(v.size()));
}

} // namespace

// ================== L2 ==================

L2::L2(int dim, float r, int n_projections, uint64_t seed)
    : dim_(dim), n_projections_(n_projections), r_(r) {
    LSHParams{n_projections, 1, dim}.validate();
    L2Params{r}.validate();

    mt19937_64 rng(seed);
    a_ = generate_random_projections(n_projections, dim, rng);
    uniform_real_distribution<float> uniform_dist(0.0f, r);
    b_.resize(n_projections);
    for (int i = 0; i < n_projections; ++i) {
        b_(i) = uniform_dist(rng);
    }
}

Signature L2::hash(const Ref<const VectorXf>& x) const {
    // saturate to the int32 range, NaN hashes to 0
    ArrayXd prod = ((a_ * x + b_) / r_).array().cast<double>().floor();
    ArrayXd clamped = prod.max(static_cast<double>(numeric_limits<int32_t>::min()))
                          .min(static_cast<double>(numeric_limits<int32_t>::max()));
    ArrayXd h = prod.isNaN().select(ArrayXd::Zero(prod.size()), clamped);
    return to_signature(h.cast<int>().matrix());
}

Signature L2::hash_vec_put(const DataPoint& v) const {
    check_dimension(v.size(), dim_);
    return hash(as_eigen(v));
}

Signature L2::hash_vec_query(const DataPoint& v) const {
    return hash_vec_put(v);
}

// ================== SignRandomProjections ==================

SignRandomProjections::SignRandomProjections(int n_projections, int dim, uint64_t seed)
    : dim_(dim), n_projections_(n_projections) {
    LSHParams{n_projections, 1, dim}.validate();

    mt19937_64 rng(seed);
    hyperplanes_ = generate_random_projections(n_projections, dim, rng);

    // project onto the unit sphere
    VectorXf norms = hyperplanes_.rowwise().norm();
    hyperplanes_ = hyperplanes_.cwiseQuotient(norms.replicate(1, dim));
}

Signature SignRandomProjections::hash(const DataPoint& v) const {
    check_dimension(v.size(), dim_);
    VectorXf prod = hyperplanes_ * as_eigen(v);
    return to_signature((prod.array() > 0.0f).cast<int>().matrix());
}

Signature SignRandomProjections::hash_vec_put(const DataPoint& v) const {
    return hash(v);
}

Signature SignRandomProjections::hash_vec_query(const DataPoint& v) const {
    return hash(v);
}

// ================== MIPS ==================

namespace {

int augmented_dim(int dim, float r, float U, int m, float max_norm) {
    if (dim <= 0) {
        throw Error(ErrorKind::kInvalidParameter,
                    "dim must be positive, got " + std::to_string(dim));
    }
    MIPSParams{r, U, m, max_norm}.validate();
    return dim + m;
}

} // namespace

MIPS::MIPS(int dim, float r, float U, int m, int n_projections, uint64_t seed, float max_norm)
    : dim_(dim), U_(U), m_(m), max_norm_(max_norm),
      hasher_(augmented_dim(dim, r, U, m, max_norm), r, n_projections, seed) {}

VectorXf MIPS::transform_put(const DataPoint& v) const {
    check_dimension(v.size(), dim_);
    VectorXf x_new(dim_ + m_);

    // shrink the norm below U < 1 so the appended powers vanish
    x_new.head(dim_) = as_eigen(v) * (U_ / max_norm_);
    float norm_pow = x_new.head(dim_).squaredNorm();
    for (int i = 0; i < m_; ++i) {
        x_new(dim_ + i) = norm_pow;
        norm_pow *= norm_pow;
    }
    return x_new;
}

VectorXf MIPS::transform_query(const DataPoint& v) const {
    check_dimension(v.size(), dim_);
    VectorXf x_new(dim_ + m_);

    float norm = as_eigen(v).norm();
    if (norm > 0.0f) {
        x_new.head(dim_) = as_eigen(v) / norm;
    } else {
        x_new.head(dim_).setZero();
    }
    x_new.tail(m_).setConstant(0.5f);
    return x_new;
}

Signature MIPS::hash_vec_put(const DataPoint& v) const {
    return hasher_.hash(transform_put(v));
}

Signature MIPS::hash_vec_query(const DataPoint& v) const {
    return hasher_.hash(transform_query(v));
}

float MIPS::max_norm_of(const vector<DataPoint>& vs) {
    float max_norm = 0.0f;
    for (const DataPoint& v : vs) {
        max_norm = max(max_norm, as_eigen(v).norm());
    }
    return max_norm;
}

} // namespace lshpp

#pragma once

#include <lshpp/types.hpp>

#include <Eigen/Dense>
#include <cstdint>
#include <vector>

namespace lshpp {

class MIPS;

/**
 * @class L2
 * @brief p-stable LSH for Euclidean distance.
 *
 * See https://www.cs.princeton.edu/courses/archive/spring05/cos598E/bib/p253-datar.pdf,
 * section 3.2. Every projection i computes h_i(v) = floor((a_i . v + b_i) / r) with
 * a_i ~ N(0, 1)^dim and b_i ~ U[0, r).
 */
class L2 {
public:
    /**
     * @brief Initialize the L2 hasher.
     * @param dim Dimensionality of the hashed vectors.
     * @param r Quantization width. Must be positive.
     * @param n_projections Signature length.
     * @param seed Seed of the generator the projections are sampled from.
     * @throws Error(kInvalidParameter) on a zero dimension or non-positive r.
     */
    L2(int dim, float r, int n_projections, uint64_t seed);

    /**
     * @brief Hash a vector for insertion.
     * @throws Error(kDimensionMismatch) if v.size() != dim.
     */
    Signature hash_vec_put(const DataPoint& v) const;

    /**
     * @brief Hash a query vector. Identical to hash_vec_put.
     * @throws Error(kDimensionMismatch) if v.size() != dim.
     */
    Signature hash_vec_query(const DataPoint& v) const;

    int dim() const { return dim_; }
    int n_projections() const { return n_projections_; }
    float r() const { return r_; }

private:
    friend class MIPS;

    int dim_;
    int n_projections_;
    float r_;
    Eigen::MatrixXf a_;
    Eigen::VectorXf b_;

    /**
     * @brief Hash a vector of the right length without checking it.
     */
    Signature hash(const Eigen::Ref<const Eigen::VectorXf>& x) const;
};

/**
 * @class SignRandomProjections
 * @brief Sign random projections approximate cosine distance between vectors.
 *
 * Projections are random unit vectors; bit i of the signature is 1 if the vector lies on the
 * positive side of hyperplane i and 0 otherwise.
 */
class SignRandomProjections {
public:
    /**
     * @brief Initialize the SignRandomProjections hasher.
     * @param n_projections The number of random hyperplanes.
     * @param dim Dimensionality of the hashed vectors.
     * @param seed Seed of the generator the hyperplanes are sampled from.
     * @throws Error(kInvalidParameter) on a zero dimension or projection count.
     */
    SignRandomProjections(int n_projections, int dim, uint64_t seed);

    Signature hash_vec_put(const DataPoint& v) const;
    Signature hash_vec_query(const DataPoint& v) const;

    int dim() const { return dim_; }
    int n_projections() const { return n_projections_; }

private:
    int dim_;
    int n_projections_;
    Eigen::MatrixXf hyperplanes_;

    Signature hash(const DataPoint& v) const;
};

/**
 * @class MIPS
 * @brief Asymmetric LSH for maximum inner product search (L2-ALSH).
 *
 * See https://arxiv.org/abs/1405.5869 and https://www.cs.rice.edu/~as143/Papers/SLIDE_MLSys.pdf.
 * Stored and query vectors are embedded differently into dim + m dimensions before an L2
 * hash is applied:
 *
 *     P(x) = [s; |s|^2; |s|^4; ...; |s|^(2^m)],  s = U * x / max_norm
 *     Q(q) = [q / |q|; 1/2; ...; 1/2]
 *
 * so that |Q(q) - P(x)|^2 = 1 + m / 4 - 2 * U * (q . x) / (|q| * max_norm) + |s|^(2^(m+1)),
 * which is small when the inner product q . x is large.
 */
class MIPS {
public:
    /**
     * @brief Initialize the MIPS hasher.
     * @param dim Dimensionality of the hashed vectors (before the transforms).
     * @param r Quantization width of the underlying L2 hasher.
     * @param U Norm bound in (0, 1) the stored vectors are rescaled to.
     * @param m Number of norm terms appended by the transforms.
     * @param n_projections Signature length.
     * @param seed Seed of the generator the projections are sampled from.
     * @param max_norm Largest norm of the vectors that will be stored.
     * @throws Error(kInvalidParameter) on a zero dimension, non-positive r, U outside (0, 1),
     * non-positive m or non-positive max_norm.
     */
    MIPS(int dim, float r, float U, int m, int n_projections, uint64_t seed,
         float max_norm = 1.0f);

    /**
     * @brief Hash a vector for insertion, under the P transform.
     * @throws Error(kDimensionMismatch) if v.size() != dim.
     */
    Signature hash_vec_put(const DataPoint& v) const;

    /**
     * @brief Hash a query vector, under the Q transform.
     * @throws Error(kDimensionMismatch) if v.size() != dim.
     */
    Signature hash_vec_query(const DataPoint& v) const;

    Eigen::VectorXf transform_put(const DataPoint& v) const;
    Eigen::VectorXf transform_query(const DataPoint& v) const;

    int dim() const { return dim_; }
    int n_projections() const { return hasher_.n_projections(); }
    float U() const { return U_; }
    int m() const { return m_; }
    float max_norm() const { return max_norm_; }

    /**
     * @brief Largest L2 norm among vs, 0 if vs is empty. Used to derive max_norm from a
     * sample of the data before the hasher is created.
     */
    static float max_norm_of(const std::vector<DataPoint>& vs);

private:
    int dim_;
    float U_;
    int m_;
    float max_norm_;
    L2 hasher_;
};

} // namespace lshpp

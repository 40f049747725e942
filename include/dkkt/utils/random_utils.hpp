// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_UTILS_RANDOM_UTILS_HPP
#define DKKT_UTILS_RANDOM_UTILS_HPP

#include <random>

#include "dkkt/typedefs.hpp"
#include "dkkt/kkt_input.hpp"

namespace dkkt
{

namespace rand
{

// fixed seed, test problems are reproducible
inline std::mt19937 gen(42);
inline std::normal_distribution<double> normal_dist;

template<typename T>
T normal_rand()
{
    return T(normal_dist(gen));
}

template<typename T>
Vec<T> vector_rand(isize n)
{
    return Vec<T>::NullaryExpr(n, [] { return normal_rand<T>(); });
}

template<typename T>
Mat<T> dense_matrix_rand(isize rows, isize cols)
{
    return Mat<T>::NullaryExpr(rows, cols, [] { return normal_rand<T>(); });
}

// product of two random factors with inner dimension rank
template<typename T>
Mat<T> dense_rank_deficient_rand(isize rows, isize cols, isize rank)
{
    Mat<T> left = dense_matrix_rand<T>(rows, rank);
    Mat<T> right = dense_matrix_rand<T>(rank, cols);
    return left * right;
}

// M M^T + rho I, the smallest eigenvalue is at least rho
template<typename T>
Mat<T> dense_positive_definite_rand(isize n, T rho = T(1e-2))
{
    Mat<T> M = dense_matrix_rand<T>(n, n);
    Mat<T> P = M * M.transpose();
    P.diagonal().array() += rho;
    return P;
}

/**
 * Equality constrained problem with an SPD Q and a consistent right hand
 * side B = A X_feas, so that the KKT system is nonsingular as long as A
 * has full row rank.
 */
template<typename T>
KKTInput<T> dense_strongly_convex_kkt(isize dim, isize n_eq, isize n_rhs = 1, T strong_convexity_factor = T(1e-2))
{
    Mat<T> Q = dense_positive_definite_rand<T>(dim, strong_convexity_factor);
    Mat<T> C = dense_matrix_rand<T>(dim, n_rhs);

    if (n_eq == 0) {
        return KKTInput<T>(Q, C);
    }

    Mat<T> A = dense_matrix_rand<T>(n_eq, dim);
    Mat<T> X_feas = dense_matrix_rand<T>(dim, n_rhs);
    Mat<T> B = A * X_feas;

    return KKTInput<T>(Q, C, A, B);
}

} // namespace rand

} // namespace dkkt

#endif //DKKT_UTILS_RANDOM_UTILS_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <cmath>
#include <stdexcept>
#include <vector>

#include "dkkt/dkkt.hpp"
#include "dkkt/utils/random_utils.hpp"

#include "gtest/gtest.h"
#include "utils.hpp"

using namespace dkkt;
using namespace dkkt::dense;

using T = double;

TEST(DenseLU, SolveRandom)
{
    isize dim = 50;

    Mat<T> A = rand::dense_matrix_rand<T>(dim, dim);
    Mat<T> B = rand::dense_matrix_rand<T>(dim, 3);

    LU<T> lu(dim);
    lu.compute(A);
    ASSERT_TRUE(lu.is_computed());
    EXPECT_TRUE(lu.is_nonsingular());
    EXPECT_TRUE(lu.is_solvable());
    EXPECT_EQ(lu.rank(), dim);

    Mat<T> X = lu.solve(B);
    EXPECT_TRUE(B.isApprox(A * X, 1e-8));

    Mat<T> Y = lu.solve_transposed(B);
    EXPECT_TRUE(B.isApprox(A.transpose() * Y, 1e-8));

    Mat<T> A_inv = lu.inverse();
    EXPECT_TRUE(Mat<T>::Identity(dim, dim).isApprox(A * A_inv, 1e-8));

    EXPECT_TRUE(A.isApprox(lu.reconstructed_matrix(), 1e-8));
}

TEST(DenseLU, Factors)
{
    isize dim = 20;

    Mat<T> A = rand::dense_matrix_rand<T>(dim, dim);

    LU<T> lu;
    lu.compute(A);

    Mat<T> L = lu.matrix_l();
    Mat<T> U = lu.matrix_u();
    assert_dense_triangular<T, Eigen::Lower>(L);
    assert_dense_triangular<T, Eigen::Upper>(U);
    EXPECT_TRUE(L.diagonal().isOnes());

    // partial pivoting bounds the multipliers
    EXPECT_LE(L.cwiseAbs().maxCoeff(), T(1));

    Mat<T> PA = lu.permutation().apply_to_rows(A);
    EXPECT_TRUE(PA.isApprox(L * U, 1e-8));
}

TEST(DenseLU, RowExchange)
{
    Mat<T> A(2, 2); A << 0, 1,
                         1, 0;

    LU<T> lu;
    lu.compute(A);

    const Permutation& perm = lu.permutation();
    EXPECT_EQ(perm.order(), std::vector<isize>({1, 0}));
    EXPECT_EQ(perm.signum(), -1);
    EXPECT_TRUE(perm.is_modified());

    EXPECT_EQ(lu.matrix_u().diagonal().prod(), T(1));
    EXPECT_EQ(lu.determinant(), T(-1));
}

TEST(DenseLU, FirstMaximumIsPivot)
{
    Mat<T> A(2, 2); A << 1, 2,
                        -1, 3;

    LU<T> lu;
    lu.compute(A);

    EXPECT_EQ(lu.pivot_order(), std::vector<isize>({0, 1}));
    EXPECT_EQ(lu.permutation().signum(), 1);
    EXPECT_FALSE(lu.permutation().is_modified());
    EXPECT_EQ(lu.determinant(), T(5));
}

TEST(DenseLU, Singular)
{
    Mat<T> A(2, 2); A << 1, 2,
                         2, 4;

    LU<T> lu;
    lu.compute(A);

    EXPECT_FALSE(lu.is_nonsingular());
    EXPECT_FALSE(lu.is_solvable());
    EXPECT_EQ(lu.rank(), 1);
    EXPECT_EQ(lu.determinant(), T(0));
    EXPECT_EQ(lu.matrix_u()(0, 0), T(2));
    EXPECT_EQ(lu.matrix_u()(1, 1), T(0));

    // solving divides by the zero pivot
    Vec<T> b(2); b << 1, 1;
    Mat<T> x = lu.solve(b);
    EXPECT_FALSE(x.allFinite());
}

TEST(DenseLU, RankThreshold)
{
    Mat<T> A(2, 2); A << 1, 0,
                         0, 1e-10;

    LU<T> lu;
    lu.compute(A);
    EXPECT_EQ(lu.rank(), 2);

    lu.set_threshold(1e-8);
    EXPECT_EQ(lu.threshold(), T(1e-8));
    EXPECT_EQ(lu.rank(), 1);
    EXPECT_TRUE(lu.is_nonsingular());

    lu.set_threshold(Eigen::Default);
    EXPECT_EQ(lu.rank(), 2);

    EXPECT_THROW(lu.set_threshold(T(-1)), std::invalid_argument);
    EXPECT_THROW(lu.set_threshold(T(1)), std::invalid_argument);
}

TEST(DenseLU, Rectangular)
{
    Mat<T> A = rand::dense_matrix_rand<T>(5, 3);

    LU<T> lu;
    lu.compute(A);

    EXPECT_EQ(lu.matrix_l().rows(), 5);
    EXPECT_EQ(lu.matrix_l().cols(), 3);
    EXPECT_EQ(lu.matrix_u().rows(), 3);
    EXPECT_EQ(lu.matrix_u().cols(), 3);
    EXPECT_TRUE(lu.is_nonsingular());
    EXPECT_FALSE(lu.is_square_and_nonsingular());
    EXPECT_FALSE(lu.is_solvable());
    EXPECT_EQ(lu.rank(), 3);
    EXPECT_TRUE(A.isApprox(lu.reconstructed_matrix(), 1e-8));

    EXPECT_THROW(lu.determinant(), std::invalid_argument);
    EXPECT_THROW(lu.solve(Vec<T>::Ones(5)), std::invalid_argument);

    Mat<T> A_wide = A.transpose();
    lu.compute(A_wide);
    EXPECT_EQ(lu.rank(), 3);
    EXPECT_TRUE(A_wide.isApprox(lu.reconstructed_matrix(), 1e-8));
}

TEST(DenseLU, InvalidUse)
{
    LU<T> lu;
    EXPECT_FALSE(lu.is_computed());
    EXPECT_FALSE(lu.is_solvable());
    EXPECT_THROW(lu.determinant(), std::logic_error);
    EXPECT_THROW(lu.solve(Vec<T>::Ones(2)), std::logic_error);

    Mat<T> A = Mat<T>::Identity(3, 3);
    lu.compute(A);
    EXPECT_THROW(lu.solve(Vec<T>::Ones(2)), std::invalid_argument);
    EXPECT_THROW(lu.solve_transposed(Vec<T>::Ones(4)), std::invalid_argument);

    lu.reset();
    EXPECT_FALSE(lu.is_computed());
    EXPECT_THROW(lu.matrix_lu(), std::logic_error);
}

TEST(DenseLU, Recompute)
{
    Mat<T> A1 = rand::dense_matrix_rand<T>(4, 4);
    Mat<T> A2 = rand::dense_matrix_rand<T>(6, 6);

    LU<T> lu(4);
    lu.compute(A1);
    lu.compute(A2);

    EXPECT_EQ(lu.rows(), 6);
    EXPECT_EQ(lu.permutation().size(), 6);
    EXPECT_TRUE(A2.isApprox(lu.reconstructed_matrix(), 1e-8));
}

TEST(DenseLU, RankIdentityAndZero)
{
    isize dim = 6;

    LU<T> lu;
    EXPECT_TRUE(lu.decompose(Mat<T>::Identity(dim, dim)));
    EXPECT_EQ(lu.rank(), dim);
    EXPECT_EQ(lu.determinant(), T(1));

    EXPECT_TRUE(lu.decompose(Mat<T>::Zero(dim, dim)));
    EXPECT_EQ(lu.rank(), 0);
    EXPECT_FALSE(lu.is_nonsingular());
}

TEST(DenseLU, Idempotent)
{
    isize dim = 10;

    Mat<T> A = rand::dense_matrix_rand<T>(dim, dim);
    Vec<T> b = rand::vector_rand<T>(dim);

    LU<T> lu;
    lu.compute(A);
    T det = lu.determinant();
    Mat<T> x = lu.solve(b);
    std::vector<isize> order = lu.pivot_order();

    lu.compute(A);
    EXPECT_EQ(lu.determinant(), det);
    EXPECT_EQ(lu.solve(b), x);
    EXPECT_EQ(lu.pivot_order(), order);
}

TEST(DenseLU, RankDeficientRandom)
{
    Mat<T> A = rand::dense_rank_deficient_rand<T>(8, 8, 5);

    LU<T> lu;
    lu.compute(A);
    lu.set_threshold(1e-10);
    EXPECT_EQ(lu.rank(), 5);
    EXPECT_TRUE(A.isApprox(lu.reconstructed_matrix(), 1e-8));
}

TEST(DenseLU, RankEmpty)
{
    LU<T> lu;
    lu.compute(Mat<T>(0, 3));
    EXPECT_EQ(lu.rank(), 0);

    lu.compute(Mat<T>(3, 0));
    EXPECT_EQ(lu.rank(), 0);
}

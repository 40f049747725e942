// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_TESTS_UTILS_HPP
#define DKKT_TESTS_UTILS_HPP

#include "dkkt/dkkt.hpp"
#include "gtest/gtest.h"

template<typename T, unsigned int Mode>
void assert_dense_triangular(const dkkt::Mat<T>& A)
{
    dkkt::Mat<T> tri = A.template triangularView<Mode>();
    ASSERT_TRUE((A - tri).cwiseAbs().maxCoeff() == 0);
}

template<typename T>
void assert_matrices_near(const dkkt::Mat<T>& A, const dkkt::Mat<T>& B, T tol)
{
    ASSERT_EQ(A.rows(), B.rows());
    ASSERT_EQ(A.cols(), B.cols());
    if (A.size() == 0) return;
    ASSERT_LE((A - B).cwiseAbs().maxCoeff(), tol);
}

// checks Q X + A^T L = C and A X = B
template<typename T>
void assert_kkt_residual(const dkkt::KKTInput<T>& input, const dkkt::KKTOutput<T>& output, T tol)
{
    ASSERT_EQ(output.x.rows(), input.n());
    ASSERT_EQ(output.x.cols(), input.k());
    ASSERT_EQ(output.l.rows(), input.m());
    ASSERT_EQ(output.l.cols(), input.k());

    dkkt::Mat<T> res_x = input.Q * output.x - input.C;
    if (input.is_constrained())
    {
        res_x += input.A->transpose() * output.l;
        dkkt::Mat<T> res_l = *input.A * output.x - *input.B;
        ASSERT_LE(res_l.cwiseAbs().maxCoeff(), tol);
    }
    ASSERT_LE(res_x.cwiseAbs().maxCoeff(), tol);
}

#endif //DKKT_TESTS_UTILS_HPP

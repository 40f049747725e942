// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <benchmark/benchmark.h>

#include "dkkt/dense/lu.hpp"
#include "dkkt/dense/qr.hpp"
#include "dkkt/dense/ldl.hpp"
#include "dkkt/utils/random_utils.hpp"

using namespace dkkt;
using namespace dkkt::dense;

template<typename T>
static void BM_EIGEN_PARTIAL_PIV_LU(benchmark::State& state)
{
    Mat<T> A = rand::dense_matrix_rand<T>(state.range(0), state.range(0));

    Eigen::PartialPivLU<Mat<T>> lu(A.rows());

    for (auto _ : state)
    {
        lu.compute(A);
    }
}

template<typename T>
static void BM_DKKT_LU(benchmark::State& state)
{
    Mat<T> A = rand::dense_matrix_rand<T>(state.range(0), state.range(0));

    LU<T> lu(A.rows());

    for (auto _ : state)
    {
        lu.compute(A);
    }
}

template<typename T>
static void BM_EIGEN_HOUSEHOLDER_QR(benchmark::State& state)
{
    Mat<T> A = rand::dense_matrix_rand<T>(2 * state.range(0), state.range(0));

    Eigen::HouseholderQR<Mat<T>> qr(A.rows(), A.cols());

    for (auto _ : state)
    {
        qr.compute(A);
    }
}

template<typename T>
static void BM_DKKT_QR(benchmark::State& state)
{
    Mat<T> A = rand::dense_matrix_rand<T>(2 * state.range(0), state.range(0));

    QR<T> qr(A.rows(), A.cols());

    for (auto _ : state)
    {
        qr.compute(A);
    }
}

template<typename T>
static void BM_EIGEN_LDLT_LOWER(benchmark::State& state)
{
    Mat<T> P = rand::dense_positive_definite_rand<T>(state.range(0), 1.0);

    Eigen::LDLT<Mat<T>, Eigen::Lower> ldlt(P.rows());

    for (auto _ : state)
    {
        ldlt.compute(P);
    }
}

template<typename T>
static void BM_DKKT_LDL(benchmark::State& state)
{
    Mat<T> P = rand::dense_positive_definite_rand<T>(state.range(0), 1.0);

    LDL<T> ldl(P.rows());

    for (auto _ : state)
    {
        ldl.compute(P);
    }
}

BENCHMARK(BM_EIGEN_PARTIAL_PIV_LU<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_DKKT_LU<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_EIGEN_HOUSEHOLDER_QR<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_DKKT_QR<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_EIGEN_LDLT_LOWER<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_DKKT_LDL<double>)->RangeMultiplier(2)->Range(4, 1<<9)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <benchmark/benchmark.h>

#include "dkkt/dkkt.hpp"
#include "dkkt/utils/random_utils.hpp"

using namespace dkkt;

template<typename T>
static void BM_KKT_SOLVE(benchmark::State& state)
{
    KKTInput<T> input = rand::dense_strongly_convex_kkt<T>(state.range(0), state.range(0) / 2);

    KKTSolver<T> solver(input);

    for (auto _ : state)
    {
        KKTOutput<T> output = solver.solve(input);
        benchmark::DoNotOptimize(output.x.data());
    }
}

BENCHMARK(BM_KKT_SOLVE<double>)->RangeMultiplier(2)->Range(4, 1<<8)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();

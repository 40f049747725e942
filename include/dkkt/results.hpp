// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_RESULTS_HPP
#define DKKT_RESULTS_HPP

#include "dkkt/typedefs.hpp"

namespace dkkt
{

enum Status
{
    DKKT_SOLVED = 1,
    DKKT_UNSOLVABLE = -2,
    DKKT_UNSOLVED = -9,
    DKKT_INVALID_SETTINGS = -10,
    DKKT_INVALID_INPUT = -11
};

constexpr const char* status_to_string(Status status)
{
    switch (status)
    {
        case Status::DKKT_SOLVED: return "solved";
        case Status::DKKT_UNSOLVABLE: return "unsolvable (infeasible or unbounded)";
        case Status::DKKT_UNSOLVED: return "unsolved";
        case Status::DKKT_INVALID_SETTINGS: return "invalid settings";
        case Status::DKKT_INVALID_INPUT: return "invalid input";
        default: return "unknown";
    }
}

// The strategies of the KKT solver in the order they are attempted.
enum class Strategy
{
    none,
    direct_elimination,
    schur_complement,
    full_augmented
};

constexpr const char* strategy_to_string(Strategy strategy)
{
    switch (strategy)
    {
        case Strategy::none: return "none";
        case Strategy::direct_elimination: return "direct_elimination";
        case Strategy::schur_complement: return "schur_complement";
        case Strategy::full_augmented: return "full_augmented";
        default: return "unknown";
    }
}

enum class StrategyOutcome
{
    solved,
    not_applicable
};

template<typename T>
struct Info
{
    Status status = Status::DKKT_UNSOLVED;
    Strategy strategy = Strategy::none;

    isize strategies_tried = 0;

    T factor_time = 0;
    T solve_time = 0;
    T run_time = 0;
};

} // namespace dkkt

#endif //DKKT_RESULTS_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_SETTINGS_HPP
#define DKKT_SETTINGS_HPP

#include "dkkt/typedefs.hpp"

namespace dkkt
{

template<typename T>
struct Settings
{
    // check Q (positive semi-definite) and A (full row rank) before solving
    bool validate = false;

    // relative tolerance below zero for the eigenvalues of Q during validation
    T psd_tolerance = 1e-12;

    // relative threshold of the rank estimates, 0 selects the factorization default
    T rank_threshold = 0;

    bool verbose = false;
    bool compute_timings = false;

    bool verify_settings() const noexcept
    {
        return psd_tolerance >= 0 &&
               rank_threshold >= 0 && rank_threshold < 1;
    }
};

} // namespace dkkt

#endif //DKKT_SETTINGS_HPP

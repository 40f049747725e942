// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_FWD_HPP
#define DKKT_FWD_HPP

#include <cstdio>
#include <Eigen/Core>

#define dkkt_print printf
#define dkkt_eprint(...) fprintf(stderr, __VA_ARGS__)

// profiler zones, compiled out unless built against tracy
#ifdef DKKT_HAS_TRACY
#include "tracy/Tracy.hpp"
#define DKKT_TRACY_ZoneScopedN(name) ZoneScopedN(name)
#else
#define DKKT_TRACY_ZoneScopedN(name)
#endif

#endif //DKKT_FWD_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DKKT_HPP
#define DKKT_DKKT_HPP

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/dense/lu.hpp"
#include "dkkt/dense/qr.hpp"
#include "dkkt/dense/ldl.hpp"
#include "dkkt/kkt_solver.hpp"

#endif //DKKT_DKKT_HPP

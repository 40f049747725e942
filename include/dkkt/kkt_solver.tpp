// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_KKT_SOLVER_TPP
#define DKKT_KKT_SOLVER_TPP

#include "dkkt/common.hpp"
#include "dkkt/kkt_solver.hpp"

namespace dkkt
{

extern template struct KKTInput<common::Scalar>;
extern template class KKTSolver<common::Scalar>;

} // namespace dkkt

#endif //DKKT_KKT_SOLVER_TPP

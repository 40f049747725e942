// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include "dkkt/common.hpp"
#include "dkkt/kkt_solver.hpp"

namespace dkkt
{

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION
void DKKT_EIGEN_ABI_CHECK_MAX_ALIGN() {}
#endif

template struct KKTInput<common::Scalar>;
template class KKTSolver<common::Scalar>;

} // namespace dkkt

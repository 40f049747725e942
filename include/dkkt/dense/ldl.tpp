// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_LDL_TPP
#define DKKT_DENSE_LDL_TPP

#include "dkkt/common.hpp"
#include "dkkt/dense/ldl.hpp"

namespace dkkt
{

namespace dense
{

extern template class LDL<common::Scalar>;

} // namespace dense

} // namespace dkkt

#endif //DKKT_DENSE_LDL_TPP

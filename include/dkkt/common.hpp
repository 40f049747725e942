// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_COMMON_HPP
#define DKKT_COMMON_HPP

#include "dkkt/typedefs.hpp"

namespace dkkt
{

namespace common
{

using Scalar = double;

} // namespace common

} // namespace dkkt

#endif //DKKT_COMMON_HPP

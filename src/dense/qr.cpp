// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include "dkkt/common.hpp"
#include "dkkt/dense/qr.hpp"

namespace dkkt
{

namespace dense
{

template class QR<common::Scalar>;

} // namespace dense

} // namespace dkkt

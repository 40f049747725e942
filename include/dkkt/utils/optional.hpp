// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_UTILS_OPTIONAL_HPP
#define DKKT_UTILS_OPTIONAL_HPP

#include <optional>

#include "dkkt/fwd.hpp"

namespace dkkt
{

template<class T>
using optional = std::optional<T>;
using nullopt_t = std::nullopt_t;
inline constexpr nullopt_t nullopt = std::nullopt;

} // namespace dkkt

#endif //DKKT_UTILS_OPTIONAL_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_TYPEDEFS_HPP
#define DKKT_TYPEDEFS_HPP

#include <type_traits>
#include <Eigen/Dense>

namespace dkkt
{

using usize = decltype(sizeof(0));
using isize = std::make_signed<usize>::type;

template<typename T>
using Vec = Eigen::Matrix<T, Eigen::Dynamic, 1>;

template<typename T>
using Mat = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>;
template<typename T>
using CMatRef = Eigen::Ref<const Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic>>;

// in-place workspace of the dense factorizations
template<typename T>
using RowMat = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION

#define DKKT_CONCAT_IMPL(a, b) a##b
#define DKKT_CONCAT(a, b) DKKT_CONCAT_IMPL(a, b)
#define DKKT_EIGEN_ABI_CHECK_MAX_ALIGN DKKT_CONCAT(_dkkt_eigen_abi_check_max_align_, EIGEN_MAX_ALIGN_BYTES)

extern void DKKT_EIGEN_ABI_CHECK_MAX_ALIGN();
inline void enforce_abi_compatibility() {
    DKKT_EIGEN_ABI_CHECK_MAX_ALIGN();
}

static const auto _abi_enforcer = (enforce_abi_compatibility(), 0);

#endif

} // namespace dkkt

#endif //DKKT_TYPEDEFS_HPP

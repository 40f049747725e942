// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_SUBSTITUTION_HPP
#define DKKT_DENSE_SUBSTITUTION_HPP

#include <Eigen/Dense>

namespace dkkt
{

namespace dense
{

namespace internal
{

// Solves tri * X = B in place for the lower triangle of tri, B is overwritten by X.
// Zero diagonal entries are divided by unconditionally, so a singular factor
// produces inf/nan entries instead of silently skipping rows.
template<typename TriType, typename RhsType>
void substitute_forwards(const Eigen::MatrixBase<TriType>& tri, Eigen::MatrixBase<RhsType>& B, bool unit_diagonal)
{
    eigen_assert(tri.rows() == tri.cols() && tri.rows() == B.rows());

    const Eigen::Index dim = B.rows();
    for (Eigen::Index i = 0; i < dim; ++i)
    {
        if (i > 0) {
            B.row(i).noalias() -= tri.row(i).head(i) * B.topRows(i);
        }
        if (!unit_diagonal) {
            B.row(i) /= tri.coeff(i, i);
        }
    }
}

// Solves tri * X = B in place for the upper triangle of tri.
template<typename TriType, typename RhsType>
void substitute_backwards(const Eigen::MatrixBase<TriType>& tri, Eigen::MatrixBase<RhsType>& B, bool unit_diagonal)
{
    eigen_assert(tri.rows() == tri.cols() && tri.rows() == B.rows());

    const Eigen::Index dim = B.rows();
    for (Eigen::Index i = dim - 1; i >= 0; --i)
    {
        Eigen::Index rs = dim - i - 1; // remaining size
        if (rs > 0) {
            B.row(i).noalias() -= tri.row(i).tail(rs) * B.bottomRows(rs);
        }
        if (!unit_diagonal) {
            B.row(i) /= tri.coeff(i, i);
        }
    }
}

} // namespace internal

} // namespace dense

} // namespace dkkt

#endif //DKKT_DENSE_SUBSTITUTION_HPP

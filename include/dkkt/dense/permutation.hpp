// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_PERMUTATION_HPP
#define DKKT_DENSE_PERMUTATION_HPP

#include <stdexcept>
#include <utility>
#include <vector>

#include "dkkt/typedefs.hpp"

namespace dkkt
{

namespace dense
{

/**
 * Row permutation of a pivoted factorization.
 *
 * Row i of the permuted matrix is row order()[i] of the unpermuted one. The
 * value is assembled once by the factorization and never changes afterwards.
 */
class Permutation
{
protected:
    std::vector<isize> m_order;
    int m_signum = 1;
    bool m_modified = false;

public:
    Permutation() = default;

    Permutation(std::vector<isize> order, int signum, bool modified)
        : m_order(std::move(order)), m_signum(signum), m_modified(modified) {}

    const std::vector<isize>& order() const noexcept { return m_order; }

    isize size() const noexcept { return static_cast<isize>(m_order.size()); }

    // +1 for an even number of row exchanges, -1 for an odd number
    int signum() const noexcept { return m_signum; }

    // true if at least one row exchange happened
    bool is_modified() const noexcept { return m_modified; }

    // returns P * M
    template<typename Derived>
    Mat<typename Derived::Scalar> apply_to_rows(const Eigen::MatrixBase<Derived>& M) const
    {
        check_rows(M.rows());
        Mat<typename Derived::Scalar> res(M.rows(), M.cols());
        for (isize i = 0; i < size(); i++) {
            res.row(i) = M.row(m_order[static_cast<usize>(i)]);
        }
        return res;
    }

    // returns P^T * M
    template<typename Derived>
    Mat<typename Derived::Scalar> transpose_apply_to_rows(const Eigen::MatrixBase<Derived>& M) const
    {
        check_rows(M.rows());
        Mat<typename Derived::Scalar> res(M.rows(), M.cols());
        for (isize i = 0; i < size(); i++) {
            res.row(m_order[static_cast<usize>(i)]) = M.row(i);
        }
        return res;
    }

protected:
    void check_rows(Eigen::Index rows) const
    {
        if (rows != size()) {
            throw std::invalid_argument("permutation and matrix row dimensions must agree");
        }
    }
};

} // namespace dense

} // namespace dkkt

#endif //DKKT_DENSE_PERMUTATION_HPP

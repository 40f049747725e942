// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_KKT_INPUT_HPP
#define DKKT_KKT_INPUT_HPP

#include <ostream>
#include <stdexcept>

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/results.hpp"
#include "dkkt/dense/block_ops.hpp"
#include "dkkt/utils/optional.hpp"

namespace dkkt
{

/**
 * Saddle point system
 *
 *     | Q  A^T | | X |   | C |
 *     | A   0  | | L | = | B |
 *
 * of an equality constrained quadratic program. A and B are either both
 * given or both omitted. C and B may have several columns.
 */
template<typename T>
struct KKTInput
{
    Mat<T> Q;
    Mat<T> C;
    optional<Mat<T>> A;
    optional<Mat<T>> B;

    KKTInput(const CMatRef<T>& Q,
             const CMatRef<T>& C,
             const optional<CMatRef<T>>& A = nullopt,
             const optional<CMatRef<T>>& B = nullopt)
      : Q(Q), C(C)
    {
        isize n = Q.rows();

        if (Q.cols() != n) { throw std::invalid_argument("Q must be square"); }
        if (C.rows() != n) { throw std::invalid_argument("C must have as many rows as Q"); }
        if (A.has_value() != B.has_value()) { throw std::invalid_argument("A and B must either both be given or both be omitted"); }

        if (A.has_value())
        {
            if (A->cols() != n) { throw std::invalid_argument("A must have as many columns as Q"); }
            if (B->rows() != A->rows()) { throw std::invalid_argument("B must have as many rows as A"); }
            if (B->cols() != C.cols()) { throw std::invalid_argument("B must have as many columns as C"); }

            this->A = Mat<T>(*A);
            this->B = Mat<T>(*B);
        }
    }

    isize n() const noexcept { return Q.rows(); }
    isize m() const noexcept { return A.has_value() ? A->rows() : 0; }
    isize k() const noexcept { return C.cols(); }

    bool is_constrained() const noexcept
    {
        return A.has_value() && A->size() > 0;
    }

    /** \returns the augmented matrix [Q A^T; A 0], or Q when unconstrained */
    Mat<T> kkt() const
    {
        if (!A.has_value()) return Q;
        return dense::assemble_block<T>(Q, A->transpose(), *A, Mat<T>::Zero(m(), m()));
    }

    /** \returns the right hand side [C; B], or C when unconstrained */
    Mat<T> rhs() const
    {
        if (!B.has_value()) return C;
        return dense::assemble_below<T>(C, *B);
    }
};

template<typename T>
struct KKTOutput
{
    Mat<T> x;
    Mat<T> l;
    bool solvable = false;

    Info<T> info;

    bool is_solvable() const noexcept { return solvable; }
};

namespace detail
{

template<typename T>
void print_flat(std::ostream& os, const Mat<T>& matrix)
{
    os << "[";
    for (Eigen::Index i = 0; i < matrix.size(); i++)
    {
        if (i > 0) os << ", ";
        os << matrix(i);
    }
    os << "]";
}

} // namespace detail

// prints "true X=[...] L=[...]" or "false", entries in column major order
template<typename T>
std::ostream& operator<<(std::ostream& os, const KKTOutput<T>& output)
{
    os << (output.solvable ? "true" : "false");
    if (output.solvable)
    {
        os << " X=";
        detail::print_flat(os, output.x);
        os << " L=";
        detail::print_flat(os, output.l);
    }
    return os;
}

} // namespace dkkt

#endif //DKKT_KKT_INPUT_HPP

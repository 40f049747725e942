// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_LU_HPP
#define DKKT_DENSE_LU_HPP

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/dense/decomposition_base.hpp"
#include "dkkt/dense/permutation.hpp"
#include "dkkt/dense/substitution.hpp"

namespace dkkt
{

namespace dense
{

/**
 * \class LU
 *
 * \brief LU decomposition with partial pivoting, P A = L U.
 *
 * Left-looking dot-product (Crout/Doolittle) variant computed in place on a
 * row-major copy of A. L is unit lower triangular and stored below the
 * diagonal, U is stored on and above it.
 *
 * The decomposition never fails structurally. A zero pivot leaves the
 * column below it undivided and is reported by is_nonsingular(); solving
 * with such a factorization divides by the zero pivot and yields inf/nan.
 */
template<typename T>
class LU : public DecompositionBase<T>
{
protected:
    using DecompositionBase<T>::m_matrix;
    using DecompositionBase<T>::m_is_computed;

    Permutation m_permutation;
    Vec<T> m_col_j; // working variable

public:
    LU() = default;

    // preallocates the workspace for size x size matrices
    explicit LU(isize size) : DecompositionBase<T>(size, size), m_col_j(size) {}

    LU& compute(const CMatRef<T>& matrix)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::LU::compute");

        reset();
        m_matrix = matrix;

        const Eigen::Index rows = m_matrix.rows();
        const Eigen::Index cols = m_matrix.cols();

        std::vector<isize> order(static_cast<usize>(rows));
        for (Eigen::Index i = 0; i < rows; i++) order[static_cast<usize>(i)] = i;
        int signum = 1;
        bool modified = false;

        m_col_j.resize(rows);

        for (Eigen::Index j = 0; j < cols; j++)
        {
            // localize the j-th column
            m_col_j = m_matrix.col(j);

            // apply previous transformations
            for (Eigen::Index i = 0; i < rows; i++)
            {
                Eigen::Index k = (std::min)(i, j);
                if (k > 0) {
                    m_col_j(i) -= m_matrix.row(i).head(k).dot(m_col_j.head(k));
                }
                m_matrix(i, j) = m_col_j(i);
            }

            // find pivot, first maximum wins
            Eigen::Index p = j;
            for (Eigen::Index i = j + 1; i < rows; i++)
            {
                if (std::abs(m_col_j(i)) > std::abs(m_col_j(p))) {
                    p = i;
                }
            }
            if (p != j)
            {
                m_matrix.row(p).swap(m_matrix.row(j));
                std::swap(order[static_cast<usize>(p)], order[static_cast<usize>(j)]);
                signum = -signum;
                modified = true;
            }

            // compute multipliers
            if (j < rows)
            {
                T pivot = m_matrix(j, j);
                if (pivot != T(0)) {
                    m_matrix.col(j).tail(rows - j - 1) /= pivot;
                }
            }
        }

        m_permutation = Permutation(std::move(order), signum, modified);
        m_is_computed = true;
        return *this;
    }

    // structurally never fails, degeneracy is reported by the predicates
    bool decompose(const CMatRef<T>& matrix)
    {
        compute(matrix);
        return true;
    }

    void reset()
    {
        this->clear();
        m_permutation = Permutation();
    }

    isize rows() const noexcept { return m_matrix.rows(); }
    isize cols() const noexcept { return m_matrix.cols(); }

    /** \returns the in-place factors, L strictly below and U on and above the diagonal */
    const RowMat<T>& matrix_lu() const
    {
        this->check_computed("LU");
        return m_matrix;
    }

    /** \returns the unit lower triangular factor (rows x min(rows, cols)) */
    Mat<T> matrix_l() const
    {
        this->check_computed("LU");
        Eigen::Index k = (std::min)(rows(), cols());
        Mat<T> L = m_matrix.leftCols(k).template triangularView<Eigen::StrictlyLower>();
        L.diagonal().setOnes();
        return L;
    }

    /** \returns the upper triangular factor (min(rows, cols) x cols) */
    Mat<T> matrix_u() const
    {
        this->check_computed("LU");
        Eigen::Index k = (std::min)(rows(), cols());
        Mat<T> U = m_matrix.topRows(k).template triangularView<Eigen::Upper>();
        return U;
    }

    const Permutation& permutation() const
    {
        this->check_computed("LU");
        return m_permutation;
    }

    const std::vector<isize>& pivot_order() const { return permutation().order(); }

    /** \returns true if no diagonal entry of U is exactly zero */
    bool is_nonsingular() const
    {
        this->check_computed("LU");
        Eigen::Index k = (std::min)(rows(), cols());
        for (Eigen::Index j = 0; j < k; j++) {
            if (m_matrix(j, j) == T(0)) return false;
        }
        return true;
    }

    bool is_square_and_nonsingular() const
    {
        return rows() == cols() && is_nonsingular();
    }

    bool is_solvable() const
    {
        return m_is_computed && is_square_and_nonsingular();
    }

    T determinant() const
    {
        this->check_computed("LU");
        if (rows() != cols()) {
            throw std::invalid_argument("matrix must be square");
        }
        T det = T(m_permutation.signum());
        for (Eigen::Index j = 0; j < cols(); j++) {
            det *= m_matrix(j, j);
        }
        return det;
    }

    isize rank() const
    {
        this->check_computed("LU");
        Eigen::Index k = (std::min)(rows(), cols());
        if (k == 0) return 0;
        return this->rank_of_diagonal(m_matrix.diagonal().head(k));
    }

    /** \returns the solution X of A X = rhs */
    Mat<T> solve(const CMatRef<T>& rhs) const
    {
        DKKT_TRACY_ZoneScopedN("dkkt::LU::solve");
        check_solve_dimensions(rhs.rows());

        Mat<T> X = m_permutation.apply_to_rows(rhs);
        internal::substitute_forwards(m_matrix, X, true);
        internal::substitute_backwards(m_matrix, X, false);
        return X;
    }

    /** \returns the solution X of A^T X = rhs, reusing the factors of A */
    Mat<T> solve_transposed(const CMatRef<T>& rhs) const
    {
        DKKT_TRACY_ZoneScopedN("dkkt::LU::solve_transposed");
        check_solve_dimensions(rhs.rows());

        // A^T = U^T L^T P
        Mat<T> X = rhs;
        internal::substitute_forwards(m_matrix.transpose(), X, false);
        internal::substitute_backwards(m_matrix.transpose(), X, true);
        return m_permutation.transpose_apply_to_rows(X);
    }

    Mat<T> inverse() const
    {
        check_solve_dimensions(rows());

        Mat<T> X = Mat<T>::Zero(rows(), rows());
        const std::vector<isize>& order = m_permutation.order();
        for (Eigen::Index i = 0; i < rows(); i++) {
            X(i, order[static_cast<usize>(i)]) = T(1);
        }
        internal::substitute_forwards(m_matrix, X, true);
        internal::substitute_backwards(m_matrix, X, false);
        return X;
    }

    /** \returns P^T L U, i.e. the decomposed matrix. Provided for debug purposes. */
    Mat<T> reconstructed_matrix() const
    {
        Mat<T> lu = matrix_l() * matrix_u();
        return m_permutation.transpose_apply_to_rows(lu);
    }

protected:
    void check_solve_dimensions(Eigen::Index rhs_rows) const
    {
        this->check_computed("LU");
        if (rows() != cols()) {
            throw std::invalid_argument("matrix must be square");
        }
        if (rhs_rows != rows()) {
            throw std::invalid_argument("matrix and right hand side row dimensions must agree");
        }
    }
};

} // namespace dense

} // namespace dkkt

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION
#include "dkkt/dense/lu.tpp"
#endif

#endif //DKKT_DENSE_LU_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_LDL_HPP
#define DKKT_DENSE_LDL_HPP

#include <algorithm>
#include <stdexcept>

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/dense/decomposition_base.hpp"
#include "dkkt/dense/substitution.hpp"

namespace dkkt
{

namespace dense
{

/**
  * \class LDL
  *
  * \brief Cholesky style decomposition of a matrix without pivoting
  *
  * Computes \f$ A = L D L^T \f$, where L is lower triangular with a unit
  * diagonal and D is a diagonal matrix. Only the diagonal and the strictly
  * lower part of A are read. The strictly lower part of the workspace holds
  * L (its unit diagonal is not stored) and the diagonal holds D.
  *
  * The factorization always runs to completion. Whether A appeared to be
  * symmetric positive definite is reported by is_spd(): any non-positive
  * pivot clears the flag. A zero pivot divides the column below it by zero.
  */
template<typename T>
class LDL : public DecompositionBase<T>
{
protected:
    using DecompositionBase<T>::m_matrix;
    using DecompositionBase<T>::m_is_computed;

    Vec<T> m_temporary; // row of L scaled by D
    bool m_is_spd = false;

public:
    LDL() = default;

    explicit LDL(isize size) : DecompositionBase<T>(size, size), m_temporary(size) {}

    LDL& compute(const CMatRef<T>& matrix)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::LDL::compute");

        reset();

        const Eigen::Index rows = matrix.rows();
        const Eigen::Index cols = matrix.cols();
        const Eigen::Index size = (std::min)(rows, cols);

        m_matrix.setZero(rows, cols);
        m_temporary.resize(size);
        m_is_spd = rows == cols;

        for (Eigen::Index k = 0; k < size; ++k)
        {
            // partition the matrix:
            //       L00 |  -  |  -
            // ldl = L10 | D11 |  -
            //       L20 | L21 | A22
            auto L10 = m_matrix.row(k).head(k);
            auto temp = m_temporary.head(k);

            temp = L10.transpose().cwiseProduct(m_matrix.diagonal().head(k));

            T d = matrix(k, k) - L10.dot(temp);
            m_matrix(k, k) = d;
            m_is_spd = m_is_spd && d > T(0);

            for (Eigen::Index i = k + 1; i < rows; ++i)
            {
                m_matrix(i, k) = (matrix(i, k) - m_matrix.row(i).head(k).dot(temp)) / d;
            }
        }

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
        m_is_spd = false;
    }

    isize rows() const noexcept { return m_matrix.rows(); }
    isize cols() const noexcept { return m_matrix.cols(); }

    /** \returns true if every pivot was strictly positive on a square matrix */
    bool is_spd() const
    {
        this->check_computed("LDL");
        return m_is_spd;
    }

    /** \returns the coefficients of the diagonal matrix D */
    Vec<T> vector_d() const
    {
        this->check_computed("LDL");
        return m_matrix.diagonal();
    }

    /** \returns the unit lower triangular factor (rows x min(rows, cols)) */
    Mat<T> matrix_l() const
    {
        this->check_computed("LDL");
        Eigen::Index k = (std::min)(rows(), cols());
        Mat<T> L = m_matrix.leftCols(k).template triangularView<Eigen::StrictlyLower>();
        L.diagonal().setOnes();
        return L;
    }

    /** \returns the LDL decomposition matrix */
    const RowMat<T>& matrix_ldl() const
    {
        this->check_computed("LDL");
        return m_matrix;
    }

    bool is_square_and_nonsingular() const
    {
        this->check_computed("LDL");
        if (rows() != cols()) return false;
        for (Eigen::Index k = 0; k < rows(); k++) {
            if (m_matrix(k, k) == T(0)) return false;
        }
        return true;
    }

    bool is_solvable() const
    {
        return m_is_computed && is_square_and_nonsingular();
    }

    T determinant() const
    {
        this->check_computed("LDL");
        if (rows() != cols()) {
            throw std::invalid_argument("matrix must be square");
        }
        return m_matrix.diagonal().prod();
    }

    /** \returns the number of D entries above the relative threshold.
      *
      * Without pivoting a zero D entry turns every later entry of D into NaN,
      * and NaN entries are never counted. The estimate is therefore only
      * meaningful up to the first zero pivot, e.g. diag(0, 1) has rank 0.
      */
    isize rank() const
    {
        this->check_computed("LDL");
        if (m_matrix.size() == 0) return 0;
        return this->rank_of_diagonal(m_matrix.diagonal());
    }

    /** \returns the solution X of A X = rhs */
    Mat<T> solve(const CMatRef<T>& rhs) const
    {
        DKKT_TRACY_ZoneScopedN("dkkt::LDL::solve");
        check_solve_dimensions(rhs.rows());

        Mat<T> X = rhs;
        solve_in_place(X);
        return X;
    }

    Mat<T> inverse() const
    {
        check_solve_dimensions(rows());

        Mat<T> X = Mat<T>::Identity(rows(), rows());
        solve_in_place(X);
        return X;
    }

    /** \returns the matrix represented by the decomposition,
     * i.e., it returns the product: L D L^T.
     * This function is provided for debug purpose. */
    Mat<T> reconstructed_matrix() const
    {
        check_solve_dimensions(rows());
        Mat<T> L = matrix_l();
        return L * m_matrix.diagonal().asDiagonal() * L.transpose();
    }

protected:
    void check_solve_dimensions(Eigen::Index rhs_rows) const
    {
        this->check_computed("LDL");
        if (rows() != cols()) {
            throw std::invalid_argument("matrix must be square");
        }
        if (rhs_rows != rows()) {
            throw std::invalid_argument("matrix and right hand side row dimensions must agree");
        }
    }

    void solve_in_place(Mat<T>& X) const
    {
        internal::substitute_forwards(m_matrix, X, true);
        for (Eigen::Index i = 0; i < X.rows(); i++) {
            X.row(i) /= m_matrix(i, i);
        }
        // L^T is read from the lower part of the workspace
        internal::substitute_backwards(m_matrix.transpose(), X, true);
    }
};

} // namespace dense

} // namespace dkkt

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION
#include "dkkt/dense/ldl.tpp"
#endif

#endif //DKKT_DENSE_LDL_HPP

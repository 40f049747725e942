// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_QR_HPP
#define DKKT_DENSE_QR_HPP

#include <cmath>
#include <stdexcept>

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/dense/decomposition_base.hpp"

namespace dkkt
{

namespace dense
{

/**
 * \class QR
 *
 * \brief Householder QR decomposition A = Q R of a rows x cols matrix, rows >= cols.
 *
 * The workspace holds A transposed, so that row k of the workspace is the
 * k-th column of A. After compute() the part of row k from index k on holds
 * the k-th Householder vector and the part before index k holds column k of
 * the strictly upper triangle of R. The diagonal of R is kept separately.
 *
 * Q is the economy sized rows x cols orthogonal factor.
 */
template<typename T>
class QR : public DecompositionBase<T>
{
protected:
    using DecompositionBase<T>::m_matrix;
    using DecompositionBase<T>::m_is_computed;

    Vec<T> m_diagonal_r;

public:
    QR() = default;

    QR(isize rows, isize cols) : DecompositionBase<T>(cols, rows), m_diagonal_r(cols) {}

    QR& compute(const CMatRef<T>& matrix)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::QR::compute");

        if (matrix.rows() < matrix.cols()) {
            throw std::invalid_argument("QR requires at least as many rows as columns");
        }

        reset();
        m_matrix = matrix.transpose();

        const Eigen::Index m = rows();
        const Eigen::Index n = cols();

        m_diagonal_r.resize(n);

        for (Eigen::Index k = 0; k < n; k++)
        {
            Eigen::Index rs = m - k; // remaining size
            auto v = m_matrix.row(k).segment(k, rs);

            // 2-norm of the k-th column without under/overflow
            T nrm = T(0);
            for (Eigen::Index i = 0; i < rs; i++) {
                nrm = std::hypot(nrm, v(i));
            }

            if (nrm != T(0))
            {
                // form the k-th Householder vector
                if (v(0) < T(0)) {
                    nrm = -nrm;
                }
                v /= nrm;
                v(0) += T(1);

                // apply the reflection to the remaining columns
                for (Eigen::Index j = k + 1; j < n; j++)
                {
                    auto col_j = m_matrix.row(j).segment(k, rs);
                    T s = v.dot(col_j) / v(0);
                    col_j -= s * v;
                }
            }
            // a zero entry flags a column in the span of the previous ones
            m_diagonal_r(k) = -nrm;
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
        m_diagonal_r.resize(0);
    }

    isize rows() const noexcept { return m_matrix.cols(); }
    isize cols() const noexcept { return m_matrix.rows(); }

    const Vec<T>& diagonal_r() const
    {
        this->check_computed("QR");
        return m_diagonal_r;
    }

    /** \returns the in-place workspace, row k holds the k-th Householder vector from index k on */
    const RowMat<T>& householder_vectors() const
    {
        this->check_computed("QR");
        return m_matrix;
    }

    /** \returns the economy sized orthogonal factor by back accumulation of the reflections */
    Mat<T> matrix_q() const
    {
        this->check_computed("QR");

        const Eigen::Index m = rows();
        const Eigen::Index n = cols();

        Mat<T> Q(m, n);
        for (Eigen::Index k = n - 1; k >= 0; k--)
        {
            Q.col(k).setZero();
            Q(k, k) = T(1);

            T vk = m_matrix(k, k);
            if (vk == T(0)) continue;

            auto v = m_matrix.row(k).segment(k, m - k).transpose();
            for (Eigen::Index j = k; j < n; j++)
            {
                T s = -v.dot(Q.col(j).segment(k, m - k)) / vk;
                Q.col(j).segment(k, m - k) += s * v;
            }
        }
        return Q;
    }

    /** \returns the upper triangular cols x cols factor */
    Mat<T> matrix_r() const
    {
        this->check_computed("QR");

        const Eigen::Index n = cols();

        Mat<T> R = Mat<T>::Zero(n, n);
        for (Eigen::Index i = 0; i < n; i++)
        {
            R(i, i) = m_diagonal_r(i);
            for (Eigen::Index j = i + 1; j < n; j++) {
                R(i, j) = m_matrix(j, i);
            }
        }
        return R;
    }

    /** \returns true if no diagonal entry of R is exactly zero */
    bool is_full_column_rank() const
    {
        this->check_computed("QR");
        for (Eigen::Index j = 0; j < cols(); j++) {
            if (m_diagonal_r(j) == T(0)) return false;
        }
        return true;
    }

    bool is_solvable() const
    {
        return m_is_computed && is_full_column_rank();
    }

    isize rank() const
    {
        this->check_computed("QR");
        return this->rank_of_diagonal(m_diagonal_r);
    }

    // every applied reflection has determinant -1
    T determinant() const
    {
        this->check_computed("QR");
        if (rows() != cols()) {
            throw std::invalid_argument("matrix must be square");
        }
        T det = (cols() % 2 == 0) ? T(1) : T(-1);
        for (Eigen::Index k = 0; k < cols(); k++) {
            det *= m_diagonal_r(k);
        }
        return det;
    }

    /** \returns the least squares solution X of A X = rhs, rhs has to have rows() rows */
    Mat<T> solve(const CMatRef<T>& rhs) const
    {
        DKKT_TRACY_ZoneScopedN("dkkt::QR::solve");
        this->check_computed("QR");

        if (rhs.rows() != rows()) {
            throw std::invalid_argument("matrix and right hand side row dimensions must agree");
        }
        if (!is_full_column_rank()) {
            throw std::runtime_error("matrix is rank deficient");
        }

        const Eigen::Index m = rows();
        const Eigen::Index n = cols();

        Mat<T> Y = rhs;

        // Y = Q^T rhs
        for (Eigen::Index k = 0; k < n; k++)
        {
            auto v = m_matrix.row(k).segment(k, m - k).transpose();
            Eigen::Matrix<T, 1, Eigen::Dynamic> s = v.transpose() * Y.middleRows(k, m - k);
            s /= m_matrix(k, k);
            Y.middleRows(k, m - k).noalias() -= v * s;
        }

        // solve R X = Y
        for (Eigen::Index k = n - 1; k >= 0; k--)
        {
            Y.row(k) /= m_diagonal_r(k);
            if (k > 0) {
                Y.topRows(k).noalias() -= m_matrix.row(k).head(k).transpose() * Y.row(k);
            }
        }

        return Y.topRows(n);
    }

    Mat<T> inverse() const
    {
        return solve(Mat<T>::Identity(rows(), rows()));
    }

    /** \returns Q R, i.e. the decomposed matrix. Provided for debug purposes. */
    Mat<T> reconstructed_matrix() const
    {
        return matrix_q() * matrix_r();
    }
};

} // namespace dense

} // namespace dkkt

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION
#include "dkkt/dense/qr.tpp"
#endif

#endif //DKKT_DENSE_QR_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_DECOMPOSITION_BASE_HPP
#define DKKT_DENSE_DECOMPOSITION_BASE_HPP

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "dkkt/typedefs.hpp"

namespace dkkt
{

namespace dense
{

/**
 * State shared by the in-place dense factorizations.
 *
 * The workspace is a row-major copy of the last input, overwritten by the
 * factors. All queries require a preceding successful compute(), otherwise
 * they throw std::logic_error.
 */
template<typename T>
class DecompositionBase
{
protected:
    RowMat<T> m_matrix;
    bool m_is_computed = false;
    bool m_use_default_threshold = true;
    T m_threshold = T(0);

public:
    bool is_computed() const noexcept { return m_is_computed; }

    /** Sets the relative threshold used by the rank estimates.
      *
      * A diagonal entry d of the triangular factor counts towards the rank
      * if |d| > threshold * max|d_k|.
      */
    DecompositionBase& set_threshold(const T& threshold)
    {
        if (threshold < T(0) || threshold >= T(1)) {
            throw std::invalid_argument("threshold must be in [0, 1)");
        }
        m_use_default_threshold = false;
        m_threshold = threshold;
        return *this;
    }

    /** Restores the default threshold max(rows, cols) * epsilon. */
    DecompositionBase& set_threshold(Eigen::Default_t)
    {
        m_use_default_threshold = true;
        return *this;
    }

    T threshold() const
    {
        if (!m_use_default_threshold) return m_threshold;
        Eigen::Index dim = (std::max)(m_matrix.rows(), m_matrix.cols());
        return T(dim) * std::numeric_limits<T>::epsilon();
    }

protected:
    DecompositionBase() = default;

    explicit DecompositionBase(isize rows, isize cols) : m_matrix(rows, cols) {}

    void clear()
    {
        m_matrix.resize(0, 0);
        m_is_computed = false;
    }

    void check_computed(const char* name) const
    {
        if (!m_is_computed) {
            throw std::logic_error(std::string(name) + " is not computed");
        }
    }

    template<typename Derived>
    isize rank_of_diagonal(const Eigen::MatrixBase<Derived>& diag) const
    {
        if (diag.size() == 0) return 0;

        T largest = diag.cwiseAbs().maxCoeff();
        T cutoff = threshold() * largest;

        isize rank = 0;
        for (Eigen::Index i = 0; i < diag.size(); i++) {
            if (std::abs(diag(i)) > cutoff) rank++;
        }
        return rank;
    }
};

} // namespace dense

} // namespace dkkt

#endif //DKKT_DENSE_DECOMPOSITION_BASE_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_DENSE_BLOCK_OPS_HPP
#define DKKT_DENSE_BLOCK_OPS_HPP

#include <stdexcept>

#include "dkkt/typedefs.hpp"

namespace dkkt
{

namespace dense
{

/**
 * Assembles the 2 x 2 block matrix
 *
 *     | top_left    | top_right    |
 *     | bottom_left | bottom_right |
 *
 * Blocks with zero rows or columns are allowed as long as the block rows
 * and block columns line up.
 */
template<typename T>
Mat<T> assemble_block(const CMatRef<T>& top_left, const CMatRef<T>& top_right,
                      const CMatRef<T>& bottom_left, const CMatRef<T>& bottom_right)
{
    if (top_left.rows() != top_right.rows() || bottom_left.rows() != bottom_right.rows()) {
        throw std::invalid_argument("blocks in the same block row must have the same number of rows");
    }
    if (top_left.cols() != bottom_left.cols() || top_right.cols() != bottom_right.cols()) {
        throw std::invalid_argument("blocks in the same block column must have the same number of columns");
    }

    const Eigen::Index r0 = top_left.rows();
    const Eigen::Index r1 = bottom_left.rows();
    const Eigen::Index c0 = top_left.cols();
    const Eigen::Index c1 = top_right.cols();

    Mat<T> res(r0 + r1, c0 + c1);
    res.topLeftCorner(r0, c0) = top_left;
    res.topRightCorner(r0, c1) = top_right;
    res.bottomLeftCorner(r1, c0) = bottom_left;
    res.bottomRightCorner(r1, c1) = bottom_right;
    return res;
}

// stacks top above bottom
template<typename T>
Mat<T> assemble_below(const CMatRef<T>& top, const CMatRef<T>& bottom)
{
    return assemble_block<T>(top, Mat<T>(top.rows(), 0), bottom, Mat<T>(bottom.rows(), 0));
}

/** \returns the rows [first, last) of matrix */
template<typename T>
Mat<T> row_range(const CMatRef<T>& matrix, isize first, isize last)
{
    if (first < 0 || last < first || last > matrix.rows()) {
        throw std::invalid_argument("row range out of bounds");
    }
    return matrix.middleRows(first, last - first);
}

} // namespace dense

} // namespace dkkt

#endif //DKKT_DENSE_BLOCK_OPS_HPP

// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#include <iostream>
#include "dkkt/dkkt.hpp"

/*
 * min 3 x1^2 + 2 x2^2 - x1 - 4 x2
 * s.t. x1 - 2 x2 = 1
 */
int main()
{
    int n = 2;
    int m = 1;

    Eigen::MatrixXd Q(n, n); Q << 6, 0, 0, 4;
    Eigen::VectorXd C(n); C << 1, 4;

    Eigen::MatrixXd A(m, n); A << 1, -2;
    Eigen::VectorXd B(m); B << 1;

    dkkt::KKTInput<double> input(Q, C, A, B);

    dkkt::KKTSolver<double> solver;
    solver.settings().verbose = true;
    solver.settings().compute_timings = true;
    solver.settings().validate = true;

    dkkt::KKTOutput<double> output = solver.solve(input);

    std::cout << "status = " << dkkt::status_to_string(output.info.status) << std::endl;
    std::cout << output << std::endl;

    return 0;
}

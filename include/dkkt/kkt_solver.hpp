// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_KKT_SOLVER_HPP
#define DKKT_KKT_SOLVER_HPP

#include <algorithm>
#include <array>
#include <Eigen/Dense>

#include "dkkt/fwd.hpp"
#include "dkkt/typedefs.hpp"
#include "dkkt/timer.hpp"
#include "dkkt/results.hpp"
#include "dkkt/settings.hpp"
#include "dkkt/kkt_input.hpp"
#include "dkkt/dense/block_ops.hpp"
#include "dkkt/dense/ldl.hpp"
#include "dkkt/dense/lu.hpp"

namespace dkkt
{

/**
 * Solver for dense KKT systems.
 *
 * When the KKT matrix is nonsingular there is a unique optimal primal-dual
 * pair (X, L). When it is singular but the system is still solvable, any
 * solution is an optimal pair. When the system is not solvable the quadratic
 * program is unbounded below or infeasible, which is reported through
 * KKTOutput::solvable and Status::DKKT_UNSOLVABLE.
 *
 * The strategies in strategy_order are tried one after the other and the
 * first one that succeeds produces the result:
 *  - direct_elimination: A is square and nonsingular, X is the only feasible point
 *  - schur_complement: Q is SPD and the Schur complement A Q^-1 A^T is nonsingular
 *  - full_augmented: the augmented KKT matrix is nonsingular
 *
 * A solver instance owns its factorization workspaces and must not be used
 * from several threads at the same time.
 */
template<typename T>
class KKTSolver
{
public:
    static constexpr std::array<Strategy, 3> strategy_order = {
        Strategy::direct_elimination,
        Strategy::schur_complement,
        Strategy::full_augmented
    };

protected:
    Settings<T> m_settings;

    dense::LDL<T> m_cholesky; // SPD detection of Q and solves with Q
    dense::LU<T> m_lu;

    Timer<T> m_factor_timer;

public:
    KKTSolver() = default;

    // preallocates the workspaces for problems shaped like template_input
    explicit KKTSolver(const KKTInput<T>& template_input)
        : m_cholesky(template_input.n()), m_lu(template_input.n())
    {}

    Settings<T>& settings() { return m_settings; }
    const Settings<T>& settings() const { return m_settings; }

    KKTOutput<T> solve(const KKTInput<T>& input)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::KKTSolver::solve");

        KKTOutput<T> output;

        if (!m_settings.verify_settings())
        {
            dkkt_eprint("invalid settings\n");
            output.info.status = Status::DKKT_INVALID_SETTINGS;
            return output;
        }

        Timer<T> run_timer;
        if (m_settings.compute_timings)
        {
            run_timer.start();
        }
        m_factor_timer.reset();

        apply_threshold();

        if (m_settings.verbose)
        {
            dkkt_print("----------------------------------------------------------\n");
            dkkt_print("                 DKKT dense KKT system solver             \n");
            dkkt_print("----------------------------------------------------------\n");
            dkkt_print("variables n = %zd\n", input.n());
            dkkt_print("equality constraints m = %zd\n", input.m());
            dkkt_print("right hand sides k = %zd\n", input.k());
        }

        output.x = Mat<T>::Zero(input.n(), input.k());
        output.l = Mat<T>::Zero(input.m(), input.k());

        if (m_settings.validate && !validate(input))
        {
            output.info.status = Status::DKKT_INVALID_INPUT;
            finish(output, run_timer);
            return output;
        }

        Timer<T> solve_timer;
        if (m_settings.compute_timings)
        {
            solve_timer.start();
        }

        for (Strategy strategy : strategy_order)
        {
            output.info.strategies_tried++;

            StrategyOutcome outcome = try_strategy(strategy, input, output);

            if (m_settings.verbose)
            {
                dkkt_print("strategy %-20s %s\n", strategy_to_string(strategy),
                           outcome == StrategyOutcome::solved ? "solved" : "not applicable");
            }

            if (outcome == StrategyOutcome::solved)
            {
                output.solvable = true;
                output.info.strategy = strategy;
                break;
            }
        }

        if (m_settings.compute_timings)
        {
            // substitutions and assembly, the factorizations are accounted separately
            output.info.solve_time = solve_timer.stop() - m_factor_timer.total();
        }

        output.info.status = output.solvable ? Status::DKKT_SOLVED : Status::DKKT_UNSOLVABLE;

        if (!output.solvable && m_settings.verbose)
        {
            dkkt_print("KKT system unsolvable\n");
            print_matrix("KKT", input.kkt());
            print_matrix("RHS", input.rhs());
            if (input.is_constrained())
            {
                print_matrix("Q", input.Q);
                print_matrix("C", input.C);
                print_matrix("A", *input.A);
                print_matrix("B", *input.B);
            }
        }

        finish(output, run_timer);
        return output;
    }

    /**
     * Runs a single strategy on input.
     *
     * On success output.x and output.l hold the solution. A strategy that is
     * not applicable may still have overwritten output.x or output.l.
     */
    StrategyOutcome try_strategy(Strategy strategy, const KKTInput<T>& input, KKTOutput<T>& output)
    {
        switch (strategy)
        {
            case Strategy::direct_elimination: return direct_elimination(input, output);
            case Strategy::schur_complement: return schur_complement(input, output);
            case Strategy::full_augmented: return full_augmented(input, output);
            case Strategy::none: return StrategyOutcome::not_applicable;
        }
        return StrategyOutcome::not_applicable;
    }

    /**
     * Checks that Q and C are non-empty, that A and B are given together,
     * that Q is positive semi-definite and that A has full row rank.
     * The reason of a failure is printed if verbose is set.
     */
    bool validate(const KKTInput<T>& input)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::KKTSolver::validate");

        apply_threshold();

        if (input.Q.size() == 0 || input.C.size() == 0) {
            return invalid("Neither Q nor C may be empty\n");
        }
        if (input.A.has_value() != input.B.has_value()) {
            return invalid("Either A or B is missing, and the other one is not\n");
        }

        m_cholesky.compute(input.Q);
        if (!m_cholesky.is_spd())
        {
            // not positive definite, check if at least positive semi-definite
            Mat<T> Q_sym = T(0.5) * (input.Q + input.Q.transpose());
            Eigen::SelfAdjointEigenSolver<Mat<T>> eig(Q_sym, Eigen::EigenvaluesOnly);
            if (eig.info() != Eigen::Success) {
                return invalid("Eigenvalue decomposition of Q failed\n");
            }

            const Vec<T>& eigenvalues = eig.eigenvalues();
            T scale = (std::max)(T(1), eigenvalues.cwiseAbs().maxCoeff());
            if (eigenvalues.minCoeff() < -m_settings.psd_tolerance * scale) {
                return invalid("Q must be positive semi-definite\n");
            }
        }

        if (input.A.has_value())
        {
            const Mat<T>& A = *input.A;
            if (A.rows() < A.cols()) {
                m_lu.compute(A.transpose());
            } else {
                m_lu.compute(A);
            }
            if (m_lu.rank() != A.rows()) {
                return invalid("A must have full row rank\n");
            }
        }

        return true;
    }

protected:
    StrategyOutcome direct_elimination(const KKTInput<T>& input, KKTOutput<T>& output)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::KKTSolver::direct_elimination");

        if (!input.is_constrained() || input.A->rows() != input.A->cols()) {
            return StrategyOutcome::not_applicable;
        }

        const Mat<T>& A = *input.A;

        factor(m_lu, A);
        if (!m_lu.is_solvable()) {
            return StrategyOutcome::not_applicable;
        }

        // only one feasible point
        output.x = m_lu.solve(*input.B);
        output.l = m_lu.solve_transposed(input.C - input.Q * output.x);

        return StrategyOutcome::solved;
    }

    StrategyOutcome schur_complement(const KKTInput<T>& input, KKTOutput<T>& output)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::KKTSolver::schur_complement");

        factor(m_cholesky, input.Q);
        if (!m_cholesky.is_spd()) {
            return StrategyOutcome::not_applicable;
        }

        if (!input.is_constrained())
        {
            output.x = m_cholesky.solve(input.C);
            output.l = Mat<T>::Zero(0, input.k());
            return StrategyOutcome::solved;
        }

        const Mat<T>& A = *input.A;

        // negated Schur complement A Q^-1 A^T
        Mat<T> inv_Q_AT = m_cholesky.solve(A.transpose());
        Mat<T> S = A * inv_Q_AT;

        factor(m_lu, S);
        if (!m_lu.is_solvable()) {
            return StrategyOutcome::not_applicable;
        }

        Mat<T> inv_Q_C = m_cholesky.solve(input.C);
        output.l = m_lu.solve(A * inv_Q_C - *input.B);
        output.x = m_cholesky.solve(input.C - A.transpose() * output.l);

        return StrategyOutcome::solved;
    }

    StrategyOutcome full_augmented(const KKTInput<T>& input, KKTOutput<T>& output)
    {
        DKKT_TRACY_ZoneScopedN("dkkt::KKTSolver::full_augmented");

        factor(m_lu, input.kkt());
        if (!m_lu.is_solvable()) {
            return StrategyOutcome::not_applicable;
        }

        Mat<T> XL = m_lu.solve(input.rhs());
        output.x = dense::row_range<T>(XL, 0, input.n());
        output.l = dense::row_range<T>(XL, input.n(), input.n() + input.m());

        return StrategyOutcome::solved;
    }

    template<typename Decomposition>
    void factor(Decomposition& decomposition, const CMatRef<T>& matrix)
    {
        if (m_settings.compute_timings)
        {
            m_factor_timer.start();
        }

        decomposition.compute(matrix);

        if (m_settings.compute_timings)
        {
            m_factor_timer.stop();
        }
    }

    void apply_threshold()
    {
        if (m_settings.rank_threshold > 0)
        {
            m_cholesky.set_threshold(m_settings.rank_threshold);
            m_lu.set_threshold(m_settings.rank_threshold);
        }
        else
        {
            m_cholesky.set_threshold(Eigen::Default);
            m_lu.set_threshold(Eigen::Default);
        }
    }

    bool invalid(const char* reason) const
    {
        if (m_settings.verbose)
        {
            dkkt_eprint("%s", reason);
        }
        return false;
    }

    void finish(KKTOutput<T>& output, Timer<T>& run_timer) const
    {
        if (m_settings.compute_timings)
        {
            output.info.factor_time = m_factor_timer.total();
            output.info.run_time = run_timer.stop();
        }

        if (m_settings.verbose)
        {
            dkkt_print("\n");
            dkkt_print("status:               %s\n", status_to_string(output.info.status));
            dkkt_print("strategy:             %s\n", strategy_to_string(output.info.strategy));
            if (m_settings.compute_timings)
            {
                dkkt_print("total run time:       %.3es\n", static_cast<double>(output.info.run_time));
                dkkt_print("  factor time:        %.3es\n", static_cast<double>(output.info.factor_time));
                dkkt_print("  solve time:         %.3es\n", static_cast<double>(output.info.solve_time));
            }
        }
    }

    static void print_matrix(const char* name, const Mat<T>& matrix)
    {
        dkkt_print("%s (%zd x %zd)\n", name, static_cast<isize>(matrix.rows()), static_cast<isize>(matrix.cols()));
        for (Eigen::Index i = 0; i < matrix.rows(); i++)
        {
            for (Eigen::Index j = 0; j < matrix.cols(); j++)
            {
                dkkt_print(" % .6e", static_cast<double>(matrix(i, j)));
            }
            dkkt_print("\n");
        }
    }
};

} // namespace dkkt

#ifdef DKKT_WITH_TEMPLATE_INSTANTIATION
#include "dkkt/kkt_solver.tpp"
#endif

#endif //DKKT_KKT_SOLVER_HPP

// SPDX-License-Identifier: MIT
#include "interpfit/math/dense_solver.hpp"
#include "interpfit/support/interpfit_trace.h"
#include <cassert>

namespace interpfit {

namespace {

Eigen::Map<const Eigen::VectorXd> as_vector(std::span<const double> v) {
    return Eigen::Map<const Eigen::VectorXd>(v.data(), static_cast<Eigen::Index>(v.size()));
}

} // namespace

Eigen::MatrixXd normal_matrix(const Eigen::MatrixXd& A) {
    return A.transpose() * A;
}

Eigen::VectorXd normal_rhs(const Eigen::MatrixXd& A, std::span<const double> b) {
    assert(static_cast<Eigen::Index>(b.size()) == A.rows());
    return A.transpose() * as_vector(b);
}

FitResult<std::vector<double>> solve_dense(
    const Eigen::MatrixXd& A,
    std::span<const double> b,
    const DenseSolverConfig& config)
{
    const auto rows = static_cast<size_t>(A.rows());
    const auto cols = static_cast<size_t>(A.cols());

    if (rows != cols) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_DENSE_SOLVER,
            static_cast<int>(FitErrorCode::DimensionMismatch), rows, cols);
        return std::unexpected(FitError(FitErrorCode::DimensionMismatch, rows, cols));
    }
    if (rows != b.size()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_DENSE_SOLVER,
            static_cast<int>(FitErrorCode::DimensionMismatch), rows, b.size());
        return std::unexpected(FitError(FitErrorCode::DimensionMismatch, rows, b.size()));
    }

    const Eigen::Index n = A.rows();
    if (n == 0) {
        return std::vector<double>{};
    }

    // Augmented matrix [A | b], n × (n+1)
    Eigen::MatrixXd aug(n, n + 1);
    aug.leftCols(n) = A;
    aug.col(n) = as_vector(b);

    // ========== Forward Elimination ==========

    for (Eigen::Index col = 0; col < n; ++col) {
        // Partial pivoting: largest magnitude in this column at or below the diagonal
        Eigen::Index offset = 0;
        const double pivot_mag = aug.col(col).tail(n - col).cwiseAbs().maxCoeff(&offset);
        const Eigen::Index pivot_row = col + offset;

        if (pivot_mag < config.singularity_tol) {
            INTERPFIT_TRACE_SOLVER_SINGULAR(col, pivot_mag);
            return std::unexpected(FitError(FitErrorCode::SingularMatrix,
                                            static_cast<size_t>(n),
                                            static_cast<size_t>(col),
                                            pivot_mag));
        }

        if (pivot_row != col) {
            aug.row(col).swap(aug.row(pivot_row));
        }

        const Eigen::Index width = n + 1 - col;
        for (Eigen::Index r = col + 1; r < n; ++r) {
            const double factor = aug(r, col) / aug(col, col);
            if (factor == 0.0) continue;
            aug.row(r).tail(width) -= factor * aug.row(col).tail(width);
        }
    }

    // ========== Back Substitution ==========

    Eigen::VectorXd x(n);
    for (Eigen::Index i = n - 1; i >= 0; --i) {
        const Eigen::Index rest = n - 1 - i;
        const double sum = aug(i, n) - aug.row(i).segment(i + 1, rest).dot(x.segment(i + 1, rest));
        x(i) = sum / aug(i, i);
    }

    return std::vector<double>(x.data(), x.data() + n);
}

FitResult<std::vector<double>> solve_normal_equations(
    const Eigen::MatrixXd& A,
    std::span<const double> b,
    const DenseSolverConfig& config)
{
    if (static_cast<Eigen::Index>(b.size()) != A.rows()) {
        INTERPFIT_TRACE_VALIDATION_ERROR(INTERPFIT_MODULE_DENSE_SOLVER,
            static_cast<int>(FitErrorCode::DimensionMismatch), A.rows(), b.size());
        return std::unexpected(FitError(FitErrorCode::DimensionMismatch,
                                        static_cast<size_t>(A.rows()), b.size()));
    }

    const Eigen::MatrixXd AtA = normal_matrix(A);
    const Eigen::VectorXd Atb = normal_rhs(A, b);
    return solve_dense(AtA, std::span<const double>(Atb.data(), static_cast<size_t>(Atb.size())), config);
}

} // namespace interpfit

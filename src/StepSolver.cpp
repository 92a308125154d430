#include "curvefit/StepSolver.hpp"
#include "curvefit/ThreadPool.hpp"
#include "curvefit/Errors.hpp"
#include <Eigen/Cholesky>
#include <Eigen/QR>
#include <cmath>
#include <string>

namespace curvefit {

StepSolver::StepSolver(const ResidualEvaluator& evaluator,
                       const StepSolverOptions& options,
                       ThreadPool*              pool)
    : evaluator_(evaluator)
    , opt_(options)
    , pool_(pool)
{}

/* --------------------------------------------------------------------- */
/*  one forward-difference column                                        */
/* --------------------------------------------------------------------- */
Vector StepSolver::column(const Vector& params, const Vector& f0, Eigen::Index k) const
{
    const double h = opt_.gradient_difference;
    Vector p_eps = params;
    p_eps[k] += h;
    return (evaluator_.model_values(p_eps) - f0) / h;
}

Matrix StepSolver::jacobian(const Vector& params) const
{
    const Eigen::Index m = evaluator_.data().size();
    const Eigen::Index n = params.size();
    const Vector f0 = evaluator_.model_values(params);

    Matrix J(m, n);
    if (pool_ && pool_->size() > 1 && n > 1) {
        /* every task writes its own column only */
        pool_->for_each_index(static_cast<std::size_t>(n), [&](std::size_t k) {
            const auto col = static_cast<Eigen::Index>(k);
            J.col(col) = column(params, f0, col);
        });
    } else {
        for (Eigen::Index k = 0; k < n; ++k)
            J.col(k) = column(params, f0, k);
    }
    return J;
}

bool solve_damped_system(const Matrix& A, const Vector& b, Vector& delta)
{
    if (!A.allFinite() || !b.allFinite()) return false;

    Eigen::LDLT<Matrix> ldlt(A);                    // SPD solve
    if (ldlt.info() == Eigen::Success) {
        delta = ldlt.solve(b);
        if (ldlt.info() == Eigen::Success && delta.allFinite()) return true;
    }

    /* singular or indefinite: minimum-norm least squares */
    Eigen::CompleteOrthogonalDecomposition<Matrix> cod(A);
    delta = cod.solve(b);
    return delta.allFinite();
}

/* --------------------------------------------------------------------- */
/*  (JᵀJ + λ D) Δ = Jᵀ r ,   candidate θ + Δ                              */
/* --------------------------------------------------------------------- */
Vector StepSolver::compute_step(const Vector& params, double damping) const
{
    const Eigen::Index n = params.size();

    Vector r = evaluator_.residual_vector(params);
    Matrix J = jacobian(params);

    if (!r.allFinite() || !J.allFinite())
        throw NumericalFailure(std::string("The function evaluated to ") +
                               (r.hasNaN() || J.hasNaN() ? "NaN" : "Inf") +
                               " while estimating the Jacobian.\n  p = " +
                               format_vector(params),
                               params);

    /* ---------- weight rows by 1/σ_i when uncertainties are known ---- */
    if (evaluator_.has_uncertainties()) {
        const Vector s = evaluator_.sigmas(params);
        for (Eigen::Index i = 0; i < r.size(); ++i) {
            if (s[i] > 0.0) {
                r[i]     /= s[i];
                J.row(i) /= s[i];
            }
        }
    }

    Matrix JTJ = Matrix::Zero(n, n);
    JTJ.selfadjointView<Eigen::Lower>().rankUpdate(J.adjoint(), 1.0);
    JTJ.triangularView<Eigen::StrictlyUpper>() = JTJ.transpose();

    const Vector g = J.transpose() * r;

    switch (opt_.scaling) {
        case DampingScaling::Identity:
            JTJ.diagonal().array() += damping;
            break;
        case DampingScaling::Marquardt:
            JTJ.diagonal().array() += damping * (JTJ.diagonal().array() + 1e-20);
            break;
    }

    Vector delta;
    if (!solve_damped_system(JTJ, g, delta))
        throw NumericalFailure("The damped normal equations could not be solved "
                               "(damping = " + std::to_string(damping) + ").\n"
                               "  p = " + format_vector(params),
                               params);
    return params + delta;
}

} // namespace curvefit

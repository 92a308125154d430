#pragma once
#include "Types.hpp"
#include "DataSet.hpp"
#include "ResidualEvaluator.hpp"

namespace curvefit {

class ThreadPool;

/*  What λ multiplies in  (JᵀJ + λ D) Δ = Jᵀr .                              */
enum class DampingScaling {
    Identity,   // D = I
    Marquardt   // D = diag(JᵀJ)
};

struct StepSolverOptions {
    double         gradient_difference = 1e-6;
    DampingScaling scaling             = DampingScaling::Identity;
};

/*  Linearise the model around θ by forward differences and solve the damped
 *  normal equations for the update.  Rows are divided by σ_i when the
 *  evaluator carries uncertainties.
 */
class StepSolver {
public:
    StepSolver(const ResidualEvaluator& evaluator,
               const StepSolverOptions& options,
               ThreadPool*              pool = nullptr);

    /*  J_ik = (f(θ + δ e_k)(x_i) − f(θ)(x_i)) / δ ,  unweighted.            */
    Matrix jacobian(const Vector& params) const;

    /*  θ + Δ, not yet clipped to any bounds.  Throws NumericalFailure.      */
    Vector compute_step(const Vector& params, double damping) const;

private:
    Vector column(const Vector& params, const Vector& f0, Eigen::Index k) const;

    const ResidualEvaluator& evaluator_;
    StepSolverOptions        opt_;
    ThreadPool*              pool_;
};

/*  Solve  A Δ = b  for symmetric positive (semi-)definite A.  LDLᵀ first,
 *  complete orthogonal decomposition when that fails or is not finite.
 *  Returns false if neither produces a finite solution.                     */
bool solve_damped_system(const Matrix& A, const Vector& b, Vector& delta);

} // namespace curvefit

#include "curvefit/LevenbergMarquardt.hpp"
#include "curvefit/ConvergenceWindow.hpp"
#include "curvefit/ErrorPropagation.hpp"
#include "curvefit/ResidualEvaluator.hpp"
#include "curvefit/StepSolver.hpp"
#include "curvefit/ThreadPool.hpp"
#include "curvefit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>

namespace curvefit {

namespace {

void clip(Vector& p, const Vector& lower, const Vector& upper)
{
    for (Eigen::Index k = 0; k < p.size(); ++k)
        p[k] = std::min(std::max(lower[k], p[k]), upper[k]);
}

} // namespace

FitResult levenberg_marquardt(const DataSet&       data,
                              const ModelFunction& model,
                              const FitOptions&    opt)
{
    /* --------------------------------------------------------------- */
    /*  preconditions, before any model evaluation                     */
    /* --------------------------------------------------------------- */
    if (!(opt.damping > 0.0))
        throw InvalidOption("The damping option must be a positive number");
    validate(data);
    validate(opt);
    if (!model)
        throw InvalidOption("The model function must not be empty");

    Vector params = initial_parameters(opt);
    const Eigen::Index n = params.size();

    Vector lower, upper;
    resolve_bounds(opt, n, lower, upper);
    clip(params, lower, upper);

    if ((upper - lower).cwiseAbs().maxCoeff() == 0.0)
        std::cout << "[LM]  Warning: All parameters are pinned by their bounds! "
                     "There is nothing to fit..." << std::endl;

    if (opt.verbose)
        std::cout << "[LM] Entered fit: " << data.size() << " points, "
                  << n << " parameters, p0 = " << format_vector(params) << std::endl;

    /* --------------------------------------------------------------- */
    /*  per-call collaborators                                         */
    /* --------------------------------------------------------------- */
    PropagationConfig prop_cfg;
    prop_cfg.samples  = opt.error_propagation;
    prop_cfg.sampling = opt.propagation_sampling;
    prop_cfg.seed     = opt.seed;
    const ErrorPropagator propagator(prop_cfg);

    const ResidualEvaluator evaluator(data, model, propagator);

    std::unique_ptr<ThreadPool> pool;
    if (opt.threads > 1) pool = std::make_unique<ThreadPool>(opt.threads);

    StepSolverOptions step_opt;
    step_opt.gradient_difference = opt.gradient_difference;
    step_opt.scaling             = opt.damping_scaling;
    const StepSolver solver(evaluator, step_opt, pool.get());

    /* --------------------------------------------------------------- */
    /*  main iteration loop                                            */
    /* --------------------------------------------------------------- */
    FitResult result;
    ConvergenceWindow window;

    double residuals = evaluator.sum_of_squared_residuals(params);
    double damping   = opt.damping;
    bool   converged = false;
    int    iteration = 0;

    if (opt.verbose)
        std::cout << "[LM] Initial χ²=" << residuals << "  λ=" << damping << std::endl;

    while (iteration < opt.max_iterations && !converged) {
        Vector candidate = solver.compute_step(params, damping);
        clip(candidate, lower, upper);

        /* NaN throws NumericalFailure from here, never retried; +Inf is rejected */
        const double candidate_residuals = evaluator.sum_of_squared_residuals(candidate);
        const double previous            = residuals;
        const bool   accepted            = candidate_residuals < residuals;

        if (opt.record_history) {
            IterationRecord rec;
            rec.iteration           = iteration;
            rec.candidate           = candidate;
            rec.previous_residuals  = previous;
            rec.candidate_residuals = candidate_residuals;
            rec.accepted            = accepted;
            result.history.push_back(std::move(rec));
        }

        if (accepted) {
            params.swap(candidate);
            residuals = candidate_residuals;
            damping  *= opt.damping_drop;
        } else {
            damping  *= opt.damping_boost;
        }
        damping = std::max(opt.min_damping, std::min(opt.max_damping, damping));

        if (opt.record_history) {
            result.history.back().residuals = residuals;
            result.history.back().damping   = damping;
        }

        window.push(std::abs(previous - candidate_residuals));
        converged = window.converged(opt.residual_epsilon);

        if (opt.verbose)
            std::cout << "[LM]  iter " << iteration
                      << "  χ²=" << candidate_residuals
                      << "  λ="  << damping
                      << (accepted ? "  (accepted)" : "  (rejected)") << std::endl;
        ++iteration;
    }

    /* --------------------------------------------------------------- */
    /*  report from the accepted parameters, not from the cache        */
    /* --------------------------------------------------------------- */
    result.parameter_values = params;
    result.residuals        = evaluator.sum_of_squared_residuals(params);
    result.iterations       = iteration;
    result.converged        = converged;
    result.parameter_error  = result.residuals;

    if (opt.verbose)
        std::cout << "[LM] " << (converged ? "Converged" : "Iteration limit reached")
                  << " after " << iteration << " iterations, χ²=" << result.residuals
                  << ", p = " << format_vector(params) << std::endl;
    return result;
}

FitResult normalize_result(FitResult internal, bool propagated)
{
    if (!propagated) internal.parameter_error = internal.residuals;
    return internal;
}

FitResult fit(const DataSet&       data,
              const ModelFunction& model,
              const FitOptions&    opt)
{
    return normalize_result(levenberg_marquardt(data, model, opt),
                            data.has_uncertainties());
}

FitResult fit(const DataSet&        data,
              const ModelFunction&  model,
              const nlohmann::json& raw_options)
{
    return fit(data, model, normalize_options(raw_options));
}

} // namespace curvefit

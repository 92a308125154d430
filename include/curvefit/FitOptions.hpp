#pragma once
#include "Types.hpp"
#include "ErrorPropagation.hpp"
#include "StepSolver.hpp"
#include <nlohmann/json.hpp>
#include <cfloat>
#include <cstdint>
#include <vector>

namespace curvefit {

/* ---------------------------  user visible bits  --------------------------- */

struct FitOptions {
    double damping             = 0.1;
    double damping_drop        = 0.1;
    double damping_boost       = 1.5;
    double min_damping         = DBL_EPSILON;
    double max_damping         = 9007199254740991.0;   // 2^53 - 1
    double gradient_difference = 1e-6;

    std::vector<double> min_values;                    // empty = unbounded
    std::vector<double> max_values;
    std::vector<double> initial_values;                // empty = all ones
    int    parameter_count     = 0;                    // used without initial_values

    int    max_iterations      = 100;
    double residual_epsilon    = 1e-6;
    int    error_propagation   = 50;                   // samples per point

    PropagationSampling propagation_sampling = PropagationSampling::Quantile;
    std::uint32_t       seed                 = 42;
    DampingScaling      damping_scaling      = DampingScaling::Identity;
    unsigned            threads              = 1;      // Jacobian workers
    bool                verbose              = false;  // chatty?
    bool                record_history       = false;
};

/*  Throws InvalidOption on any inconsistent field.  The parameter count is
 *  only checked against the bounds once it is known, see resolve_bounds().  */
void validate(const FitOptions& opt);

/*  Starting vector: initial_values, or parameter_count ones.                */
Vector initial_parameters(const FitOptions& opt);

/*  Per-component bounds of length n; absent sides are ±DBL_MAX.             */
void resolve_bounds(const FitOptions& opt,
                    Eigen::Index      n,
                    Vector&           lower,
                    Vector&           upper);

/* --------------------  boundary: canonical & legacy shapes  ---------------- */

/*  Accepts the canonical camelCase keys and the 1.x ones
 *  ("errorTolerance" → residualEpsilon).  null means default.               */
FitOptions normalize_options(const nlohmann::json& raw);

} // namespace curvefit

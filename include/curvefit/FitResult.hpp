#pragma once
#include "Types.hpp"
#include <vector>

namespace curvefit {

/*  One entry per iteration, filled only with FitOptions::record_history.    */
struct IterationRecord {
    int    iteration          = 0;
    Vector candidate;                  // after bound clipping
    double previous_residuals  = 0.0;  // objective before this iteration
    double candidate_residuals = 0.0;
    double residuals           = 0.0;  // after the accept / reject decision
    double damping             = 0.0;  // after clamping
    bool   accepted            = false;
};

struct FitResult {
    Vector parameter_values;
    double residuals       = 0.0;
    int    iterations      = 0;
    double parameter_error = 0.0;
    bool   converged       = false;    // window criterion met before the cap
    std::vector<IterationRecord> history;
};

/*  Legacy result shape: parameter_error mirrors residuals unless a
 *  propagated value was produced.                                           */
FitResult normalize_result(FitResult internal, bool propagated);

} // namespace curvefit

#pragma once
#include "Types.hpp"
#include "DataSet.hpp"
#include "FitOptions.hpp"
#include "FitResult.hpp"
#include <nlohmann/json.hpp>

namespace curvefit {

/* -------------------  Levenberg–Marquardt driver routine  ------------------ */
/*
 *  Minimises  Σ (y_i − f(θ)(x_i))²   (weighted by the propagated σ_i when the
 *  data set carries uncertainties) starting from initial_parameters(opt).
 *
 *  Damping shrinks by damping_drop after an accepted step and grows by
 *  damping_boost after a rejected one, clamped to [min_damping, max_damping].
 *  Stops after max_iterations or once the last ten objective changes are all
 *  ≤ residual_epsilon.
 *
 *  Throws InvalidOption / InvalidData before iterating, NumericalFailure when
 *  the objective turns NaN or the damped system cannot be solved.
 */
FitResult levenberg_marquardt(const DataSet&       data,
                              const ModelFunction& model,
                              const FitOptions&    opt = {});

/*  levenberg_marquardt() followed by normalize_result().                    */
FitResult fit(const DataSet&       data,
              const ModelFunction& model,
              const FitOptions&    opt = {});

/*  Raw (canonical or legacy) JSON options.                                  */
FitResult fit(const DataSet&        data,
              const ModelFunction&  model,
              const nlohmann::json& raw_options);

} // namespace curvefit

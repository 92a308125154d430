#pragma once
#include "Types.hpp"

namespace curvefit {

/*  χ² with per-point σ:
 *
 *        Σ  r_i² / σ_i²       (σ_i > 0)
 *        Σ  r_i²              (σ_i = 0, no error information)
 *
 *  An empty σ means "no weights at all".
 */
double weighted_chi2(const Vector& resid, const Vector& sigma);

} // namespace curvefit

#pragma once
#include "Types.hpp"
#include "DataSet.hpp"
#include <cstdint>

namespace curvefit {

// Noise added on top of the exact model values
struct NoiseConfig {
    double        y_sigma       = 0.0;    // Gaussian noise on y
    double        x_sigma       = 0.0;    // Gaussian jitter on x (after evaluation)
    bool          attach_errors = false;  // store the sigmas as x_error / y_error
    std::uint32_t seed          = 1;
};

/*  n equally spaced points on [lo, hi], both ends included                  */
Vector linspace(double lo, double hi, int n);

/*  y_i = f(θ)(x_i) (+ noise)                                               */
DataSet make_synthetic_dataset(const ModelFunction& model,
                               const Vector&        exact_params,
                               const Vector&        x,
                               const NoiseConfig&   noise = {});

} // namespace curvefit

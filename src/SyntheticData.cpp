#include "curvefit/SyntheticData.hpp"
#include "curvefit/Errors.hpp"
#include <random>
#include <string>

namespace curvefit {

Vector linspace(double lo, double hi, int n)
{
    if (n < 1) throw InvalidData("linspace(): need at least one point, got " + std::to_string(n));
    if (n == 1) return Vector::Constant(1, lo);

    Vector x(n);
    for (int i = 0; i < n; ++i) x[i] = lo + i * (hi - lo) / (n - 1);
    return x;
}

DataSet make_synthetic_dataset(const ModelFunction& model,
                               const Vector&        exact_params,
                               const Vector&        x,
                               const NoiseConfig&   noise)
{
    if (noise.x_sigma < 0.0 || noise.y_sigma < 0.0)
        throw InvalidData("make_synthetic_dataset(): noise sigmas must not be negative");

    const Evaluator f = model(exact_params);
    const Eigen::Index n = x.size();

    DataSet ds;
    ds.x.resize(n);
    ds.y.resize(n);

    std::mt19937 rng(noise.seed);
    std::normal_distribution<> gauss(0.0, 1.0);

    for (Eigen::Index i = 0; i < n; ++i) {
        ds.y[i] = f(x[i]);
        if (noise.y_sigma > 0.0) ds.y[i] += noise.y_sigma * gauss(rng);

        /* the recorded abscissa is the noisy one */
        ds.x[i] = x[i];
        if (noise.x_sigma > 0.0) ds.x[i] += noise.x_sigma * gauss(rng);
    }

    if (noise.attach_errors) {
        if (noise.x_sigma > 0.0) ds.x_error = Vector::Constant(n, noise.x_sigma);
        if (noise.y_sigma > 0.0) ds.y_error = Vector::Constant(n, noise.y_sigma);
    }
    return ds;
}

} // namespace curvefit

#include "curvefit/ErrorPropagation.hpp"
#include "curvefit/Errors.hpp"
#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <random>

namespace curvefit {

ErrorPropagator::ErrorPropagator(const PropagationConfig& cfg)
{
    if (cfg.samples < 1)
        throw InvalidOption("errorPropagation must be at least 1");

    const int n = cfg.samples;
    z_.resize(n);

    switch (cfg.sampling) {
        case PropagationSampling::Quantile: {
            const boost::math::normal_distribution<double> unit(0.0, 1.0);
            for (int k = 0; k < n; ++k)
                z_[k] = boost::math::quantile(unit, (k + 0.5) / n);
            break;
        }
        case PropagationSampling::Random: {
            std::mt19937 rng(cfg.seed);
            std::normal_distribution<double> unit(0.0, 1.0);
            for (int k = 0; k < n; ++k)
                z_[k] = unit(rng);
            break;
        }
    }
}

double ErrorPropagator::variance(const Evaluator& f,
                                 double           x,
                                 double           x_error,
                                 double           y_error) const
{
    double var = y_error * y_error;
    if (x_error <= 0.0 || z_.size() < 2) return var;

    /* population variance of f over the perturbed abscissae (Welford) */
    double mean = 0.0;
    double m2   = 0.0;
    for (Eigen::Index k = 0; k < z_.size(); ++k) {
        const double v     = f(x + x_error * z_[k]);
        const double delta = v - mean;
        mean += delta / static_cast<double>(k + 1);
        m2   += delta * (v - mean);
    }
    return var + m2 / static_cast<double>(z_.size());
}

Vector ErrorPropagator::sigmas(const DataSet& data, const Evaluator& f) const
{
    const Eigen::Index n = data.size();
    Vector s = Vector::Zero(n);
    if (!data.has_uncertainties()) return s;

    for (Eigen::Index i = 0; i < n; ++i) {
        const double dx = data.has_x_error() ? data.x_error[i] : 0.0;
        const double dy = data.has_y_error() ? data.y_error[i] : 0.0;
        s[i] = std::sqrt(variance(f, data.x[i], dx, dy));
    }
    return s;
}

} // namespace curvefit

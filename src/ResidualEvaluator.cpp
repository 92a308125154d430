#include "curvefit/ResidualEvaluator.hpp"
#include "curvefit/Chi2Utils.hpp"
#include "curvefit/Errors.hpp"
#include <cmath>
#include <string>

namespace curvefit {

ResidualEvaluator::ResidualEvaluator(const DataSet&         data,
                                     const ModelFunction&   model,
                                     const ErrorPropagator& propagator)
    : data_(data)
    , model_(model)
    , propagator_(propagator)
{}

Vector ResidualEvaluator::model_values(const Vector& params) const
{
    const Evaluator f = model_(params);
    const Eigen::Index n = data_.size();
    Vector out(n);
    for (Eigen::Index i = 0; i < n; ++i) out[i] = f(data_.x[i]);
    return out;
}

Vector ResidualEvaluator::residual_vector(const Vector& params) const
{
    return data_.y - model_values(params);
}

Vector ResidualEvaluator::sigmas(const Vector& params) const
{
    if (!has_uncertainties()) return Vector::Zero(data_.size());
    return propagator_.sigmas(data_, model_(params));
}

double ResidualEvaluator::sum_of_squared_residuals(const Vector& params) const
{
    /* one model instantiation for residuals and propagation alike */
    const Evaluator f = model_(params);
    const Eigen::Index n = data_.size();

    Vector r(n);
    for (Eigen::Index i = 0; i < n; ++i) r[i] = data_.y[i] - f(data_.x[i]);

    const double chi2 = has_uncertainties()
                      ? weighted_chi2(r, propagator_.sigmas(data_, f))
                      : weighted_chi2(r, Vector());

    /* +Inf is returned; the driver's strict '<' rejects it as a candidate */
    if (std::isnan(chi2))
        throw NumericalFailure("The function evaluated to NaN.\n"
                               "  p = " + format_vector(params) + "\n"
                               "  f(x) = " + format_vector(data_.y - r) + "\n"
                               "  x = " + format_vector(data_.x),
                               params);
    return chi2;
}

} // namespace curvefit

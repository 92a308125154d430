#pragma once
#include "Types.hpp"
#include "DataSet.hpp"
#include "ErrorPropagation.hpp"

namespace curvefit {

/*  Scores a parameter vector against one data set.  The propagator is only
 *  consulted when the data set carries x_error and/or y_error.             */
class ResidualEvaluator {
public:
    ResidualEvaluator(const DataSet&        data,
                      const ModelFunction&  model,
                      const ErrorPropagator& propagator);

    const DataSet& data() const { return data_; }
    bool has_uncertainties() const { return data_.has_uncertainties(); }

    /*  f(θ)(x_i) for every point                                            */
    Vector model_values(const Vector& params) const;

    /*  y_i − f(θ)(x_i)                                                      */
    Vector residual_vector(const Vector& params) const;

    /*  σ_i, 0 where there is no error information (or none at all).        */
    Vector sigmas(const Vector& params) const;

    /*  Σ r_i² / σ_i²  (σ_i = 0 → r_i²).  Throws NumericalFailure when the
     *  sum is NaN; an overflowing sum is returned as +Inf.                 */
    double sum_of_squared_residuals(const Vector& params) const;

private:
    const DataSet&         data_;
    const ModelFunction&   model_;
    const ErrorPropagator& propagator_;
};

} // namespace curvefit

#pragma once
#include "Types.hpp"
#include "DataSet.hpp"
#include <cstdint>

namespace curvefit {

/*  How the perturbations z_k of x_i are chosen.                             */
enum class PropagationSampling {
    Quantile,   // z_k = Φ⁻¹((k + ½) / N), deterministic
    Random      // z_k ~ N(0,1), drawn once from a seeded mt19937
};

struct PropagationConfig {
    int                 samples  = 50;
    PropagationSampling sampling = PropagationSampling::Quantile;
    std::uint32_t       seed     = 42;
};

/*  Effective output uncertainty of the model at each data point:
 *
 *        σ_i²  =  Var_k[ f(x_i + Δx_i · z_k) ]  +  Δy_i² .
 *
 *  The offsets z_k are fixed at construction, so every point and every
 *  iteration of one fit sees the very same samples.
 */
class ErrorPropagator {
public:
    explicit ErrorPropagator(const PropagationConfig& cfg);

    int           samples() const { return static_cast<int>(z_.size()); }
    const Vector& offsets() const { return z_; }

    double variance(const Evaluator& f,
                    double           x,
                    double           x_error,
                    double           y_error) const;

    /*  σ_i for every point; 0 where the data set has no error information.  */
    Vector sigmas(const DataSet& data, const Evaluator& f) const;

private:
    Vector z_;
};

} // namespace curvefit

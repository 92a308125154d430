#pragma once
#include "Types.hpp"

namespace curvefit {

// Observed points, optionally with 1-σ uncertainties on either axis.
// An empty error vector means "no information" for that axis.
struct DataSet {
    Vector x;
    Vector y;
    Vector x_error;
    Vector y_error;

    Eigen::Index size() const { return x.size(); }
    bool has_x_error() const { return x_error.size() > 0; }
    bool has_y_error() const { return y_error.size() > 0; }
    bool has_uncertainties() const { return has_x_error() || has_y_error(); }
};

/*  Throws InvalidData unless
 *     len(x) == len(y) >= 2,
 *     error vectors are empty or of the same length, finite and ≥ 0.
 */
void validate(const DataSet& data);

} // namespace curvefit

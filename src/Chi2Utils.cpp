#include "curvefit/Chi2Utils.hpp"
#include <cmath>

namespace curvefit {

double weighted_chi2(const Vector& r, const Vector& s)
{
    if (s.size() == 0) return r.squaredNorm();

    double chi2 = 0.0;
    for (int i = 0; i < r.size(); ++i) {
        const double ri2 = r[i] * r[i];
        chi2 += (s[i] > 0.0) ? ri2 / (s[i] * s[i]) : ri2;
    }
    return chi2;
}

} // namespace curvefit

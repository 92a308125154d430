#include "curvefit/Errors.hpp"
#include <sstream>
#include <iomanip>
#include <limits>

namespace curvefit {

std::string format_vector(const Vector& v)
{
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << '[';
    for (Eigen::Index i = 0; i < v.size(); ++i) {
        if (i) os << ", ";
        os << v[i];
    }
    os << ']';
    return os.str();
}

} // namespace curvefit

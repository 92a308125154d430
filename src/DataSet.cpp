#include "curvefit/DataSet.hpp"
#include "curvefit/Errors.hpp"
#include <cmath>
#include <string>

namespace curvefit {

static void check_errors(const Vector& err, Eigen::Index n, const char* name)
{
    if (err.size() == 0) return;
    if (err.size() != n)
        throw InvalidData(std::string("The data object must have ") + name +
                          " of the same length as x and y");
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!std::isfinite(err[i]) || err[i] < 0.0)
            throw InvalidData(std::string(name) + " entries must be finite and "
                              "non-negative (index " + std::to_string(i) + ")");
    }
}

void validate(const DataSet& data)
{
    if (data.x.size() == 0 || data.y.size() == 0)
        throw InvalidData("The data object must have x and y elements");
    if (data.x.size() < 2 || data.y.size() < 2)
        throw InvalidData("The data must have more than 2 points");
    if (data.x.size() != data.y.size())
        throw InvalidData("The data object must have equal number of x and y coordinates");

    check_errors(data.x_error, data.x.size(), "xError");
    check_errors(data.y_error, data.x.size(), "yError");
}

} // namespace curvefit

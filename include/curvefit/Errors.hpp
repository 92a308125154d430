#pragma once
#include "Types.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace curvefit {

/*  Base of everything the fitter throws.                                    */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*  Malformed configuration, detected before the first iteration.            */
class InvalidOption : public Error {
public:
    using Error::Error;
};

/*  Malformed data set (missing x/y, too few points, length mismatch …).     */
class InvalidData : public Error {
public:
    using Error::Error;
};

/*  NaN objective or an unsolvable damped system.  Fatal, never retried.     */
class NumericalFailure : public Error {
public:
    NumericalFailure(const std::string& what, Vector parameters)
        : Error(what)
        , parameters_(std::move(parameters))
    {}

    const Vector& parameters() const { return parameters_; }

private:
    Vector parameters_;
};

/*  "[a, b, c]" – used when composing error messages                         */
std::string format_vector(const Vector& v);

} // namespace curvefit

#include "curvefit/FitOptions.hpp"
#include "curvefit/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace curvefit {

void validate(const FitOptions& opt)
{
    if (!(opt.damping > 0.0))
        throw InvalidOption("The damping option must be a positive number");
    if (!opt.min_values.empty() && !opt.max_values.empty() &&
        opt.min_values.size() != opt.max_values.size())
        throw InvalidOption("minValues and maxValues should be the same size");
    if (opt.initial_values.empty() && opt.parameter_count <= 0)
        throw InvalidOption("Either initialValues or a positive parameterCount must be given");

    if (!(opt.damping_drop > 0.0 && opt.damping_drop <= 1.0))
        throw InvalidOption("dampingDrop must lie in (0, 1]");
    if (!(opt.damping_boost >= 1.0) || !std::isfinite(opt.damping_boost))
        throw InvalidOption("dampingBoost must be a finite number >= 1");
    if (!(opt.min_damping > 0.0) || !(opt.min_damping <= opt.max_damping))
        throw InvalidOption("Damping limits must satisfy 0 < minDamping <= maxDamping");
    if (opt.gradient_difference == 0.0 || !std::isfinite(opt.gradient_difference))
        throw InvalidOption("gradientDifference must be a finite, non-zero number");
    if (opt.max_iterations < 0)
        throw InvalidOption("maxIterations must not be negative");
    if (!(opt.residual_epsilon >= 0.0))
        throw InvalidOption("residualEpsilon must not be negative");
    if (opt.error_propagation < 1)
        throw InvalidOption("errorPropagation must be at least 1");
}

Vector initial_parameters(const FitOptions& opt)
{
    if (!opt.initial_values.empty())
        return Vector(Eigen::Map<const Vector>(opt.initial_values.data(),
                                               static_cast<Eigen::Index>(opt.initial_values.size())));
    return Vector::Ones(opt.parameter_count);
}

static Vector bound_or_default(const std::vector<double>& b,
                               Eigen::Index              n,
                               double                    fill,
                               const char*               name)
{
    if (b.empty()) return Vector::Constant(n, fill);
    if (static_cast<Eigen::Index>(b.size()) != n)
        throw InvalidOption(std::string(name) + " must have one entry per parameter (" +
                            std::to_string(n) + "), got " + std::to_string(b.size()));
    return Vector(Eigen::Map<const Vector>(b.data(), n));
}

void resolve_bounds(const FitOptions& opt,
                    Eigen::Index      n,
                    Vector&           lower,
                    Vector&           upper)
{
    lower = bound_or_default(opt.min_values, n, std::numeric_limits<double>::lowest(), "minValues");
    upper = bound_or_default(opt.max_values, n, std::numeric_limits<double>::max(),    "maxValues");

    for (Eigen::Index k = 0; k < n; ++k) {
        if (std::isnan(lower[k]) || std::isnan(upper[k]) || lower[k] > upper[k])
            throw InvalidOption("Invalid bounds for parameter " + std::to_string(k) +
                                ": [" + std::to_string(lower[k]) + ", " +
                                std::to_string(upper[k]) + "]");
    }
}

/* ------------------------------------------------------------------ */
/*  JSON boundary                                                      */
/* ------------------------------------------------------------------ */
namespace {

using nlohmann::json;

bool present(const json& j, const char* key)
{
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

/* JSON has no ±Infinity literal, accept it spelled out */
double as_number(const json& v, const std::string& key)
{
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "Infinity"  || s == "inf")  return  std::numeric_limits<double>::infinity();
        if (s == "-Infinity" || s == "-inf") return -std::numeric_limits<double>::infinity();
    }
    throw InvalidOption("option '" + key + "' must be a number");
}

void read(const json& j, const char* key, double& out)
{
    if (present(j, key)) out = as_number(j.at(key), key);
}

void read(const json& j, const char* key, int& out)
{
    if (!present(j, key)) return;
    const double v = as_number(j.at(key), key);
    if (v != std::floor(v) ||
        v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        throw InvalidOption(std::string("option '") + key + "' must be an integer");
    out = static_cast<int>(v);
}

void read(const json& j, const char* key, std::uint32_t& out)
{
    if (!present(j, key)) return;
    const double v = as_number(j.at(key), key);
    if (v != std::floor(v) || v < 0.0 ||
        v > static_cast<double>(std::numeric_limits<std::uint32_t>::max()))
        throw InvalidOption(std::string("option '") + key +
                            "' must be an integer in [0, 4294967295]");
    out = static_cast<std::uint32_t>(v);
}

void read(const json& j, const char* key, bool& out)
{
    if (!present(j, key)) return;
    if (!j.at(key).is_boolean())
        throw InvalidOption(std::string("option '") + key + "' must be a boolean");
    out = j.at(key).get<bool>();
}

void read(const json& j, const char* key, std::vector<double>& out)
{
    if (!present(j, key)) return;
    const json& arr = j.at(key);
    if (!arr.is_array())
        throw InvalidOption(std::string(key) + " must be an array");
    out.clear();
    out.reserve(arr.size());
    for (const auto& el : arr) out.push_back(as_number(el, key));
}

} // namespace

FitOptions normalize_options(const nlohmann::json& raw)
{
    FitOptions opt;
    if (raw.is_null()) return opt;
    if (!raw.is_object())
        throw InvalidOption("options must be a JSON object");

    read(raw, "damping",            opt.damping);
    read(raw, "dampingDrop",        opt.damping_drop);
    read(raw, "dampingBoost",       opt.damping_boost);
    read(raw, "minDamping",         opt.min_damping);
    read(raw, "maxDamping",         opt.max_damping);
    read(raw, "gradientDifference", opt.gradient_difference);
    read(raw, "minValues",          opt.min_values);
    read(raw, "maxValues",          opt.max_values);
    read(raw, "initialValues",      opt.initial_values);
    read(raw, "parameterCount",     opt.parameter_count);
    read(raw, "maxIterations",      opt.max_iterations);
    read(raw, "errorPropagation",   opt.error_propagation);
    read(raw, "verbose",            opt.verbose);
    read(raw, "recordHistory",      opt.record_history);

    /* 1.x spelled the convergence threshold "errorTolerance" */
    if (present(raw, "residualEpsilon"))
        read(raw, "residualEpsilon", opt.residual_epsilon);
    else
        read(raw, "errorTolerance",  opt.residual_epsilon);

    read(raw, "seed",               opt.seed);

    int threads = static_cast<int>(opt.threads);
    read(raw, "threads", threads);
    if (threads < 0) throw InvalidOption("option 'threads' must not be negative");
    opt.threads = static_cast<unsigned>(threads);

    if (present(raw, "propagationSampling")) {
        const auto& v = raw.at("propagationSampling");
        const std::string s = v.is_string() ? v.get<std::string>() : std::string();
        if      (s == "quantile") opt.propagation_sampling = PropagationSampling::Quantile;
        else if (s == "random")   opt.propagation_sampling = PropagationSampling::Random;
        else throw InvalidOption("propagationSampling must be \"quantile\" or \"random\"");
    }
    if (present(raw, "dampingScaling")) {
        const auto& v = raw.at("dampingScaling");
        const std::string s = v.is_string() ? v.get<std::string>() : std::string();
        if      (s == "identity")  opt.damping_scaling = DampingScaling::Identity;
        else if (s == "marquardt") opt.damping_scaling = DampingScaling::Marquardt;
        else throw InvalidOption("dampingScaling must be \"identity\" or \"marquardt\"");
    }
    return opt;
}

} // namespace curvefit

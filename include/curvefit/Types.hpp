#pragma once
#include <Eigen/Dense>
#include <functional>

namespace curvefit {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	/*  f(x) for one fixed parameter vector                                 */
	using Evaluator     = std::function<double(double)>;
	/*  parameters  ->  (x -> y)                                            */
	using ModelFunction = std::function<Evaluator(const Vector&)>;
} // namespace curvefit

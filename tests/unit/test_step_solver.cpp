/**
 * @file test_step_solver.cpp
 * @brief Unit tests for the finite-difference Jacobian and damped step
 */

#include <gtest/gtest.h>
#include <curvefit/StepSolver.hpp>
#include <curvefit/ThreadPool.hpp>
#include <curvefit/Errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

using namespace curvefit;

class StepSolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        line_ = [](const Vector& p) {
            return Evaluator([a = p[0], b = p[1]](double t) { return a * t + b; });
        };
        data_.x = Vector::LinSpaced(11, 0.0, 5.0);
        data_.y = (2.0 * data_.x.array() - 1.0).matrix();
    }

    DataSet         data_;
    ModelFunction   line_;
    ErrorPropagator propagator_{PropagationConfig{}};
};

// =============================================================================
// jacobian()
// =============================================================================

TEST_F(StepSolverTest, Jacobian_LinearModel) {
    ResidualEvaluator ev(data_, line_, propagator_);
    StepSolver solver(ev, StepSolverOptions{});

    Matrix J = solver.jacobian(Vector::Zero(2));
    ASSERT_EQ(J.rows(), 11);
    ASSERT_EQ(J.cols(), 2);
    for (Eigen::Index i = 0; i < J.rows(); ++i) {
        EXPECT_NEAR(J(i, 0), data_.x[i], 1e-6);   // ∂f/∂a = t
        EXPECT_NEAR(J(i, 1), 1.0, 1e-6);          // ∂f/∂b = 1
    }
}

TEST_F(StepSolverTest, Jacobian_ForwardDifference) {
    ModelFunction expo = [](const Vector& p) {
        return Evaluator([k = p[0]](double t) { return std::exp(k * t); });
    };
    ResidualEvaluator ev(data_, expo, propagator_);
    StepSolverOptions opt;
    opt.gradient_difference = 1e-3;
    StepSolver solver(ev, opt);

    Matrix J = solver.jacobian(Vector::Constant(1, 0.5));
    for (Eigen::Index i = 0; i < J.rows(); ++i) {
        const double t = data_.x[i];
        const double expected = (std::exp((0.5 + 1e-3) * t) - std::exp(0.5 * t)) / 1e-3;
        EXPECT_NEAR(J(i, 0), expected, 1e-9 * std::max(1.0, std::abs(expected)));
    }
}

TEST_F(StepSolverTest, Jacobian_ThreadedMatchesSerial) {
    ModelFunction poly = [](const Vector& p) {
        return Evaluator([p](double t) {
            return p[0] + p[1] * t + p[2] * t * t + p[3] * std::sin(p[4] * t);
        });
    };
    ResidualEvaluator ev(data_, poly, propagator_);
    Vector p(5);
    p << 0.3, -1.2, 0.05, 2.0, 1.7;

    StepSolver serial(ev, StepSolverOptions{});
    ThreadPool pool(4);
    StepSolver threaded(ev, StepSolverOptions{}, &pool);

    const Matrix a = serial.jacobian(p);
    const Matrix b = threaded.jacobian(p);
    EXPECT_EQ((a - b).cwiseAbs().maxCoeff(), 0.0);
    EXPECT_EQ((serial.compute_step(p, 0.1) - threaded.compute_step(p, 0.1)).cwiseAbs().maxCoeff(), 0.0);
}

// =============================================================================
// compute_step()
// =============================================================================

TEST_F(StepSolverTest, Step_GaussNewtonSolvesLinearModel) {
    ResidualEvaluator ev(data_, line_, propagator_);
    StepSolver solver(ev, StepSolverOptions{});

    Vector next = solver.compute_step(Vector::Zero(2), 1e-12);
    EXPECT_NEAR(next[0], 2.0, 1e-6);
    EXPECT_NEAR(next[1], -1.0, 1e-6);
}

TEST_F(StepSolverTest, Step_LargeDampingIsShortGradientStep) {
    ResidualEvaluator ev(data_, line_, propagator_);
    StepSolver solver(ev, StepSolverOptions{});

    const Vector p0 = Vector::Zero(2);
    const double lambda = 1e8;
    Vector delta = solver.compute_step(p0, lambda) - p0;

    // (JᵀJ + λI)Δ = Jᵀr  →  Δ ≈ Jᵀr / λ for λ ≫ ‖JᵀJ‖
    const Matrix J = solver.jacobian(p0);
    const Vector g = J.transpose() * ev.residual_vector(p0);
    EXPECT_TRUE(delta.isApprox(g / lambda, 1e-4));
}

TEST_F(StepSolverTest, Step_MarquardtScaling) {
    ResidualEvaluator ev(data_, line_, propagator_);
    StepSolverOptions opt;
    opt.scaling = DampingScaling::Marquardt;
    StepSolver solver(ev, opt);

    const Vector p0 = Vector::Zero(2);
    const double lambda = 0.5;
    Vector delta = solver.compute_step(p0, lambda) - p0;

    const Matrix J = solver.jacobian(p0);
    Matrix A = J.transpose() * J;
    A.diagonal() *= (1.0 + lambda);
    const Vector expected = A.ldlt().solve(J.transpose() * ev.residual_vector(p0));
    EXPECT_TRUE(delta.isApprox(expected, 1e-9));
}

TEST_F(StepSolverTest, Step_WeightsRowsByPropagatedSigma) {
    data_.y_error = Vector::Constant(data_.size(), 0.1);
    data_.y_error[0] = 10.0;                  // nearly ignore the first point
    data_.y[0] += 5.0;

    ResidualEvaluator ev(data_, line_, propagator_);
    StepSolver solver(ev, StepSolverOptions{});
    Vector next = solver.compute_step(Vector::Zero(2), 1e-12);

    // the outlier carries 1e-4 of the weight of the others
    EXPECT_NEAR(next[0], 2.0, 1e-2);
    EXPECT_NEAR(next[1], -1.0, 1e-2);
}

TEST_F(StepSolverTest, Step_NaNModelThrows) {
    ModelFunction bad = [](const Vector&) {
        return Evaluator([](double) { return std::numeric_limits<double>::quiet_NaN(); });
    };
    ResidualEvaluator ev(data_, bad, propagator_);
    StepSolver solver(ev, StepSolverOptions{});
    try {
        solver.compute_step(Vector::Ones(1), 0.1);
        FAIL() << "expected NumericalFailure";
    } catch (const NumericalFailure& e) {
        EXPECT_NE(std::string(e.what()).find("evaluated to NaN while estimating the Jacobian"),
                  std::string::npos);
    }
}

TEST_F(StepSolverTest, Step_InfiniteJacobianIsReportedAsInf) {
    // finite at a = 1, overflows one forward difference away
    ModelFunction wall = [](const Vector& p) {
        return Evaluator([a = p[0]](double t) {
            return a > 1.0 ? std::numeric_limits<double>::infinity() : a * t;
        });
    };
    ResidualEvaluator ev(data_, wall, propagator_);
    StepSolver solver(ev, StepSolverOptions{});
    try {
        solver.compute_step(Vector::Ones(1), 0.1);
        FAIL() << "expected NumericalFailure";
    } catch (const NumericalFailure& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("evaluated to Inf while estimating the Jacobian"), std::string::npos);
        EXPECT_EQ(what.find("NaN"), std::string::npos);
    }
}

// =============================================================================
// solve_damped_system()
// =============================================================================

TEST(SolveDampedSystemTest, SymmetricPositiveDefinite) {
    Matrix A(2, 2);
    A << 4.0, 1.0,
         1.0, 3.0;
    Vector b(2);
    b << 1.0, 2.0;
    Vector x;
    ASSERT_TRUE(solve_damped_system(A, b, x));
    EXPECT_TRUE((A * x).isApprox(b, 1e-12));
}

TEST(SolveDampedSystemTest, SingularButConsistent) {
    Matrix A(2, 2);
    A << 1.0, 1.0,
         1.0, 1.0;
    Vector b(2);
    b << 2.0, 2.0;
    Vector x;
    ASSERT_TRUE(solve_damped_system(A, b, x));
    EXPECT_TRUE(x.allFinite());
    EXPECT_TRUE((A * x).isApprox(b, 1e-9));
}

TEST(SolveDampedSystemTest, NonFiniteInputFails) {
    Matrix A = Matrix::Identity(2, 2);
    A(0, 1) = A(1, 0) = std::numeric_limits<double>::quiet_NaN();
    Vector b = Vector::Ones(2);
    Vector x;
    EXPECT_FALSE(solve_damped_system(A, b, x));
}

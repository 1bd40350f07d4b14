#include <cmath>

#include <gtest/gtest.h>
#include <Eigen/Dense>

#include "BLP.hpp"
#include "Optimizer.hpp"
#include "Results.hpp"
#include "Simulate.hpp"
#include "TestMarkets.hpp"
#include "ThetaMatrix.hpp"


class EstimationTest : public ::testing::Test
{

protected:
  EstimationTest()
    : design(small_design(40, 4, 40)), data(simulate_markets(design)\
					    .to_eigen())
  {
    blp_options.max_threads = 4;
    opt_options.grad_tol = 1e-9;
    opt_options.f_tol = 1e-14;
    opt_options.max_iter = 300;
    opt_options.verbose = false;
  }
  SimulationDesign design;
  EstimationData data;
  BLPOptions blp_options;
  OptimizerOptions opt_options;
};

TEST_F(EstimationTest, TrueParametersZeroTheMoments)
{
  BLP inst_BLP(data, ThetaMatrix(design.theta2), blp_options);
  const Eigen::VectorXd x = ThetaMatrix(design.theta2).vector();
  inst_BLP.objective(x);
  // settle the tolerance schedule down to its finest level
  for (unsigned rep = 0; rep < 3; ++rep) {
    Eigen::VectorXd x_rep = x;
    x_rep(0) += (rep + 1) * 1e-12;
    inst_BLP.objective(x_rep);
  }
  EXPECT_LT(inst_BLP.objective(x), 1e-12);
  for (unsigned k = 0; k < 3; ++k) {
    EXPECT_NEAR(inst_BLP.get_theta1()(k), design.theta1(k), 1e-6);
  }
}

TEST_F(EstimationTest, GMMRecoversParameters)
{
  BLP inst_BLP(data, ThetaMatrix(.9 * design.theta2), blp_options);
  ASSERT_EQ(inst_BLP.dimension(), 2u);
  Results results = inst_BLP.gmm(opt_options);
  EXPECT_TRUE(results.optimizer.converged);
  EXPECT_LT(results.objective, 1e-8);
  EXPECT_NEAR(results.theta2(0, 0), design.theta2(0, 0), 1e-3);
  EXPECT_NEAR(results.theta2(0, 1), design.theta2(0, 1), 1e-3);
  EXPECT_EQ(results.theta2(1, 0), 0.);
  EXPECT_EQ(results.theta2(1, 1), 0.);
  for (unsigned k = 0; k < 3; ++k) {
    EXPECT_NEAR(results.theta1(k), design.theta1(k), 1e-3);
  }
  ASSERT_EQ(results.varcov.rows(), 5);
  ASSERT_EQ(results.se_theta1.size(), 3);
  for (unsigned k = 0; k < 3; ++k) {
    EXPECT_TRUE(std::isfinite(results.se_theta1(k)));
    EXPECT_GT(results.se_theta1(k), 0.);
  }
  EXPECT_GT(results.se_theta2(0, 0), 0.);
  EXPECT_GT(results.se_theta2(0, 1), 0.);
  EXPECT_EQ(results.se_theta2(1, 0), 0.);
  EXPECT_EQ(results.se_theta2(1, 1), 0.);
  EXPECT_EQ(results.xi.size(), data.jt_size);
}

TEST_F(EstimationTest, VarcovIsSymmetricPositiveSemidefinite)
{
  Eigen::MatrixXd theta_start(2, 2);
  theta_start << .7, .4,
                 .2, 0.;
  BLP inst_BLP(data, ThetaMatrix(theta_start), blp_options);
  Eigen::MatrixXd varcov = inst_BLP.calc_varcov(ThetaMatrix(theta_start)\
						.vector());
  ASSERT_EQ(varcov.rows(), 6);
  ASSERT_EQ(varcov.cols(), 6);
  EXPECT_TRUE(varcov == varcov.transpose());
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen_solver(varcov);
  const Eigen::VectorXd eigenvalues = eigen_solver.eigenvalues();
  EXPECT_GE(eigenvalues.minCoeff(), -1e-10 * eigenvalues.maxCoeff());

  Eigen::MatrixXd se = inst_BLP.calc_se(varcov);
  ASSERT_EQ(se.rows(), 2);
  ASSERT_EQ(se.cols(), 2);
  EXPECT_NEAR(se(1, 0), std::sqrt(varcov(4, 4)), 1e-14);
  EXPECT_EQ(se(1, 1), 0.);
  EXPECT_EQ(thrown_stage([&] {
	inst_BLP.calc_se(Eigen::MatrixXd::Identity(4, 4)); }),
    Stage::sequencing);
}

TEST_F(EstimationTest, UnidentifiedParameterMakesVarcovSingular)
{
  // a free coefficient on a characteristic that is zero everywhere
  EstimationData flat = data;
  flat.X2.col(1).setZero();
  Eigen::MatrixXd theta_start(2, 2);
  theta_start << .7, .4,
                 .3, 0.;
  BLP inst_BLP(flat, ThetaMatrix(theta_start), blp_options);
  const Eigen::VectorXd x = ThetaMatrix(theta_start).vector();
  EXPECT_EQ(thrown_stage([&] { inst_BLP.calc_varcov(x); }),
	    Stage::linear_solve);
}

TEST_F(EstimationTest, GMMStopsWhenStartFails)
{
  Eigen::MatrixXd theta_bad(2, 2);
  theta_bad << 500., .5,
               0., 0.;
  BLP inst_BLP(data, ThetaMatrix(theta_bad), blp_options);
  EXPECT_EQ(thrown_stage([&] { inst_BLP.gmm(opt_options); }),
	    Stage::contraction);
}

#include <algorithm>
#include <cmath>

#include <gtest/gtest.h>
#include <Eigen/Dense>

#include "Contraction.hpp"
#include "Jacobian.hpp"
#include "Simulator.hpp"
#include "TestMarkets.hpp"
#include "ThetaMatrix.hpp"


static Eigen::VectorXd solve_delta(const EstimationData& data, const\
				   Eigen::MatrixXd& theta2)
{
  ContractionOptions options;
  options.tol = 1e-13;
  options.mean_tol = 1e-13;
  options.max_iter = 20000;
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  Eigen::VectorXd delta = Eigen::VectorXd::Zero(data.jt_size);
  calc_mu(data, theta2, mu);
  ContractionResult result = contraction(data, mu, delta, options, s_ijt,
					 s_calc);
  EXPECT_TRUE(result.ok());
  return delta;
}

TEST(Jacobian, TwoProductClosedForm)
{
  const unsigned ns = 10;
  EstimationData data = two_product_market(ns);
  ThetaMatrix theta2((Eigen::MatrixXd(1, 1) << .7).finished());
  Eigen::VectorXd delta(2);
  delta << -1., -.5;
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, theta2.matrix(), mu);
  calc_shares(data, delta, mu, s_ijt, s_calc);
  Eigen::MatrixXd Ddelta = calc_Ddelta(data, theta2, s_ijt);
  ASSERT_EQ(Ddelta.rows(), 2);
  ASSERT_EQ(Ddelta.cols(), 1);

  double h11 = 0., h22 = 0., h12 = 0., f1 = 0., f2 = 0.;
  for (unsigned i = 0; i < ns; ++i) {
    const double v = data.v[i][0][0];
    const double e1 = std::exp(delta(0) + .7 * v);
    const double e2 = std::exp(delta(1) + 2. * .7 * v);
    const double p1 = e1 / (1. + e1 + e2);
    const double p2 = e2 / (1. + e1 + e2);
    const double x_bar = 1. * p1 + 2. * p2;
    h11 += p1 * (1. - p1) / ns;
    h22 += p2 * (1. - p2) / ns;
    h12 -= p1 * p2 / ns;
    f1 += p1 * v * (1. - x_bar) / ns;
    f2 += p2 * v * (2. - x_bar) / ns;
  }
  const double det = h11 * h22 - h12 * h12;
  EXPECT_NEAR(Ddelta(0, 0), -(h22 * f1 - h12 * f2) / det, 1e-12);
  EXPECT_NEAR(Ddelta(1, 0), -(h11 * f2 - h12 * f1) / det, 1e-12);
}

TEST(Jacobian, MatchesFiniteDifferences)
{
  EstimationData data = small_markets(10, 3, 20);
  Eigen::MatrixXd theta0(2, 2);
  theta0 << .8, .5,
            .3, 0.;
  ThetaMatrix theta2(theta0);
  ASSERT_EQ(theta2.n_free(), 3u);

  Eigen::VectorXd delta = solve_delta(data, theta0);
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, theta0, mu);
  calc_shares(data, delta, mu, s_ijt, s_calc);
  Eigen::MatrixXd Ddelta = calc_Ddelta(data, theta2, s_ijt, 2);
  ASSERT_EQ(Ddelta.rows(), data.jt_size);
  ASSERT_EQ(Ddelta.cols(), 3);

  const double h = 1e-5;
  const Eigen::VectorXd theta_vec = theta2.vector();
  for (unsigned q = 0; q < 3; ++q) {
    Eigen::VectorXd step = Eigen::VectorXd::Zero(3);
    step(q) = h;
    Eigen::VectorXd d_plus = solve_delta(data, theta2.expand(theta_vec +\
							     step));
    Eigen::VectorXd d_minus = solve_delta(data, theta2.expand(theta_vec -\
							      step));
    Eigen::VectorXd numeric = (d_plus - d_minus) / (2. * h);
    for (unsigned jt = 0; jt < data.jt_size; ++jt) {
      EXPECT_NEAR(Ddelta(jt, q), numeric(jt), 1e-6 * std::max(1.,\
					std::abs(numeric(jt))))
	<< "product " << jt << ", parameter " << q;
    }
  }
}

TEST(Jacobian, ThreadCountDoesNotChangeResult)
{
  EstimationData data = small_markets(9, 3, 20);
  ThetaMatrix theta2(small_design().theta2);
  Eigen::VectorXd delta = solve_delta(data, theta2.matrix());
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, theta2.matrix(), mu);
  calc_shares(data, delta, mu, s_ijt, s_calc);
  EXPECT_TRUE(calc_Ddelta(data, theta2, s_ijt, 1) ==\
	      calc_Ddelta(data, theta2, s_ijt, 4));
}

TEST(Jacobian, SingularMarketThrows)
{
  EstimationData data = two_product_market(4);
  ThetaMatrix theta2((Eigen::MatrixXd(1, 1) << .5).finished());
  // nobody buys the second product
  Eigen::MatrixXd s_ijt = Eigen::MatrixXd::Zero(2, 4);
  s_ijt.row(0).setConstant(.3);
  EXPECT_EQ(thrown_stage([&] { calc_Ddelta(data, theta2, s_ijt); }),
	    Stage::linear_solve);
}

TEST(Jacobian, StaleSharesThrow)
{
  EstimationData data = two_product_market(4);
  ThetaMatrix theta2((Eigen::MatrixXd(1, 1) << .5).finished());
  Eigen::MatrixXd s_ijt = Eigen::MatrixXd::Constant(2, 3, .2);
  EXPECT_EQ(thrown_stage([&] { calc_Ddelta(data, theta2, s_ijt); }),
	    Stage::sequencing);
}

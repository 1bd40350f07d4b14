#include <cmath>

#include <gtest/gtest.h>
#include <Eigen/Dense>

#include "Errors.hpp"
#include "Simulator.hpp"
#include "TestMarkets.hpp"


class SimulatorTest : public ::testing::Test
{

protected:
  SimulatorTest() : data(small_markets(8, 4, 25))
  {
    theta2.resize(2, 2);
    theta2 << .8, .5,
              .3, -.2;
    delta = Eigen::VectorXd::LinSpaced(data.jt_size, -2., .5);
  }
  EstimationData data;
  Eigen::MatrixXd theta2;
  Eigen::VectorXd delta;
};

TEST_F(SimulatorTest, MuMatchesDefinition)
{
  Eigen::MatrixXd mu;
  calc_mu(data, theta2, mu);
  ASSERT_EQ(mu.rows(), data.jt_size);
  ASSERT_EQ(mu.cols(), data.ns);
  const unsigned jt = 5;
  const unsigned i = 7;
  const unsigned t = data.mkt_id[jt];
  double expected = 0.;
  for (unsigned k = 0; k < 2; ++k) {
    expected += data.X2(jt, k) * (theta2(k, 0) * data.v[i][k][t] +\
				  theta2(k, 1) * data.D[i][0][t]);
  }
  EXPECT_NEAR(mu(jt, i), expected, 1e-14);
}

TEST_F(SimulatorTest, OutsideGoodTakesTheRest)
{
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, theta2, mu);
  calc_shares(data, delta, mu, s_ijt, s_calc);
  for (unsigned t = 0; t < data.nmkt; ++t) {
    for (unsigned i = 0; i < data.ns; ++i) {
      double inside = 0.;
      double exp_sum = 0.;
      for (unsigned jt = data.mkt_begin[t]; jt < data.mkt_begin[t+1]; ++jt) {
	EXPECT_GT(s_ijt(jt, i), 0.);
	inside += s_ijt(jt, i);
	exp_sum += std::exp(delta(jt) + mu(jt, i));
      }
      EXPECT_LT(inside, 1.);
      EXPECT_NEAR(1. - inside, 1. / (1. + exp_sum), 1e-14);
    }
  }
  for (unsigned jt = 0; jt < data.jt_size; ++jt) {
    EXPECT_NEAR(s_calc(jt), s_ijt.row(jt).mean(), 1e-15);
  }
}

TEST_F(SimulatorTest, ZeroThetaIsPlainLogit)
{
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, Eigen::MatrixXd::Zero(2, 2), mu);
  calc_shares(data, delta, mu, s_ijt, s_calc);
  for (unsigned t = 0; t < data.nmkt; ++t) {
    double denom = 1.;
    for (unsigned jt = data.mkt_begin[t]; jt < data.mkt_begin[t+1]; ++jt) {
      denom += std::exp(delta(jt));
    }
    for (unsigned jt = data.mkt_begin[t]; jt < data.mkt_begin[t+1]; ++jt) {
      EXPECT_NEAR(s_calc(jt), std::exp(delta(jt)) / denom, 1e-15);
    }
  }
}

TEST_F(SimulatorTest, ThreadCountDoesNotChangeShares)
{
  Eigen::MatrixXd mu_1, mu_3, s_ijt_1, s_ijt_3;
  Eigen::VectorXd s_calc_1, s_calc_3;
  calc_mu(data, theta2, mu_1, 1);
  calc_mu(data, theta2, mu_3, 3);
  calc_shares(data, delta, mu_1, s_ijt_1, s_calc_1, 1);
  calc_shares(data, delta, mu_3, s_ijt_3, s_calc_3, 3);
  EXPECT_TRUE(mu_1 == mu_3);
  EXPECT_TRUE(s_ijt_1 == s_ijt_3);
  EXPECT_TRUE(s_calc_1 == s_calc_3);
}

TEST_F(SimulatorTest, WrongThetaShapeThrows)
{
  Eigen::MatrixXd mu;
  EXPECT_EQ(thrown_stage([&] { calc_mu(data, Eigen::MatrixXd::Zero(2, 3),
				       mu); }), Stage::simulator);
  EXPECT_EQ(thrown_stage([&] { calc_mu(data, Eigen::MatrixXd::Zero(3, 2),
				       mu); }), Stage::simulator);
}

#include <random>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "MarketData.hpp"
#include "Simulate.hpp"
#include "Simulator.hpp"


MarketData simulate_markets(const SimulationDesign& design, const unsigned\
			    num_threads)
{
  const unsigned nmkt = design.nmkt;
  const unsigned nbrand = design.nbrand;
  const unsigned ns = design.ns;
  const unsigned jt_size = nmkt * nbrand;
  const unsigned nD = design.theta2.cols() - 1;
  if (jt_size == 0 || ns == 0) {
    throw BLPError(Stage::config, "simulation needs markets, products and"\
		   " draws");
  }
  if (design.theta1.size() != 3 || design.theta2.rows() != 2 ||\
      design.theta2.cols() < 1) {
    throw BLPError(Stage::config, "simulation needs 3 linear parameters and"\
		   " a 2-row theta2");
  }
  std::mt19937 generator(design.seed);
  std::normal_distribution<double> normal_dist(0., 1.);

  MarketData md(ns, nmkt, 2, nD);
  /// draws, demographics shifted by a market mean
  std::vector<double> D_mean(nmkt, 0.);
  for (unsigned t = 0; t < nmkt; ++t) {
    const double mkt_shift = .5 * normal_dist(generator);
    for (unsigned i = 0; i < ns; ++i) {
      for (unsigned k = 0; k < 2; ++k) {
	md.v[i][k][t] = normal_dist(generator);
      }
      for (unsigned d = 0; d < nD; ++d) {
	md.D[i][d][t] = mkt_shift + normal_dist(generator);
      }
    }
    if (nD > 0) {
      for (unsigned i = 0; i < ns; ++i) {
	D_mean[t] += md.D[i][0][t] / ns;
      }
    }
  }

  /// characteristics, price and instruments
  Eigen::VectorXd x(jt_size), p(jt_size), u(jt_size), e(jt_size);
  Eigen::MatrixXd z(jt_size, 3);
  for (unsigned jt = 0; jt < jt_size; ++jt) {
    x(jt) = normal_dist(generator);
    for (unsigned l = 0; l < 3; ++l) {
      z(jt, l) = normal_dist(generator);
    }
    u(jt) = normal_dist(generator);
    e(jt) = normal_dist(generator);
    p(jt) = 1. + .5 * z(jt, 0) + .5 * z(jt, 1) + .3 * z(jt, 2) + .3 * x(jt)\
      + .5 * u(jt);
  }
  // no demographic interaction instrument without demographics
  const unsigned nz = (nD > 0) ? 8 : 7;
  Eigen::MatrixXd X1(jt_size, 3), X2(jt_size, 2), Z(jt_size, nz);
  for (unsigned t = 0; t < nmkt; ++t) {
    double x_sum = 0.;
    for (unsigned j = 0; j < nbrand; ++j) {
      x_sum += x(t * nbrand + j);
    }
    for (unsigned j = 0; j < nbrand; ++j) {
      const unsigned jt = t * nbrand + j;
      X1.row(jt) << 1., x(jt), p(jt);
      X2.row(jt) << x(jt), p(jt);
      Z(jt, 0) = 1.;
      Z(jt, 1) = x(jt);
      Z.block(jt, 2, 1, 3) = z.row(jt);
      Z(jt, 5) = x(jt) * x(jt);
      Z(jt, 6) = x_sum - x(jt);
      if (nD > 0) {
	Z(jt, 7) = x(jt) * D_mean[t];
      }
    }
  }

  /// structural error, correlated with price and orthogonal to Z
  Eigen::VectorXd xi = design.xi_sd * (e + .5 * u);
  Eigen::LLT<Eigen::MatrixXd> phi_llt(Z.transpose() * Z);
  if (phi_llt.info() != Eigen::Success) {
    throw BLPError(Stage::linear_solve, "simulated instruments are collinear");
  }
  xi -= Z * phi_llt.solve(Z.transpose() * xi);
  Eigen::VectorXd delta = X1 * design.theta1 + xi;

  /// shares simulated forward
  EstimationData data;
  data.jt_size = jt_size;
  data.nmkt = nmkt;
  data.ns = ns;
  data.X2 = X2;
  data.mkt_id.resize(jt_size);
  data.mkt_begin.resize(nmkt + 1);
  for (unsigned t = 0; t <= nmkt; ++t) {
    data.mkt_begin[t] = t * nbrand;
  }
  for (unsigned jt = 0; jt < jt_size; ++jt) {
    data.mkt_id[jt] = jt / nbrand;
  }
  data.v.resize(boost::extents[ns][2][nmkt]);
  data.v = md.v;
  data.D.resize(boost::extents[ns][nD][nmkt]);
  data.D = md.D;
  Eigen::MatrixXd mu, s_ijt;
  Eigen::VectorXd s_calc;
  calc_mu(data, design.theta2, mu, num_threads);
  calc_shares(data, delta, mu, s_ijt, s_calc, num_threads);

  md.S.resize(jt_size);
  md.X1.resize(jt_size, 3);
  md.X2.resize(jt_size, 2);
  md.Z.resize(jt_size, nz);
  md.mkt_id.resize(jt_size);
  for (unsigned jt = 0; jt < jt_size; ++jt) {
    md.S(jt) = s_calc(jt);
    for (unsigned i = 0; i < 3; ++i) {
      md.X1(jt, i) = X1(jt, i);
    }
    for (unsigned i = 0; i < 2; ++i) {
      md.X2(jt, i) = X2(jt, i);
    }
    for (unsigned i = 0; i < nz; ++i) {
      md.Z(jt, i) = Z(jt, i);
    }
    md.mkt_id(jt) = jt / nbrand;
  }
  return md;
}

#include <cmath>
#include <iostream>
#include <string>

#include <Eigen/Dense>

#include "BLP.hpp"
#include "Contraction.hpp"
#include "Errors.hpp"
#include "Jacobian.hpp"
#include "Parallel.hpp"
#include "Simulator.hpp"


BLP::BLP(const EstimationData& data_, const ThetaMatrix& theta2_, const\
	 BLPOptions& options_)
  : data(data_), options(options_), theta2(theta2_)
{
  num_threads = hardware_threads(options.max_threads);
  if (theta2.rows() != data.nx2() || theta2.num_demogr() != data.nD()) {
    throw BLPError(Stage::simulator, "theta2 must be " +\
		   std::to_string(data.nx2()) + "x" +\
		   std::to_string(data.nD() + 1));
  }

  /// weighting matrix and linear IV pieces, fixed for the run
  phi_llt.compute(data.Z.transpose() * data.Z);
  if (phi_llt.info() != Eigen::Success) {
    throw BLPError(Stage::linear_solve, "Z'Z is not positive definite");
  }
  Z_x1 = data.Z.transpose() * data.X1;
  phi_inv_Z_x1 = phi_llt.solve(Z_x1);
  x1_llt.compute(Z_x1.transpose() * phi_inv_Z_x1);
  if (x1_llt.info() != Eigen::Success) {
    throw BLPError(Stage::linear_solve, "x1'Z W Z'x1 is not positive definite");
  }

  /// initial delta: fit of the logit IV regression of ln S_jt - ln S_0t
  Eigen::VectorXd y(data.jt_size);
  for (unsigned t = 0; t < data.nmkt; ++t) {
    double s_0t = 1.;
    for (unsigned jt = data.mkt_begin[t]; jt < data.mkt_begin[t+1]; ++jt) {
      s_0t -= data.S(jt);
    }
    for (unsigned jt = data.mkt_begin[t]; jt < data.mkt_begin[t+1]; ++jt) {
      y(jt) = data.ln_S(jt) - std::log(s_0t);
    }
  }
  delta = data.X1 * x1_llt.solve(phi_inv_Z_x1.transpose() *\
				 (data.Z.transpose() * y));

  etol = options.tol_coarse;
  gmm_old = 0.;
  gmm_diff = 1.;
  obj_value = options.sentinel;
  evaluated = false;
  last_ok = false;
}

void BLP::update_etol()
{
  if (gmm_diff < options.fine_threshold) {
    etol = options.tol_fine;
  } else if (gmm_diff < options.mid_threshold) {
    etol = options.tol_mid;
  } else {
    etol = options.tol_coarse;
  }
}

void BLP::calc_theta1()
{
  // theta1 = (X1'Z*phi_inv*Z'X1)^(-1)*X1'Z*phi_inv*Z'delta
  theta1 = x1_llt.solve(phi_inv_Z_x1.transpose() *\
			(data.Z.transpose() * delta));
}

double BLP::objective(const Eigen::VectorXd& theta_vec)
{
  if (theta_vec.size() != dimension()) {
    throw BLPError(Stage::sequencing, "objective called with " +\
		   std::to_string(theta_vec.size()) + " parameters, expected "\
		   + std::to_string(dimension()));
  }
  if (evaluated && theta_vec == last_theta_vec) {
    return obj_value;
  }
  theta2.set_vector(theta_vec);
  this->update_etol();
  calc_mu(data, theta2.matrix(), mu, num_threads);
  ContractionOptions c_options;
  c_options.tol = etol;
  c_options.mean_tol = options.mean_tol;
  c_options.max_iter = options.contraction_max_iter;
  c_options.num_threads = num_threads;
  c_options.verbose = options.verbose;
  last_contraction = contraction(data, mu, delta, c_options, s_ijt, s_calc);
  evaluated = true;
  last_theta_vec = theta_vec;
  if (!last_contraction.ok()) {
    last_ok = false;
    obj_value = options.sentinel;
    return obj_value;
  }
  last_ok = true;
  this->calc_theta1();
  xi = delta - data.X1 * theta1;
  Eigen::VectorXd Z_xi = data.Z.transpose() * xi;
  obj_value = Z_xi.dot(phi_llt.solve(Z_xi));
  gmm_diff = std::abs(gmm_old - obj_value);
  gmm_old = obj_value;
  if (options.verbose) {
    std::cout << "GMM value: " << obj_value << std::endl;
  }
  return obj_value;
}

Eigen::MatrixXd BLP::calc_Ddelta()
{
  if (!evaluated) {
    throw BLPError(Stage::sequencing, "Jacobian requested before any"\
		   " objective evaluation");
  }
  if (!last_ok) {
    throw BLPError(Stage::contraction, "no solved delta at the last"\
		   " evaluated parameters");
  }
  // individual shares at the solved delta
  calc_shares(data, delta, mu, s_ijt, s_calc, num_threads);
  return ::calc_Ddelta(data, theta2, s_ijt, num_threads);
}

Eigen::VectorXd BLP::gradient(const Eigen::VectorXd& theta_vec)
{
  if (!evaluated) {
    throw BLPError(Stage::sequencing, "gradient requested before any"\
		   " objective evaluation");
  }
  if (theta_vec.size() != dimension()) {
    throw BLPError(Stage::sequencing, "gradient called with " +\
		   std::to_string(theta_vec.size()) + " parameters, expected "\
		   + std::to_string(dimension()));
  }
  if (theta_vec != last_theta_vec) {
    if (options.verbose) {
      std::cout << "gradient away from last objective point, re-evaluating"\
		<< std::endl;
    }
    this->objective(theta_vec);
  }
  if (!last_ok) {
    throw BLPError(Stage::contraction, "gradient requested where the"\
		   " contraction mapping failed");
  }
  Eigen::MatrixXd Ddelta = this->calc_Ddelta();
  return 2. * Ddelta.transpose() * (data.Z * phi_llt.solve(data.Z.transpose()\
							    * xi));
}

Eigen::MatrixXd BLP::calc_varcov(const Eigen::VectorXd& theta_vec)
{
  this->objective(theta_vec);
  if (!last_ok) {
    throw BLPError(Stage::contraction, "contraction mapping failed at the"\
		   " final parameters");
  }
  // covariance of the moment conditions
  Eigen::MatrixXd Z_res = data.Z.array().colwise() * xi.array();
  Eigen::MatrixXd omega = Z_res.transpose() * Z_res;
  // gradient of the moment conditions
  Eigen::MatrixXd Ddelta = this->calc_Ddelta();
  Eigen::MatrixXd X(data.jt_size, data.X1.cols() + Ddelta.cols());
  X << data.X1, Ddelta;
  Eigen::MatrixXd G = data.Z.transpose() * X;
  Eigen::MatrixXd WG = phi_llt.solve(G);
  Eigen::LLT<Eigen::MatrixXd> GWG_llt(G.transpose() * WG);
  if (GWG_llt.info() != Eigen::Success) {
    throw BLPError(Stage::linear_solve, "G'WG is singular, parameters not"\
		   " identified by the instruments");
  }
  // (G'WG)^-1 G'W omega W G (G'WG)^-1
  Eigen::MatrixXd tmp = GWG_llt.solve(WG.transpose() * omega * WG);
  Eigen::MatrixXd varcov = GWG_llt.solve(tmp.transpose());
  return .5 * (varcov + varcov.transpose());
}

Eigen::VectorXd BLP::calc_se_theta1(const Eigen::MatrixXd& varcov) const
{
  const unsigned K1 = data.X1.cols();
  if (varcov.rows() != K1 + dimension()) {
    throw BLPError(Stage::sequencing, "varcov does not match the parameters");
  }
  return varcov.diagonal().head(K1).cwiseMax(0.).cwiseSqrt();
}

Eigen::MatrixXd BLP::calc_se(const Eigen::MatrixXd& varcov) const
{
  const unsigned K1 = data.X1.cols();
  if (varcov.rows() != K1 + dimension()) {
    throw BLPError(Stage::sequencing, "varcov does not match the parameters");
  }
  Eigen::VectorXd se_all = varcov.diagonal().cwiseMax(0.).cwiseSqrt();
  return theta2.expand(se_all.tail(dimension()));
}

Results BLP::gmm(const OptimizerOptions& opt_options)
{
  Eigen::VectorXd theta_vec = theta2.vector();
  this->objective(theta_vec);
  if (!last_ok) {
    throw BLPError(Stage::contraction, "contraction mapping fails at the"\
		   " starting values");
  }
  Results results;
  results.optimizer = minimize_bfgs(*this, theta_vec, opt_options);
  if (!results.optimizer.converged) {
    std::cout << "optimizer stopped without convergence after " <<\
      results.optimizer.iterations << " iterations" << std::endl;
  }
  results.varcov = this->calc_varcov(results.optimizer.x);
  results.objective = obj_value;
  results.theta2 = theta2.matrix();
  results.theta1 = theta1;
  results.xi = xi;
  results.delta = delta;
  results.se_theta1 = this->calc_se_theta1(results.varcov);
  results.se_theta2 = this->calc_se(results.varcov);
  return results;
}

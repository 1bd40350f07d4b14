#include <cmath>
#include <iostream>

#include <Eigen/Dense>

#include "Contraction.hpp"
#include "MarketData.hpp"
#include "Simulator.hpp"


const char* status_name(const ContractionStatus status)
{
  switch (status) {
  case ContractionStatus::iterating:
    return "iterating";
  case ContractionStatus::converged:
    return "converged";
  case ContractionStatus::failed:
    return "failed";
  case ContractionStatus::max_iterations:
    return "max_iterations";
  }
  return "unknown";
}

ContractionResult contraction(const EstimationData& data, const\
			      Eigen::MatrixXd& mu, Eigen::VectorXd& delta,\
			      const ContractionOptions& options,\
			      Eigen::MatrixXd& s_ijt, Eigen::VectorXd& s_calc)
{
  ContractionResult result;
  const Eigen::VectorXd delta_start = delta;
  Eigen::VectorXd diff(data.jt_size);
  while (result.status == ContractionStatus::iterating) {
    calc_shares(data, delta, mu, s_ijt, s_calc, options.num_threads);
    diff = data.ln_S - s_calc.array().log().matrix();
    if (!diff.allFinite()) {
      result.status = ContractionStatus::failed;
      break;
    }
    delta += diff;
    ++result.iterations;
    result.max_diff = diff.cwiseAbs().maxCoeff();
    result.mean_diff = diff.cwiseAbs().mean();
    if (result.max_diff < options.tol && result.mean_diff < options.mean_tol) {
      result.status = ContractionStatus::converged;
    } else if (result.iterations >= options.max_iter) {
      result.status = ContractionStatus::max_iterations;
    }
  }
  if (result.ok()) {
    if (options.verbose) {
      std::cout << "contraction mapping finished in " << result.iterations <<\
	" iterations" << std::endl;
    }
  } else {
    std::cout << "contraction mapping " << status_name(result.status) <<\
      " after " << result.iterations << " iterations (max |diff| " <<\
      result.max_diff << "), restoring delta" << std::endl;
    delta = delta_start;
  }
  return result;
}

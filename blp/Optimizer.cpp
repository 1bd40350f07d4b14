#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "Optimizer.hpp"


OptimizerResult minimize_bfgs(ObjectiveProvider& problem, const\
			      Eigen::VectorXd& x0, const OptimizerOptions&\
			      options)
{
  const unsigned n = x0.size();
  if (n != problem.dimension()) {
    throw BLPError(Stage::sequencing, "starting vector has " +\
		   std::to_string(n) + " entries, problem has " +\
		   std::to_string(problem.dimension()));
  }
  OptimizerResult res;
  res.x = x0;
  res.fval = problem.objective(res.x);
  ++res.fevals;
  if (n == 0) {
    res.grad.resize(0);
    res.converged = true;
    return res;
  }
  res.grad = problem.gradient(res.x);
  const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(n, n);
  Eigen::MatrixXd Hinv = I;
  bool scaled = false;
  double grad_size = res.grad.cwiseAbs().maxCoeff();
  while (true) {
    if (grad_size < options.grad_tol) {
      res.converged = true;
      break;
    }
    if (res.iterations == options.max_iter) {
      break;
    }
    Eigen::VectorXd dir = -Hinv * res.grad;
    double slope = res.grad.dot(dir);
    if (!(slope < 0.)) {
      // lost descent, restart from steepest descent
      Hinv = I;
      scaled = false;
      dir = -res.grad;
      slope = res.grad.dot(dir);
    }
    double step = scaled ? 1. : std::min(1., options.step_size / dir.norm());
    // backtracking
    Eigen::VectorXd x_new;
    double f_new = res.fval;
    bool accepted = false;
    for (unsigned h = 0; h <= options.max_halvings; ++h) {
      x_new = res.x + step * dir;
      f_new = problem.objective(x_new);
      ++res.fevals;
      if (std::isfinite(f_new) && f_new <= res.fval + 1e-4 * step * slope) {
	accepted = true;
	break;
      }
      step *= .5;
    }
    if (!accepted) {
      std::cout << "line search failed at iter " << res.iterations <<\
	", stopping" << std::endl;
      break;
    }
    Eigen::VectorXd g_new = problem.gradient(x_new);
    Eigen::VectorXd s = x_new - res.x;
    Eigen::VectorXd y = g_new - res.grad;
    double ys = y.dot(s);
    if (ys > 1e-12 * s.norm() * y.norm()) {
      if (!scaled) {
	Hinv = I * (ys / y.squaredNorm());
	scaled = true;
      }
      double rho = 1. / ys;
      Hinv = (I - rho * s * y.transpose()) * Hinv * (I - rho * y *\
						     s.transpose()) +\
	rho * s * s.transpose();
    }
    double f_old = res.fval;
    res.x = x_new;
    res.fval = f_new;
    res.grad = g_new;
    ++res.iterations;
    grad_size = res.grad.cwiseAbs().maxCoeff();
    if (options.verbose) {
      std::cout << "NR #iter: " << res.iterations << "  Gradient size: " <<\
	grad_size << "  Objective value: " << res.fval << std::endl;
    }
    if (f_old - res.fval <= options.f_tol * std::abs(f_old)) {
      res.converged = true;
      break;
    }
  }
  return res;
}

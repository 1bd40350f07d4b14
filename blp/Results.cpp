#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "Results.hpp"


void persist(const Results& results, const std::string& persist_file)
{
  std::remove(persist_file.c_str());
  std::ofstream fdesc;
  fdesc.open(persist_file);
  if (!fdesc.is_open()) {
    throw BLPError(Stage::data, "cannot write results file " + persist_file);
  }
  fdesc.precision(10);
  fdesc << "GMM objective: " << results.objective << '\n';
  fdesc << "optimizer converged: " << results.optimizer.converged <<\
    " (" << results.optimizer.iterations << " iters, " <<\
    results.optimizer.fevals << " objective evals)" << '\n';
  for (unsigned i = 0; i < results.theta1.size(); ++i) {
    fdesc << "theta1_" << i << ": " << results.theta1(i) << " (" <<\
      results.se_theta1(i) << ")" << '\n';
  }
  for (unsigned c = 0; c < results.theta2.cols(); ++c) {
    for (unsigned k = 0; k < results.theta2.rows(); ++k) {
      fdesc << "theta2_" << k << "_" << c << ": " << results.theta2(k, c) <<\
	" (" << results.se_theta2(k, c) << ")" << '\n';
    }
  }
  fdesc << "varcov:" << '\n';
  fdesc << results.varcov << '\n';
  fdesc.close();
  std::cout << "Finished params persistance in file " << persist_file <<\
    std::endl;
}

#ifndef RESULTSHEADERDEF
#define RESULTSHEADERDEF

#include <string>

#include <Eigen/Dense>

#include "Optimizer.hpp"


struct Results
{
  Eigen::MatrixXd theta2;
  Eigen::VectorXd theta1;
  Eigen::VectorXd xi;
  Eigen::VectorXd delta;
  // linear parameters first, then the free entries of theta2
  Eigen::MatrixXd varcov;
  Eigen::VectorXd se_theta1;
  Eigen::MatrixXd se_theta2;
  double objective = 0.;
  OptimizerResult optimizer;
};

void persist(const Results& results, const std::string& persist_file);

#endif

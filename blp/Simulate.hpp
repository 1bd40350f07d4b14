#ifndef SIMULATEHEADERDEF
#define SIMULATEHEADERDEF

#include <Eigen/Dense>

#include "MarketData.hpp"


struct SimulationDesign
{
  unsigned nmkt = 50;
  unsigned nbrand = 4;
  unsigned ns = 50;
  unsigned seed = 1234;
  // coefficients on [1, x, p]
  Eigen::VectorXd theta1 = (Eigen::VectorXd(3) << -1., 1., -1.).finished();
  // rows x and p; columns sigma and pi for each demographic
  Eigen::MatrixXd theta2 = (Eigen::MatrixXd(2, 2) << .8, .5, 0., 0.).finished();
  double xi_sd = .1;
};

/* Synthetic markets: X1 = [1, x, p], X2 = [x, p],
   Z = [1, x, z1, z2, z3, x^2, sum of rival x, x * market mean demographic]
   (the last column only with demographics).
   Price loads on the excluded instruments and on an error correlated with xi.
   xi is projected off Z, so the true parameters are an exact zero of the
   sample moment conditions. Shares are simulated forward with the same
   draws that are stored in the result. */
MarketData simulate_markets(const SimulationDesign& design, const unsigned\
			    num_threads=1);

#endif

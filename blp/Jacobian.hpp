#ifndef JACOBIANHEADERDEF
#define JACOBIANHEADERDEF

#include <Eigen/Dense>

#include "MarketData.hpp"
#include "ThetaMatrix.hpp"


/* d delta / d theta2 for the free entries of theta2 (columns in the order of
   ThetaMatrix::vector()), from the individual choice probabilities s_ijt at
   the solved delta. Per market the implicit function theorem gives
     H * Ddelta_t = -F1_t,   H = (diag(sum_i p_i) - sum_i p_i p_i') / ns
   where F1_t holds the share derivatives w/ respect to theta2. Markets are
   independent and split across threads. Throws BLPError(linear_solve) if some
   market's H is singular. */
Eigen::MatrixXd calc_Ddelta(const EstimationData& data, const ThetaMatrix&\
			    theta2, const Eigen::MatrixXd& s_ijt,\
			    const unsigned num_threads=1);

#endif

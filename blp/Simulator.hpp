#ifndef SIMULATORHEADERDEF
#define SIMULATORHEADERDEF

#include <Eigen/Dense>

#include "MarketData.hpp"


/* Market share simulator. Pure functions writing into caller buffers:
     mu(jt, i)    = x2_jt' (sigma .* v_it + Pi D_it)
     s_ijt(jt, i) = exp(delta_jt + mu(jt, i)) /
                    (1 + sum_{r in mkt(jt)} exp(delta_r + mu(r, i)))
     s_calc(jt)   = mean_i s_ijt(jt, i)
   Utilities are exponentiated directly, without max-shifting, so delta + mu
   must stay within the range of exp. */

void calc_mu(const EstimationData& data, const Eigen::MatrixXd& theta2,\
	     Eigen::MatrixXd& mu, const unsigned num_threads=1);

void calc_shares(const EstimationData& data, const Eigen::VectorXd& delta,\
		 const Eigen::MatrixXd& mu, Eigen::MatrixXd& s_ijt,\
		 Eigen::VectorXd& s_calc, const unsigned num_threads=1);

#endif

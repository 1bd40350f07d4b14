#include <cmath>
#include <string>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "MarketData.hpp"
#include "Parallel.hpp"
#include "Simulator.hpp"


void calc_mu(const EstimationData& data, const Eigen::MatrixXd& theta2,\
	     Eigen::MatrixXd& mu, const unsigned num_threads)
{
  const unsigned nx2 = data.nx2();
  const unsigned nD = data.nD();
  if (theta2.rows() != nx2 || theta2.cols() != nD + 1) {
    throw BLPError(Stage::simulator, "theta2 is " +\
		   std::to_string(theta2.rows()) + "x" +\
		   std::to_string(theta2.cols()) + ", data need " +\
		   std::to_string(nx2) + "x" + std::to_string(nD + 1));
  }
  mu.resize(data.jt_size, data.ns);
  auto mu_L = [&] (unsigned th, unsigned begin, unsigned end) {
		for (unsigned i = begin; i < end; ++i) {
		  for (unsigned jt = 0; jt < data.jt_size; ++jt) {
		    const unsigned t = data.mkt_id[jt];
		    double mu_ijt = 0.;
		    for (unsigned k = 0; k < nx2; ++k) {
		      double beta_ik = theta2(k, 0) * data.v[i][k][t];
		      for (unsigned d = 0; d < nD; ++d) {
			beta_ik += theta2(k, d + 1) * data.D[i][d][t];
		      }
		      mu_ijt += data.X2(jt, k) * beta_ik;
		    }
		    mu(jt, i) = mu_ijt;
		  }
		}
	      };
  run_blocks(data.ns, num_threads, mu_L);
}

void calc_shares(const EstimationData& data, const Eigen::VectorXd& delta,\
		 const Eigen::MatrixXd& mu, Eigen::MatrixXd& s_ijt,\
		 Eigen::VectorXd& s_calc, const unsigned num_threads)
{
  s_ijt.resize(data.jt_size, data.ns);
  // each individual owns one column of s_ijt
  auto s_calc_L = [&] (unsigned th, unsigned begin, unsigned end) {
		    for (unsigned i = begin; i < end; ++i) {
		      for (unsigned jt = 0; jt < data.jt_size; ++jt) {
			s_ijt(jt, i) = std::exp(delta(jt) + mu(jt, i));
		      }
		      for (unsigned t = 0; t < data.nmkt; ++t) {
			double mkt_sum = 1.;  // outside good
			for (unsigned jt = data.mkt_begin[t];\
			     jt < data.mkt_begin[t+1]; ++jt) {
			  mkt_sum += s_ijt(jt, i);
			}
			for (unsigned jt = data.mkt_begin[t];\
			     jt < data.mkt_begin[t+1]; ++jt) {
			  s_ijt(jt, i) /= mkt_sum;
			}
		      }
		    }
		  };
  run_blocks(data.ns, num_threads, s_calc_L);
  s_calc = s_ijt.rowwise().mean();
}

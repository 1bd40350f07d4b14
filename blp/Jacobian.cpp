#include <algorithm>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "Jacobian.hpp"
#include "MarketData.hpp"
#include "Parallel.hpp"
#include "ThetaMatrix.hpp"


Eigen::MatrixXd calc_Ddelta(const EstimationData& data, const ThetaMatrix&\
			    theta2, const Eigen::MatrixXd& s_ijt,\
			    const unsigned num_threads)
{
  const unsigned ns = data.ns;
  const double ns_d = ns;
  const unsigned n_free = theta2.n_free();
  if (theta2.rows() != data.nx2() || theta2.num_demogr() != data.nD()) {
    throw BLPError(Stage::simulator, "theta2 shape does not match X2 and D");
  }
  if (s_ijt.rows() != data.jt_size || s_ijt.cols() != ns) {
    throw BLPError(Stage::sequencing, "individual shares not computed for"\
		   " the current data");
  }
  Eigen::MatrixXd Ddelta(data.jt_size, n_free);
  std::vector<int> singular_mkt(std::max(1u, num_threads), -1);
  auto Ddelta_L = [&] (unsigned th, unsigned begin, unsigned end) {
		    Eigen::MatrixXd p, H, F1;
		    Eigen::VectorXd draw(ns);
		    Eigen::VectorXd mkt_total(ns);
		    for (unsigned t = begin; t < end; ++t) {
		      const unsigned jt0 = data.mkt_begin[t];
		      const unsigned nbrand = data.mkt_size(t);
		      if (nbrand == 0) {
			continue;
		      }
		      p = s_ijt.middleRows(jt0, nbrand);
		      /* share derivatives w/ respect to theta2: weight x2_k by
			 the draw of the column (v for sigma, D for pi), then
			 center on the within-market probability-weighted
			 total */
		      F1.resize(nbrand, n_free);
		      for (unsigned q = 0; q < n_free; ++q) {
			const unsigned k = theta2.free_row(q);
			const unsigned c = theta2.free_col(q);
			for (unsigned i = 0; i < ns; ++i) {
			  draw(i) = (c == 0) ? data.v[i][k][t] :\
			    data.D[i][c - 1][t];
			}
			mkt_total.setZero();
			for (unsigned j = 0; j < nbrand; ++j) {
			  mkt_total += data.X2(jt0 + j, k) *\
			    p.row(j).transpose();
			}
			for (unsigned j = 0; j < nbrand; ++j) {
			  F1(j, q) = (p.row(j).transpose().array() *\
				      draw.array() * (data.X2(jt0 + j, k) -\
						      mkt_total.array())).mean();
			}
		      }
		      // share derivatives w/ respect to delta
		      H = -(p * p.transpose()) / ns_d;
		      H.diagonal() += p.rowwise().sum() / ns_d;
		      Eigen::LLT<Eigen::MatrixXd> llt(H);
		      if (llt.info() == Eigen::Success) {
			Ddelta.middleRows(jt0, nbrand) = -llt.solve(F1);
		      } else {
			Eigen::FullPivLU<Eigen::MatrixXd> lu(H);
			if (lu.isInvertible()) {
			  Ddelta.middleRows(jt0, nbrand) = -lu.solve(F1);
			} else {
			  singular_mkt[th] = t;
			  break;
			}
		      }
		    }
		  };
  run_blocks(data.nmkt, num_threads, Ddelta_L);
  for (const auto& t : singular_mkt) {
    if (t >= 0) {
      throw BLPError(Stage::linear_solve, "share Jacobian w/ respect to delta"\
		     " is singular in market " + std::to_string(t));
    }
  }
  return Ddelta;
}

#ifndef CONTRACTIONHEADERDEF
#define CONTRACTIONHEADERDEF

#include <Eigen/Dense>

#include "MarketData.hpp"


enum class ContractionStatus
{
  iterating,
  converged,
  failed,  // non-finite share difference
  max_iterations
};

struct ContractionOptions
{
  double tol = 1e-9;  // max |ln S - ln s|
  double mean_tol = 1e-3;  // mean |ln S - ln s|
  unsigned max_iter = 1000;
  unsigned num_threads = 1;
  bool verbose = false;
};

struct ContractionResult
{
  ContractionStatus status = ContractionStatus::iterating;
  unsigned iterations = 0;
  double max_diff = 0.;
  double mean_diff = 0.;
  bool ok() const { return status == ContractionStatus::converged; }
};

const char* status_name(const ContractionStatus status);

/* Berry's contraction delta <- delta + ln S - ln s(delta, mu), warm-started
   from the delta passed in. If the result is not converged, delta is left at
   its warm-start value. s_ijt and s_calc hold the shares of the last step. */
ContractionResult contraction(const EstimationData& data, const\
			      Eigen::MatrixXd& mu, Eigen::VectorXd& delta,\
			      const ContractionOptions& options,\
			      Eigen::MatrixXd& s_ijt, Eigen::VectorXd& s_calc);

#endif

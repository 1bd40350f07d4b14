#ifndef BLPHEADERDEF
#define BLPHEADERDEF

#include <Eigen/Dense>

#include "Contraction.hpp"
#include "MarketData.hpp"
#include "Optimizer.hpp"
#include "Results.hpp"
#include "ThetaMatrix.hpp"


struct BLPOptions
{
  // contraction tol schedule on |change in GMM objective|
  double tol_coarse = 1e-9;
  double tol_mid = 1e-12;
  double tol_fine = 1e-13;
  double mid_threshold = 1e-3;
  double fine_threshold = 1e-6;
  double mean_tol = 1e-3;
  unsigned contraction_max_iter = 1000;
  // objective returned when the contraction fails
  double sentinel = 1e10;
  unsigned max_threads = 64;
  bool verbose = false;
};

/* GMM estimation driver. Owns delta, theta2 and the adaptive contraction
   tolerance; objective() and gradient() are the only mutators and are meant
   to be called in sequence by one optimizer. */
class BLP : public ObjectiveProvider
{

public:
  BLP(const EstimationData& data_, const ThetaMatrix& theta2_, const\
      BLPOptions& options_=BLPOptions());
  double objective(const Eigen::VectorXd& theta_vec) override;
  Eigen::VectorXd gradient(const Eigen::VectorXd& theta_vec) override;
  unsigned dimension() const override { return theta2.n_free(); }
  Eigen::MatrixXd calc_Ddelta();
  Eigen::MatrixXd calc_varcov(const Eigen::VectorXd& theta_vec);
  Eigen::MatrixXd calc_se(const Eigen::MatrixXd& varcov) const;
  Eigen::VectorXd calc_se_theta1(const Eigen::MatrixXd& varcov) const;
  Results gmm(const OptimizerOptions& opt_options);
  const EstimationData& get_data() const { return data; }
  const ThetaMatrix& get_theta2() const { return theta2; }
  const Eigen::VectorXd& get_delta() const { return delta; }
  const Eigen::VectorXd& get_theta1() const { return theta1; }
  const Eigen::VectorXd& get_xi() const { return xi; }
  double get_etol() const { return etol; }
  const ContractionResult& get_contraction() const { return last_contraction; }
  unsigned get_num_threads() const { return num_threads; }

private:
  void update_etol();
  void calc_theta1();
  EstimationData data;
  BLPOptions options;
  unsigned num_threads;
  ThetaMatrix theta2;
  // phi = Z'Z, the inverse of the weighting matrix
  Eigen::LLT<Eigen::MatrixXd> phi_llt;
  Eigen::MatrixXd Z_x1;
  Eigen::MatrixXd phi_inv_Z_x1;
  // x1'Z phi^-1 Z'x1
  Eigen::LLT<Eigen::MatrixXd> x1_llt;
  Eigen::VectorXd delta;
  Eigen::VectorXd theta1;
  Eigen::VectorXd xi;
  /// calc objs
  Eigen::MatrixXd mu;
  Eigen::MatrixXd s_ijt;
  Eigen::VectorXd s_calc;
  ContractionResult last_contraction;
  // adaptive tol state
  double etol;
  double gmm_old;
  double gmm_diff;
  double obj_value;
  bool evaluated;
  bool last_ok;
  Eigen::VectorXd last_theta_vec;
};

#endif

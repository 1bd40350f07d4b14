#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Errors.hpp"
#include "ThetaMatrix.hpp"


ThetaMatrix::ThetaMatrix(const Eigen::MatrixXd& theta0)
  : values(theta0)
{
  if (theta0.cols() < 1) {
    throw BLPError(Stage::config, "theta2 needs at least the sigma column");
  }
  mask = theta0.array() != 0.;
  this->index_mask();
}

ThetaMatrix::ThetaMatrix(const Eigen::MatrixXd& theta0, const MaskArray& mask_)
  : values(theta0), mask(mask_)
{
  if (theta0.cols() < 1) {
    throw BLPError(Stage::config, "theta2 needs at least the sigma column");
  }
  if (mask.rows() != theta0.rows() || mask.cols() != theta0.cols()) {
    throw BLPError(Stage::config, "theta2 mask has wrong shape");
  }
  for (unsigned c = 0; c < values.cols(); ++c) {
    for (unsigned k = 0; k < values.rows(); ++k) {
      if (!mask(k, c)) {
	values(k, c) = 0.;
      }
    }
  }
  this->index_mask();
}

void ThetaMatrix::index_mask()
{
  free_rows.clear();
  free_cols.clear();
  for (unsigned c = 0; c < mask.cols(); ++c) {
    for (unsigned k = 0; k < mask.rows(); ++k) {
      if (mask(k, c)) {
	free_rows.push_back(k);
	free_cols.push_back(c);
      }
    }
  }
}

Eigen::VectorXd ThetaMatrix::vector() const
{
  Eigen::VectorXd theta_vec(n_free());
  for (unsigned p = 0; p < n_free(); ++p) {
    theta_vec(p) = values(free_rows[p], free_cols[p]);
  }
  return theta_vec;
}

void ThetaMatrix::set_vector(const Eigen::VectorXd& theta_vec)
{
  if (theta_vec.size() != n_free()) {
    throw BLPError(Stage::sequencing, "parameter vector has " +\
		   std::to_string(theta_vec.size()) + " entries, mask has " +\
		   std::to_string(n_free()));
  }
  for (unsigned p = 0; p < n_free(); ++p) {
    values(free_rows[p], free_cols[p]) = theta_vec(p);
  }
}

Eigen::MatrixXd ThetaMatrix::expand(const Eigen::VectorXd& theta_vec) const
{
  if (theta_vec.size() != n_free()) {
    throw BLPError(Stage::sequencing, "cannot expand vector of size " +\
		   std::to_string(theta_vec.size()));
  }
  Eigen::MatrixXd out = Eigen::MatrixXd::Zero(values.rows(), values.cols());
  for (unsigned p = 0; p < n_free(); ++p) {
    out(free_rows[p], free_cols[p]) = theta_vec(p);
  }
  return out;
}

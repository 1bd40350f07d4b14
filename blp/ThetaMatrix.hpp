#ifndef THETAMATRIXHEADERDEF
#define THETAMATRIXHEADERDEF

#include <vector>

#include <Eigen/Dense>

typedef Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic> MaskArray;


/* Nonlinear parameters: one row per x2 characteristic, column 0 holds the
   taste-shock scales (sigma), columns 1..nD the demographic interactions (pi).
   Only entries flagged in the mask are estimated, the rest stay at zero. The
   mask is fixed at construction. */
class ThetaMatrix
{

public:
  ThetaMatrix() {}
  explicit ThetaMatrix(const Eigen::MatrixXd& theta0);
  ThetaMatrix(const Eigen::MatrixXd& theta0, const MaskArray& mask_);
  unsigned n_free() const { return free_rows.size(); }
  unsigned rows() const { return values.rows(); }
  unsigned cols() const { return values.cols(); }
  unsigned num_demogr() const { return values.cols() - 1; }
  bool is_free(unsigned k, unsigned c) const { return mask(k, c); }
  // free entries, column-major
  Eigen::VectorXd vector() const;
  void set_vector(const Eigen::VectorXd& theta_vec);
  Eigen::MatrixXd expand(const Eigen::VectorXd& theta_vec) const;
  const Eigen::MatrixXd& matrix() const { return values; }
  const MaskArray& free_mask() const { return mask; }
  double sigma(unsigned k) const { return values(k, 0); }
  double pi(unsigned k, unsigned d) const { return values(k, d + 1); }
  // position of the p-th free entry
  unsigned free_row(unsigned p) const { return free_rows[p]; }
  unsigned free_col(unsigned p) const { return free_cols[p]; }

private:
  void index_mask();
  Eigen::MatrixXd values;
  MaskArray mask;
  std::vector<unsigned> free_rows;
  std::vector<unsigned> free_cols;
};

#endif

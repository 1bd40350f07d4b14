#ifndef OPTIMIZERHEADERDEF
#define OPTIMIZERHEADERDEF

#include <Eigen/Dense>


// what an outer optimizer needs from a criterion function
class ObjectiveProvider
{

public:
  virtual ~ObjectiveProvider() {}
  virtual double objective(const Eigen::VectorXd& x) = 0;
  virtual Eigen::VectorXd gradient(const Eigen::VectorXd& x) = 0;
  virtual unsigned dimension() const = 0;
};

struct OptimizerOptions
{
  double grad_tol = 1e-8;  // max |gradient|
  double f_tol = 1e-12;  // relative objective decrease
  double step_size = 1e-1;  // length of the first trial step
  unsigned max_iter = 200;
  unsigned max_halvings = 40;
  bool verbose = true;
};

struct OptimizerResult
{
  Eigen::VectorXd x;
  double fval = 0.;
  Eigen::VectorXd grad;
  unsigned iterations = 0;
  unsigned fevals = 0;
  bool converged = false;
};

/* Quasi-Newton minimization with BFGS updates of the inverse Hessian and
   backtracking (Armijo) line search. The problem sees objective(x) before
   gradient(x) at every accepted point. */
OptimizerResult minimize_bfgs(ObjectiveProvider& problem, const\
			      Eigen::VectorXd& x0, const OptimizerOptions&\
			      options);

#endif

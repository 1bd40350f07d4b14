#ifndef CONFIGHEADERDEF
#define CONFIGHEADERDEF

#include <string>

#include <Eigen/Dense>

#include "BLP.hpp"
#include "Optimizer.hpp"
#include "Simulate.hpp"


struct RunConfig
{
  // run identifier
  std::string run_id = "01";
  // results directory
  std::string results_dir = "results/";
  std::string db_conninfo = "dbname = blp user = postgres password = passwd"\
    " hostaddr = 127.0.0.1 port = 5432";
  // num of draws and seed, database runs
  unsigned ns = 100;
  unsigned seed = 1;
  // initial params, one row per X2 column: sigma, pi_1, ..., pi_nD
  Eigen::MatrixXd theta2 = (Eigen::MatrixXd(2, 2) << .5, .5, 0., 0.).finished();
  BLPOptions blp;
  OptimizerOptions optimizer;
  SimulationDesign simulation;
  std::string arrays_file() const { return results_dir + "arrays/" + run_id; }
  std::string params_file() const { return results_dir + "est_params/" +\
      run_id; }
};

/* INI file, every key optional:
   [run] id, results_dir, db_conninfo, ns, seed
   [model] theta2 ("0.5 0.5; 0 0")
   [contraction] tol_coarse, tol_mid, tol_fine, mid_threshold,
                 fine_threshold, mean_tol, max_iter, sentinel, verbose
   [optimizer] grad_tol, f_tol, step_size, max_iter, verbose
   [parallel] max_threads
   [simulation] nmkt, nbrand, ns, seed, theta1 ("-1 1 -1"), theta2, xi_sd */
RunConfig load_config(const std::string& ini_file);

// rows separated by ';', entries by blanks or ','
Eigen::MatrixXd parse_matrix(const std::string& text);

#endif

#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <Eigen/Dense>

#include "Config.hpp"
#include "Errors.hpp"

namespace pt = boost::property_tree;


Eigen::MatrixXd parse_matrix(const std::string& text)
{
  std::vector<std::string> rows;
  std::string trimmed = boost::algorithm::trim_copy(text);
  boost::algorithm::split(rows, trimmed, boost::algorithm::is_any_of(";"));
  std::vector<std::vector<double>> values;
  for (auto& row : rows) {
    boost::algorithm::trim(row);
    if (row.empty()) {
      continue;
    }
    std::vector<std::string> entries;
    boost::algorithm::split(entries, row, boost::algorithm::is_any_of(" \t,"),\
			    boost::algorithm::token_compress_on);
    std::vector<double> row_values;
    for (const auto& entry : entries) {
      try {
	row_values.push_back(boost::lexical_cast<double>(entry));
      } catch (const boost::bad_lexical_cast&) {
	throw BLPError(Stage::config, "bad number '" + entry + "' in '" +\
		       text + "'");
      }
    }
    if (!values.empty() && row_values.size() != values[0].size()) {
      throw BLPError(Stage::config, "rows of different length in '" + text +\
		     "'");
    }
    values.push_back(row_values);
  }
  if (values.empty()) {
    throw BLPError(Stage::config, "empty matrix");
  }
  Eigen::MatrixXd m(values.size(), values[0].size());
  for (unsigned r = 0; r < values.size(); ++r) {
    for (unsigned c = 0; c < values[r].size(); ++c) {
      m(r, c) = values[r][c];
    }
  }
  return m;
}

/* Keys absent from the file keep their default, present keys must convert
   to the type of the default. */
template<class T>
void read_key(const pt::ptree& tree, const std::string& key, T& value)
{
  boost::optional<std::string> text = tree.get_optional<std::string>(key);
  if (!text) {
    return;
  }
  const std::string trimmed = boost::algorithm::trim_copy(*text);
  try {
    value = boost::lexical_cast<T>(trimmed);
  } catch (const boost::bad_lexical_cast&) {
    throw BLPError(Stage::config, "bad value '" + *text + "' for " + key);
  }
}

// lexical_cast wraps negative text around for unsigned
template<>
void read_key<unsigned>(const pt::ptree& tree, const std::string& key,\
			unsigned& value)
{
  boost::optional<std::string> text = tree.get_optional<std::string>(key);
  if (!text) {
    return;
  }
  const std::string trimmed = boost::algorithm::trim_copy(*text);
  if (trimmed.empty() || trimmed[0] == '-' || trimmed[0] == '+') {
    throw BLPError(Stage::config, "bad value '" + *text + "' for " + key);
  }
  try {
    value = boost::lexical_cast<unsigned>(trimmed);
  } catch (const boost::bad_lexical_cast&) {
    throw BLPError(Stage::config, "bad value '" + *text + "' for " + key);
  }
}

template<>
void read_key<bool>(const pt::ptree& tree, const std::string& key, bool&\
		    value)
{
  boost::optional<std::string> text = tree.get_optional<std::string>(key);
  if (!text) {
    return;
  }
  const std::string flag = boost::algorithm::to_lower_copy(\
			     boost::algorithm::trim_copy(*text));
  if (flag == "true" || flag == "1" || flag == "yes") {
    value = true;
  } else if (flag == "false" || flag == "0" || flag == "no") {
    value = false;
  } else {
    throw BLPError(Stage::config, "bad value '" + *text + "' for " + key);
  }
}

template<>
void read_key<std::string>(const pt::ptree& tree, const std::string& key,\
			   std::string& value)
{
  boost::optional<std::string> text = tree.get_optional<std::string>(key);
  if (text) {
    value = boost::algorithm::trim_copy(*text);
  }
}

RunConfig load_config(const std::string& ini_file)
{
  RunConfig config;
  pt::ptree tree;
  try {
    pt::read_ini(ini_file, tree);
  } catch (const pt::ini_parser_error& e) {
    throw BLPError(Stage::config, e.what());
  }
  /// run
  read_key(tree, "run.id", config.run_id);
  read_key(tree, "run.results_dir", config.results_dir);
  if (!config.results_dir.empty() && config.results_dir.back() != '/') {
    config.results_dir += '/';
  }
  read_key(tree, "run.db_conninfo", config.db_conninfo);
  read_key(tree, "run.ns", config.ns);
  read_key(tree, "run.seed", config.seed);
  boost::optional<std::string> theta2 =\
    tree.get_optional<std::string>("model.theta2");
  if (theta2) {
    config.theta2 = parse_matrix(*theta2);
  }

  /// contraction and adaptive tol
  BLPOptions& blp = config.blp;
  read_key(tree, "contraction.tol_coarse", blp.tol_coarse);
  read_key(tree, "contraction.tol_mid", blp.tol_mid);
  read_key(tree, "contraction.tol_fine", blp.tol_fine);
  read_key(tree, "contraction.mid_threshold", blp.mid_threshold);
  read_key(tree, "contraction.fine_threshold", blp.fine_threshold);
  read_key(tree, "contraction.mean_tol", blp.mean_tol);
  read_key(tree, "contraction.max_iter", blp.contraction_max_iter);
  read_key(tree, "contraction.sentinel", blp.sentinel);
  read_key(tree, "contraction.verbose", blp.verbose);
  read_key(tree, "parallel.max_threads", blp.max_threads);

  /// optimizer
  OptimizerOptions& opt = config.optimizer;
  read_key(tree, "optimizer.grad_tol", opt.grad_tol);
  read_key(tree, "optimizer.f_tol", opt.f_tol);
  read_key(tree, "optimizer.step_size", opt.step_size);
  read_key(tree, "optimizer.max_iter", opt.max_iter);
  read_key(tree, "optimizer.verbose", opt.verbose);

  /// synthetic data
  SimulationDesign& sim = config.simulation;
  read_key(tree, "simulation.nmkt", sim.nmkt);
  read_key(tree, "simulation.nbrand", sim.nbrand);
  read_key(tree, "simulation.ns", sim.ns);
  read_key(tree, "simulation.seed", sim.seed);
  read_key(tree, "simulation.xi_sd", sim.xi_sd);
  boost::optional<std::string> sim_theta1 =\
    tree.get_optional<std::string>("simulation.theta1");
  if (sim_theta1) {
    Eigen::MatrixXd m = parse_matrix(*sim_theta1);
    if (m.rows() != 1) {
      throw BLPError(Stage::config, "simulation.theta1 must be one row");
    }
    sim.theta1 = m.row(0).transpose();
  }
  boost::optional<std::string> sim_theta2 =\
    tree.get_optional<std::string>("simulation.theta2");
  if (sim_theta2) {
    sim.theta2 = parse_matrix(*sim_theta2);
  }

  if (config.ns == 0 || config.blp.max_threads == 0 ||\
      config.blp.contraction_max_iter == 0) {
    throw BLPError(Stage::config, "ns, max_threads and contraction max_iter"\
		   " must be positive");
  }
  return config;
}

#include <fstream>
#include <string>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <Eigen/Dense>

#include "Results.hpp"
#include "TestMarkets.hpp"


static Results small_results()
{
  Results results;
  results.theta1.resize(2);
  results.theta1 << -1.5, .25;
  results.se_theta1.resize(2);
  results.se_theta1 << .2, .05;
  results.theta2.resize(2, 2);
  results.theta2 << .5, .75,
                    0., 0.;
  results.se_theta2.resize(2, 2);
  results.se_theta2 << .1, .3,
                       0., 0.;
  results.varcov = Eigen::MatrixXd::Identity(4, 4);
  results.objective = 1e-9;
  results.optimizer.converged = true;
  results.optimizer.iterations = 12;
  return results;
}

static std::vector<std::string> read_lines(const std::string& file)
{
  std::ifstream ifs(file);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(ifs, line)) {
    lines.push_back(line);
  }
  return lines;
}

TEST(Results, PersistWritesReport)
{
  const std::string persist_file = ::testing::TempDir() + "blp_params_test";
  persist(small_results(), persist_file);
  std::vector<std::string> lines = read_lines(persist_file);
  ASSERT_FALSE(lines.empty());
  EXPECT_TRUE(boost::algorithm::starts_with(lines[0], "GMM objective: "));

  std::vector<std::string> theta1_lines, theta2_lines;
  unsigned varcov_line = 0;
  for (unsigned l = 0; l < lines.size(); ++l) {
    if (boost::algorithm::starts_with(lines[l], "theta1_")) {
      theta1_lines.push_back(lines[l]);
    } else if (boost::algorithm::starts_with(lines[l], "theta2_")) {
      theta2_lines.push_back(lines[l]);
    } else if (lines[l] == "varcov:") {
      varcov_line = l;
    }
  }
  ASSERT_EQ(theta1_lines.size(), 2u);
  EXPECT_EQ(theta1_lines[0], "theta1_0: -1.5 (0.2)");
  ASSERT_EQ(theta2_lines.size(), 4u);
  // column-major, sigma column first
  EXPECT_EQ(theta2_lines[0], "theta2_0_0: 0.5 (0.1)");
  EXPECT_EQ(theta2_lines[1], "theta2_1_0: 0 (0)");
  EXPECT_EQ(theta2_lines[2], "theta2_0_1: 0.75 (0.3)");
  EXPECT_EQ(theta2_lines[3], "theta2_1_1: 0 (0)");

  ASSERT_GT(varcov_line, 0u);
  unsigned varcov_rows = 0;
  for (unsigned l = varcov_line + 1; l < lines.size(); ++l) {
    if (!lines[l].empty()) {
      ++varcov_rows;
    }
  }
  EXPECT_EQ(varcov_rows, 4u);
}

TEST(Results, UnwritableReportThrows)
{
  EXPECT_EQ(thrown_stage([] {
	persist(small_results(), ::testing::TempDir() +
		"no_such_dir/est_params"); }), Stage::data);
}

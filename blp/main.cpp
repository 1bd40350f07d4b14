#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "BLP.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "MarketData.hpp"
#include "Parallel.hpp"
#include "Results.hpp"
#include "Simulate.hpp"
#include "ThetaMatrix.hpp"


/* current run options:
   1) argv[1] simulate
   2) argv[1] estimation
   3) argv[1] simulate, argv[2] estimation
   an argument that is not a mode is taken as the ini config file */


int main(int argc, char* argv[])
{
  auto chrono_start = std::chrono::steady_clock::now();

  bool simulate = false;
  bool estimation = false;
  std::string config_file;
  for (int a = 1; a < argc; ++a) {
    if (std::strcmp(argv[a], "simulate") == 0) {
      simulate = true;
    } else if (std::strcmp(argv[a], "estimation") == 0) {
      estimation = true;
    } else {
      config_file = argv[a];
    }
  }
  if (!simulate && !estimation) {
    std::cout << "Invalid args! usage: blp [simulate] [estimation] [config.ini]"\
	      << std::endl;
    return 1;
  }

  RunConfig config;
  try {
    if (!config_file.empty()) {
      config = load_config(config_file);
    }

    if (simulate) {
      MarketData md = simulate_markets(config.simulation,\
				       hardware_threads(config.blp.max_threads));
      md.save_file(config.arrays_file());
      std::cout << "Simulated " << md.S.size() << " products in " <<\
	md.num_mkts() << " markets, arrays in " << config.arrays_file() <<\
	std::endl;
    }

    if (estimation) {
      MarketData md;
      md.load_file(config.arrays_file());
      md.elim_nans();
      EstimationData data = md.to_eigen();
      BLP inst_BLP(data, ThetaMatrix(config.theta2), config.blp);
      std::cout << "Estimating " << inst_BLP.dimension() << " nonlinear and "\
		<< data.X1.cols() << " linear parameters on " << data.jt_size\
		<< " products, " << data.nmkt << " markets, " << data.ns <<\
	" draws, " << inst_BLP.get_num_threads() << " threads" << std::endl;
      Results results = inst_BLP.gmm(config.optimizer);
      persist(results, config.params_file());
    }
  } catch (const BLPError& e) {
    std::cerr << "[" << stage_name(e.stage()) << "] " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  // finish chrono
  auto chrono_end = std::chrono::steady_clock::now();
  auto time_diff = chrono_end - chrono_start;
  std::string time_fpersist = config.results_dir + "elapsed_time";
  std::remove(time_fpersist.c_str());
  std::ofstream fdesc_time;
  fdesc_time.open(time_fpersist);
  fdesc_time << "Last run duration: " << \
    std::chrono::duration_cast<std::chrono::seconds> (time_diff).count() << \
    " secs" << std::endl;
  fdesc_time.close();
  std::cout << "Elapsed time: " << \
    std::chrono::duration_cast<std::chrono::seconds> (time_diff).count() << \
    " secs" << std::endl;

  return 0;
}

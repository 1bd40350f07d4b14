#include <iostream>
#include <stdexcept>
#include <string>

#include "Config.hpp"
#include "Errors.hpp"
#include "GenArrays.hpp"
#include "MarketData.hpp"


// usage: genarrays [config.ini]; writes the arrays file read by blp estimation
int main(int argc, char* argv[])
{
  try {
    RunConfig config;
    if (argc > 1) {
      config = load_config(argv[1]);
    }
    MarketData md = gen_arrays(config.db_conninfo, config.ns, config.seed);
    md.validate();
    md.save_file(config.arrays_file());
    std::cout << "Arrays persisted in " << config.arrays_file() << std::endl;
  } catch (const BLPError& e) {
    std::cerr << "[" << stage_name(e.stage()) << "] " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}

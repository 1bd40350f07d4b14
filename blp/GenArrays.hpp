#ifndef GENARRAYSHEADERDEF
#define GENARRAYSHEADERDEF

#include <string>

#include "MarketData.hpp"


/* Build the estimation arrays from the database tables loaded by csvimport:
     products (mkt, prod, share, x1_*, x2_*, z_*)
     demographics (mkt, d_*)
   Taste shocks are drawn N(0,1); each simulated individual's demographics are
   a row drawn with replacement from the market's demographics rows. Products
   with a null share are dropped. */
MarketData gen_arrays(const std::string& conninfo, const unsigned ns, const\
		      unsigned seed);

#endif

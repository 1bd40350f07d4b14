#ifndef MARKETDATAHEADERDEF
#define MARKETDATAHEADERDEF

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include "boost/multi_array.hpp"
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>
#include <boost/serialization/split_member.hpp>
#include <boost/serialization/vector.hpp>
#include <Eigen/Dense>

#include "Errors.hpp"

namespace ublas = boost::numeric::ublas;

typedef boost::multi_array<double, 3> DrawArray;

// three extents whose product is num_elements, computed without wrapping
inline bool draw_shape_matches(const std::vector<unsigned>& shape, const\
			       std::size_t num_elements)
{
  if (shape.size() != 3) {
    return false;
  }
  if (std::find(shape.begin(), shape.end(), 0u) != shape.end()) {
    return num_elements == 0;
  }
  std::size_t count = 1;
  for (const auto& extent : shape) {
    if (extent > num_elements / count) {
      return false;
    }
    count *= extent;
  }
  return count == num_elements;
}


// read-only view of a data set used by the numerical core
struct EstimationData
{
  unsigned jt_size;  // product observations
  unsigned nmkt;
  unsigned ns;  // simulated individuals per market
  Eigen::VectorXd S;
  Eigen::VectorXd ln_S;
  Eigen::MatrixXd X1;
  Eigen::MatrixXd X2;
  Eigen::MatrixXd Z;
  // rows of market t are [mkt_begin[t], mkt_begin[t+1])
  std::vector<unsigned> mkt_begin;
  std::vector<unsigned> mkt_id;
  // v[i][k][t], D[i][d][t]
  DrawArray v;
  DrawArray D;
  unsigned nx2() const { return X2.cols(); }
  unsigned nD() const { return D.shape()[1]; }
  unsigned mkt_size(unsigned t) const { return mkt_begin[t+1] - mkt_begin[t]; }
};

/* Product rows ordered by market, with the simulated consumer draws of each
   market. This is what gets persisted between a data generation run and an
   estimation run. */
class MarketData
{

public:
  MarketData() : ns(0) {}
  MarketData(const unsigned ns_, const unsigned nmkt, const unsigned nx2,\
	     const unsigned nD);
  template<class Archive>
  void save(Archive & ar, const unsigned int version) const
  {
    ar & ns;
    ar & S;
    ar & X1;
    ar & X2;
    ar & Z;
    ar & mkt_id;
    std::vector<unsigned> v_shape(v.shape(), v.shape() + 3);
    std::vector<unsigned> D_shape(D.shape(), D.shape() + 3);
    std::vector<double> v_flat(v.data(), v.data() + v.num_elements());
    std::vector<double> D_flat(D.data(), D.data() + D.num_elements());
    ar & v_shape;
    ar & v_flat;
    ar & D_shape;
    ar & D_flat;
  }
  template<class Archive>
  void load(Archive & ar, const unsigned int version)
  {
    ar & ns;
    ar & S;
    ar & X1;
    ar & X2;
    ar & Z;
    ar & mkt_id;
    std::vector<unsigned> v_shape, D_shape;
    std::vector<double> v_flat, D_flat;
    ar & v_shape;
    ar & v_flat;
    ar & D_shape;
    ar & D_flat;
    if (!draw_shape_matches(v_shape, v_flat.size()) ||\
	!draw_shape_matches(D_shape, D_flat.size())) {
      throw BLPError(Stage::data, "corrupt draws in arrays archive");
    }
    v.resize(boost::extents[v_shape[0]][v_shape[1]][v_shape[2]]);
    D.resize(boost::extents[D_shape[0]][D_shape[1]][D_shape[2]]);
    std::copy(v_flat.begin(), v_flat.end(), v.data());
    std::copy(D_flat.begin(), D_flat.end(), D.data());
  }
  BOOST_SERIALIZATION_SPLIT_MEMBER()
  void save_file(const std::string& persist_file) const;
  void load_file(const std::string& persist_file);
  void elim_nans();
  void validate() const;
  EstimationData to_eigen() const;
  unsigned num_mkts() const { return v.shape()[2]; }

  unsigned ns;
  ublas::vector<double> S;
  ublas::matrix<double> X1;
  ublas::matrix<double> X2;
  ublas::matrix<double> Z;
  ublas::vector<unsigned> mkt_id;
  // random coeff draws
  DrawArray v;
  DrawArray D;
};

#endif

#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>
#include <Eigen/Dense>

#include "Errors.hpp"
#include "MarketData.hpp"

namespace ublas = boost::numeric::ublas;


MarketData::MarketData(const unsigned ns_, const unsigned nmkt, const unsigned\
		       nx2, const unsigned nD)
  : ns(ns_)
{
  v.resize(boost::extents[ns][nx2][nmkt]);
  D.resize(boost::extents[ns][nD][nmkt]);
}

void MarketData::save_file(const std::string& persist_file) const
{
  std::remove(persist_file.c_str());
  std::ofstream ofs(persist_file);
  if (!ofs.is_open()) {
    throw BLPError(Stage::data, "cannot write arrays file " + persist_file);
  }
  boost::archive::text_oarchive oa(ofs);
  oa << *this;
}

void MarketData::load_file(const std::string& persist_file)
{
  std::ifstream ifs(persist_file);
  if (!ifs.is_open()) {
    throw BLPError(Stage::data, "cannot open arrays file " + persist_file);
  }
  boost::archive::text_iarchive ia(ifs);
  ia >> *this;
  ifs.close();
}

void MarketData::elim_nans()
{
  std::vector<unsigned> keep_rows;
  for (unsigned i = 0; i != S.size(); ++i) {
    if (!std::isnan(S(i))) {
      keep_rows.push_back(i);
    }
  }
  if (keep_rows.size() == S.size()) {
    return;
  }
  ublas::vector<double> S_tmp(keep_rows.size());
  ublas::matrix<double> X1_tmp(keep_rows.size(), X1.size2());
  ublas::matrix<double> X2_tmp(keep_rows.size(), X2.size2());
  ublas::matrix<double> Z_tmp(keep_rows.size(), Z.size2());
  ublas::vector<unsigned> mkt_id_tmp(keep_rows.size());
  for (unsigned j = 0; j != keep_rows.size(); ++j) {
    unsigned i = keep_rows[j];
    S_tmp(j) = S(i);
    for (unsigned col = 0; col != X1.size2(); ++col) {
      X1_tmp(j, col) = X1(i, col);
    }
    for (unsigned col = 0; col != X2.size2(); ++col) {
      X2_tmp(j, col) = X2(i, col);
    }
    for (unsigned col = 0; col != Z.size2(); ++col) {
      Z_tmp(j, col) = Z(i, col);
    }
    mkt_id_tmp(j) = mkt_id(i);
  }
  S = S_tmp;
  X1 = X1_tmp;
  X2 = X2_tmp;
  Z = Z_tmp;
  mkt_id = mkt_id_tmp;
}

void MarketData::validate() const
{
  const unsigned jt_size = S.size();
  if (jt_size == 0) {
    throw BLPError(Stage::data, "no product observations");
  }
  if (X1.size1() != jt_size || X2.size1() != jt_size || Z.size1() != jt_size\
      || mkt_id.size() != jt_size) {
    throw BLPError(Stage::data, "S, X1, X2, Z and mkt_id differ in rows");
  }
  if (Z.size2() < X1.size2()) {
    throw BLPError(Stage::data, "fewer instruments than linear parameters");
  }
  if (ns == 0 || v.shape()[0] != ns || D.shape()[0] != ns) {
    throw BLPError(Stage::data, "draws do not match ns = " +\
		   std::to_string(ns));
  }
  if (v.shape()[1] != X2.size2()) {
    throw BLPError(Stage::data, "need one taste shock per X2 column");
  }
  if (D.shape()[2] != v.shape()[2]) {
    throw BLPError(Stage::data, "v and D cover different markets");
  }
  const unsigned nmkt = num_mkts();
  std::vector<double> outside(nmkt, 1.);
  for (unsigned jt = 0; jt < jt_size; ++jt) {
    if (mkt_id(jt) >= nmkt) {
      throw BLPError(Stage::data, "market id " + std::to_string(mkt_id(jt))\
		     + " has no draws");
    }
    if (jt > 0 && mkt_id(jt) < mkt_id(jt-1)) {
      throw BLPError(Stage::data, "rows are not ordered by market");
    }
    if (!(S(jt) > 0.)) {
      throw BLPError(Stage::data, "non-positive share in row " +\
		     std::to_string(jt));
    }
    outside[mkt_id(jt)] -= S(jt);
  }
  for (unsigned t = 0; t < nmkt; ++t) {
    if (!(outside[t] > 0.)) {
      throw BLPError(Stage::data, "no outside share left in market " +\
		     std::to_string(t));
    }
  }
}

EstimationData MarketData::to_eigen() const
{
  this->validate();
  EstimationData data;
  data.jt_size = S.size();
  data.nmkt = num_mkts();
  data.ns = ns;
  data.S.resize(data.jt_size);
  data.ln_S.resize(data.jt_size);
  data.X1.resize(data.jt_size, X1.size2());
  data.X2.resize(data.jt_size, X2.size2());
  data.Z.resize(data.jt_size, Z.size2());
  data.mkt_id.resize(data.jt_size);
  for (unsigned jt = 0; jt < data.jt_size; ++jt) {
    data.S(jt) = S(jt);
    data.ln_S(jt) = std::log(S(jt));
    for (unsigned i = 0; i < X1.size2(); ++i) {
      data.X1(jt, i) = X1(jt, i);
    }
    for (unsigned i = 0; i < X2.size2(); ++i) {
      data.X2(jt, i) = X2(jt, i);
    }
    for (unsigned i = 0; i < Z.size2(); ++i) {
      data.Z(jt, i) = Z(jt, i);
    }
    data.mkt_id[jt] = mkt_id(jt);
  }
  // market row ranges, empty markets allowed
  data.mkt_begin.assign(data.nmkt + 1, 0);
  for (unsigned jt = 0; jt < data.jt_size; ++jt) {
    ++data.mkt_begin[mkt_id(jt) + 1];
  }
  for (unsigned t = 0; t < data.nmkt; ++t) {
    data.mkt_begin[t+1] += data.mkt_begin[t];
  }
  data.v.resize(boost::extents[v.shape()[0]][v.shape()[1]][v.shape()[2]]);
  data.v = v;
  data.D.resize(boost::extents[D.shape()[0]][D.shape()[1]][D.shape()[2]]);
  data.D = D;
  return data;
}

#include <cmath>
#include <iostream>
#include <map>
#include <pqxx/pqxx>
#include <random>
#include <string>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <boost/numeric/ublas/vector.hpp>

#include "Errors.hpp"
#include "GenArrays.hpp"
#include "MarketData.hpp"

namespace ublas = boost::numeric::ublas;


MarketData gen_arrays(const std::string& conninfo, const unsigned ns, const\
		      unsigned seed)
{
  pqxx::connection C(conninfo);
  if (C.is_open()) {
    std::cout << "Opened database successfully: " << C.dbname() << std::endl;
  } else {
    throw BLPError(Stage::data, "can't open database");
  }
  pqxx::nontransaction N(C);
  pqxx::result R_prod;
  pqxx::result R_demogr;
  try {
    R_prod = N.exec("SELECT * FROM products ORDER BY mkt, prod;");
    R_demogr = N.exec("SELECT * FROM demographics ORDER BY mkt;");
  } catch (const pqxx::sql_error& e) {
    throw BLPError(Stage::data, std::string("query failed: ") + e.what());
  }
  N.commit();

  /// column roles by name prefix
  std::vector<unsigned> x1_cols, x2_cols, z_cols, d_cols;
  int mkt_col = -1;
  int share_col = -1;
  for (unsigned col = 0; col < R_prod.columns(); ++col) {
    const std::string name = R_prod.column_name(col);
    if (name == "mkt") {
      mkt_col = col;
    } else if (name == "share") {
      share_col = col;
    } else if (boost::algorithm::starts_with(name, "x1_")) {
      x1_cols.push_back(col);
    } else if (boost::algorithm::starts_with(name, "x2_")) {
      x2_cols.push_back(col);
    } else if (boost::algorithm::starts_with(name, "z_")) {
      z_cols.push_back(col);
    }
  }
  int demogr_mkt_col = -1;
  for (unsigned col = 0; col < R_demogr.columns(); ++col) {
    const std::string name = R_demogr.column_name(col);
    if (name == "mkt") {
      demogr_mkt_col = col;
    } else if (boost::algorithm::starts_with(name, "d_")) {
      d_cols.push_back(col);
    }
  }
  if (mkt_col < 0 || share_col < 0 || demogr_mkt_col < 0 ||\
      x1_cols.empty() || x2_cols.empty() || z_cols.empty()) {
    throw BLPError(Stage::data, "products needs mkt, share, x1_*, x2_*, z_*"\
		   " and demographics needs mkt");
  }

  /// fill S, X1, X2, Z and mkt_id, markets renumbered from 0
  std::map<long, unsigned> mkt_index;
  const unsigned num_prods = R_prod.size();
  for (auto c = R_prod.begin(); c != R_prod.end(); ++c) {
    long mkt = c[mkt_col].as<long>();
    if (mkt_index.find(mkt) == mkt_index.end()) {
      unsigned next = mkt_index.size();
      mkt_index[mkt] = next;
    }
  }
  const unsigned num_mkts = mkt_index.size();
  MarketData md(ns, num_mkts, x2_cols.size(), d_cols.size());
  md.S.resize(num_prods);
  md.X1.resize(num_prods, x1_cols.size());
  md.X2.resize(num_prods, x2_cols.size());
  md.Z.resize(num_prods, z_cols.size());
  md.mkt_id.resize(num_prods);
  unsigned i = 0;
  for (auto c = R_prod.begin(); c != R_prod.end(); ++c) {
    md.mkt_id(i) = mkt_index[c[mkt_col].as<long>()];
    if (!c[share_col].is_null()) {
      md.S(i) = c[share_col].as<double>();
    } else {
      md.S(i) = NAN;
    }
    for (unsigned col = 0; col != x1_cols.size(); ++col) {
      md.X1(i, col) = c[x1_cols[col]].as<double>();
    }
    for (unsigned col = 0; col != x2_cols.size(); ++col) {
      md.X2(i, col) = c[x2_cols[col]].as<double>();
    }
    for (unsigned col = 0; col != z_cols.size(); ++col) {
      md.Z(i, col) = c[z_cols[col]].as<double>();
    }
    ++i;
  }

  /// draw v & D
  std::vector<std::vector<std::vector<double>>> demogr_rows(num_mkts);
  for (auto c = R_demogr.begin(); c != R_demogr.end(); ++c) {
    auto it = mkt_index.find(c[demogr_mkt_col].as<long>());
    if (it == mkt_index.end()) {
      continue;
    }
    std::vector<double> row;
    for (const auto& col : d_cols) {
      row.push_back(c[col].as<double>());
    }
    demogr_rows[it->second].push_back(row);
  }
  std::default_random_engine generator(seed);
  std::normal_distribution<double> normal_dist(0., 1.);
  for (unsigned t = 0; t != num_mkts; ++t) {
    if (!d_cols.empty() && demogr_rows[t].empty()) {
      throw BLPError(Stage::data, "no demographics rows for market " +\
		     std::to_string(t));
    }
    for (unsigned draw_counter = 0; draw_counter < ns; ++draw_counter) {
      for (unsigned k = 0; k != x2_cols.size(); ++k) {
	md.v[draw_counter][k][t] = normal_dist(generator);
      }
      if (!d_cols.empty()) {
	std::uniform_int_distribution<unsigned> pick(0, demogr_rows[t].size()\
						     - 1);
	const std::vector<double>& row = demogr_rows[t][pick(generator)];
	for (unsigned d = 0; d != d_cols.size(); ++d) {
	  md.D[draw_counter][d][t] = row[d];
	}
      }
    }
  }
  md.elim_nans();
  std::cout << "Loaded " << md.S.size() << " products in " << num_mkts <<\
    " markets" << std::endl;
  return md;
}

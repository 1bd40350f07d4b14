#include <fstream>
#include <iostream>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "dbfunctions.hpp"


std::vector<std::string> csv_header(const std::string& datafile)
{
  std::ifstream ifs(datafile);
  if (!ifs.is_open()) {
    throw std::runtime_error("can't open " + datafile);
  }
  std::string line;
  std::getline(ifs, line);
  boost::algorithm::trim(line);
  std::vector<std::string> columns;
  boost::algorithm::split(columns, line, boost::algorithm::is_any_of(";"));
  for (auto& col : columns) {
    boost::algorithm::trim(col);
    boost::algorithm::to_lower(col);
    if (col.empty()) {
      throw std::runtime_error("empty column name in " + datafile);
    }
  }
  return columns;
}

void csvimport(pqxx::work& W, const std::string& datafile, const std::string&\
	       table)
{
  std::vector<std::string> columns = csv_header(datafile);
  std::string sql_createtbl = "DROP TABLE IF EXISTS " + W.quote_name(table) +\
    "; CREATE TABLE " + W.quote_name(table) + " (";
  for (unsigned i = 0; i != columns.size(); ++i) {
    if (i > 0) {
      sql_createtbl += ", ";
    }
    sql_createtbl += W.quote_name(columns[i]);
    if (columns[i] == "mkt" || columns[i] == "prod") {
      sql_createtbl += " integer";
    } else {
      sql_createtbl += " real";
    }
  }
  sql_createtbl += ");";

  W.exec(sql_createtbl);

  std::string sql_copy = "COPY " + W.quote_name(table) + " FROM " +\
    W.quote(datafile) + " delimiter ';' NULL as 'N/A' csv header;";
  W.exec(sql_copy);
  std::cout << "Csv file loaded: " + table + " (" << columns.size() <<\
    " columns)" << std::endl;
}

#ifndef DBFUNCTIONSHEADERDEF
#define DBFUNCTIONSHEADERDEF

#include <pqxx/pqxx>
#include <string>
#include <vector>


// column names from the header line of a ';' delimited csv file
std::vector<std::string> csv_header(const std::string& datafile);

/* (Re)create table from the csv header, mkt and prod as integer and every
   other column real, then COPY the file into it. N/A is read as null. */
void csvimport(pqxx::work& W, const std::string& datafile, const std::string&\
	       table);

#endif

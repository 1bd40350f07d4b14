#include <cstring>
#include <iostream>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "dbfunctions.hpp"

using std::string;
using std::vector;


/* usage: csvimport <table> [data_dir] [conninfo]
   table is products or demographics, read from <data_dir>/<table>.csv */
int main(int argc, char* argv[])
{
    try {
        string data_dir = "/var/lib/postgresql/data/pgdata/databases/blp/";
        string conninfo = "dbname = blp user = postgres password = passwd"\
	  " hostaddr = 127.0.0.1 port = 5432";
        if (argc > 2) {
            data_dir = argv[2];
            if (data_dir.back() != '/') {
                data_dir += '/';
            }
        }
        if (argc > 3) {
            conninfo = argv[3];
        }
        pqxx::connection C(conninfo);
        if (C.is_open()) {
            std::cout << "Opened database successfully: " << C.dbname() <<\
	      std::endl;
        } else {
            std::cout << "Can't open database" << std::endl;
            return 1;
        }

        // csv import argv[1]
        if (argc > 1 && (std::strcmp(argv[1], "products") == 0 ||\
			 std::strcmp(argv[1], "demographics") == 0)) {
            pqxx::work W(C);
	    string table = argv[1];
            string datafile = data_dir + table + ".csv";
            csvimport(W, datafile, table);
            W.commit();
	} else {
	  std::cout << "Please provide valid table name as argument"\
	    " (products, demographics)" << std::endl;
	  return 1;
	}

        std::cout << "database operation successfull" << std::endl;
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}

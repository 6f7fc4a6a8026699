/*
-------------------------------------------------------------------------------
 StudentRecords.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for the Student Records store. Contains main(): makes
   sure the schema exists, then hands control to the menu loop.

 Usage:
   StudentRecords [database-file]
   The database file defaults to students.db in the working directory and is
   created on first run.

 Exit status:
   0 on normal exit, 1 if the database cannot be opened or the schema cannot
   be created. Later storage errors are reported per action and do not end
   the program.

 Build:
   - Requires SQLite3 dev headers/libs and a C++17 (or later) compiler.
-------------------------------------------------------------------------------
*/

#include <iostream>
#include <string>
#include "db.hpp"
#include "helpers.hpp"

static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "                  Student Records Store              \n";
    std::cout << "=====================================================\n\n";
}

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [database-file]\n";
        return 2;
    }
    const std::string db_path = argc == 2 ? argv[1] : kDefaultDbPath;

    showWelcome();

    // A missing or half-created table would make every later call fail.
    DbStatus s = db_ensure_schema(db_path);
    if (s != DbStatus::Ok) {
        std::cout << "Could not initialize database '" << db_path << "' ("
            << db_status_text(s) << ").\n";
        return 1;
    }

    run_menu(db_path);
    return 0;
}

#pragma once
#include <string>
#include <iostream>
#include "db.hpp"
#include "validation.hpp"   // InputCtl

/*
-------------------------------------------------------------------------------
 helpers.hpp — Menu actions
-------------------------------------------------------------------------------
One function per menu entry. Each one prompts for what it needs, calls the
matching db_* function, and prints the outcome. They hold no state; the
database file named by `db_path` is the only source of truth.

Return values:
  - InputCtl::Ok    the action finished (successfully or with a message).
  - InputCtl::Back  the user backed out; nothing was written.
  - InputCtl::Exit  the user asked to quit (or input ended).

Store failures (StorageUnavailable) are reported and the action returns Ok,
so the menu keeps running. Only schema setup in main() is fatal.
-------------------------------------------------------------------------------
*/

/// [1] Prompt for name, grade and email, then create the record.
InputCtl menu_add_student(const std::string& db_path,
    std::istream& in = std::cin, std::ostream& out = std::cout);

/// [2] Print every record in id order.
InputCtl menu_view_students(const std::string& db_path, std::ostream& out = std::cout);

/// [3] Prompt for an id, show current values, overwrite all three fields.
InputCtl menu_update_student(const std::string& db_path,
    std::istream& in = std::cin, std::ostream& out = std::cout);

/// [4] Prompt for an id, confirm, delete.
InputCtl menu_delete_student(const std::string& db_path,
    std::istream& in = std::cin, std::ostream& out = std::cout);

/// Main menu loop. Returns when the user picks Exit or input ends.
void run_menu(const std::string& db_path,
    std::istream& in = std::cin, std::ostream& out = std::cout);

#pragma once
#include <string>
#include <vector>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite student store
-------------------------------------------------------------------------------

This header declares every function that touches the database file. Callers
(the console menu, tests) never see raw sqlite3_* calls.

Design:
  - Each function takes the path of the database file, opens its own
    connection, runs one statement (autocommit) and closes the connection
    before returning. Nothing is cached between calls.
  - Each function returns a DbStatus. Results come back through out-params
    and are only written when the status is Ok.
  - Update and delete report NotFound when no row matched. Storage is left
    untouched in that case; it is not a failure.

Usage convention:
  - Call `db_ensure_schema` once at startup. If it fails, stop.
  - Then call the CRUD functions in any order.
-------------------------------------------------------------------------------
*/

/// Outcome of a store call.
enum class DbStatus {
    Ok,
    NotFound,            // id did not match a row (update/delete/find)
    InvalidId,           // id was not a positive integer
    StorageUnavailable   // file could not be opened, read or written
};

/// Short human-readable text for a status, e.g. for console messages.
const char* db_status_text(DbStatus s);

/// Default database file, relative to the working directory.
constexpr const char* kDefaultDbPath = "students.db";

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Create the students table if missing. Never touches existing rows, so it
/// is safe to call on every startup.
DbStatus db_ensure_schema(const std::string& path);

// ==========================
// CRUD
// ==========================

/// INSERT a student. Empty strings are stored as given.
/// On Ok, `new_id` holds the id SQLite assigned.
DbStatus db_create_student(const std::string& path, const std::string& name,
    const std::string& grade, const std::string& email, StudentId& new_id);

/// All students ordered by ascending id. An empty table yields Ok with an
/// empty vector.
DbStatus db_read_all_students(const std::string& path, std::vector<StudentRecord>& out);

/// Overwrite name, grade and email of the row with `id` in one statement.
DbStatus db_update_student(const std::string& path, StudentId id, const std::string& name,
    const std::string& grade, const std::string& email);

/// Delete the row with `id`.
DbStatus db_delete_student(const std::string& path, StudentId id);

// ==========================
// Lookups
// ==========================

/// Fetch one student by id.
DbStatus db_find_student(const std::string& path, StudentId id, StudentRecord& out);

/// Number of rows in the students table.
DbStatus db_count_students(const std::string& path, int& out);

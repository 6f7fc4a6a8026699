/*
-------------------------------------------------------------------------------
 db.cpp — SQLite persistence layer for the Student Records store
-------------------------------------------------------------------------------
Purpose
  - Implements all database I/O for the `students` table using SQLite3.
  - Exposes small, purpose-specific functions called by the console menu.

Design notes
  - Every public function opens its own connection through ScopedDb and lets
    the destructor close it, so the file is released on every return path.
  - Each call runs exactly one statement in autocommit mode. There is no
    transaction spanning two calls.
  - Write ops use prepared statements with bound parameters to avoid SQL
    injection and handle quoting safely.
  - `id` is INTEGER PRIMARY KEY AUTOINCREMENT: SQLite keeps the high-water
    mark in sqlite_sequence, so a deleted id is never handed out again.

Error surfacing
  - Failures print `sqlite3_errmsg(db)` to std::cerr and return
    DbStatus::StorageUnavailable. Nothing is retried.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include <iostream>

// Owns one connection for the duration of a single store call.
class ScopedDb {
public:
    explicit ScopedDb(const std::string& path) : ok_(db_open(db_, path)) {}
    ~ScopedDb() { db_close(db_); }
    ScopedDb(const ScopedDb&) = delete;
    ScopedDb& operator=(const ScopedDb&) = delete;

    bool ok() const { return ok_; }
    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    bool ok_;
};

// Report the last error on this connection and map it to StorageUnavailable.
static DbStatus storage_error(sqlite3* db, const char* what) {
    std::cerr << "DB error (" << what << "): " << sqlite3_errmsg(db) << "\n";
    return DbStatus::StorageUnavailable;
}

// Small helper to run a raw SQL string with sqlite3_exec and report errors.
static bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (err ? err : sqlite3_errstr(rc)) << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

// Columns are NOT NULL, but a file edited by hand could still hold NULLs.
// Length comes from sqlite3_column_bytes so embedded NULs survive.
static std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* p = sqlite3_column_text(st, col);
    if (!p) return std::string();
    return std::string(reinterpret_cast<const char*>(p),
        static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

static StudentRecord row_to_record(sqlite3_stmt* st) {
    StudentRecord r;
    r.id = sqlite3_column_int64(st, 0);
    r.name = column_text(st, 1);
    r.grade = column_text(st, 2);
    r.email = column_text(st, 3);
    return r;
}

static void bind_string(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void bind_fields(sqlite3_stmt* st, const std::string& name,
    const std::string& grade, const std::string& email) {
    bind_string(st, 1, name);
    bind_string(st, 2, grade);
    bind_string(st, 3, email);
}

const char* db_status_text(DbStatus s) {
    switch (s) {
    case DbStatus::Ok: return "OK";
    case DbStatus::NotFound: return "Not found";
    case DbStatus::InvalidId: return "Invalid id";
    case DbStatus::StorageUnavailable: return "Storage unavailable";
    }
    return "Unknown status";
}

// Open (or create) the SQLite database file at `path`. On failure the
// half-open handle sqlite3_open leaves behind is closed and `db` is nulled.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open DB '" << path << "': "
            << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

// Create the table if it doesn't exist yet. Existing rows are never touched.
DbStatus db_ensure_schema(const std::string& path) {
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;

    const char* ddl =
        "CREATE TABLE IF NOT EXISTS students ("
        "  id    INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  name  TEXT NOT NULL,"
        "  grade TEXT NOT NULL,"
        "  email TEXT NOT NULL"
        ");";
    if (!exec_sql(conn.get(), ddl)) return DbStatus::StorageUnavailable;
    return DbStatus::Ok;
}

/* =========================
   CRUD
   ========================= */

// INSERT student row and hand back the id SQLite picked.
DbStatus db_create_student(const std::string& path, const std::string& name,
    const std::string& grade, const std::string& email, StudentId& new_id) {
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    const char* sql = "INSERT INTO students(name,grade,email) VALUES(?,?,?);";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare insert");
    bind_fields(st, name, grade, email);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return storage_error(db, "insert");

    new_id = sqlite3_last_insert_rowid(db);
    return DbStatus::Ok;
}

// SELECT every row, oldest id first.
DbStatus db_read_all_students(const std::string& path, std::vector<StudentRecord>& out) {
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT id,name,grade,email FROM students ORDER BY id;",
            -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare select");

    std::vector<StudentRecord> rows;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        rows.push_back(row_to_record(st));
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return storage_error(db, "select");

    out.swap(rows);
    return DbStatus::Ok;
}

// UPDATE all three fields by id. Zero changed rows means the id is absent.
DbStatus db_update_student(const std::string& path, StudentId id, const std::string& name,
    const std::string& grade, const std::string& email) {
    if (id <= 0) return DbStatus::InvalidId;
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    const char* sql = "UPDATE students SET name=?, grade=?, email=? WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare update");
    bind_fields(st, name, grade, email);
    sqlite3_bind_int64(st, 4, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return storage_error(db, "update");

    return sqlite3_changes(db) > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

// DELETE by id.
DbStatus db_delete_student(const std::string& path, StudentId id) {
    if (id <= 0) return DbStatus::InvalidId;
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM students WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare delete");
    sqlite3_bind_int64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) return storage_error(db, "delete");

    return sqlite3_changes(db) > 0 ? DbStatus::Ok : DbStatus::NotFound;
}

/* =========================
   Lookups
   ========================= */

DbStatus db_find_student(const std::string& path, StudentId id, StudentRecord& out) {
    if (id <= 0) return DbStatus::InvalidId;
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT id,name,grade,email FROM students WHERE id=?;",
            -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare find");
    sqlite3_bind_int64(st, 1, id);

    DbStatus result = DbStatus::NotFound;
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        out = row_to_record(st);
        result = DbStatus::Ok;
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) return storage_error(db, "find");
    return result;
}

// Row count for the menu header.
DbStatus db_count_students(const std::string& path, int& out) {
    ScopedDb conn(path);
    if (!conn.ok()) return DbStatus::StorageUnavailable;
    sqlite3* db = conn.get();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM students;", -1, &st, nullptr) != SQLITE_OK)
        return storage_error(db, "prepare count");

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out = sqlite3_column_int(st, 0);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok ? DbStatus::Ok : storage_error(db, "count");
}

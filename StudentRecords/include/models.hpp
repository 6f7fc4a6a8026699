#pragma once
#include <cstdint>
#include <string>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain struct
-------------------------------------------------------------------------------
Defines the single entity persisted by the store:
  - StudentRecord (id + name, grade, email)

A plain value type with public fields. `id` is assigned by SQLite on insert
and is never reused for the lifetime of the database file. It is the 64-bit
SQLite rowid, so StudentId is 64 bits wide as well.
-------------------------------------------------------------------------------
*/

using StudentId = std::int64_t;

// A student record
struct StudentRecord {
    StudentId id{ 0 };   // surrogate key, 0 until the store assigns one
    std::string name;
    std::string grade;
    std::string email;
};

inline bool operator==(const StudentRecord& a, const StudentRecord& b) {
    return a.id == b.id && a.name == b.name && a.grade == b.grade && a.email == b.email;
}

inline bool operator!=(const StudentRecord& a, const StudentRecord& b) {
    return !(a == b);
}

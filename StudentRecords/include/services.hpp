#pragma once
#include <vector>
#include <string>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - Console presentation helpers
-------------------------------------------------------------------------------
Small inline helpers the menu uses to render StudentRecords as plain text.
They only format; they never touch the database. Rows are printed in the order
given, which is ascending id when they come from db_read_all_students.

Conventions
  - Output goes to the supplied stream (std::cout by default) so the same
    helpers can be checked against an ostringstream.
  - Column widths grow to fit the longest value in each column.
-------------------------------------------------------------------------------
*/

// One-line summary, e.g. "#3 Ann (A) <ann@x.com>"
inline std::string describe_student(const StudentRecord& s) {
    return "#" + std::to_string(s.id) + " " + s.name + " (" + s.grade + ") <" + s.email + ">";
}

// Print a table of students.
inline void show_students(const std::vector<StudentRecord>& rows, std::ostream& out = std::cout) {
    if (rows.empty()) {
        out << "No students found.\n";
        return;
    }

    std::size_t w_id = 2, w_name = 4, w_grade = 5;
    for (const auto& s : rows) {
        w_id = std::max(w_id, std::to_string(s.id).size());
        w_name = std::max(w_name, s.name.size());
        w_grade = std::max(w_grade, s.grade.size());
    }

    out << "--- ********************** ---\n";
    out << "        View Students         \n";
    out << "--- ********************** ---\n";
    out << std::left
        << std::setw(static_cast<int>(w_id)) << "ID" << "  "
        << std::setw(static_cast<int>(w_name)) << "Name" << "  "
        << std::setw(static_cast<int>(w_grade)) << "Grade" << "  "
        << "Email\n";
    for (const auto& s : rows) {
        out << std::setw(static_cast<int>(w_id)) << s.id << "  "
            << std::setw(static_cast<int>(w_name)) << s.name << "  "
            << std::setw(static_cast<int>(w_grade)) << s.grade << "  "
            << s.email << "\n";
    }
    out << std::right << rows.size() << (rows.size() == 1 ? " student\n" : " students\n");
}

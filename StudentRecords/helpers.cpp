#include "helpers.hpp"
#include "services.hpp"
#include <vector>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Menu actions for the Student Records console
-------------------------------------------------------------------------------
Actions never hold a connection; they go through the db_* functions, which
each open and close their own. That keeps every menu step its own
transaction: an action that fails half way (e.g. the user exits at the email
prompt) has written nothing.

Validation split
  - Name must be non-blank, grade non-blank and short, email well formed.
    These checks live here, not in the store.
  - Ids are parsed by prompt_id_or_back, which re-prompts on bad input.
-------------------------------------------------------------------------------
*/

static void report_failure(std::ostream& out, const char* action, DbStatus s) {
    out << "Could not " << action << " (" << db_status_text(s) << ").\n";
}

static void report_missing(std::ostream& out, StudentId id) {
    out << "No student with id " << id << ".\n";
}

InputCtl menu_add_student(const std::string& db_path, std::istream& in, std::ostream& out) {
    std::string name, grade, email;

    auto r1 = prompt_until_valid_or_back("Name", name, is_non_empty,
        "Name is required.", in, out);
    if (r1 != InputCtl::Ok) return r1;

    auto r2 = prompt_until_valid_or_back("Grade", grade, is_non_empty_short,
        "Grade required (max 60 chars).", in, out);
    if (r2 != InputCtl::Ok) return r2;

    auto r3 = prompt_until_valid_or_back("Email", email, is_valid_email,
        "Invalid email (e.g. ann@example.com).", in, out);
    if (r3 != InputCtl::Ok) return r3;

    StudentId id = 0;
    DbStatus s = db_create_student(db_path, name, grade, email, id);
    if (s == DbStatus::Ok)
        out << "Student added with id " << id << ".\n";
    else
        report_failure(out, "add student", s);
    return InputCtl::Ok;
}

InputCtl menu_view_students(const std::string& db_path, std::ostream& out) {
    std::vector<StudentRecord> rows;
    DbStatus s = db_read_all_students(db_path, rows);
    if (s != DbStatus::Ok) {
        report_failure(out, "read students", s);
        return InputCtl::Ok;
    }
    show_students(rows, out);
    return InputCtl::Ok;
}

InputCtl menu_update_student(const std::string& db_path, std::istream& in, std::ostream& out) {
    StudentId id = 0;
    auto p = prompt_id_or_back("Student ID to update", id, in, out);
    if (p != InputCtl::Ok) return p;

    // Load current values so Enter can keep them.
    StudentRecord cur;
    DbStatus found = db_find_student(db_path, id, cur);
    if (found == DbStatus::NotFound) { report_missing(out, id); return InputCtl::Ok; }
    if (found != DbStatus::Ok) { report_failure(out, "load student", found); return InputCtl::Ok; }

    StudentRecord upd = cur;

    auto r1 = prompt_edit_string("Name", cur.name, upd.name, is_non_empty,
        "Name is required.", in, out);
    if (r1 != InputCtl::Ok) return r1;

    auto r2 = prompt_edit_string("Grade", cur.grade, upd.grade, is_non_empty_short,
        "Grade required (max 60 chars).", in, out);
    if (r2 != InputCtl::Ok) return r2;

    auto r3 = prompt_edit_string("Email", cur.email, upd.email, is_valid_email,
        "Invalid email.", in, out);
    if (r3 != InputCtl::Ok) return r3;

    DbStatus s = db_update_student(db_path, id, upd.name, upd.grade, upd.email);
    if (s == DbStatus::Ok)
        out << "Student updated.\n";
    else if (s == DbStatus::NotFound)
        report_missing(out, id);
    else
        report_failure(out, "update student", s);
    return InputCtl::Ok;
}

InputCtl menu_delete_student(const std::string& db_path, std::istream& in, std::ostream& out) {
    StudentId id = 0;
    auto p = prompt_id_or_back("Student ID to delete", id, in, out);
    if (p != InputCtl::Ok) return p;

    StudentRecord cur;
    DbStatus found = db_find_student(db_path, id, cur);
    if (found == DbStatus::NotFound) { report_missing(out, id); return InputCtl::Ok; }
    if (found != DbStatus::Ok) { report_failure(out, "load student", found); return InputCtl::Ok; }

    auto c = confirm_or_back("Delete " + describe_student(cur) + "?", in, out);
    if (c == InputCtl::Exit) return c;
    if (c == InputCtl::Back) { out << "Delete canceled.\n"; return InputCtl::Ok; }

    DbStatus s = db_delete_student(db_path, id);
    if (s == DbStatus::Ok)
        out << "Student deleted.\n";
    else if (s == DbStatus::NotFound)
        report_missing(out, id);
    else
        report_failure(out, "delete student", s);
    return InputCtl::Ok;
}

void run_menu(const std::string& db_path, std::istream& in, std::ostream& out) {
    for (;;) {
        int count = 0;
        bool have_count = db_count_students(db_path, count) == DbStatus::Ok;

        out << "=====================================================\n"
            << "                 STUDENT RECORDS MENU                \n"
            << "=====================================================\n";
        if (have_count)
            out << "    Students on file: " << count << "\n";
        out << "-----------------------------------------------------\n"
            << "  [1]  Add student       [2]  View students          \n"
            << "  [3]  Update student    [4]  Delete student         \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        std::string line;
        if (!std::getline(in, line)) break;
        line = trim(line);

        InputCtl r = InputCtl::Ok;
        if (line == "1") r = menu_add_student(db_path, in, out);
        else if (line == "2") r = menu_view_students(db_path, out);
        else if (line == "3") r = menu_update_student(db_path, in, out);
        else if (line == "4") r = menu_delete_student(db_path, in, out);
        else if (line == "0" || is_exit(line)) break;
        else out << "Unknown option.\n";

        if (r == InputCtl::Exit) break;
    }
    out << "Exiting program...\n";
}

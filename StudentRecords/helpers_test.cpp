#include "helpers.hpp"
#include "services.hpp"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

class MenuTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = (std::filesystem::temp_directory_path() /
                 (std::string("student_records_menu_") + info->name() + ".db")).string();
        std::remove(path_.c_str());
        ASSERT_EQ(db_ensure_schema(path_), DbStatus::Ok);
    }

    void TearDown() override {
        std::remove(path_.c_str());
        std::remove((path_ + "-journal").c_str());
    }

    std::vector<StudentRecord> ReadAll() {
        std::vector<StudentRecord> rows;
        EXPECT_EQ(db_read_all_students(path_, rows), DbStatus::Ok);
        return rows;
    }

    StudentId Seed(const std::string& name) {
        StudentId id = 0;
        EXPECT_EQ(db_create_student(path_, name, "A", name + "@x.com", id), DbStatus::Ok);
        return id;
    }

    static bool Contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::string path_;
};

TEST_F(MenuTest, AddStudent) {
    std::istringstream in("\nAnn\nA\nnot-an-email\nann@x.com\n");
    std::ostringstream out;
    EXPECT_EQ(menu_add_student(path_, in, out), InputCtl::Ok);

    std::vector<StudentRecord> rows = ReadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].name, "Ann");
    EXPECT_EQ(rows[0].grade, "A");
    EXPECT_EQ(rows[0].email, "ann@x.com");
    EXPECT_TRUE(Contains(out.str(), "Name is required."));
    EXPECT_TRUE(Contains(out.str(), "Invalid email"));
    EXPECT_TRUE(Contains(out.str(), "Student added with id " + std::to_string(rows[0].id)));
}

TEST_F(MenuTest, AddStudentBackWritesNothing) {
    std::istringstream in("Ann\nA\nb\n");
    std::ostringstream out;
    EXPECT_EQ(menu_add_student(path_, in, out), InputCtl::Back);
    EXPECT_TRUE(ReadAll().empty());
}

TEST_F(MenuTest, ViewStudents) {
    std::ostringstream empty;
    menu_view_students(path_, empty);
    EXPECT_TRUE(Contains(empty.str(), "No students found."));

    Seed("Ann");
    Seed("Bob");
    std::ostringstream out;
    menu_view_students(path_, out);
    EXPECT_TRUE(Contains(out.str(), "Ann"));
    EXPECT_TRUE(Contains(out.str(), "bob@x.com"));
    EXPECT_LT(out.str().find("Ann"), out.str().find("Bob"));
}

TEST_F(MenuTest, UpdateKeepsAndReplacesFields) {
    StudentId id = Seed("Ann");
    std::istringstream in(std::to_string(id) + "\n\nB\nann.new@x.com\n");
    std::ostringstream out;
    EXPECT_EQ(menu_update_student(path_, in, out), InputCtl::Ok);

    std::vector<StudentRecord> rows = ReadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (StudentRecord{ id, "Ann", "B", "ann.new@x.com" }));
    EXPECT_TRUE(Contains(out.str(), "Student updated."));
}

TEST_F(MenuTest, UpdateUnknownId) {
    Seed("Ann");
    std::vector<StudentRecord> before = ReadAll();
    std::istringstream in("999\n");
    std::ostringstream out;
    EXPECT_EQ(menu_update_student(path_, in, out), InputCtl::Ok);
    EXPECT_TRUE(Contains(out.str(), "No student with id 999."));
    EXPECT_EQ(ReadAll(), before);
}

TEST_F(MenuTest, DeleteNeedsConfirmation) {
    StudentId a = Seed("Ann");
    StudentId b = Seed("Bob");

    std::istringstream cancel(std::to_string(a) + "\nn\n");
    std::ostringstream out1;
    EXPECT_EQ(menu_delete_student(path_, cancel, out1), InputCtl::Ok);
    EXPECT_TRUE(Contains(out1.str(), "Delete canceled."));
    EXPECT_EQ(ReadAll().size(), 2u);

    std::istringstream confirm("oops\n" + std::to_string(a) + "\ny\n");
    std::ostringstream out2;
    EXPECT_EQ(menu_delete_student(path_, confirm, out2), InputCtl::Ok);
    EXPECT_TRUE(Contains(out2.str(), "Invalid ID"));
    EXPECT_TRUE(Contains(out2.str(), "Student deleted."));

    std::vector<StudentRecord> rows = ReadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].id, b);
}

TEST_F(MenuTest, UpdateAndDeleteLargeId) {
    StudentId seeded = 0;
    ASSERT_EQ(db_create_student(path_, "Ann", "A", "ann@x.com", seeded), DbStatus::Ok);

    // Move the row past the 32-bit range through raw SQL.
    sqlite3* db = nullptr;
    ASSERT_TRUE(db_open(db, path_));
    ASSERT_EQ(sqlite3_exec(db, "UPDATE students SET id=4294967297;", nullptr, nullptr, nullptr),
        SQLITE_OK);
    db_close(db);

    std::istringstream upd("4294967297\nAnnie\n\n\n");
    std::ostringstream out1;
    EXPECT_EQ(menu_update_student(path_, upd, out1), InputCtl::Ok);
    EXPECT_TRUE(Contains(out1.str(), "Student updated."));
    std::vector<StudentRecord> rows = ReadAll();
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0], (StudentRecord{ 4294967297LL, "Annie", "A", "ann@x.com" }));

    std::istringstream del("4294967297\ny\n");
    std::ostringstream out2;
    EXPECT_EQ(menu_delete_student(path_, del, out2), InputCtl::Ok);
    EXPECT_TRUE(Contains(out2.str(), "#4294967297 Annie"));
    EXPECT_TRUE(ReadAll().empty());
}

TEST_F(MenuTest, DeleteUnknownId) {
    std::istringstream in("999\n");
    std::ostringstream out;
    EXPECT_EQ(menu_delete_student(path_, in, out), InputCtl::Ok);
    EXPECT_TRUE(Contains(out.str(), "No student with id 999."));
}

TEST_F(MenuTest, StorageFailureIsReportedNotFatal) {
    const std::string bad = "/nonexistent-student-records-dir/students.db";
    std::ostringstream out;
    EXPECT_EQ(menu_view_students(bad, out), InputCtl::Ok);
    EXPECT_TRUE(Contains(out.str(), "Could not read students (Storage unavailable)."));

    std::istringstream in("Ann\nA\nann@x.com\n");
    std::ostringstream out2;
    EXPECT_EQ(menu_add_student(bad, in, out2), InputCtl::Ok);
    EXPECT_TRUE(Contains(out2.str(), "Could not add student (Storage unavailable)."));
}

TEST_F(MenuTest, RunMenuSession) {
    std::istringstream in(
        "1\nAnn\nA\nann@x.com\n"
        "1\nBob\nB\nbob@x.com\n"
        "7\n"
        "2\n"
        "0\n");
    std::ostringstream out;
    run_menu(path_, in, out);

    EXPECT_EQ(ReadAll().size(), 2u);
    EXPECT_TRUE(Contains(out.str(), "Unknown option."));
    EXPECT_TRUE(Contains(out.str(), "Students on file: 2"));
    EXPECT_TRUE(Contains(out.str(), "bob@x.com"));
    EXPECT_TRUE(Contains(out.str(), "Exiting program..."));
}

TEST_F(MenuTest, RunMenuStopsAtEndOfInput) {
    std::istringstream in("1\nAnn\n");
    std::ostringstream out;
    run_menu(path_, in, out);
    EXPECT_TRUE(ReadAll().empty());
    EXPECT_TRUE(Contains(out.str(), "Exiting program..."));
}

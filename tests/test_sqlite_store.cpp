// tests/test_sqlite_store.cpp
// SQLite store against an in-memory database.

#include "groups/CourseMatching.hpp"
#include "store/SqliteStore.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace groups;

namespace {

class SqliteStoreTest : public ::testing::Test {
protected:
    store::SqliteStore db{":memory:"};

    void SetUp() override { db.init_schema(); }

    CourseId course_id(const std::string& code) {
        for (const auto& c : db.list_courses()) {
            if (c.code == code) return c.id;
        }
        throw std::runtime_error("no course " + code);
    }

    StudentId add(const std::string& name, int size, std::vector<CourseId> courses, std::set<TimeSlotId> slots) {
        Student s;
        s.name = name;
        s.email = name + "@example.edu";
        s.preferred_group_size = size;
        s.course_ids = std::move(courses);
        s.availability = std::move(slots);
        return db.upsert_student(s);
    }
};

}  // namespace

TEST_F(SqliteStoreTest, SeedsReferenceDataOnce) {
    db.init_schema();

    const auto courses = db.list_courses();
    ASSERT_EQ(courses.size(), 3u);
    EXPECT_EQ(courses[0].code, "CS101");
    EXPECT_EQ(courses[1].code, "MATH201");
    EXPECT_EQ(courses[2].code, "PHYS150");

    const auto slots = db.list_timeslots();
    ASSERT_EQ(slots.size(), 6u);
    EXPECT_EQ(slots[0].label, "Mon 10-12");
    EXPECT_EQ(slots[5].label, "Wed 14-16");
}

TEST_F(SqliteStoreTest, UpsertNormalizesAndClamps) {
    Student s;
    s.name = "  Ada Lovelace ";
    s.email = " ADA@Example.EDU ";
    s.preferred_group_size = 9;
    const StudentId id = db.upsert_student(s);

    const auto students = db.list_students();
    ASSERT_EQ(students.size(), 1u);
    EXPECT_EQ(students[0].id, id);
    EXPECT_EQ(students[0].name, "Ada Lovelace");
    EXPECT_EQ(students[0].email, "ada@example.edu");
    EXPECT_EQ(students[0].preferred_group_size, 5);
}

TEST_F(SqliteStoreTest, UpsertBySameEmailReplacesRelations) {
    const CourseId cs = course_id("CS101");
    const CourseId math = course_id("MATH201");

    const StudentId first = add("ada", 3, {cs}, {1, 2});
    const StudentId second = add("ada", 1, {math}, {3});
    EXPECT_EQ(first, second);

    const auto students = db.list_students();
    ASSERT_EQ(students.size(), 1u);
    EXPECT_EQ(students[0].preferred_group_size, 2);
    EXPECT_EQ(students[0].course_ids, std::vector<CourseId>{math});
    EXPECT_EQ(students[0].availability, std::set<TimeSlotId>{3});
}

TEST_F(SqliteStoreTest, UpsertRejectsMissingFieldsAndUnknownIds) {
    Student s;
    s.name = "   ";
    s.email = "x@example.edu";
    EXPECT_THROW(db.upsert_student(s), std::invalid_argument);

    s.name = "x";
    s.course_ids = {999};
    EXPECT_THROW(db.upsert_student(s), std::invalid_argument);

    s.course_ids.clear();
    s.availability = {999};
    EXPECT_THROW(db.upsert_student(s), std::invalid_argument);

    EXPECT_TRUE(db.list_students().empty());
}

TEST_F(SqliteStoreTest, RostersOrderedByCourseThenStudent) {
    const CourseId cs = course_id("CS101");
    const CourseId phys = course_id("PHYS150");

    const StudentId a = add("a", 3, {phys, cs}, {1});
    const StudentId b = add("b", 3, {cs}, {1, 2});

    const auto rosters = db.load_rosters();
    ASSERT_EQ(rosters.size(), 2u);
    EXPECT_EQ(rosters[0].course_id, std::min(cs, phys));

    const auto& cs_roster = rosters[0].course_id == cs ? rosters[0] : rosters[1];
    ASSERT_EQ(cs_roster.students.size(), 2u);
    EXPECT_EQ(cs_roster.students[0].id, a);
    EXPECT_EQ(cs_roster.students[1].id, b);
    EXPECT_EQ(cs_roster.students[1].availability, (std::set<TimeSlotId>{1, 2}));

    // the copy in the lower-id roster still lists both enrollments
    const auto& first = rosters[0].students[0];
    ASSERT_EQ(first.id, a);
    EXPECT_EQ(first.course_ids, (std::vector<CourseId>{std::min(cs, phys), std::max(cs, phys)}));
}

TEST_F(SqliteStoreTest, MatchPersistsGroupsReadableByName) {
    const CourseId cs = course_id("CS101");
    add("dave", 2, {cs}, {1});
    add("carol", 2, {cs}, {1});
    add("bob", 2, {cs}, {2});
    add("alice", 2, {cs}, {2});

    CourseMatcher matcher(db, db);
    const MatchingResult res = matcher.run_matching();
    ASSERT_EQ(res.courses.size(), 1u);
    ASSERT_EQ(res.courses[0].groups.size(), 2u);

    const auto views = db.list_groups();
    ASSERT_EQ(views.size(), 2u);
    EXPECT_EQ(views[0].course_code, "CS101");
    EXPECT_EQ(views[0].group_index, 1);
    EXPECT_EQ(views[0].group_id, res.courses[0].group_ids[0]);

    // dave and carol share slot 1 and were matched first
    ASSERT_EQ(views[0].members.size(), 2u);
    EXPECT_EQ(views[0].members[0].name, "carol");
    EXPECT_EQ(views[0].members[1].name, "dave");
    EXPECT_EQ(views[1].members[0].name, "alice");
    EXPECT_EQ(views[1].members[1].name, "bob");
}

TEST_F(SqliteStoreTest, RollbackKeepsCommittedGroups) {
    const CourseId cs = course_id("CS101");
    const StudentId a = add("a", 2, {cs}, {});
    const StudentId b = add("b", 2, {cs}, {});

    db.begin_replace();
    db.clear_all_groups();
    db.write_group(cs, 1, {a, b});
    db.commit_replace();
    ASSERT_EQ(db.list_groups().size(), 1u);

    db.begin_replace();
    db.clear_all_groups();
    db.write_group(cs, 1, {a});
    db.rollback_replace();

    const auto views = db.list_groups();
    ASSERT_EQ(views.size(), 1u);
    EXPECT_EQ(views[0].members.size(), 2u);
}

TEST_F(SqliteStoreTest, WritingUnknownStudentFails) {
    const CourseId cs = course_id("CS101");
    db.begin_replace();
    EXPECT_THROW(db.write_group(cs, 1, {12345}), store::StorageError);
    db.rollback_replace();
    EXPECT_TRUE(db.list_groups().empty());
}

TEST(SqliteStore, OpenFailureThrows) {
    EXPECT_THROW({ store::SqliteStore db("/nonexistent-dir/for/sure/groups.db"); }, store::StorageError);
}

// tests/test_group_formation.cpp
// Seed-and-grow formation, leftover merge, determinism.

#include "groups/GroupFormation.hpp"
#include "groups/Compatibility.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

using namespace groups;

static std::vector<std::vector<StudentId>> ids_of(const std::vector<Group>& groups) {
    std::vector<std::vector<StudentId>> out;
    for (const auto& g : groups) {
        std::vector<StudentId> ids;
        for (const auto& s : g) ids.push_back(s.id);
        out.push_back(ids);
    }
    return out;
}

static std::vector<Student> uniform_roster(size_t n, int pref, std::initializer_list<TimeSlotId> slots) {
    std::vector<Student> out;
    for (size_t i = 0; i < n; ++i) out.push_back(make_student(static_cast<StudentId>(i + 1), pref, slots));
    return out;
}

TEST(GroupFormation, EmptyRosterGivesNoGroups) {
    EXPECT_TRUE(form_groups({}).empty());

    const FormationResult r = form_groups_detailed({});
    EXPECT_TRUE(r.groups.empty());
    EXPECT_TRUE(r.steps.empty());
}

TEST(GroupFormation, SingleStudentStaysAlone) {
    const auto groups = form_groups({make_student(42, 4, {1})});
    ASSERT_EQ(groups.size(), 1u);
    ASSERT_EQ(groups[0].size(), 1u);
    EXPECT_EQ(groups[0][0].id, 42);
}

TEST(GroupFormation, SixIdenticalStudentsFormTwoTriples) {
    const auto roster = uniform_roster(6, 3, {1});
    const FormationResult r = form_groups_detailed(roster);

    EXPECT_EQ(r.target_size, 3);
    const std::vector<std::vector<StudentId>> expected = {{1, 2, 3}, {4, 5, 6}};
    EXPECT_EQ(ids_of(r.groups), expected);

    for (const auto& g : r.groups) {
        for (size_t i = 0; i < g.size(); ++i) {
            for (size_t j = i + 1; j < g.size(); ++j) EXPECT_EQ(compatibility(g[i], g[j]), 6);
        }
    }
}

TEST(GroupFormation, TrailingSingletonMergesIntoFirstGroupOnTie) {
    const auto roster = uniform_roster(7, 3, {1});
    const auto groups = form_groups(roster);

    const std::vector<std::vector<StudentId>> expected = {{1, 2, 3, 7}, {4, 5, 6}};
    EXPECT_EQ(ids_of(groups), expected);
}

TEST(GroupFormation, TrailingSingletonMergesIntoMostCompatibleGroup) {
    // 1 and 2 share three slots and form first; 5 shares a slot with 3 and 4.
    const std::vector<Student> roster = {
        make_student(1, 2, {1, 2, 3}),
        make_student(2, 2, {1, 2, 3}),
        make_student(3, 2, {4}),
        make_student(4, 2, {4}),
        make_student(5, 2, {4}),
    };
    const FormationResult r = form_groups_detailed(roster);

    EXPECT_EQ(r.target_size, 2);
    const std::vector<std::vector<StudentId>> expected = {{1, 2}, {3, 4, 5}};
    EXPECT_EQ(ids_of(r.groups), expected);

    ASSERT_FALSE(r.steps.empty());
    const FormationStep& last = r.steps.back();
    EXPECT_EQ(last.kind, StepKind::Merge);
    EXPECT_EQ(last.student_id, 5);
    EXPECT_EQ(last.group_position, 1);
    EXPECT_DOUBLE_EQ(last.score, 6.0);
}

TEST(GroupFormation, SeedIsHighestTotalWithRosterOrderTieBreak) {
    // 10/11 score 7 together, 12/13 score 6; every cross pair scores 5.
    const std::vector<Student> roster = {
        make_student(12, 2, {3}),
        make_student(13, 2, {3}),
        make_student(10, 2, {1, 2}),
        make_student(11, 2, {1, 2}),
    };
    const FormationResult r = form_groups_detailed(roster);

    const std::vector<std::vector<StudentId>> expected = {{10, 11}, {12, 13}};
    EXPECT_EQ(ids_of(r.groups), expected);

    ASSERT_EQ(r.steps.size(), 4u);
    EXPECT_EQ(r.steps[0].kind, StepKind::Seed);
    EXPECT_EQ(r.steps[0].student_id, 10);
    EXPECT_DOUBLE_EQ(r.steps[0].score, 17.0);
    EXPECT_EQ(r.steps[1].kind, StepKind::Grow);
    EXPECT_DOUBLE_EQ(r.steps[1].score, 7.0);
    EXPECT_EQ(r.steps[2].student_id, 12);
    EXPECT_EQ(r.steps[2].group_position, 1);
}

TEST(GroupFormation, FillsGroupsEvenWhenAllScoresAreZero) {
    FormationConfig cfg;
    cfg.base_score = 0;

    const std::vector<Student> roster = {
        make_student(1, 2), make_student(2, 5), make_student(3, 2), make_student(4, 5), make_student(5, 2),
    };
    // target 2; every score is 0, so roster order decides
    const auto groups = form_groups(roster, cfg);

    const std::vector<std::vector<StudentId>> expected = {{1, 2, 5}, {3, 4}};
    EXPECT_EQ(ids_of(groups), expected);
}

TEST(GroupFormation, RosterSmallerThanTargetFormsOneGroup) {
    const auto groups = form_groups(uniform_roster(2, 5, {}));
    // target 5, both fit in one group
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), 2u);
}

TEST(GroupFormation, EveryStudentPlacedExactlyOnce) {
    for (size_t n = 1; n <= 25; ++n) {
        for (unsigned seed = 1; seed <= 4; ++seed) {
            const auto roster = random_roster(n, seed * 97 + static_cast<unsigned>(n));
            const auto groups = form_groups(roster);

            std::multiset<StudentId> seen;
            for (const auto& g : groups) {
                EXPECT_FALSE(g.empty());
                for (const auto& s : g) seen.insert(s.id);
            }

            std::multiset<StudentId> expected;
            for (const auto& s : roster) expected.insert(s.id);
            EXPECT_EQ(seen, expected) << "n=" << n << " seed=" << seed;

            const auto singletons = std::count_if(groups.begin(), groups.end(),
                                                  [](const Group& g) { return g.size() == 1; });
            if (n == 1) {
                EXPECT_EQ(singletons, 1);
            } else {
                EXPECT_EQ(singletons, 0) << "n=" << n << " seed=" << seed;
            }
        }
    }
}

TEST(GroupFormation, GroupsNeverExceedTargetExceptMergeTarget) {
    for (unsigned seed = 1; seed <= 10; ++seed) {
        const auto roster = random_roster(17, seed);
        const FormationResult r = form_groups_detailed(roster);

        bool merged = false;
        for (const auto& s : r.steps) merged = merged || s.kind == StepKind::Merge;

        size_t oversized = 0;
        for (const auto& g : r.groups) {
            EXPECT_LE(g.size(), static_cast<size_t>(r.target_size) + 1);
            if (g.size() > static_cast<size_t>(r.target_size)) ++oversized;
        }
        EXPECT_EQ(oversized, merged ? 1u : 0u);
    }
}

TEST(GroupFormation, RepeatedRunsAreIdentical) {
    const auto roster = random_roster(23, 7);
    const FormationResult a = form_groups_detailed(roster);
    const FormationResult b = form_groups_detailed(roster);

    EXPECT_EQ(ids_of(a.groups), ids_of(b.groups));
    ASSERT_EQ(a.steps.size(), b.steps.size());
    for (size_t i = 0; i < a.steps.size(); ++i) {
        EXPECT_EQ(a.steps[i].student_id, b.steps[i].student_id);
        EXPECT_EQ(a.steps[i].group_position, b.steps[i].group_position);
    }
}

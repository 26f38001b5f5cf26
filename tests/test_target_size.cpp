// tests/test_target_size.cpp

#include "groups/TargetSize.hpp"
#include "TestUtil.hpp"

#include <gtest/gtest.h>

using namespace groups;

static std::vector<Student> roster_with_sizes(std::initializer_list<int> sizes) {
    std::vector<Student> out;
    StudentId id = 1;
    for (int s : sizes) out.push_back(make_student(id++, s));
    return out;
}

TEST(TargetSize, OddCountTakesMiddleValue) {
    EXPECT_EQ(resolve_target_size(roster_with_sizes({5, 2, 4})), 4);
    EXPECT_EQ(resolve_target_size(roster_with_sizes({3})), 3);
}

TEST(TargetSize, EvenCountTruncatesMeanOfMiddleValues) {
    EXPECT_EQ(resolve_target_size(roster_with_sizes({2, 3})), 2);      // 2.5 -> 2
    EXPECT_EQ(resolve_target_size(roster_with_sizes({2, 5, 4, 3})), 3); // (3+4)/2 -> 3
    EXPECT_EQ(resolve_target_size(roster_with_sizes({4, 4, 5, 5})), 4); // 4.5 -> 4
}

TEST(TargetSize, ClampsPreferencesBeforeMedian) {
    // clamped to {2, 2, 5}
    EXPECT_EQ(resolve_target_size(roster_with_sizes({-3, 0, 12})), 2);
    EXPECT_EQ(resolve_target_size(roster_with_sizes({9, 9, 1})), 5);
}

TEST(TargetSize, EmptyRosterFallsBack) {
    EXPECT_EQ(resolve_target_size({}), 3);

    FormationConfig cfg;
    cfg.fallback_group_size = 4;
    EXPECT_EQ(resolve_target_size({}, cfg), 4);
}

TEST(TargetSize, UniformPreferenceStaysInRange) {
    for (int pref = 2; pref <= 5; ++pref) {
        const auto roster = roster_with_sizes({pref, pref, pref, pref, pref, pref});
        const int t = resolve_target_size(roster);
        EXPECT_EQ(t, pref);
        EXPECT_GE(t, 2);
        EXPECT_LE(t, 5);
    }
}

TEST(TargetSize, HonorsConfiguredBounds) {
    FormationConfig cfg;
    cfg.min_group_size = 3;
    cfg.max_group_size = 4;
    EXPECT_EQ(resolve_target_size(roster_with_sizes({2, 2, 2}), cfg), 3);
    EXPECT_EQ(resolve_target_size(roster_with_sizes({5, 5}), cfg), 4);
}

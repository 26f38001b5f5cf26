#include "groups/GroupFormation.hpp"

#include "groups/Compatibility.hpp"
#include "groups/TargetSize.hpp"

namespace groups {

const char* step_kind_str(StepKind k) {
    switch (k) {
        case StepKind::Seed: return "seed";
        case StepKind::Grow: return "grow";
        case StepKind::Merge: return "merge";
        default: return "unknown";
    }
}

namespace {

// Average scores are compared as fractions (sum / count) so that ties are exact.
struct Average {
    long long sum = 0;
    long long count = 1;

    bool greater_than(const Average& o) const { return sum * o.count > o.sum * count; }
    double value() const { return count > 0 ? static_cast<double>(sum) / static_cast<double>(count) : 0.0; }
};

Average average_against(const CompatibilityMatrix& scores, size_t candidate, const std::vector<size_t>& members) {
    Average avg;
    if (members.empty()) return avg;
    avg.count = static_cast<long long>(members.size());
    for (size_t m : members) avg.sum += scores.at(candidate, m);
    return avg;
}

}  // namespace

FormationResult form_groups_detailed(const std::vector<Student>& students, const FormationConfig& cfg) {
    FormationResult res;

    if (students.empty()) return res;
    if (students.size() == 1) {
        res.groups.push_back(students);
        res.steps.push_back(FormationStep{StepKind::Seed, students.front().id, 0, 0.0});
        return res;
    }

    res.target_size = resolve_target_size(students, cfg);
    const size_t target = static_cast<size_t>(res.target_size);

    const CompatibilityMatrix scores = CompatibilityMatrix::build(students, cfg);
    const size_t n = students.size();

    // Roster positions, enumerated in roster order everywhere below.
    std::vector<bool> assigned(n, false);
    size_t remaining = n;

    std::vector<std::vector<size_t>> formed;

    while (remaining > 0) {
        // Seed: highest total against the other unassigned students.
        size_t seed = n;
        long long seed_total = -1;
        for (size_t i = 0; i < n; ++i) {
            if (assigned[i]) continue;
            long long total = 0;
            for (size_t j = 0; j < n; ++j) {
                if (j == i || assigned[j]) continue;
                total += scores.at(i, j);
            }
            if (total > seed_total) {
                seed_total = total;
                seed = i;
            }
        }

        const int position = static_cast<int>(formed.size());
        std::vector<size_t> members{seed};
        assigned[seed] = true;
        --remaining;
        res.steps.push_back(FormationStep{StepKind::Seed, students[seed].id, position, static_cast<double>(seed_total)});

        // Grow: best average against the current members. Some candidate is
        // always taken, even when every average is zero.
        while (members.size() < target && remaining > 0) {
            size_t best = n;
            Average best_avg;
            for (size_t i = 0; i < n; ++i) {
                if (assigned[i]) continue;
                const Average avg = average_against(scores, i, members);
                if (best == n || avg.greater_than(best_avg)) {
                    best = i;
                    best_avg = avg;
                }
            }

            members.push_back(best);
            assigned[best] = true;
            --remaining;
            res.steps.push_back(FormationStep{StepKind::Grow, students[best].id, position, best_avg.value()});
        }

        formed.push_back(std::move(members));
    }

    // Leftover reconciliation: only the last group is checked.
    if (formed.size() >= 2 && formed.back().size() == 1) {
        const size_t lone = formed.back().front();
        formed.pop_back();

        size_t best_group = 0;
        Average best_avg;
        for (size_t g = 0; g < formed.size(); ++g) {
            const Average avg = average_against(scores, lone, formed[g]);
            if (g == 0 || avg.greater_than(best_avg)) {
                best_group = g;
                best_avg = avg;
            }
        }

        formed[best_group].push_back(lone);
        res.steps.push_back(FormationStep{StepKind::Merge, students[lone].id, static_cast<int>(best_group), best_avg.value()});
    }

    res.groups.reserve(formed.size());
    for (const auto& members : formed) {
        Group g;
        g.reserve(members.size());
        for (size_t i : members) g.push_back(students[i]);
        res.groups.push_back(std::move(g));
    }

    return res;
}

std::vector<Group> form_groups(const std::vector<Student>& students, const FormationConfig& cfg) {
    return form_groups_detailed(students, cfg).groups;
}

}  // namespace groups

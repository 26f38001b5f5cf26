#pragma once

#include "store/Store.hpp"

#include <vector>

namespace store {

// Keeps a dataset and its groups in memory. Rosters come out in course order
// of the dataset, students in dataset order.
class MemoryStore final : public RosterProvider, public ResultSink, public GroupQuery {
public:
    MemoryStore() = default;
    explicit MemoryStore(Dataset data);

    const Dataset& data() const { return m_data; }

    std::vector<groups::CourseRoster> load_rosters() override;

    void begin_replace() override;
    void clear_all_groups() override;
    groups::GroupId write_group(groups::CourseId course_id,
                                int group_index,
                                const std::vector<groups::StudentId>& member_ids) override;
    void commit_replace() override;
    void rollback_replace() override;

    std::vector<GroupView> list_groups() override;

    size_t group_count() const { return m_groups.size(); }

private:
    struct StoredGroup {
        groups::GroupId id = 0;
        groups::CourseId course_id = 0;
        int group_index = 0;
        std::vector<groups::StudentId> member_ids;
    };

    Dataset m_data;

    std::vector<StoredGroup> m_groups;      // committed
    std::vector<StoredGroup> m_staged;
    bool m_in_replace = false;
    groups::GroupId m_next_group_id = 1;
    groups::GroupId m_staged_next_id = 1;
};

}  // namespace store

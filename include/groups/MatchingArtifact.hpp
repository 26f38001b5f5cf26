#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "groups/CourseMatching.hpp"
#include "store/Store.hpp"

namespace groups {

struct MatchingArtifact {
    std::string source;          // database or roster file the run read from
    FormationConfig cfg;
    MatchingResult result;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

// { "groups": [ { group_id, course_id, course_code, course_name, group_index, members: [...] } ] }
nlohmann::json group_views_to_json(const std::vector<store::GroupView>& views);

void write_json_file(const std::filesystem::path& out_path, const nlohmann::json& j);

}  // namespace groups

#include "groups/MatchingArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace groups {

static nlohmann::json course_to_json(const CourseGroups& c) {
    nlohmann::json j;
    j["course_id"] = c.course_id;
    j["target_size"] = c.target_size;

    nlohmann::json arr = nlohmann::json::array();
    for (size_t i = 0; i < c.groups.size(); ++i) {
        nlohmann::json g;
        g["group_index"] = static_cast<int>(i) + 1;
        if (i < c.group_ids.size()) g["group_id"] = c.group_ids[i];
        g["member_ids"] = c.groups[i];
        arr.push_back(g);
    }
    j["groups"] = arr;

    nlohmann::json steps = nlohmann::json::array();
    for (const auto& s : c.steps) {
        steps.push_back({
            {"kind", step_kind_str(s.kind)},
            {"student_id", s.student_id},
            {"group_position", s.group_position},
            {"score", s.score}
        });
    }
    j["steps"] = steps;

    return j;
}

nlohmann::json MatchingArtifact::to_json() const {
    nlohmann::json j;
    j["source"] = source;
    j["config"] = {
        {"base_score", cfg.base_score},
        {"min_group_size", cfg.min_group_size},
        {"max_group_size", cfg.max_group_size},
        {"fallback_group_size", cfg.fallback_group_size},
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : result.courses) {
        arr.push_back(course_to_json(c));
    }
    j["courses"] = arr;

    return j;
}

void MatchingArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json_file(out_path, to_json());
}

nlohmann::json group_views_to_json(const std::vector<store::GroupView>& views) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : views) {
        nlohmann::json members = nlohmann::json::array();
        for (const auto& m : v.members) {
            members.push_back({{"id", m.id}, {"name", m.name}, {"email", m.email}});
        }
        arr.push_back({
            {"group_id", v.group_id},
            {"course_id", v.course_id},
            {"course_code", v.course_code},
            {"course_name", v.course_name},
            {"group_index", v.group_index},
            {"members", members},
        });
    }

    nlohmann::json j;
    j["groups"] = arr;
    return j;
}

void write_json_file(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

}  // namespace groups

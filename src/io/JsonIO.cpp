#include "io/JsonIO.hpp"

#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw std::runtime_error(where + " must be an array");
    }
}

static long long require_integer(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) {
        throw std::runtime_error(where + " missing required field: " + std::string(key));
    }
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<long long>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return "";
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<long long> optional_id_array(const json& j, const char* key, const std::string& where) {
    std::vector<long long> out;
    if (!j.contains(key) || j.at(key).is_null()) return out;

    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_number_integer()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be an integer";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<long long>());
    }
    return out;
}

static groups::Course parseCourse(const json& j, const std::string& where) {
    require_object(j, where);

    groups::Course c;
    c.id   = require_integer(j, "id", where);
    c.code = optional_string(j, "code", where);
    c.name = optional_string(j, "name", where);
    return c;
}

static groups::TimeSlot parseTimeSlot(const json& j, const std::string& where) {
    require_object(j, where);

    groups::TimeSlot t;
    t.id          = require_integer(j, "id", where);
    t.label       = optional_string(j, "label", where);
    t.day_of_week = optional_string(j, "day_of_week", where);
    t.start_time  = optional_string(j, "start_time", where);
    t.end_time    = optional_string(j, "end_time", where);
    return t;
}

static groups::Student parseStudent(const json& j, const std::string& where) {
    require_object(j, where);

    groups::Student s;
    s.id    = require_integer(j, "id", where);
    s.name  = optional_string(j, "name", where);
    s.email = optional_string(j, "email", where);

    // missing or null -> 3, anything else is clamped before it reaches the matcher
    long long size = 3;
    if (j.contains("preferred_group_size") && !j.at("preferred_group_size").is_null()) {
        if (!j.at("preferred_group_size").is_number_integer()) {
            throw std::runtime_error(where + ".preferred_group_size must be an integer");
        }
        size = j.at("preferred_group_size").get<long long>();
    }
    s.preferred_group_size = groups::clamp_group_size(size, groups::FormationConfig{});

    s.course_ids = optional_id_array(j, "course_ids", where);
    for (long long tid : optional_id_array(j, "availability_timeslot_ids", where)) {
        s.availability.insert(tid);
    }
    return s;
}

template <typename T, typename Parse>
static void parse_array(const json& root, const char* key, std::vector<T>& out, Parse parse) {
    if (!root.contains(key)) return;

    const std::string where = std::string("root.") + key;
    const json& arr = root.at(key);
    require_array(arr, where);

    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        std::ostringstream oss;
        oss << where << "[" << i << "]";
        out.push_back(parse(arr.at(i), oss.str()));
    }
}

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

store::Dataset parseDataset(const json& j) {
    require_object(j, "root");

    store::Dataset d;
    parse_array(j, "courses", d.courses, parseCourse);
    parse_array(j, "timeslots", d.timeslots, parseTimeSlot);
    parse_array(j, "students", d.students, parseStudent);

    // rosters are built per student, so a repeated id would be placed twice
    std::set<groups::StudentId> seen;
    for (size_t i = 0; i < d.students.size(); ++i) {
        if (!seen.insert(d.students[i].id).second) {
            std::ostringstream oss;
            oss << "root.students[" << i << "].id duplicates an earlier student";
            throw std::runtime_error(oss.str());
        }
    }
    return d;
}

store::Dataset loadRosterFile(const std::string& path) {
    return parseDataset(read_json_file(path, "roster"));
}

groups::FormationConfig parseFormationConfig(const json& j) {
    require_object(j, "config");

    for (const auto& item : j.items()) {
        const std::string& key = item.key();
        if (key != "base_score" && key != "min_group_size" && key != "max_group_size" &&
            key != "fallback_group_size") {
            throw std::runtime_error("config." + key + " is not a recognized option");
        }
    }

    groups::FormationConfig cfg;
    auto read_int = [&](const char* key, int& field) {
        if (!j.contains(key)) return;
        const long long v = require_integer(j, key, "config");
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            throw std::runtime_error("config." + std::string(key) + " is out of range");
        }
        field = static_cast<int>(v);
    };
    read_int("base_score", cfg.base_score);
    read_int("min_group_size", cfg.min_group_size);
    read_int("max_group_size", cfg.max_group_size);
    read_int("fallback_group_size", cfg.fallback_group_size);

    if (cfg.base_score < 0) throw std::runtime_error("config.base_score must be >= 0");
    if (cfg.min_group_size < 2) throw std::runtime_error("config.min_group_size must be >= 2");
    if (cfg.max_group_size < cfg.min_group_size) {
        throw std::runtime_error("config.max_group_size must be >= config.min_group_size");
    }
    if (cfg.fallback_group_size < cfg.min_group_size || cfg.fallback_group_size > cfg.max_group_size) {
        throw std::runtime_error("config.fallback_group_size must lie in [min_group_size, max_group_size]");
    }
    return cfg;
}

groups::FormationConfig loadFormationConfig(const std::string& path) {
    return parseFormationConfig(read_json_file(path, "config"));
}

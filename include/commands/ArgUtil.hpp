#pragma once
#include <string>
#include <vector>

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);
int get_arg_int(int argc, char** argv, const std::string& key, int def);

// "1,2, 5" -> {1, 2, 5}; throws std::invalid_argument on anything else
std::vector<long long> parse_id_list(const std::string& s);

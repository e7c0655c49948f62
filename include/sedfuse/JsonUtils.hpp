#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sedfuse {

// Throws ConfigError when the file is missing or not valid JSON.
nlohmann::json load_json(const std::string& path);

// Replace ${VAR} in every string value with the environment value ("" if unset).
void expand_env(nlohmann::json& j);

// First existing candidate of `name`: cwd, executable dir, ../, ../../.
// Empty string when none exists.
std::string find_settings_file(const std::string& name,
                               std::vector<std::string>* searched = nullptr);

} // namespace sedfuse

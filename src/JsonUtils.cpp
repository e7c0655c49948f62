#include "sedfuse/JsonUtils.hpp"
#include "sedfuse/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;

namespace sedfuse {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigError("Cannot open '" + path + "'");
    try {
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Error parsing JSON from " + path + ": " + e.what());
    }
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out;
    auto begin = input.cbegin();
    std::smatch m;
    while (std::regex_search(begin, input.cend(), m, re)) {
        out.append(begin, m[0].first);
        const char* env = std::getenv(m[1].str().c_str());
        out += env ? env : "";
        begin = m[0].second;                 // no re-scan of substituted text
    }
    out.append(begin, input.cend());
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

std::string find_settings_file(const std::string& name, std::vector<std::string>* searched)
{
    std::vector<std::string> candidates = {name};

    std::error_code ec;
    const fs::path exe = fs::canonical("/proc/self/exe", ec);
    if (!ec) candidates.push_back((exe.parent_path() / name).string());

    candidates.push_back("../" + name);
    candidates.push_back("../../" + name);

    for (const auto& c : candidates) {
        if (searched) searched->push_back(c);
        if (fs::exists(c, ec)) return c;
    }
    return {};
}

} // namespace sedfuse

#include "sedfuse/RunConfig.hpp"
#include "sedfuse/JsonUtils.hpp"
#include "sedfuse/Errors.hpp"

namespace sedfuse {

namespace {

template <typename T>
void read_opt(const nlohmann::json& obj, const char* key, T& out, const std::string& where)
{
    if (!obj.is_object() || !obj.contains(key)) return;
    try {
        out = obj.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("settings: '" + where + "." + key + "': " + e.what());
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* name)
{
    static const nlohmann::json empty = nlohmann::json::object();
    if (!j.contains(name)) return empty;
    const auto& s = j.at(name);
    if (!s.is_object())
        throw ConfigError(std::string("settings: '") + name + "' must be an object");
    return s;
}

} // unnamed namespace

RunConfig run_config_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        throw ConfigError("settings: top level must be an object");

    RunConfig cfg;

    /* -------- input grammar -------------------------------------------- */
    const auto& in = section(j, "input");
    read_opt(in, "fields", cfg.grammar.fields, "input");
    if (in.contains("patterns")) {
        const auto& pats = in.at("patterns");
        if (!pats.is_object())
            throw ConfigError("settings: 'input.patterns' must be an object");
        for (const auto& [name, pat] : pats.items()) {
            if (!pat.is_string())
                throw ConfigError("settings: pattern for '" + name + "' must be a string");
            cfg.grammar.patterns[name] = pat.get<std::string>();
        }
    }

    /* -------- output --------------------------------------------------- */
    const auto& out = section(j, "output");
    read_opt(out, "template",    cfg.output_template, "output");
    read_opt(out, "plotDir",     cfg.plot_dir,        "output");
    read_opt(out, "renderPlots", cfg.render_plots,    "output");

    /* -------- catalogs ------------------------------------------------- */
    read_opt(section(j, "matching"), "toleranceArcsec", cfg.tolerance_arcsec, "matching");
    if (!(cfg.tolerance_arcsec > 0.0))
        throw ConfigError("settings: 'matching.toleranceArcsec' must be positive");

    const auto& ned = section(j, "ned");
    read_opt(ned, "refcodeDenylist",  cfg.ned_filter.refcode_denylist,  "ned");
    read_opt(ned, "passbandDenylist", cfg.ned_filter.passband_denylist, "ned");

    read_opt(section(j, "dustMap"), "columns", cfg.dust_columns, "dustMap");

    /* -------- cosmology ------------------------------------------------ */
    const auto& cos = section(j, "cosmology");
    read_opt(cos, "omegaM",           cfg.cosmology.omega_m,      "cosmology");
    read_opt(cos, "omegaLambda",      cfg.cosmology.omega_lambda, "cosmology");
    read_opt(cos, "H0",               cfg.cosmology.h0,           "cosmology");
    read_opt(cos, "integrationSteps", cfg.cosmology.steps,        "cosmology");

    read_opt(section(j, "responses"), "root", cfg.responses_root, "responses");
    return cfg;
}

RunConfig load_run_config(const std::string& path)
{
    auto j = load_json(path);
    expand_env(j);
    return run_config_from_json(j);
}

} // namespace sedfuse

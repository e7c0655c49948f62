#pragma once
#include "InputParser.hpp"
#include "NedNormalizers.hpp"
#include "Cosmology.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sedfuse {

inline constexpr const char* kSettingsFileName = "sedfuse_settings.json";

// Everything one batch run needs, resolved once before any Source is read.
struct RunConfig {
    InputGrammar             grammar          = InputGrammar::defaults();
    std::string              output_template;            // empty → default template
    std::string              plot_dir;                   // empty → no plot files
    bool                     render_plots     = false;
    double                   tolerance_arcsec = 10.0;
    NedSedFilter             ned_filter;
    std::vector<std::string> dust_columns     = DustMapNormalizer::default_columns();
    CosmologyParams          cosmology;
    std::string              responses_root   = "responses";
};

// Missing keys keep their defaults; wrong types raise ConfigError.
RunConfig run_config_from_json(const nlohmann::json& j);

// Load + ${VAR}-expand + parse.
RunConfig load_run_config(const std::string& path);

} // namespace sedfuse

#include "sedfuse/JsonUtils.hpp"
#include "sedfuse/RunConfig.hpp"
#include "sedfuse/InputParser.hpp"
#include "sedfuse/OutputTemplate.hpp"
#include "sedfuse/ResponseProvider.hpp"
#include "sedfuse/SourcePipeline.hpp"
#include "sedfuse/ResultWriter.hpp"
#include "sedfuse/Errors.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

namespace fs = std::filesystem;
using namespace sedfuse;

// --config wins, otherwise the usual search locations; no file at all means
// built-in defaults.
static RunConfig resolve_config(const cxxopts::ParseResult& cli)
{
    if (cli.count("config"))
        return load_run_config(cli["config"].as<std::string>());

    std::vector<std::string> searched;
    const std::string path = find_settings_file(kSettingsFileName, &searched);
    if (path.empty()) {
        std::cout << "[config] no " << kSettingsFileName << " in";
        for (const auto& p : searched) std::cout << ' ' << p;
        std::cout << ", using defaults\n";
        return RunConfig{};
    }
    std::cout << "[config] loaded from: " << path << '\n';
    return load_run_config(path);
}

// OpenMP over Sources; per-Source log lines are kept in Source order.
static LogLines process_sources(std::vector<Source>& sources, const SourcePipeline& pipeline,
                                int nthreads)
{
    std::vector<LogLines> per_source(sources.size());
    const long n = static_cast<long>(sources.size());

    #pragma omp parallel for schedule(dynamic) num_threads(nthreads) if (nthreads > 1)
    for (long i = 0; i < n; ++i) {
        try {
            per_source[i] = pipeline.process(sources[i]);
        } catch (const std::exception& e) {
            per_source[i].push_back("[pipeline] " + sources[i].output_name() + ": " + e.what());
        }
    }

    LogLines log;
    for (auto& l : per_source)
        log.insert(log.end(), std::make_move_iterator(l.begin()), std::make_move_iterator(l.end()));
    return log;
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("sedfuse", "Build rest-frame SEDs from NED, WISE, 2MASS and GALEX responses");
        opts.add_options()
            ("input", "Source list, one object per line", cxxopts::value<std::string>())
            ("config", "Settings JSON", cxxopts::value<std::string>())
            ("responses", "Root directory of catalog responses", cxxopts::value<std::string>())
            ("output", "Output file (default: stdout)", cxxopts::value<std::string>())
            ("plot-dir", "Write one <name>.dat luminosity table per source", cxxopts::value<std::string>())
            ("render-plots", "Run gnuplot on every plot table")
            ("threads", "Number of threads", cxxopts::value<int>()->default_value("0"))
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("input")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        RunConfig cfg = resolve_config(cli);
        if (cli.count("responses"))    cfg.responses_root = cli["responses"].as<std::string>();
        if (cli.count("plot-dir"))     cfg.plot_dir       = cli["plot-dir"].as<std::string>();
        if (cli.count("render-plots")) cfg.render_plots   = true;

        int nthreads = cli["threads"].as<int>();
        if (nthreads <= 0) nthreads = static_cast<int>(std::thread::hardware_concurrency());
        if (nthreads <= 0) nthreads = 1;

        /* ---- everything that can be misconfigured fails here ---------- */
        const InputParser    parser(cfg.grammar);
        const OutputTemplate tmpl(cfg.output_template.empty() ? OutputTemplate::default_text()
                                                              : cfg.output_template,
                                  cfg.grammar.extra_fields());
        const Cosmology      cosmology(cfg.cosmology);

        const std::string input_path = cli["input"].as<std::string>();
        std::ifstream in(input_path);
        if (!in) throw ConfigError("Cannot open input '" + input_path + "'");

        LogLines input_log;
        std::vector<Source> sources = read_sources(in, parser, input_log);
        for (const auto& l : input_log) std::cerr << l << '\n';
        std::cout << "[input] " << sources.size() << " sources from "
                  << fs::path(input_path).filename().string() << '\n';

        /* ---- catalog fusion ------------------------------------------- */
        const DirectoryResponseProvider provider(cfg.responses_root);
        const SourcePipeline            pipeline(cfg, provider);

        const LogLines log = process_sources(sources, pipeline, nthreads);
        for (const auto& l : log) std::cerr << l << '\n';

        /* ---- output lines --------------------------------------------- */
        std::ofstream out_file;
        if (cli.count("output")) {
            const std::string out_path = cli["output"].as<std::string>();
            out_file.open(out_path);
            if (!out_file) throw std::runtime_error("Cannot write '" + out_path + "'");
        }
        std::ostream& out = out_file.is_open() ? out_file : std::cout;

        std::size_t total = 0;
        for (const auto& s : sources)
            for (const auto& line : render_lines(s, tmpl)) {
                out << line << '\n';
                ++total;
            }

        /* ---- plot tables ---------------------------------------------- */
        if (!cfg.plot_dir.empty()) {
            const GnuplotRenderer gnuplot;
            for (const auto& s : sources) {
                if (s.measurements().empty()) continue;
                const PlotTable   table = make_plot_table(s, cosmology);
                const std::string path  = (fs::path(cfg.plot_dir) / plot_file_name(s)).string();
                try {
                    write_plot_table(path, table);
                } catch (const std::exception& e) {
                    std::cerr << "[plot] " << s.output_name() << ": " << e.what() << '\n';
                    continue;
                }
                if (cfg.render_plots)
                    gnuplot.render(path, s.identity(), fit_uv_power_law(table));
            }
        }

        std::cout << "[output] " << total << " measurements for "
                  << sources.size() << " sources\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(end_time - start_time).count();

    int minutes = duration / 60;
    int seconds = duration % 60;

    std::cout << "\nTook: ";
    if (minutes > 0) std::cout << minutes << "m ";
    std::cout << seconds << "s\n";

    return 0;
}

#include "stellabund/AbundanceStore.hpp"
#include "stellabund/JsonUtils.hpp"
#include "stellabund/ReportUtils.hpp"
#include "stellabund/SolarAbundances.hpp"
#include "stellabund/SynthesisAbundances.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace stellabund;

// Find and load global_settings.json; an empty object if there is none
nlohmann::json load_global_config() {
    std::vector<std::string> search_paths = {
        // 1. Current working directory
        "global_settings.json",

        // 2. Same directory as executable
        []() {
            std::error_code ec;
            auto exe_path = fs::canonical("/proc/self/exe", ec);
            if (ec) return std::string("./global_settings.json");
            return (exe_path.parent_path() / "global_settings.json").string();
        }(),

        // 3. Build directory (for development)
        "../global_settings.json",

        // 4. Source directory (fallback)
        "../../global_settings.json"
    };

    for (const auto& path : search_paths) {
        if (!fs::exists(path)) continue;
        try {
            nlohmann::json config = load_json(path);
            std::cout << "Loaded config from: " << path << std::endl;
            return config;
        } catch (const std::exception& e) {
            std::cerr << "Error parsing JSON from " << path << ": " << e.what() << std::endl;
        }
    }
    return nlohmann::json::object();
}

static SynthesisAbundances::Options synthesis_options(const nlohmann::json& cfg)
{
    SynthesisAbundances::Options o;
    o.metals   = cfg.value("metals",   0.0);
    o.alphas   = cfg.value("alphas",   0.0);
    o.helium   = cfg.value("helium",   0.0);
    o.rprocess = cfg.value("rprocess", 0.0);
    o.sprocess = cfg.value("sprocess", 0.0);
    if (cfg.contains("exclude"))
        o.exclude = cfg["exclude"].get<std::vector<std::string>>();
    if (cfg.contains("solarReference"))
        o.solar_reference = cfg["solarReference"].get<std::string>();
    return o;
}

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("stellabund", "Stellar abundance reference-frame conversion");
        opts.add_options()
            ("input", "Abundance input JSON", cxxopts::value<std::string>())
            ("solar", "Solar reference (overrides the input file)", cxxopts::value<std::string>())
            ("export", "Systems to print: logeps, h or an element", cxxopts::value<std::vector<std::string>>())
            ("output", "Write exported tables to this JSON file", cxxopts::value<std::string>())
            ("list-solar", "List the known solar references")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);

        auto global_cfg = load_global_config();
        expand_env(global_cfg);

        auto& registry = SolarTableRegistry::instance();
        if (global_cfg.contains("solarTables"))
            for (const auto& path : global_cfg["solarTables"].get<std::vector<std::string>>())
                registry.load_file(path);

        if (cli.count("list-solar")) {
            for (const auto& name : registry.available()) std::cout << name << '\n';
            return 0;
        }
        if (cli.count("help") || !cli.count("input")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        auto input_cfg = load_json(cli["input"].as<std::string>());
        expand_env(input_cfg);

        /* ---------- solar reference: CLI > input file > global --------- */
        std::optional<SolarReference> solar;
        if (cli.count("solar"))
            solar = cli["solar"].as<std::string>();
        else if (input_cfg.contains("solarReference"))
            solar = input_cfg["solarReference"].get<std::string>();
        else if (global_cfg.contains("defaultSolarReference"))
            solar = global_cfg["defaultSolarReference"].get<std::string>();

        AbundanceStore store(abundances_from_json(input_cfg.at("abundances")),
                             input_cfg.value("system", std::string("logeps")),
                             solar);

        std::cout << "Tracking " << store.elements().size() << " elements for "
                  << store.size() << " star(s), solar reference: "
                  << store.solar_reference_name() << "\n\n";

        if (input_cfg.contains("materialize"))
            for (const auto& tag : input_cfg["materialize"].get<std::vector<std::string>>())
                store.materialize(tag);

        std::vector<std::string> exports;
        if (cli.count("export"))
            exports = cli["export"].as<std::vector<std::string>>();
        else if (input_cfg.contains("export"))
            exports = input_cfg["export"].get<std::vector<std::string>>();
        else
            exports = store.materialized_systems();

        nlohmann::json out = nlohmann::json::object();
        for (const auto& tag : exports) {
            const ReferenceSystem sys = ReferenceSystem::parse(tag);
            auto table = store.export_system(sys);
            if (!table) continue;
            write_table(std::cout, sys, *table);
            std::cout << '\n';
            out[sys.tag()] = to_json(*table);
        }

        if (input_cfg.contains("synthesis")) {
            const auto& syn_cfg = input_cfg["synthesis"];
            auto syn = SynthesisAbundances::from_store(
                store, synthesis_options(syn_cfg), syn_cfg.value("star", 0));
            if (syn)
                std::cout << syn->format_block() << '\n';
            else
                std::cerr << "Synthesis abundances need log eps values; "
                             "set a solar reference.\n";
        }

        if (cli.count("output")) {
            const auto path = cli["output"].as<std::string>();
            std::ofstream f(path);
            if (!f) throw std::runtime_error("Cannot write '" + path + "'");
            f << out.dump(2) << '\n';
            std::cout << "Wrote " << path << '\n';
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << duration << " ms\n";

    return 0;
}

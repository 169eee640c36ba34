#pragma once
// CLI glue for uneff: INI config loading and argument parsing.
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include "file_io.hpp"
#include "log.hpp"
#include "string_util.hpp"
#include "uneff.hpp"

struct Config {
    uneff::Settings settings;
    bool verbose = true;
};

struct CliArgs {
    std::string inputFile;
    std::optional<std::string> mappingFile;
    std::optional<std::string> outputFile;
    std::string configFile = "uneff.ini";
    bool quiet = false;
    bool analyze = false;
    bool help = false;
    std::string error;
};

inline bool ParseBool(const std::string& val, bool fallback) {
    std::string v = uneff::ToLower(val);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return fallback;
}

// Unknown keys are ignored; non-positive numbers keep the default.
inline bool LoadIni(const std::string& path, Config& cfg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::string t = uneff::Trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';' || t[0] == '[') continue;
        size_t eq = t.find('=');
        if (eq == std::string::npos) continue;
        std::string key = uneff::Trim(t.substr(0, eq));
        std::string val = uneff::Trim(t.substr(eq + 1));
        if (key == "mapping_file") cfg.settings.mappingFile = val;
        else if (key == "output_prefix") cfg.settings.outputPrefix = val;
        else if (key == "marker" && !val.empty()) cfg.settings.marker = val;
        else if (key == "verbose") cfg.verbose = ParseBool(val, cfg.verbose);
        else if (key == "create_mappings") cfg.settings.createMappings = ParseBool(val, cfg.settings.createMappings);
        else if (key == "sample_limit") {
            int n = std::atoi(val.c_str());//atoi: string->int
            if (n > 0) cfg.settings.sampleLimit = static_cast<size_t>(n);
        } else if (key == "context_width") {
            int n = std::atoi(val.c_str());
            if (n > 0) cfg.settings.contextWidth = static_cast<size_t>(n);
        }
    }
    return true;
}

inline void PrintUsage(std::ostream& os) {
    os << "Usage: uneff <file> [-m|--mapping <mapping_file>] [-o|--output <output_file>]\n"
          "             [-c|--config <ini_file>] [-q|--quiet] [-a|--analyze] [-h|--help]\n"
          "\n"
          "Remove BOM and problematic Unicode characters from files.\n"
          "  -m, --mapping  path to custom character mappings file\n"
          "  -o, --output   path to save the cleaned file (default: adds uneffd_ prefix)\n"
          "  -c, --config   INI file with default settings (default: uneff.ini)\n"
          "  -q, --quiet    suppress status messages\n"
          "  -a, --analyze  report problematic characters without writing anything\n";
}

inline bool ParseArgs(int argc, const char* const* argv, CliArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto need_value = [&](std::string& dst) {
            if (i + 1 >= argc) {
                args.error = "missing value for " + a;
                return false;
            }
            dst = argv[++i];
            return true;
        };
        std::string value;
        if (a == "-h" || a == "--help") {
            args.help = true;
        } else if (a == "-q" || a == "--quiet") {
            args.quiet = true;
        } else if (a == "-a" || a == "--analyze") {
            args.analyze = true;
        } else if (a == "-m" || a == "--mapping") {
            if (!need_value(value)) return false;
            args.mappingFile = value;
        } else if (a == "-o" || a == "--output") {
            if (!need_value(value)) return false;
            args.outputFile = value;
        } else if (a == "-c" || a == "--config") {
            if (!need_value(args.configFile)) return false;
        } else if (!a.empty() && a[0] == '-') {
            args.error = "unknown option: " + a;
            return false;
        } else if (args.inputFile.empty()) {
            args.inputFile = a;
        } else {
            args.error = "unexpected argument: " + a;
            return false;
        }
    }
    if (!args.help && args.inputFile.empty()) {
        args.error = "no input file given";
        return false;
    }
    return true;
}

// Whole CLI run. Returns 1 for usage errors or a missing input file, 0
// otherwise; processing failures are reported but keep exit code 0.
inline int Run(int argc, const char* const* argv) {
    CliArgs args;
    if (!ParseArgs(argc, argv, args)) {
        uneff::LogError(args.error);
        PrintUsage(std::cerr);
        return 1;
    }
    if (args.help) {
        PrintUsage(std::cout);
        return 0;
    }

    Config cfg;
    bool cfg_loaded = LoadIni(args.configFile, cfg);
    bool verbose = cfg.verbose && !args.quiet;
    if (verbose && cfg_loaded) {
        uneff::LogInfo("Loaded settings from: " + args.configFile);
    }

    if (!uneff::FileExists(args.inputFile)) {
        uneff::LogError("File '" + args.inputFile + "' not found.");
        return 1;
    }

    if (args.analyze) {
        uneff::AnalysisResult res = uneff::AnalyzeFile(args.inputFile, args.mappingFile, verbose, cfg.settings);
        if (!res.success && !verbose) uneff::LogError(res.error);
        return 0;
    }

    uneff::CleanResult res = uneff::CleanFile(args.inputFile, args.mappingFile, args.outputFile, verbose, cfg.settings);
    if (!res.success && !verbose) uneff::LogError(res.errorMessage);
    return 0;
}

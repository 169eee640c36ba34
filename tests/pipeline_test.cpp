/*
File-level tests, run in a scratch directory under the system temp dir:
1) mapping source creation, silent fallback, degraded load and malformed rows;
2) cleanFile output naming, content, missing source and write failure;
3) cleanText and analyzeFile;
4) INI settings and command-line parsing used by the uneff executable.
*/
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "file_io.hpp"
#include "log.hpp"
#include "uneff.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace uneff;

static int g_failed = 0;

static bool expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "[FAIL] " << msg << std::endl;
        ++g_failed;
    } else {
        std::cout << "[PASS] " << msg << std::endl;
    }
    return cond;
}

static void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

static std::string read_file(const fs::path& p) {
    std::string s;
    if (!ReadFileBytes(p.string(), s)) return "";
    return s;
}

static void test_mapping_load(const fs::path& dir) {
    fs::path created = dir / "created.csv";
    auto res = MappingStore::Load(created.string(), true);
    expect(res.created && fs::exists(created), "Missing mapping source is created with defaults");
    expect(res.mappings.size() == MappingStore::Defaults().size() && !res.degraded,
           "Created defaults are used for the current run");
    auto again = MappingStore::Load(created.string(), true);
    expect(!again.created && again.mappings.size() == MappingStore::Defaults().size() && again.skipped == 0,
           "Created mapping source loads back to the default set");

    fs::path absent = dir / "absent.csv";
    auto silent = MappingStore::Load(absent.string(), false);
    expect(silent.mappings.size() == 2 && !silent.degraded && !fs::exists(absent),
           "Without createIfMissing the minimal fallback is used and nothing is written");

    fs::path folder = dir / "folder.csv";
    fs::create_directories(folder);
    auto degraded = MappingStore::Load(folder.string(), true);
    expect(degraded.degraded && degraded.mappings.size() == 2 && !degraded.error.empty(),
           "Unreadable mapping source degrades to the fallback set");

    fs::path empty = dir / "empty.csv";
    write_file(empty, "");
    auto emptyRes = MappingStore::Load(empty.string(), true);
    expect(emptyRes.degraded && emptyRes.mappings.size() == 2 && !emptyRes.error.empty(),
           "Empty mapping source degrades to the fallback set");
    fs::path blank = dir / "blank.csv";
    write_file(blank, "\n  \r\n");
    expect(MappingStore::Load(blank.string(), true).degraded, "Mapping source of blank lines degrades too");
    fs::path headerOnly = dir / "header_only.csv";
    write_file(headerOnly, "Character,Unicode,Name,Remove\n");
    auto headerRes = MappingStore::Load(headerOnly.string(), true);
    expect(!headerRes.degraded && headerRes.mappings.empty(), "Header-only mapping source is an explicit empty set");

    fs::path malformed = dir / "malformed.csv";
    write_file(malformed, "\xEF\xBB\xBF" "Character,Unicode,Name,Remove\n"
                          ",\\u200b\n"
                          ",\\u200b,Zero Width Space,True\n");
    auto partial = MappingStore::Load(malformed.string(), true);
    expect(partial.mappings.size() == 1 && partial.skipped == 1 && partial.mappings[0].character == 0x200B,
           "Two-field row is skipped and the next row still loads");
}

static void test_clean_file(const fs::path& dir) {
    fs::path mapping = dir / "map.csv";
    fs::path input = dir / "data.csv";
    write_file(input, "\xEF\xBB\xBF" "id,name\n1,a\xE2\x80\x8B" "b\n");

    auto res = CleanFile(input.string(), mapping.string(), std::nullopt, false);
    fs::path expected_out = dir / "uneffd_data.csv";
    expect(res.success && res.error == ErrorKind::None, "cleanFile succeeds");
    expect(res.outputPath == expected_out.string() && fs::exists(expected_out), "Default output gets uneffd_ prefix beside input");
    expect(read_file(expected_out) == "id,name\n1,ab\n", "Output has BOM and zero width space removed");
    expect(res.bomRemoved && res.bomKind == BomKind::Utf8 && res.changeReport.countFor("Zero Width Space") == 1,
           "Result reports BOM and removed character");
    expect(!fs::exists(fs::path(expected_out.string() + ".tmp")), "No temporary file is left behind");

    fs::path explicit_out = dir / "explicit.txt";
    auto res2 = CleanFile(input.string(), mapping.string(), explicit_out.string(), false);
    expect(res2.success && fs::exists(explicit_out) && res2.outputPath == explicit_out.string(), "Explicit output path is honoured");

    auto missing = CleanFile((dir / "nope.txt").string(), mapping.string(), std::nullopt, false);
    expect(!missing.success && missing.error == ErrorKind::SourceMissing && !fs::exists(dir / "uneffd_nope.txt"),
           "Missing input is reported and produces no output");

    fs::path bad_out = dir / "no_such_dir" / "out.txt";
    auto unwritable = CleanFile(input.string(), mapping.string(), bad_out.string(), false);
    expect(!unwritable.success && unwritable.error == ErrorKind::WriteFailure && !fs::exists(bad_out),
           "Write failure is surfaced as a failed result");

    std::ostringstream info, err;
    SetLogStreams(info, err);
    auto verbose = CleanFile(input.string(), mapping.string(), std::nullopt, true);
    ResetLogStreams();
    std::string log = info.str();
    expect(verbose.success && log.find("[INFO] Processing file: ") != std::string::npos &&
           log.find("UTF-8 BOM character detected at start") != std::string::npos &&
           log.find("Line 2, Position 4:") != std::string::npos &&
           log.find("Cleaned file saved to: ") != std::string::npos,
           "Verbose run logs BOM, locations and output path");
}

static void test_clean_text(const fs::path& dir) {
    fs::path mapping = dir / "map.csv";
    std::string text = "\xEF\xBB\xBF" "hi\xE2\x80\x8B" " there\xE2\x80\x8F";
    expect(CleanText(text, mapping.string()) == "hi there", "cleanText removes leading BOM and mapped characters");

    fs::path folder = dir / "folder.csv";
    expect(CleanText("a\xEF\xBF\xBD" "b\xE2\x80\x8B", folder.string()) == "ab\xE2\x80\x8B",
           "cleanText with degraded mappings only removes fallback characters");
}

static void test_analyze_file(const fs::path& dir) {
    fs::path mapping = dir / "map.csv";
    fs::path input = dir / "many.txt";
    std::string content;
    for (int i = 0; i < 12; ++i) content += "x\xE2\x80\x8B";
    write_file(input, content);

    auto res = AnalyzeFile(input.string(), mapping.string(), false);
    expect(res.success && res.problematicCount == 12 && res.fileSize == content.size(), "Analysis counts every occurrence");
    expect(res.details.size() == 1 && res.details[0].samples.size() == 10 && res.details[0].remaining() == 2,
           "Analysis samples 10 locations and reports the rest");
    expect(read_file(input) == content && !fs::exists(dir / "uneffd_many.txt"), "Analysis leaves the file untouched");
}

static void test_config(const fs::path& dir) {
    fs::path ini = dir / "uneff.ini";
    write_file(ini, "# uneff settings\n"
                    "mapping_file = /tmp/custom.csv\r\n"
                    "output_prefix = clean_\n"
                    "sample_limit = 3\n"
                    "context_width = -4\n"
                    "verbose = false\n"
                    "unknown = 1\n");
    Config cfg;
    expect(LoadIni(ini.string(), cfg), "INI file loads");
    expect(cfg.settings.mappingFile == "/tmp/custom.csv" && cfg.settings.outputPrefix == "clean_" &&
           cfg.settings.sampleLimit == 3 && cfg.settings.contextWidth == 15 && !cfg.verbose,
           "INI values override defaults, invalid numbers are ignored");
    Config none;
    expect(!LoadIni((dir / "missing.ini").string(), none) && none.verbose, "Missing INI keeps defaults");

    const char* argv1[] = {"uneff", "file.txt", "-m", "map.csv", "--output", "o.txt", "-q", "-a"};
    CliArgs a1;
    expect(ParseArgs(8, argv1, a1) && a1.inputFile == "file.txt" && a1.mappingFile == std::string("map.csv") &&
           a1.outputFile == std::string("o.txt") && a1.quiet && a1.analyze,
           "Command line flags are parsed");
    const char* argv2[] = {"uneff", "-m"};
    CliArgs a2;
    expect(!ParseArgs(2, argv2, a2) && !a2.error.empty(), "Missing option value is a usage error");
    const char* argv3[] = {"uneff", "--bogus", "x"};
    CliArgs a3;
    expect(!ParseArgs(3, argv3, a3), "Unknown option is a usage error");

    expect(DeriveOutputPath("dir/report.csv", "uneffd_") == (fs::path("dir") / "uneffd_report.csv").string(),
           "Output name keeps directory and extension");
}

static void test_run(const fs::path& dir) {
    std::string map = (dir / "map.csv").string();
    std::string ini = (dir / "none.ini").string();
    std::string input = (dir / "run.txt").string();
    write_file(input, "x\xE2\x80\x8By");

    std::ostringstream info, err;
    SetLogStreams(info, err);

    const char* missing[] = {"uneff", "nope.txt", "-c", ini.c_str(), "-m", map.c_str(), "-q"};
    int missingCode = Run(7, missing);

    const char* usage[] = {"uneff"};
    int usageCode = Run(1, usage);

    const char* ok[] = {"uneff", input.c_str(), "-c", ini.c_str(), "-m", map.c_str(), "-q"};
    int okCode = Run(7, ok);

    std::string badOut = (dir / "no_such_dir" / "out.txt").string();
    const char* unwritable[] = {"uneff", input.c_str(), "-c", ini.c_str(), "-m", map.c_str(), "-o", badOut.c_str(), "-q"};
    size_t errBefore = err.str().size();
    int unwritableCode = Run(9, unwritable);
    bool reported = err.str().size() > errBefore;

    const char* analyze[] = {"uneff", input.c_str(), "-c", ini.c_str(), "-m", map.c_str(), "-q", "-a"};
    int analyzeCode = Run(8, analyze);

    ResetLogStreams();

    expect(missingCode == 1 && err.str().find("not found") != std::string::npos, "Missing input exits with 1");
    expect(usageCode == 1, "Usage error exits with 1");
    expect(okCode == 0 && read_file(dir / "uneffd_run.txt") == "xy", "Successful clean exits with 0");
    expect(unwritableCode == 0 && reported, "Reported write failure still exits with 0");
    expect(analyzeCode == 0, "Analysis exits with 0");
}

int main() {
    fs::path dir = fs::temp_directory_path() / "uneff_pipeline_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);

    test_mapping_load(dir);
    test_clean_file(dir);
    test_clean_text(dir);
    test_analyze_file(dir);
    test_config(dir);
    test_run(dir);

    fs::remove_all(dir, ec);
    if (g_failed > 0) {
        std::cerr << "\n" << g_failed << " test(s) FAILED." << std::endl;
        return 1;
    }
    std::cout << "\nAll tests PASSED." << std::endl;
    return 0;
}

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bom.hpp"
#include "cleaner.hpp"
#include "decode.hpp"
#include "mapping_store.hpp"

// Engine entry points: raw bytes -> BOM strip -> decode -> clean -> report.

namespace uneff {

struct Settings {
    std::string mappingFile = "uneff_mappings.csv";
    std::string outputPrefix = "uneffd_";
    std::size_t sampleLimit = 10;
    std::size_t contextWidth = 15;
    std::string marker = "\xE2\x86\xAF";
    bool createMappings = true;
};

enum class ErrorKind { None, SourceMissing, ReadFailure, WriteFailure, Internal };

struct CleanResult {
    std::string cleanedText;  // UTF-8
    bool bomRemoved = false;
    BomKind bomKind = BomKind::None;
    ChangeReport changeReport;
    bool success = false;

    ErrorKind error = ErrorKind::None;
    std::string errorMessage;
    std::string outputPath;
    bool mappingDegraded = false;
    DecodeStep decodeStep = DecodeStep::Utf8Strict;
};

struct AnalysisResult {
    bool success = false;
    std::string error;
    std::string path;
    std::uintmax_t fileSize = 0;
    BomKind bomKind = BomKind::None;
    DecodeStep decodeStep = DecodeStep::Utf8Strict;
    std::size_t totalLength = 0;  // scalar values
    std::size_t lineCount = 0;
    std::size_t problematicCount = 0;
    std::vector<CharacterLocations> details;
};

// In-memory pipeline over raw bytes. No file I/O.
CleanResult CleanBuffer(const std::string& bytes, const MappingSet& mappings,
                        bool locate = false, const Settings& settings = Settings(), bool verbose = false);

// Reads path, cleans it and writes the result to outputPath (default:
// "<prefix><name>" beside the input). Never throws; failures come back in
// the result.
CleanResult CleanFile(const std::string& path,
                      const std::optional<std::string>& mappingPath = std::nullopt,
                      const std::optional<std::string>& outputPath = std::nullopt,
                      bool verbose = true, const Settings& settings = Settings());

// UTF-8 text in, cleaned UTF-8 text out. Returns text unchanged on any
// internal error.
std::string CleanText(const std::string& text,
                      const std::optional<std::string>& mappingPath = std::nullopt,
                      bool verbose = false, const Settings& settings = Settings());

// Report-only: nothing is modified or written.
AnalysisResult AnalyzeBuffer(const std::string& bytes, const MappingSet& mappings,
                             const Settings& settings = Settings());

AnalysisResult AnalyzeFile(const std::string& path,
                           const std::optional<std::string>& mappingPath = std::nullopt,
                           bool verbose = true, const Settings& settings = Settings());

} // namespace uneff

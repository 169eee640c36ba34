#pragma once
#include <cstdint>
#include <string>

#include "bom.hpp"
#include "cleaner.hpp"
#include "decode.hpp"

namespace uneff {

struct AnalysisResult;

struct ReportOptions {
    std::string marker = "\xE2\x86\xAF";  // U+21AF
    std::size_t sampleLimit = 10;
};

// "U+200B"
std::string CodePointLabel(char32_t ch);

// Context slice with every occurrence of ch replaced by the marker glyph.
std::string MarkContext(const std::u32string& context, char32_t ch, const std::string& marker);

// Counts, sampled locations (when the report carries them) and the BOM /
// output summary. outputPath may be empty when nothing was written.
std::string FormatReport(const ChangeReport& report, BomKind bomKind,
                         const std::string& outputPath = "", const ReportOptions& opts = ReportOptions());

std::string FormatAnalysis(const AnalysisResult& analysis, const ReportOptions& opts = ReportOptions());

} // namespace uneff

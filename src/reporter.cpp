#include "reporter.hpp"
#include <cstdio>
#include <sstream>

#include "uneff.hpp"

namespace uneff {

std::string CodePointLabel(char32_t ch) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(ch));
    return buf;
}

std::string MarkContext(const std::u32string& context, char32_t ch, const std::string& marker) {
    std::string out;
    std::u32string run;
    for (char32_t c : context) {
        if (c == ch) {
            out += EncodeUtf8(run);
            out += marker;
            run.clear();
        } else {
            run.push_back(c);
        }
    }
    out += EncodeUtf8(run);
    return out;
}

static void write_locations(std::ostringstream& out, const CharacterLocations& loc, const ReportOptions& opts) {
    for (const auto& l : loc.samples) {
        out << "    Line " << l.line << ", Position " << l.column << ": ..."
            << MarkContext(l.context, loc.character, opts.marker) << "...\n";
    }
    if (loc.remaining() > 0) {
        out << "    ... and " << loc.remaining() << " more instances\n";
    }
}

std::string FormatReport(const ChangeReport& report, BomKind bomKind,
                         const std::string& outputPath, const ReportOptions& opts) {
    std::ostringstream out;
    if (!report.charCounts.empty()) {
        out << "\nProblematic characters found and removed:\n";
        for (const auto& p : report.charCounts) {
            out << "  - " << p.first << ": " << p.second << " instance(s)\n";
        }
        if (!report.locations.empty()) {
            out << "\nCharacter locations (showing up to " << opts.sampleLimit << " instances per character):\n";
            for (const auto& loc : report.locations) {
                out << "\n  Character: '" << loc.name << "' [Unicode: " << CodePointLabel(loc.character) << "]\n";
                write_locations(out, loc, opts);
            }
        }
    } else {
        out << "\nNo problematic characters found.\n";
    }

    out << "\n";
    if (bomKind != BomKind::None) {
        out << BomKindName(bomKind) << " removed from start of file.\n";
    } else if (report.bomInText) {
        out << "BOM character removed from start of text.\n";
    } else {
        out << "No BOM found at start.\n";
    }
    if (!outputPath.empty()) {
        if (report.changesFound() || bomKind != BomKind::None) out << "Cleaned file saved to: " << outputPath << "\n";
        else out << "Clean copy saved to: " << outputPath << "\n";
    }
    return out.str();
}

std::string FormatAnalysis(const AnalysisResult& analysis, const ReportOptions& opts) {
    std::ostringstream out;
    out << "\nFile: " << analysis.path << "\n";
    out << "Size: " << analysis.fileSize << " bytes\n";
    out << "Encoding: " << DecodeStepName(analysis.decodeStep) << "\n";
    out << "Lines: " << analysis.lineCount << "\n";
    if (analysis.bomKind != BomKind::None) {
        out << "BOM: " << BomKindName(analysis.bomKind) << " detected at start\n";
    }

    if (analysis.problematicCount == 0) {
        out << "\nNo problematic characters found.\n";
        return out.str();
    }
    out << "\nFound " << analysis.problematicCount << " problematic characters:\n";
    for (const auto& loc : analysis.details) {
        out << "\n  Character: '" << loc.name << "' [Unicode: " << CodePointLabel(loc.character) << "]\n";
        out << "  Count: " << loc.total << " instances\n";
        out << "  Locations (showing up to " << opts.sampleLimit << " instances):\n";
        size_t idx = 0;
        for (const auto& l : loc.samples) {
            out << "    #" << ++idx << ": Line " << l.line << ", Column " << l.column
                << " (Pos: " << l.offset << ")\n";
            out << "        Context: ..." << MarkContext(l.context, loc.character, opts.marker) << "...\n";
        }
        if (loc.remaining() > 0) {
            out << "    ... and " << loc.remaining() << " more instances\n";
        }
    }
    return out.str();
}

} // namespace uneff

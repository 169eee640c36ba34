#include "uneff.hpp"
#include <algorithm>
#include <exception>

#include "file_io.hpp"
#include "log.hpp"
#include "reporter.hpp"

namespace uneff {

static ReportOptions report_options(const Settings& settings) {
    ReportOptions opts;
    opts.marker = settings.marker;
    opts.sampleLimit = settings.sampleLimit;
    return opts;
}

static void log_bom(BomKind kind) {
    if (kind == BomKind::None) {
        LogInfo("No BOM character detected at start.");
    } else {
        LogInfo(BomKindName(kind) + " character detected at start. Removing...");
    }
}

CleanResult CleanBuffer(const std::string& bytes, const MappingSet& mappings,
                        bool locate, const Settings& settings, bool verbose) {
    CleanResult res;
    BomStripResult stripped = StripBom(bytes);
    res.bomKind = stripped.kind;
    if (verbose) log_bom(stripped.kind);

    DecodeResult decoded = Decode(stripped.remaining, verbose);
    res.decodeStep = decoded.step;

    CleanOptions opts;
    opts.locate = locate;
    opts.sampleLimit = settings.sampleLimit;
    opts.contextWidth = settings.contextWidth;
    CleanOutput cleaned = Clean(decoded.text, mappings, opts);

    res.cleanedText = EncodeUtf8(cleaned.text);
    res.changeReport = std::move(cleaned.report);
    res.bomRemoved = res.bomKind != BomKind::None || res.changeReport.bomInText;
    res.success = true;
    return res;
}

CleanResult CleanFile(const std::string& path,
                      const std::optional<std::string>& mappingPath,
                      const std::optional<std::string>& outputPath,
                      bool verbose, const Settings& settings) {
    if (verbose) LogInfo("Processing file: " + path);

    CleanResult res;
    try {
        if (!FileExists(path)) {
            res.error = ErrorKind::SourceMissing;
            res.errorMessage = "File '" + path + "' not found.";
            if (verbose) LogError(res.errorMessage);
            return res;
        }

        MappingLoadResult loaded = MappingStore::Load(mappingPath.value_or(settings.mappingFile),
                                                      settings.createMappings, verbose);

        std::string bytes;
        if (!ReadFileBytes(path, bytes)) {
            res.error = ErrorKind::ReadFailure;
            res.errorMessage = "cannot read input file: " + path;
            if (verbose) LogError(res.errorMessage);
            return res;
        }

        res = CleanBuffer(bytes, loaded.mappings, verbose, settings, verbose);
        res.mappingDegraded = loaded.degraded;
        res.outputPath = outputPath.value_or(DeriveOutputPath(path, settings.outputPrefix));

        std::string err;
        if (!WriteFileAtomic(res.outputPath, res.cleanedText, err)) {
            res.success = false;
            res.error = ErrorKind::WriteFailure;
            res.errorMessage = err;
            if (verbose) LogError("Error processing file: " + err);
            return res;
        }

        if (verbose) {
            LogRaw(FormatReport(res.changeReport, res.bomKind, res.outputPath, report_options(settings)));
        }
        return res;
    } catch (const std::exception& e) {
        res.success = false;
        res.error = ErrorKind::Internal;
        res.errorMessage = e.what();
        if (verbose) LogError(std::string("Error processing file: ") + e.what());
        return res;
    }
}

std::string CleanText(const std::string& text,
                      const std::optional<std::string>& mappingPath,
                      bool verbose, const Settings& settings) {
    try {
        MappingLoadResult loaded = MappingStore::Load(mappingPath.value_or(settings.mappingFile),
                                                      settings.createMappings, verbose);
        DecodeResult decoded = Decode(text, verbose);
        CleanOutput cleaned = Clean(decoded.text, loaded.mappings);
        if (verbose) {
            if (cleaned.report.bomInText) LogInfo("BOM character detected at start. Removing...");
            if (!cleaned.report.charCounts.empty()) {
                LogInfo("Problematic characters found and removed:");
                for (const auto& p : cleaned.report.charCounts) {
                    LogInfo("  - " + p.first + ": " + std::to_string(p.second) + " instance(s)");
                }
            }
        }
        return EncodeUtf8(cleaned.text);
    } catch (const std::exception& e) {
        if (verbose) LogError(std::string("Error cleaning text: ") + e.what());
        return text;
    }
}

AnalysisResult AnalyzeBuffer(const std::string& bytes, const MappingSet& mappings, const Settings& settings) {
    AnalysisResult res;
    res.fileSize = bytes.size();
    BomStripResult stripped = StripBom(bytes);
    res.bomKind = stripped.kind;

    DecodeResult decoded = Decode(stripped.remaining);
    res.decodeStep = decoded.step;
    res.totalLength = decoded.text.size();
    res.lineCount = static_cast<std::size_t>(std::count(decoded.text.begin(), decoded.text.end(), U'\n')) + 1;

    res.details = Locate(decoded.text, mappings, settings.sampleLimit, settings.contextWidth);
    for (const auto& d : res.details) res.problematicCount += d.total;
    res.success = true;
    return res;
}

AnalysisResult AnalyzeFile(const std::string& path,
                           const std::optional<std::string>& mappingPath,
                           bool verbose, const Settings& settings) {
    if (verbose) LogInfo("Analyzing file: " + path);

    AnalysisResult res;
    try {
        if (!FileExists(path)) {
            res.error = "File '" + path + "' not found.";
            if (verbose) LogError(res.error);
            return res;
        }
        MappingLoadResult loaded = MappingStore::Load(mappingPath.value_or(settings.mappingFile),
                                                      settings.createMappings, verbose);
        std::string bytes;
        if (!ReadFileBytes(path, bytes)) {
            res.error = "cannot read input file: " + path;
            if (verbose) LogError(res.error);
            return res;
        }

        res = AnalyzeBuffer(bytes, loaded.mappings, settings);
        res.path = path;
        if (verbose) LogRaw(FormatAnalysis(res, report_options(settings)));
        return res;
    } catch (const std::exception& e) {
        res.success = false;
        res.error = e.what();
        if (verbose) LogError(std::string("Error analyzing file: ") + e.what());
        return res;
    }
}

} // namespace uneff

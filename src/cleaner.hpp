#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "mapping_store.hpp"

namespace uneff {

constexpr char32_t kBomChar = 0xFEFF;

struct Location {
    std::size_t line = 0;    // 1-based
    std::size_t column = 0;  // 1-based, in scalar values
    std::size_t offset = 0;  // 0-based scalar offset in the whole text
    std::u32string context;  // surrounding slice of the line, character still in place
};

struct CharacterLocations {
    char32_t character = 0;
    std::string name;
    std::size_t total = 0;           // occurrences in the pre-removal text
    std::vector<Location> samples;   // first sampleLimit occurrences

    // Occurrences not sampled, i.e. total minus the sample cap.
    std::size_t remaining() const { return total > samples.size() ? total - samples.size() : 0; }
};

struct ChangeReport {
    // name -> count, in mapping order
    std::vector<std::pair<std::string, std::size_t>> charCounts;
    // filled only when locations were requested
    std::vector<CharacterLocations> locations;
    // leading U+FEFF removed from the decoded text
    bool bomInText = false;

    bool changesFound() const { return bomInText || !charCounts.empty(); }
    std::size_t countFor(const std::string& name) const;
    std::size_t totalRemoved() const;
};

struct CleanOptions {
    bool locate = false;
    std::size_t sampleLimit = 10;
    std::size_t contextWidth = 15;
};

struct CleanOutput {
    std::u32string text;
    ChangeReport report;
};

// Replaces every ch in text with replacement (deletes when empty).
// Returns the number of occurrences.
std::size_t ReplaceAll(std::u32string& text, char32_t ch, const std::u32string& replacement);

// Scans text line by line ('\n' separated) for each mapped character present.
// Duplicate characters in the set are located once, under the first entry.
std::vector<CharacterLocations> Locate(const std::u32string& text, const MappingSet& mappings,
                                       std::size_t sampleLimit, std::size_t contextWidth);

// Pure: no I/O, no logging. An entry whose replacement contains a mapped
// character deletes instead of substituting.
CleanOutput Clean(const std::u32string& text, const MappingSet& mappings, const CleanOptions& opts = CleanOptions());

} // namespace uneff

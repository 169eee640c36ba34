#pragma once
#include <cstddef>
#include <string>

namespace uneff {

enum class BomKind { None, Utf8, Utf16LE, Utf16BE, Utf32LE, Utf32BE };

struct BomStripResult {
    std::string remaining;
    BomKind kind = BomKind::None;
    std::size_t consumed = 0;
};

// Longest matching byte-order mark at the start of bytes, or None.
// UTF-32 marks are tested before UTF-16 since FF FE is a prefix of FF FE 00 00.
BomKind DetectBom(const std::string& bytes);

std::size_t BomLength(BomKind kind);

// Removes exactly one leading BOM (if any). Never fails.
BomStripResult StripBom(const std::string& bytes);

// "UTF-8 BOM", "UTF-16 LE BOM", ... ; empty for None
std::string BomKindName(BomKind kind);

} // namespace uneff

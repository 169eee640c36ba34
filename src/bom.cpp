#include "bom.hpp"

namespace uneff {

static bool starts_with(const std::string& s, const unsigned char* prefix, std::size_t n) {
    if (s.size() < n) return false;
    for (std::size_t i = 0; i < n; ++i) {
        if (static_cast<unsigned char>(s[i]) != prefix[i]) return false;
    }
    return true;
}

BomKind DetectBom(const std::string& bytes) {
    static const unsigned char kUtf32LE[] = {0xFF, 0xFE, 0x00, 0x00};
    static const unsigned char kUtf32BE[] = {0x00, 0x00, 0xFE, 0xFF};
    static const unsigned char kUtf8[] = {0xEF, 0xBB, 0xBF};
    static const unsigned char kUtf16LE[] = {0xFF, 0xFE};
    static const unsigned char kUtf16BE[] = {0xFE, 0xFF};

    if (starts_with(bytes, kUtf32LE, 4)) return BomKind::Utf32LE;
    if (starts_with(bytes, kUtf32BE, 4)) return BomKind::Utf32BE;
    if (starts_with(bytes, kUtf8, 3)) return BomKind::Utf8;
    if (starts_with(bytes, kUtf16LE, 2)) return BomKind::Utf16LE;
    if (starts_with(bytes, kUtf16BE, 2)) return BomKind::Utf16BE;
    return BomKind::None;
}

std::size_t BomLength(BomKind kind) {
    switch (kind) {
    case BomKind::Utf8: return 3;
    case BomKind::Utf16LE:
    case BomKind::Utf16BE: return 2;
    case BomKind::Utf32LE:
    case BomKind::Utf32BE: return 4;
    case BomKind::None: break;
    }
    return 0;
}

BomStripResult StripBom(const std::string& bytes) {
    BomStripResult res;
    res.kind = DetectBom(bytes);
    res.consumed = BomLength(res.kind);
    res.remaining = bytes.substr(res.consumed);
    return res;
}

std::string BomKindName(BomKind kind) {
    switch (kind) {
    case BomKind::Utf8: return "UTF-8 BOM";
    case BomKind::Utf16LE: return "UTF-16 LE BOM";
    case BomKind::Utf16BE: return "UTF-16 BE BOM";
    case BomKind::Utf32LE: return "UTF-32 LE BOM";
    case BomKind::Utf32BE: return "UTF-32 BE BOM";
    case BomKind::None: break;
    }
    return "";
}

} // namespace uneff

#include "decode.hpp"
#include <iterator>

#include "utf8.h"

#include "log.hpp"

namespace uneff {

std::optional<std::u32string> TryDecodeUtf8Strict(const std::string& bytes) {
    if (!utf8::is_valid(bytes.begin(), bytes.end())) return std::nullopt;
    std::u32string u32;
    u32.reserve(bytes.size());
    utf8::utf8to32(bytes.begin(), bytes.end(), std::back_inserter(u32));
    return u32;
}

std::optional<std::u32string> TryDecodeUtf8Replace(const std::string& bytes) {
    std::string fixed;
    fixed.reserve(bytes.size());
    try {
        utf8::replace_invalid(bytes.begin(), bytes.end(), std::back_inserter(fixed));
    } catch (const utf8::exception&) {
        return std::nullopt;
    }
    return TryDecodeUtf8Strict(fixed);
}

std::u32string DecodeLatin1(const std::string& bytes) {
    std::u32string u32;
    u32.reserve(bytes.size());
    for (char c : bytes) u32.push_back(static_cast<unsigned char>(c));
    return u32;
}

DecodeResult Decode(const std::string& bytes, bool verbose) {
    DecodeResult res;
    if (auto strict = TryDecodeUtf8Strict(bytes)) {
        res.text = std::move(*strict);
        res.step = DecodeStep::Utf8Strict;
        return res;
    }
    if (auto replaced = TryDecodeUtf8Replace(bytes)) {
        if (verbose) LogWarning("Used replacement characters during decoding. File might have encoding issues.");
        res.text = std::move(*replaced);
        res.step = DecodeStep::Utf8Replace;
        return res;
    }
    if (verbose) LogWarning("Forced Latin-1 decoding. Character representation may be incorrect.");
    res.text = DecodeLatin1(bytes);
    res.step = DecodeStep::Latin1;
    return res;
}

std::string DecodeStepName(DecodeStep step) {
    switch (step) {
    case DecodeStep::Utf8Strict: return "utf-8";
    case DecodeStep::Utf8Replace: return "utf-8 (with replacement characters)";
    case DecodeStep::Latin1: return "latin-1 (fallback)";
    }
    return "unknown";
}

std::string EncodeUtf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    utf8::utf32to8(text.begin(), text.end(), std::back_inserter(out));
    return out;
}

std::string EncodeUtf8(char32_t ch) {
    return EncodeUtf8(std::u32string(1, ch));
}

} // namespace uneff

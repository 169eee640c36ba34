#pragma once
#include <optional>
#include <string>

// Byte buffer -> Unicode scalar values.
// Fallback chain: strict UTF-8, UTF-8 with U+FFFD replacement, Latin-1.

namespace uneff {

enum class DecodeStep { Utf8Strict, Utf8Replace, Latin1 };

struct DecodeResult {
    std::u32string text;
    DecodeStep step = DecodeStep::Utf8Strict;
};

// Each attempt returns nullopt instead of throwing when it cannot decode.
std::optional<std::u32string> TryDecodeUtf8Strict(const std::string& bytes);
std::optional<std::u32string> TryDecodeUtf8Replace(const std::string& bytes);
std::u32string DecodeLatin1(const std::string& bytes);

// Runs the chain and reports which step produced the text.
// With verbose, every fallback taken is logged as a warning.
DecodeResult Decode(const std::string& bytes, bool verbose = false);

std::string DecodeStepName(DecodeStep step);

std::string EncodeUtf8(const std::u32string& text);
std::string EncodeUtf8(char32_t ch);

} // namespace uneff

#pragma once
#include <cstdint>
#include <string>

namespace uneff {

// Regular file only.
bool FileExists(const std::string& path);
// Anything at path, directories included.
bool PathExists(const std::string& path);

// Reads the whole file as raw bytes. false if it cannot be opened or read.
bool ReadFileBytes(const std::string& path, std::string& bytes);

// Writes to "<path>.tmp" then renames over path, so a failed write never
// leaves a truncated target. err receives a message on failure.
bool WriteFileAtomic(const std::string& path, const std::string& data, std::string& err);

// "<dir>/<prefix><filename>" next to the input file.
std::string DeriveOutputPath(const std::string& inputPath, const std::string& prefix);

std::uintmax_t FileSize(const std::string& path);

} // namespace uneff

#pragma once
#include <ostream>
#include <string>

// Console logging with bracketed severity prefixes.
// [INFO] and [WARNING] go to the info stream (stdout by default),
// [ERROR] goes to the error stream (stderr by default).

namespace uneff {

void SetLogStreams(std::ostream& info, std::ostream& error);
void ResetLogStreams();

void LogInfo(const std::string& msg);
void LogWarning(const std::string& msg);
void LogError(const std::string& msg);

// Writes msg without a prefix, used for multi-line reports.
void LogRaw(const std::string& msg);

} // namespace uneff

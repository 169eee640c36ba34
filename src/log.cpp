#include "log.hpp"
#include <iostream>

namespace uneff {

static std::ostream* g_info = &std::cout;
static std::ostream* g_error = &std::cerr;

void SetLogStreams(std::ostream& info, std::ostream& error) {
    g_info = &info;
    g_error = &error;
}

void ResetLogStreams() {
    g_info = &std::cout;
    g_error = &std::cerr;
}

void LogInfo(const std::string& msg) {
    *g_info << "[INFO] " << msg << std::endl;
}

void LogWarning(const std::string& msg) {
    *g_info << "[WARNING] " << msg << std::endl;
}

void LogError(const std::string& msg) {
    *g_error << "[ERROR] " << msg << std::endl;
}

void LogRaw(const std::string& msg) {
    *g_info << msg;
    g_info->flush();
}

} // namespace uneff

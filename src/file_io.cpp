#include "file_io.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace uneff {

bool FileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(fs::u8path(path), ec);
}

bool PathExists(const std::string& path) {
    std::error_code ec;
    return fs::exists(fs::u8path(path), ec);
}

bool ReadFileBytes(const std::string& path, std::string& bytes) {
    if (!FileExists(path)) {
        return false;
    }
    std::ifstream ifs(fs::u8path(path), std::ios::binary);
    if (!ifs.is_open()) {
        return false;
    }
    bytes.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    return !ifs.bad();
}

bool WriteFileAtomic(const std::string& path, const std::string& data, std::string& err) {
    const fs::path target = fs::u8path(path);
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            err = "cannot open output file: " + path;
            return false;
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            err = "failed writing output file: " + path;
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        err = "cannot move output into place: " + path + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

std::string DeriveOutputPath(const std::string& inputPath, const std::string& prefix) {
    const fs::path in = fs::u8path(inputPath);
    fs::path out = in.parent_path() / fs::u8path(prefix + in.filename().u8string());
    return out.u8string();
}

std::uintmax_t FileSize(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(fs::u8path(path), ec);
    return ec ? 0 : size;
}

} // namespace uneff

#include "fileio.hpp"
#include "lib.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace fileio {

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        THROW("cannot open '%s' for reading", path.c_str());
    }
    in.seekg(0, std::ios::end);
    std::streamoff n = in.tellg();
    if (n < 0) {
        THROW("cannot determine size of '%s'", path.c_str());
    }
    std::string out(static_cast<std::size_t>(n), '\0');
    in.seekg(0, std::ios::beg);
    if (n > 0 && !in.read(&out[0], n)) {
        THROW("failed reading '%s'", path.c_str());
    }
    return out;
}

void write_text(const std::string& path, const std::string& text) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            THROW("cannot open '%s' for writing", tmp.c_str());
        }
        out << text;
        out.flush();
        if (!out) {
            THROW("failed writing '%s'", tmp.c_str());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        THROW("cannot replace '%s'", path.c_str());
    }
}

void backup_file(const std::string& src, const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        THROW("cannot create backup directory '%s': %s", dir.c_str(), ec.message().c_str());
    }
    fs::path dst = fs::path(dir) / fs::path(src).filename();
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        THROW("cannot back up '%s' to '%s': %s", src.c_str(), dst.string().c_str(), ec.message().c_str());
    }
}

std::vector<std::string> list_files(const std::string& dir, const std::string& ext) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        THROW("'%s' is not a directory", dir.c_str());
    }
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ext) continue;
        names.push_back(entry.path().filename().string());
    }
    if (ec) {
        THROW("cannot list '%s': %s", dir.c_str(), ec.message().c_str());
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace fileio

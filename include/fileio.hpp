#pragma once
#include <string>
#include <vector>

namespace fileio {

// whole file as bytes; throws when it cannot be opened or read
std::string read_text(const std::string& path);

// writes to "<path>.tmp" then renames over path; throws on failure
void write_text(const std::string& path, const std::string& text);

// copies src into dir (created when missing), keeping the file name
void backup_file(const std::string& src, const std::string& dir);

// regular files of dir with the given extension, sorted by name
std::vector<std::string> list_files(const std::string& dir, const std::string& ext);

} // namespace fileio

#include "brace_scanner.hpp"
#include "lib.hpp"

namespace merge {

ScanResult scan_balanced(const std::string& text, std::size_t open_brace) {
    if (open_brace >= text.size() || text[open_brace] != '{') {
        THROW("scan_balanced: offset %zu is not an opening brace", open_brace);
    }

    int depth = 0;
    for (std::size_t i = open_brace; i < text.size(); i++) {
        if (text[i] == '{') {
            depth++;
        } else if (text[i] == '}') {
            depth--;
            if (depth == 0) {
                return { true, { open_brace + 1, i } };
            }
        }
    }
    return { false, {} };
}

std::size_t find_open_brace(const std::string& text, std::size_t pos) {
    if (pos >= text.size()) return std::string::npos;
    return text.find('{', pos);
}

} // namespace merge

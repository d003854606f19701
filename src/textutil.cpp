#include "textutil.hpp"
#include <algorithm>
#include <cctype>

namespace merge {

namespace {
    bool is_blank_char(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    char lower(char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
}

std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (char c : s) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

std::size_t ifind(const std::string& hay, const std::string& needle, std::size_t pos) {
    if (needle.empty()) return pos <= hay.size() ? pos : std::string::npos;
    if (pos >= hay.size() || needle.size() > hay.size()) return std::string::npos;
    auto it = std::search(hay.begin() + pos, hay.end(), needle.begin(), needle.end(),
                          [](char a, char b) { return lower(a) == lower(b); });
    if (it == hay.end()) return std::string::npos;
    return static_cast<std::size_t>(it - hay.begin());
}

std::string ltrim(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && is_blank_char(s[i])) i++;
    return s.substr(i);
}

std::string rtrim(const std::string& s) {
    std::size_t n = s.size();
    while (n > 0 && is_blank_char(s[n - 1])) n--;
    return s.substr(0, n);
}

std::string trim(const std::string& s) {
    return ltrim(rtrim(s));
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), is_blank_char);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::size_t line_start(const std::string& text, std::size_t pos) {
    if (pos == 0 || text.empty()) return 0;
    std::size_t nl = text.rfind('\n', pos - 1);
    return nl == std::string::npos ? 0 : nl + 1;
}

std::string indent_at(const std::string& text, std::size_t pos) {
    std::size_t i = pos;
    while (i < text.size() && (text[i] == ' ' || text[i] == '\t')) i++;
    return text.substr(pos, i - pos);
}

std::string line_break(const std::string& text) {
    return text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
}

std::string collapse_blank_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        // count a run of line breaks (\n or \r\n)
        std::size_t j = i;
        int breaks = 0;
        bool crlf = false;
        while (j < text.size()) {
            if (text[j] == '\n') {
                breaks++;
                j++;
            } else if (text[j] == '\r' && j + 1 < text.size() && text[j + 1] == '\n') {
                crlf = true;
                breaks++;
                j += 2;
            } else {
                break;
            }
        }
        if (breaks == 0) {
            out += text[i++];
        } else if (breaks >= 3) {
            out += crlf ? "\r\n\r\n" : "\n\n";
            i = j;
        } else {
            out.append(text, i, j - i);
            i = j;
        }
    }
    return out;
}

} // namespace merge

#pragma once
#include <string>
#include <vector>
#include <cstddef>

// Small string helpers shared by the strippers, the locator and the differ.
namespace merge {

// escapes ECMAScript regex metacharacters
std::string regex_escape(const std::string& s);

// case-insensitive (ASCII) find; npos when absent
std::size_t ifind(const std::string& hay, const std::string& needle, std::size_t pos = 0);

std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);
std::string trim(const std::string& s);
bool is_blank(const std::string& s);

// splits on '\n'; a trailing '\r' is dropped from each line
std::vector<std::string> split_lines(const std::string& text);

// offset of the first character of the line containing pos
std::size_t line_start(const std::string& text, std::size_t pos);

// leading blanks (spaces and tabs) of the line starting at pos
std::string indent_at(const std::string& text, std::size_t pos);

// "\r\n" when the text uses CRLF line endings, "\n" otherwise
std::string line_break(const std::string& text);

// three or more consecutive line breaks become exactly two
std::string collapse_blank_lines(const std::string& text);

} // namespace merge

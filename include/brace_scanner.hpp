#pragma once
#include <string>
#include <cstddef>
#include "merge.hpp"

struct ScanResult {
    bool ok { false };
    Span span {}; // body between the braces; the closing '}' sits at span.end
};

namespace merge {

/**
 * @brief Finds the '}' matching the '{' at @p open_brace.
 *
 * Plain depth counting over raw text: braces inside string literals and
 * comments count like any other brace.
 *
 * @param text the source text
 * @param open_brace offset of a '{' (throws if it is anything else)
 * @return ok=false when the text ends before depth returns to zero
 */
ScanResult scan_balanced(const std::string& text, std::size_t open_brace);

// first '{' at or after pos, std::string::npos if none
std::size_t find_open_brace(const std::string& text, std::size_t pos);

} // namespace merge

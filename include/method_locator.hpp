#pragma once
#include <string>
#include "merge.hpp"

struct LocateResult {
    bool ok { false };
    MethodBody method {};
    MergeError error { MergeError::None };
    std::string reason;
};

namespace merge {

// "protected override void <method>(<[ns.]builder> <param>)" with the param captured
std::string signature_pattern(const MergeConfig& config);

/**
 * @brief Locates the single OnModelCreating-style method in @p text.
 *
 * 1. matches the signature pattern (more than one match is AmbiguousMethod)
 * 2. takes the first '{' after the match
 * 3. brace-matches the body with scan_balanced()
 *
 * The callers treat any failure as fatal for the whole merge.
 */
LocateResult locate_method(const std::string& text, const MergeConfig& config);

} // namespace merge

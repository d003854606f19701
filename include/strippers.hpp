#pragma once
#include <string>
#include <vector>
#include "merge.hpp"

struct EntityScan {
    bool found { false };     // anchor present at or after the cursor
    bool malformed { false }; // no lambda '{' before end of text, or its braces never close
    bool block { false };     // false with found: chained call or initializer, not removable
    EntityBlock entity {};
};

namespace merge {

/**
 * @brief Removes previously inserted marker regions from a method body.
 *
 * - every [begin .. end] region (inclusive of both markers) is dropped
 * - every line whose text starts with markers.prefix, or that holds a lone
 *   begin/end marker, is dropped with its line break
 *
 * Running it twice gives the same result as running it once.
 */
std::string strip_markers(const std::string& body, const MarkerPair& markers);

// Recognizes the next "<anchor>...(x => { ... });" statement at or after from.
// The '{' must open the lambda argument itself and the statement must end with "});".
EntityScan next_entity_block(const std::string& body, const std::string& anchor, std::size_t from);

/**
 * @brief Removes every entity configuration statement introduced by @p anchor.
 *
 * The anchor is matched case-insensitively. A block is the anchor, the lambda
 * body found by brace matching and the trailing ")" and ";". An anchor with
 * no lambda body before end of text leaves the rest of the text untouched.
 */
std::string strip_entity_blocks(const std::string& body, const std::string& anchor);

// Removes every "<partial>(<param>);" statement.
std::string strip_terminal_call(const std::string& body, const std::string& partial_method,
                                const std::string& param);

} // namespace merge

#include "strippers.hpp"
#include "brace_scanner.hpp"
#include "textutil.hpp"
#include "lib.hpp"
#include <algorithm>
#include <regex>

namespace merge {

namespace {

    bool is_hblank(char c) { return c == ' ' || c == '\t'; }

    std::size_t skip_ws(const std::string& s, std::size_t i) {
        while (i < s.size() && (is_hblank(s[i]) || s[i] == '\n' || s[i] == '\r')) i++;
        return i;
    }

    // end of the trailing blanks plus one line break after pos, npos if other text follows
    std::size_t rest_of_line(const std::string& s, std::size_t pos) {
        std::size_t k = pos;
        while (k < s.size() && is_hblank(s[k])) k++;
        if (k == s.size()) return k;
        if (s[k] == '\n') return k + 1;
        if (s[k] == '\r' && k + 1 < s.size() && s[k + 1] == '\n') return k + 2;
        return std::string::npos;
    }

    // true when the last non-blank text before pos is "=>"
    bool follows_arrow(const std::string& s, std::size_t pos) {
        std::size_t k = pos;
        while (k > 0 && (is_hblank(s[k - 1]) || s[k - 1] == '\n' || s[k - 1] == '\r')) k--;
        return k >= 2 && s[k - 2] == '=' && s[k - 1] == '>';
    }

    bool starts_with(const std::string& s, const std::string& prefix) {
        return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
    }

    bool is_marker_line(const std::string& line, const MarkerPair& markers) {
        std::string t = trim(line);
        return starts_with(t, markers.prefix) || starts_with(t, markers.begin) || starts_with(t, markers.end);
    }
}

std::string strip_markers(const std::string& body, const MarkerPair& markers) {
    std::string out = body;

    // paired regions
    std::size_t from = 0;
    while (!markers.begin.empty() && !markers.end.empty()) {
        std::size_t b = out.find(markers.begin, from);
        if (b == std::string::npos) break;
        std::size_t e = out.find(markers.end, b + markers.begin.size());
        if (e == std::string::npos) {
            LOG_WARN("marker '%s' at offset %zu has no closing '%s'", markers.begin.c_str(), b, markers.end.c_str());
            break;
        }
        std::size_t cut_from = b;
        std::size_t cut_to = e + markers.end.size();
        std::size_t ls = line_start(out, b);
        std::size_t eol = rest_of_line(out, cut_to);
        if (is_blank(out.substr(ls, b - ls)) && eol != std::string::npos) {
            cut_from = ls;
            cut_to = eol;
        }
        out.erase(cut_from, cut_to - cut_from);
        from = cut_from;
    }

    // stray single-line markers
    std::string kept;
    kept.reserve(out.size());
    std::size_t pos = 0;
    while (pos < out.size()) {
        std::size_t nl = out.find('\n', pos);
        std::size_t next = (nl == std::string::npos) ? out.size() : nl + 1;
        std::string line = out.substr(pos, (nl == std::string::npos ? out.size() : nl) - pos);
        if (!is_marker_line(line, markers)) {
            kept.append(out, pos, next - pos);
        }
        pos = next;
    }
    return kept;
}

EntityScan next_entity_block(const std::string& body, const std::string& anchor, std::size_t from) {
    EntityScan scan;
    std::size_t a = ifind(body, anchor, from);
    if (a == std::string::npos) return scan;

    scan.found = true;
    scan.entity.anchor = { a, a + anchor.size() };

    // walk to the lambda '{' without leaving the enclosing call
    int paren = 0;
    std::size_t i = scan.entity.anchor.end;
    for (; i < body.size(); i++) {
        char c = body[i];
        if (c == '(') {
            paren++;
        } else if (c == ')') {
            if (--paren < 0) return scan; // anchor was an argument of an outer call
        } else if (c == ';' && paren == 0) {
            return scan; // statement ended without a lambda body
        } else if (c == '{') {
            // only "Entity<T>(x => {" opens a block; object initializers and chained calls do not
            if (paren != 1 || !follows_arrow(body, i)) return scan;
            break;
        }
    }
    if (i >= body.size()) {
        scan.malformed = true;
        return scan;
    }

    ScanResult braces = scan_balanced(body, i);
    if (!braces.ok) {
        scan.malformed = true;
        return scan;
    }

    // the statement must end right after the lambda: "});"
    std::size_t k = skip_ws(body, braces.span.end + 1);
    if (k >= body.size() || body[k] != ')') return scan;
    k = skip_ws(body, k + 1);
    if (k >= body.size() || body[k] != ';') return scan;
    std::size_t j = k + 1;

    scan.block = true;
    scan.entity.lambda_open = i;
    scan.entity.lambda_close = braces.span.end;
    scan.entity.statement_end = j;
    return scan;
}

std::string strip_entity_blocks(const std::string& body, const std::string& anchor) {
    std::string out;
    out.reserve(body.size());
    std::size_t cursor = 0;
    int removed = 0;

    while (cursor <= body.size()) {
        EntityScan scan = next_entity_block(body, anchor, cursor);
        if (!scan.found) {
            out.append(body, cursor, std::string::npos);
            break;
        }
        if (scan.malformed) {
            LOG_WARN("'%s' at offset %zu has no complete lambda body, left untouched",
                     anchor.c_str(), scan.entity.anchor.start);
            out.append(body, cursor, std::string::npos);
            break;
        }
        if (!scan.block) {
            out.append(body, cursor, scan.entity.anchor.end - cursor);
            cursor = scan.entity.anchor.end;
            continue;
        }

        // drop the whole line when the statement stands alone on it
        std::size_t a = scan.entity.anchor.start;
        std::size_t ls = std::max(line_start(body, a), cursor);
        std::size_t cut_from = a;
        std::size_t resume = scan.entity.statement_end;
        std::size_t eol = rest_of_line(body, resume);
        if (is_blank(body.substr(ls, a - ls)) && eol != std::string::npos) {
            cut_from = ls;
            resume = eol;
        }
        out.append(body, cursor, cut_from - cursor);
        cursor = resume;
        removed++;
    }

    LOG_DEBUG("removed %d '%s' block(s)", removed, anchor.c_str());
    return collapse_blank_lines(out);
}

std::string strip_terminal_call(const std::string& body, const std::string& partial_method,
                                const std::string& param) {
    // group 1 is the character before the call (or nothing at the start); it is put back
    const std::regex call(R"((^|[^\w. \t])[ \t]*)" + regex_escape(partial_method) + R"(\s*\(\s*)" +
                          regex_escape(param) + R"(\s*\)\s*;)");
    return std::regex_replace(body, call, "$1");
}

} // namespace merge

#include "carryover.hpp"
#include "method_locator.hpp"
#include "strippers.hpp"
#include "textutil.hpp"
#include "lib.hpp"
#include <cctype>
#include <regex>
#include <utility>

namespace merge {

namespace {

    // drops whole blank lines at the front, keeps the first line's indentation
    std::string drop_leading_blank_lines(const std::string& s) {
        std::size_t i = 0;
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) i++;
        if (i == s.size()) return "";
        return s.substr(line_start(s, i));
    }

    // indentation of the first non-blank line, "    " for an empty body
    std::string body_indent(const std::string& body) {
        for (const auto& line : split_lines(body)) {
            if (!is_blank(line)) return indent_at(line, 0);
        }
        return "    ";
    }
}

ExtractResult extract_carry_over(const std::string& old_text, const MergeConfig& config) {
    ExtractResult res;
    LocateResult loc = locate_method(old_text, config);
    if (!loc.ok) {
        res.error = loc.error;
        res.reason = "old file: " + loc.reason;
        return res;
    }

    const std::string& param = loc.method.param_name;
    std::string body = strip_markers(loc.method.content, config.markers());
    body = strip_entity_blocks(body, config.entity_anchor(param));
    body = strip_terminal_call(body, config.partial_method, param);
    body = collapse_blank_lines(body);

    res.ok = true;
    res.param_name = param;
    res.preserved = rtrim(drop_leading_blank_lines(body));
    LOG_DEBUG("carry-over from old file: %zu byte(s)", res.preserved.size());
    return res;
}

std::string wrap_in_banner(const std::string& preserved, const std::string& indent,
                           const MergeConfig& config, const std::string& nl) {
    return indent + config.banner_begin + nl +
           preserved + nl +
           indent + config.banner_end + nl;
}

InsertResult insert_carry_over(const std::string& new_text, const std::string& preserved,
                               const MergeConfig& config) {
    InsertResult res;
    LocateResult loc = locate_method(new_text, config);
    if (!loc.ok) {
        res.error = loc.error;
        res.reason = "new file: " + loc.reason;
        return res;
    }

    res.ok = true;
    if (is_blank(preserved)) {
        res.text = new_text;
        return res;
    }

    const std::string nl = line_break(new_text);
    const MethodBody& m = loc.method;
    const std::string& body = m.content;
    std::string new_body;

    // the call must start at an identifier boundary: "MyOnModelCreatingPartial(...)" is not it
    const std::regex anchor(R"((^|[^\w.]))" + regex_escape(config.partial_method) + R"(\s*\(\s*)" +
                            regex_escape(m.param_name) + R"(\s*\)\s*;)");
    std::smatch hit;
    if (std::regex_search(body, hit, anchor)) {
        std::size_t p = static_cast<std::size_t>(hit.position(0) + hit.length(1));
        std::size_t ls = line_start(body, p);
        std::string lead = body.substr(ls, p - ls);
        if (is_blank(lead)) {
            res.plan.insert_at = ls;
            new_body = body.substr(0, ls) + wrap_in_banner(preserved, lead, config, nl) + nl + body.substr(ls);
        } else {
            // other code shares the line: break before the call
            std::string indent = indent_at(body, ls);
            res.plan.insert_at = p;
            new_body = body.substr(0, p) + nl + wrap_in_banner(preserved, indent, config, nl) + nl + indent + body.substr(p);
        }
    } else {
        LOG_WARN("no '%s(%s);' call in the new '%s', appending carried-over code at the end of the body",
                 config.partial_method.c_str(), m.param_name.c_str(), config.method_name.c_str());
        std::string head = rtrim(body);
        std::string tail = body.substr(head.size());
        if (tail.find('\n') == std::string::npos) tail = nl + tail;
        res.plan.insert_at = head.size();
        new_body = head + (head.empty() ? nl : nl + nl) +
                   rtrim(wrap_in_banner(preserved, body_indent(body), config, nl)) + tail;
    }
    res.plan.preserved = preserved;

    res.text = new_text.substr(0, m.body.start) + new_body + new_text.substr(m.body.end);
    return res;
}

const char* to_string(MergeStage stage) {
    switch (stage) {
        case MergeStage::ExtractOld:      return "extract-old";
        case MergeStage::LocateNewMethod: return "locate-new-method";
        case MergeStage::ComposeInsert:   return "compose-insert";
        case MergeStage::Validate:        return "validate";
        case MergeStage::Done:            return "done";
    }
    return "unknown";
}

} // namespace merge

ContextMerger::ContextMerger(MergeConfig config)
    : config_(std::move(config)) {}

MergeResult ContextMerger::merge(const std::string& old_text, const std::string& new_text) const {
    MergeResult res;

    res.stage = MergeStage::ExtractOld;
    ExtractResult ex = merge::extract_carry_over(old_text, config_);
    if (!ex.ok) {
        res.error = ex.error;
        res.reason = ex.reason;
        return res;
    }

    res.stage = MergeStage::LocateNewMethod;
    LocateResult loc = merge::locate_method(new_text, config_);
    if (!loc.ok) {
        res.error = loc.error;
        res.reason = "new file: " + loc.reason;
        return res;
    }
    if (!ex.preserved.empty() && loc.method.param_name != ex.param_name) {
        LOG_WARN("builder parameter changed from '%s' to '%s'; carried-over code still uses the old name",
                 ex.param_name.c_str(), loc.method.param_name.c_str());
    }

    res.stage = MergeStage::ComposeInsert;
    InsertResult ins = merge::insert_carry_over(new_text, ex.preserved, config_);
    if (!ins.ok) {
        res.error = ins.error;
        res.reason = ins.reason;
        return res;
    }

    // the spliced file must still yield exactly one balanced method
    res.stage = MergeStage::Validate;
    LocateResult check = merge::locate_method(ins.text, config_);
    if (!check.ok) {
        res.error = check.error;
        res.reason = "merged output: " + check.reason;
        return res;
    }

    res.stage = MergeStage::Done;
    res.ok = true;
    res.text = std::move(ins.text);
    res.preserved = std::move(ex.preserved);
    LOG_INFO("merged %zu byte(s) of custom configuration into %s", res.preserved.size(),
             config_.method_name.c_str());
    return res;
}

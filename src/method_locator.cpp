#include "method_locator.hpp"
#include "brace_scanner.hpp"
#include "textutil.hpp"
#include "lib.hpp"
#include <regex>

namespace merge {

std::string signature_pattern(const MergeConfig& config) {
    return R"(protected\s+override\s+void\s+)" + regex_escape(config.method_name) +
           R"(\s*\(\s*(?:[\w.]+\.)?)" + regex_escape(config.builder_type) +
           R"(\s+(\w+)\s*\))";
}

LocateResult locate_method(const std::string& text, const MergeConfig& config) {
    LocateResult res;
    const std::regex sig(signature_pattern(config));

    auto first = std::sregex_iterator(text.begin(), text.end(), sig);
    auto last = std::sregex_iterator();
    if (first == last) {
        res.error = MergeError::NoMethodFound;
        res.reason = "no '" + config.method_name + "(" + config.builder_type + " ...)' signature found";
        return res;
    }
    const std::smatch m = *first;
    auto count = std::distance(first, last);
    if (count > 1) {
        res.error = MergeError::AmbiguousMethod;
        res.reason = strfmt("%ld '%s' signatures found, expected exactly one",
                            static_cast<long>(count), config.method_name.c_str());
        return res;
    }

    std::size_t sig_start = static_cast<std::size_t>(m.position(0));
    std::size_t sig_end = sig_start + static_cast<std::size_t>(m.length(0));

    std::size_t open = find_open_brace(text, sig_end);
    if (open == std::string::npos) {
        res.error = MergeError::NoMethodFound;
        res.reason = "found '" + config.method_name + "' signature, but no method body '{' follows";
        return res;
    }

    ScanResult scan = scan_balanced(text, open);
    if (!scan.ok) {
        res.error = MergeError::UnbalancedBraces;
        res.reason = strfmt("unbalanced braces in '%s' body opened at offset %zu",
                            config.method_name.c_str(), open);
        return res;
    }

    res.ok = true;
    res.method.signature = { sig_start, sig_end };
    res.method.open_brace = open;
    res.method.body = scan.span;
    res.method.content = text.substr(scan.span.start, scan.span.size());
    res.method.param_name = m[1].str();
    LOG_DEBUG("located %s(%s) body [%zu, %zu)", config.method_name.c_str(),
              res.method.param_name.c_str(), scan.span.start, scan.span.end);
    return res;
}

} // namespace merge

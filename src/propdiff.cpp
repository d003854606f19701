#include "propdiff.hpp"
#include "textutil.hpp"
#include <algorithm>
#include <regex>
#include <set>

void PropMap::put(const std::string& name, const std::string& type) {
    auto it = types.find(name);
    if (it == types.end()) {
        order.push_back(name);
        types.emplace(name, type);
    } else {
        it->second = type; // last declaration wins
    }
}

namespace merge {

bool parse_property(const std::string& line, PropSig& out) {
    // type: everything between the modifiers and the name, generics/arrays/nullable included
    static const std::regex prop(R"(^\s*public\s+(?:virtual\s+)?(\S.*?)\s+(\w+)\s*\{\s*get;\s*set;\s*\})");
    std::smatch m;
    if (!std::regex_search(line, m, prop)) return false;
    out.type = trim(m[1].str());
    out.name = m[2].str();
    return true;
}

PropMap extract_properties(const std::vector<std::string>& lines) {
    PropMap map;
    PropSig sig;
    for (const auto& line : lines) {
        if (parse_property(line, sig)) map.put(sig.name, sig.type);
    }
    return map;
}

DiffResult diff_properties(const std::vector<std::string>& old_lines, const std::vector<std::string>& new_lines) {
    DiffResult diff;
    PropMap old_props = extract_properties(old_lines);
    PropMap new_props = extract_properties(new_lines);

    // ADD & CHANGE
    for (const auto& name : new_props.order) {
        const std::string& nt = new_props.type_of(name);
        if (!old_props.has(name)) {
            diff.added.push_back({ name, nt });
        } else if (old_props.type_of(name) != nt) {
            diff.changed.push_back({ name, old_props.type_of(name), nt });
        }
    }
    // REMOVE
    for (const auto& name : old_props.order) {
        if (!new_props.has(name)) {
            diff.removed.push_back({ name, old_props.type_of(name) });
        }
    }
    return diff;
}

DiffResult diff_properties(const std::string& old_text, const std::string& new_text) {
    return diff_properties(split_lines(old_text), split_lines(new_text));
}

ChangeReport aggregate(const std::map<std::string, DiffResult>& per_entity) {
    ChangeReport report;
    report.entities = per_entity;
    for (const auto& [name, diff] : per_entity) {
        report.total_added   += diff.added.size();
        report.total_removed += diff.removed.size();
        report.total_changed += diff.changed.size();
    }
    return report;
}

ModelSets compare_models(const std::vector<std::string>& old_names, const std::vector<std::string>& new_names) {
    ModelSets sets;
    std::set<std::string> olds(old_names.begin(), old_names.end());
    std::set<std::string> news(new_names.begin(), new_names.end());
    for (const auto& n : news) {
        if (olds.count(n)) sets.common.push_back(n);
        else sets.added.push_back(n);
    }
    for (const auto& o : olds) {
        if (!news.count(o)) sets.removed.push_back(o);
    }
    return sets;
}

} // namespace merge

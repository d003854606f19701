#include "report.hpp"
#include <sstream>

namespace merge {

namespace {

    jval sig_to_json(const PropSig& sig, jdaloc& a) {
        jval o(rapidjson::kObjectType);
        jhlp::set(o, RPT_NAME, sig.name, a);
        jhlp::set(o, RPT_TYPE, sig.type, a);
        return o;
    }

    void entity_lines(std::ostringstream& out, const std::string& entity, const DiffResult& diff) {
        out << "  " << entity;
        if (diff.empty()) {
            out << ": no property changes\n";
            return;
        }
        out << ":\n";
        for (const auto& p : diff.added)   out << "    + " << p.name << " : " << p.type << "\n";
        for (const auto& p : diff.removed) out << "    - " << p.name << " : " << p.type << "\n";
        for (const auto& c : diff.changed) out << "    ~ " << c.name << " : " << c.from_type << " -> " << c.to_type << "\n";
    }

    void name_list(std::ostringstream& out, const char* title, const std::vector<std::string>& names) {
        if (names.empty()) return;
        out << title << " (" << names.size() << "):\n";
        for (const auto& n : names) out << "  " << n << "\n";
    }
}

jval diff_to_json(const DiffResult& diff, jdaloc& a) {
    jval o(rapidjson::kObjectType);
    jval added(rapidjson::kArrayType);
    for (const auto& p : diff.added) added.PushBack(sig_to_json(p, a), a);
    jval removed(rapidjson::kArrayType);
    for (const auto& p : diff.removed) removed.PushBack(sig_to_json(p, a), a);
    jval changed(rapidjson::kArrayType);
    for (const auto& c : diff.changed) {
        jval co(rapidjson::kObjectType);
        jhlp::set(co, RPT_NAME, c.name, a);
        jhlp::set(co, RPT_FROM, c.from_type, a);
        jhlp::set(co, RPT_TO, c.to_type, a);
        changed.PushBack(co, a);
    }
    o.AddMember(RPT_ADDED, added, a);
    o.AddMember(RPT_REMOVED, removed, a);
    o.AddMember(RPT_CHANGED, changed, a);
    return o;
}

void report_to_json(const ChangeReport& report, jdoc& doc) {
    doc.SetObject();
    jdaloc& a = doc.GetAllocator();

    doc.AddMember(RPT_ADDED_MODELS, jhlp::str_array(report.added_models, a), a);
    doc.AddMember(RPT_REMOVED_MODELS, jhlp::str_array(report.removed_models, a), a);

    jval entities(rapidjson::kObjectType);
    for (const auto& [name, diff] : report.entities) {
        entities.AddMember(jhlp::str_val(name, a), diff_to_json(diff, a), a);
    }
    doc.AddMember(RPT_ENTITIES, entities, a);

    jval totals(rapidjson::kObjectType);
    jhlp::set(totals, "propertiesAdded", static_cast<uint64_t>(report.total_added), a);
    jhlp::set(totals, "propertiesRemoved", static_cast<uint64_t>(report.total_removed), a);
    jhlp::set(totals, "propertiesChanged", static_cast<uint64_t>(report.total_changed), a);
    doc.AddMember(RPT_TOTALS, totals, a);
}

std::string render_json(const ChangeReport& report, bool pretty) {
    jdoc doc;
    report_to_json(report, doc);
    return jhlp::stringify(doc, pretty);
}

std::string render_text(const ChangeReport& report) {
    std::ostringstream out;
    out << "Model changes\n";
    name_list(out, "New models", report.added_models);
    name_list(out, "Removed models", report.removed_models);
    if (!report.entities.empty()) {
        out << "Property changes:\n";
        for (const auto& [name, diff] : report.entities) entity_lines(out, name, diff);
    }
    out << "Totals: " << report.total_added << " added, "
        << report.total_removed << " removed, "
        << report.total_changed << " changed\n";
    return out.str();
}

std::string render_text(const std::string& entity, const DiffResult& diff) {
    std::ostringstream out;
    entity_lines(out, entity, diff);
    return out.str();
}

} // namespace merge

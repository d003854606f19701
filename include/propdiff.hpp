#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

struct PropSig {
    std::string name;
    std::string type;
};

struct PropChange {
    std::string name;
    std::string from_type;
    std::string to_type;
};

// a property name shows up in at most one bucket
struct DiffResult {
    std::vector<PropSig> added;
    std::vector<PropSig> removed;
    std::vector<PropChange> changed;

    bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

// name -> type, in first-declaration order; a redeclared name keeps its slot and takes the last type
struct PropMap {
    std::vector<std::string> order;
    std::unordered_map<std::string, std::string> types;

    void put(const std::string& name, const std::string& type);
    bool has(const std::string& name) const { return types.find(name) != types.end(); }
    const std::string& type_of(const std::string& name) const { return types.at(name); }
};

struct ModelSets {
    std::vector<std::string> added;   // only in the new scaffold
    std::vector<std::string> removed; // only in the old models
    std::vector<std::string> common;
};

struct ChangeReport {
    std::vector<std::string> added_models;
    std::vector<std::string> removed_models;
    std::map<std::string, DiffResult> entities; // sorted by entity name
    std::size_t total_added = 0;
    std::size_t total_removed = 0;
    std::size_t total_changed = 0;
};

namespace merge {

// parses "public [virtual] <Type> <Name> { get; set; }"; false when the line is not one
bool parse_property(const std::string& line, PropSig& out);

PropMap extract_properties(const std::vector<std::string>& lines);

/**
 * @brief Classifies auto-properties of two versions of one model file.
 *
 * added/changed follow the new file's order, removed the old file's.
 * Types compare as plain strings: "string" and "string?" differ.
 */
DiffResult diff_properties(const std::vector<std::string>& old_lines, const std::vector<std::string>& new_lines);
DiffResult diff_properties(const std::string& old_text, const std::string& new_text);

// sums the per-entity counts; entities with an empty diff are kept
ChangeReport aggregate(const std::map<std::string, DiffResult>& per_entity);

// name-set comparison of model file stems; all lists sorted
ModelSets compare_models(const std::vector<std::string>& old_names, const std::vector<std::string>& new_names);

} // namespace merge

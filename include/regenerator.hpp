#pragma once
#include <string>
#include <vector>
#include "merge.hpp"
#include "carryover.hpp"
#include "propdiff.hpp"

struct RegenOptions {
    std::string models_dir;    // current model + context files (overwritten)
    std::string scaffold_dir;  // fresh output of the scaffolding tool (read only)
    std::string context_file;  // file name; empty: config.context_file, then auto-detect
    std::string backup_dir;    // empty: no backup
    std::string report_txt;    // empty: not written
    std::string report_json;   // empty: not written
    bool prune = false;        // delete models that are gone from the scaffold
    bool dry_run = false;      // compute everything, write nothing
    MergeConfig config;
};

struct RegenOutcome {
    std::string context_file;
    ModelSets models;
    MergeResult merge;
    ChangeReport report;
    std::vector<std::string> written; // paths written or removed, in order
};

/**
 * Regenerator
 *  - compares model file names of both directories
 *  - merges the context file (abort before any write when the merge fails)
 *  - diffs the properties of every added and common model
 *  - then, unless dry_run: backup, write context, copy models, prune, reports
 */
class Regenerator {
public:
    explicit Regenerator(RegenOptions options);

    // throws std::runtime_error on any fatal condition; nothing is written then
    RegenOutcome run();

    // the single file of dir declaring the configured OnModelCreating; throws otherwise
    static std::string detect_context(const std::string& dir, const MergeConfig& config);

private:
    std::string resolve_context_() const;
    std::vector<std::string> model_stems_(const std::string& dir, const std::string& context) const;
    std::string path_(const std::string& dir, const std::string& file) const;

    RegenOptions opt_;
};

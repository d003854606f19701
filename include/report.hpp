#pragma once
#include <string>
#include "propdiff.hpp"
#include "jsonhlp.hpp"

/****************** REPORT KEYS */
#define RPT_ADDED_MODELS   "addedModels"
#define RPT_REMOVED_MODELS "removedModels"
#define RPT_ENTITIES       "entities"
#define RPT_ADDED          "added"
#define RPT_REMOVED        "removed"
#define RPT_CHANGED        "changed"
#define RPT_TOTALS         "totals"
#define RPT_NAME           "name"
#define RPT_TYPE           "type"
#define RPT_FROM           "from"
#define RPT_TO             "to"

namespace merge {

// one entity's diff as a JSON object {added[], removed[], changed[]}
jval diff_to_json(const DiffResult& diff, jdaloc& allocator);

// the whole report as a JSON document
void report_to_json(const ChangeReport& report, jdoc& doc);

std::string render_json(const ChangeReport& report, bool pretty = true);

/**
 * @brief Human-readable summary.
 *
 *   + Name : Type          added property
 *   - Name : Type          removed property
 *   ~ Name : From -> To    changed type
 */
std::string render_text(const ChangeReport& report);

std::string render_text(const std::string& entity, const DiffResult& diff);

} // namespace merge

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "jsonhlp.hpp"

/****************** CONFIG KEYS */
#define CFG_METHOD_NAME     "methodName"
#define CFG_BUILDER_TYPE    "builderType"
#define CFG_PARTIAL_METHOD  "partialMethod"
#define CFG_ENTITY_CALL     "entityCall"
#define CFG_MARKER_BEGIN    "markerBegin"
#define CFG_MARKER_END      "markerEnd"
#define CFG_MARKER_PREFIX   "markerPrefix"
#define CFG_BANNER_BEGIN    "bannerBegin"
#define CFG_BANNER_END      "bannerEnd"
#define CFG_CONTEXT_FILE    "contextFile"
#define CFG_MODEL_EXT       "modelExtension"

/****************** DEFAULT LITERALS (scaffolder contract) */
#define DEF_METHOD_NAME     "OnModelCreating"
#define DEF_BUILDER_TYPE    "ModelBuilder"
#define DEF_PARTIAL_METHOD  "OnModelCreatingPartial"
#define DEF_ENTITY_CALL     "Entity<"
#define DEF_MARKER_BEGIN    "// <ctxmerge:region>"
#define DEF_MARKER_END      "// </ctxmerge:region>"
#define DEF_MARKER_PREFIX   "// ctxmerge:"
#define DEF_BANNER_BEGIN    "// ctxmerge: preserved custom configuration"
#define DEF_BANNER_END      "// ctxmerge: end preserved custom configuration"
#define DEF_MODEL_EXT       ".cs"


enum class MergeError { None, NoMethodFound, UnbalancedBraces, AmbiguousMethod };


// half-open [start, end) offsets into the text it was computed from
struct Span {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const { return end - start; }
    bool empty() const { return start == end; }
};

struct MethodBody {
    Span signature;             // the matched "protected override void ...(...)" text
    std::size_t open_brace = 0; // offset of the body '{'
    Span body;                  // between the braces, braces excluded
    std::string content;        // == text.substr(body.start, body.size())
    std::string param_name;     // builder parameter, e.g. "modelBuilder"
};

struct MarkerPair {
    std::string begin;
    std::string end;
    std::string prefix; // any single-line comment starting with this is a stray marker
};

struct EntityBlock {
    Span anchor;
    std::size_t lambda_open = 0;
    std::size_t lambda_close = 0;
    std::size_t statement_end = 0; // one past the consumed ')' / ';'
};

struct MergePlan {
    std::size_t insert_at = 0; // offset inside the new body
    std::string preserved;
};

/**
 * MergeConfig
 *  - literal contracts shared with the scaffolding tool
 *  - every value has a default; a JSON config only overrides what it names
 */
class MergeConfig {
public:
    std::string method_name    = DEF_METHOD_NAME;
    std::string builder_type   = DEF_BUILDER_TYPE;
    std::string partial_method = DEF_PARTIAL_METHOD;
    std::string entity_call    = DEF_ENTITY_CALL;
    std::string marker_begin   = DEF_MARKER_BEGIN;
    std::string marker_end     = DEF_MARKER_END;
    std::string marker_prefix  = DEF_MARKER_PREFIX;
    std::string banner_begin   = DEF_BANNER_BEGIN;
    std::string banner_end     = DEF_BANNER_END;
    std::string context_file;  // empty: resolved by the workflow
    std::string model_ext      = DEF_MODEL_EXT;

    MarkerPair markers() const { return { marker_begin, marker_end, marker_prefix }; }

    // "<param>.Entity<"
    std::string entity_anchor(const std::string& param) const;
    // "OnModelCreatingPartial(<param>);"
    std::string partial_call(const std::string& param) const;

    static bool from_json(jdoc& doc, MergeConfig& config);
    static MergeConfig load(const std::string& path);
};

namespace merge {

const char* to_string(MergeError err);

} // namespace merge

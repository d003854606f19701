#pragma once
#include <string>
#include "merge.hpp"

enum class MergeStage { ExtractOld, LocateNewMethod, ComposeInsert, Validate, Done };

struct ExtractResult {
    bool ok { false };
    std::string preserved;  // custom statements, may be empty
    std::string param_name; // builder parameter of the old method
    MergeError error { MergeError::None };
    std::string reason;
};

struct InsertResult {
    bool ok { false };
    std::string text;       // whole file with the new body spliced in
    MergePlan plan {};
    MergeError error { MergeError::None };
    std::string reason;
};

namespace merge {

/**
 * @brief Pulls the hand-written statements out of the old OnModelCreating body.
 *
 * locate -> strip_markers -> strip_entity_blocks -> strip_terminal_call -> trim.
 * What is left is everything the scaffolder would not regenerate.
 */
ExtractResult extract_carry_over(const std::string& old_text, const MergeConfig& config);

// preserved text between the banner lines, ready to splice
std::string wrap_in_banner(const std::string& preserved, const std::string& indent,
                           const MergeConfig& config, const std::string& nl);

/**
 * @brief Splices @p preserved into the OnModelCreating body of @p new_text.
 *
 * The wrapped text lands right before "OnModelCreatingPartial(<param>);",
 * which stays in place; without that call it is appended to the body.
 * Blank @p preserved returns @p new_text unchanged.
 */
InsertResult insert_carry_over(const std::string& new_text, const std::string& preserved,
                               const MergeConfig& config);

const char* to_string(MergeStage stage);

} // namespace merge

struct MergeResult {
    bool ok { false };
    std::string text;      // merged file, empty unless ok
    std::string preserved; // what was carried over
    MergeStage stage { MergeStage::ExtractOld }; // last stage reached
    MergeError error { MergeError::None };
    std::string reason;
};

/**
 * ContextMerger
 *  - ExtractOld -> LocateNewMethod -> ComposeInsert -> Validate -> Done
 *  - any failing stage stops the run; the result then carries no text and
 *    nothing may be written
 */
class ContextMerger {
public:
    explicit ContextMerger(MergeConfig config = MergeConfig());

    MergeResult merge(const std::string& old_text, const std::string& new_text) const;

    const MergeConfig& config() const { return config_; }

private:
    MergeConfig config_;
};

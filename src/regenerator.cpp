#include "regenerator.hpp"
#include "fileio.hpp"
#include "method_locator.hpp"
#include "report.hpp"
#include "lib.hpp"
#include <filesystem>
#include <map>
#include <regex>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

#define ER_MERGE   "cannot safely merge '%s' (%s, stage %s): %s. Aborting to avoid data loss; no changes were applied."
#define ER_NO_CTX  "no file in '%s' declares %s(%s ...); pass the context file explicitly"
#define ER_MANY    "%zu files in '%s' declare %s(%s ...); pass the context file explicitly"

Regenerator::Regenerator(RegenOptions options)
    : opt_(std::move(options)) {}

std::string Regenerator::detect_context(const std::string& dir, const MergeConfig& config) {
    const std::regex sig(merge::signature_pattern(config));
    std::vector<std::string> hits;
    for (const auto& file : fileio::list_files(dir, config.model_ext)) {
        std::string text = fileio::read_text((fs::path(dir) / file).string());
        if (std::regex_search(text, sig)) hits.push_back(file);
    }
    if (hits.empty()) {
        THROW(ER_NO_CTX, dir.c_str(), config.method_name.c_str(), config.builder_type.c_str());
    }
    if (hits.size() > 1) {
        THROW(ER_MANY, hits.size(), dir.c_str(), config.method_name.c_str(), config.builder_type.c_str());
    }
    return hits.front();
}

std::string Regenerator::resolve_context_() const {
    if (!opt_.context_file.empty()) return opt_.context_file;
    if (!opt_.config.context_file.empty()) return opt_.config.context_file;
    return detect_context(opt_.scaffold_dir, opt_.config);
}

std::string Regenerator::path_(const std::string& dir, const std::string& file) const {
    return (fs::path(dir) / file).string();
}

std::vector<std::string> Regenerator::model_stems_(const std::string& dir, const std::string& context) const {
    std::vector<std::string> stems;
    for (const auto& file : fileio::list_files(dir, opt_.config.model_ext)) {
        if (file == context) continue;
        stems.push_back(fs::path(file).stem().string());
    }
    return stems;
}

RegenOutcome Regenerator::run() {
    RegenOutcome out;
    const std::string ctx = resolve_context_();
    const std::string& ext = opt_.config.model_ext;
    out.context_file = ctx;
    LOG_INFO("context file: %s", ctx.c_str());

    // 1. every read happens before the first write
    std::string old_ctx = fileio::read_text(path_(opt_.models_dir, ctx));
    std::string new_ctx = fileio::read_text(path_(opt_.scaffold_dir, ctx));
    out.models = merge::compare_models(model_stems_(opt_.models_dir, ctx),
                                       model_stems_(opt_.scaffold_dir, ctx));
    LOG_INFO("models: %zu new, %zu removed, %zu common", out.models.added.size(),
             out.models.removed.size(), out.models.common.size());

    // 2. merge the context; a failure here leaves the disk untouched
    ContextMerger merger(opt_.config);
    out.merge = merger.merge(old_ctx, new_ctx);
    if (!out.merge.ok) {
        THROW(ER_MERGE, ctx.c_str(), merge::to_string(out.merge.error), merge::to_string(out.merge.stage),
              out.merge.reason.c_str());
    }

    // 3. property diffs
    std::map<std::string, std::string> new_models;
    std::map<std::string, DiffResult> diffs;
    for (const auto& stem : out.models.common) {
        std::string nt = fileio::read_text(path_(opt_.scaffold_dir, stem + ext));
        std::string ot = fileio::read_text(path_(opt_.models_dir, stem + ext));
        diffs[stem] = merge::diff_properties(ot, nt);
        new_models[stem] = std::move(nt);
    }
    for (const auto& stem : out.models.added) {
        std::string nt = fileio::read_text(path_(opt_.scaffold_dir, stem + ext));
        diffs[stem] = merge::diff_properties(std::string(), nt);
        new_models[stem] = std::move(nt);
    }
    out.report = merge::aggregate(diffs);
    out.report.added_models = out.models.added;
    out.report.removed_models = out.models.removed;

    if (opt_.dry_run) {
        LOG_INFO("dry run: no files written");
        return out;
    }

    // 4. backup, then write
    const std::string ctx_path = path_(opt_.models_dir, ctx);
    if (!opt_.backup_dir.empty()) {
        fileio::backup_file(ctx_path, opt_.backup_dir);
        for (const auto& stem : out.models.common) {
            fileio::backup_file(path_(opt_.models_dir, stem + ext), opt_.backup_dir);
        }
        if (opt_.prune) {
            for (const auto& stem : out.models.removed) {
                fileio::backup_file(path_(opt_.models_dir, stem + ext), opt_.backup_dir);
            }
        }
        LOG_INFO("backup written to %s", opt_.backup_dir.c_str());
    }

    fileio::write_text(ctx_path, out.merge.text);
    out.written.push_back(ctx_path);
    for (const auto& [stem, text] : new_models) {
        std::string p = path_(opt_.models_dir, stem + ext);
        fileio::write_text(p, text);
        out.written.push_back(p);
    }
    if (opt_.prune) {
        for (const auto& stem : out.models.removed) {
            std::string p = path_(opt_.models_dir, stem + ext);
            std::error_code ec;
            fs::remove(p, ec);
            if (ec) {
                THROW("cannot remove '%s': %s", p.c_str(), ec.message().c_str());
            }
            out.written.push_back(p);
        }
    } else if (!out.models.removed.empty()) {
        LOG_WARN("%zu model(s) no longer scaffolded were kept; use --prune to delete them",
                 out.models.removed.size());
    }

    if (!opt_.report_txt.empty()) {
        fileio::write_text(opt_.report_txt, merge::render_text(out.report));
        out.written.push_back(opt_.report_txt);
    }
    if (!opt_.report_json.empty()) {
        fileio::write_text(opt_.report_json, merge::render_json(out.report));
        out.written.push_back(opt_.report_json);
    }
    LOG_INFO("%zu file(s) written", out.written.size());
    return out;
}

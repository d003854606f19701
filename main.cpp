#include <iostream>
#include <filesystem>
#include <map>
#include <system_error>
#include <string>
#include <vector>
#include "lib.hpp"
#include "merge.hpp"
#include "carryover.hpp"
#include "propdiff.hpp"
#include "report.hpp"
#include "regenerator.hpp"
#include "fileio.hpp"

enum class Command { None, Merge, Diff, Regen, Help };

struct Options {
    Command command = Command::None;
    std::vector<std::string> inputs; // positional arguments after the command
    std::string output;              // -o
    std::string config_path;         // --config
    bool json = false;               // diff: print JSON
    LogLevel level = LogLevel::Info;
    RegenOptions regen;
};

static void print_help(const char* program) {
    std::cout << "ctxmerge - regenerate scaffolded models, keeping OnModelCreating customizations\n\n"
              << "usage:\n"
              << "  " << program << " merge <old-context> <new-context> [-o <out>]\n"
              << "  " << program << " diff <old-model> <new-model> [--json]\n"
              << "  " << program << " regen --models <dir> --scaffold <dir> [--context <file>]\n"
              << "        [--backup <dir>] [--report <txt>] [--report-json <json>] [--prune] [--dry-run]\n\n"
              << "options:\n"
              << "  --config <json>   merge literals (markers, method and builder names)\n"
              << "  -q, --quiet       errors only\n"
              << "  -v, --verbose     debug output\n"
              << "  -h, --help        this text\n";
}

// returns false on a usage error
static bool parse_args(int argc, char** argv, Options& opt) {
    if (argc < 2) return false;
    std::string cmd = argv[1];
    if (cmd == "merge") opt.command = Command::Merge;
    else if (cmd == "diff") opt.command = Command::Diff;
    else if (cmd == "regen") opt.command = Command::Regen;
    else if (cmd == "-h" || cmd == "--help" || cmd == "help") { opt.command = Command::Help; return true; }
    else return false;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        auto value = [&](std::string& target) -> bool {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << a << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };
        if (a == "-h" || a == "--help") { opt.command = Command::Help; return true; }
        else if (a == "-q" || a == "--quiet") opt.level = LogLevel::Quiet;
        else if (a == "-v" || a == "--verbose") opt.level = LogLevel::Debug;
        else if (a == "--json") opt.json = true;
        else if (a == "--prune") opt.regen.prune = true;
        else if (a == "--dry-run") opt.regen.dry_run = true;
        else if (a == "-o" || a == "--output") { if (!value(opt.output)) return false; }
        else if (a == "--config") { if (!value(opt.config_path)) return false; }
        else if (a == "--models") { if (!value(opt.regen.models_dir)) return false; }
        else if (a == "--scaffold") { if (!value(opt.regen.scaffold_dir)) return false; }
        else if (a == "--context") { if (!value(opt.regen.context_file)) return false; }
        else if (a == "--backup") { if (!value(opt.regen.backup_dir)) return false; }
        else if (a == "--report") { if (!value(opt.regen.report_txt)) return false; }
        else if (a == "--report-json") { if (!value(opt.regen.report_json)) return false; }
        else if (!a.empty() && a[0] == '-') {
            std::cerr << "unknown option " << a << std::endl;
            return false;
        }
        else opt.inputs.push_back(a);
    }

    switch (opt.command) {
        case Command::Merge:
        case Command::Diff:
            return opt.inputs.size() == 2;
        case Command::Regen:
            return opt.inputs.empty() && !opt.regen.models_dir.empty() && !opt.regen.scaffold_dir.empty();
        default:
            return false;
    }
}

static MergeConfig load_config(const Options& opt) {
    if (!opt.config_path.empty()) return MergeConfig::load(opt.config_path);
    if (opt.command == Command::Regen) {
        std::filesystem::path local = std::filesystem::path(opt.regen.models_dir) / "ctxmerge.json";
        std::error_code ec;
        if (std::filesystem::exists(local, ec)) {
            LOG_INFO("using config %s", local.string().c_str());
            return MergeConfig::load(local.string());
        }
    }
    return MergeConfig();
}

static int run_merge(const Options& opt, const MergeConfig& config) {
    std::string old_text = fileio::read_text(opt.inputs[0]);
    std::string new_text = fileio::read_text(opt.inputs[1]);
    ContextMerger merger(config);
    MergeResult res = merger.merge(old_text, new_text);
    if (!res.ok) {
        THROW("cannot safely merge '%s' into '%s' (%s, stage %s): %s. Aborting to avoid data loss; no changes were applied.",
              opt.inputs[0].c_str(), opt.inputs[1].c_str(), merge::to_string(res.error),
              merge::to_string(res.stage), res.reason.c_str());
    }
    if (opt.output.empty()) {
        std::cout << res.text;
    } else {
        fileio::write_text(opt.output, res.text);
        LOG_INFO("merged context written to %s", opt.output.c_str());
    }
    return 0;
}

static int run_diff(const Options& opt) {
    std::string old_text = fileio::read_text(opt.inputs[0]);
    std::string new_text = fileio::read_text(opt.inputs[1]);
    DiffResult diff = merge::diff_properties(old_text, new_text);
    std::string entity = std::filesystem::path(opt.inputs[1]).stem().string();
    if (opt.json) {
        std::map<std::string, DiffResult> one{ { entity, diff } };
        std::cout << merge::render_json(merge::aggregate(one)) << std::endl;
    } else {
        std::cout << merge::render_text(entity, diff);
    }
    return 0;
}

static int run_regen(Options& opt, const MergeConfig& config) {
    opt.regen.config = config;
    Regenerator regen(opt.regen);
    RegenOutcome out = regen.run();
    std::cout << merge::render_text(out.report);
    return 0;
}

int main(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        print_help(argv[0]);
        return 2;
    }
    if (opt.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }
    set_log_level(opt.level);

    try {
        MergeConfig config = load_config(opt);
        switch (opt.command) {
            case Command::Merge: return run_merge(opt, config);
            case Command::Diff:  return run_diff(opt);
            case Command::Regen: return run_regen(opt, config);
            default: break;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 2;
}

#include "catch.hpp"
#include "regenerator.hpp"
#include "fixtures.hpp"
#include "lib.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

// models/: previous run (custom code in the context, Legacy no longer scaffolded)
// scaffold/: fresh output (Customer changed, Order new)
struct Workspace {
    TempDir tmp;
    fs::path models;
    fs::path scaffold;

    Workspace() {
        set_log_level(LogLevel::Warn);
        models = tmp.sub("models");
        scaffold = tmp.sub("scaffold");
        put_file(models / "ShopContext.cs", OLD_CONTEXT);
        put_file(models / "Customer.cs", OLD_CUSTOMER);
        put_file(models / "Legacy.cs", "public class Legacy { public int Id { get; set; } }\n");
        put_file(scaffold / "ShopContext.cs", NEW_CONTEXT);
        put_file(scaffold / "Customer.cs", NEW_CUSTOMER);
        put_file(scaffold / "Order.cs", NEW_ORDER);
    }

    RegenOptions options() const {
        RegenOptions opt;
        opt.models_dir = models.string();
        opt.scaffold_dir = scaffold.string();
        return opt;
    }
};

TEST_CASE("detect_context finds the single file declaring OnModelCreating", "[regen]") {
    Workspace ws;
    REQUIRE(Regenerator::detect_context(ws.scaffold.string(), MergeConfig()) == "ShopContext.cs");

    put_file(ws.scaffold / "OtherContext.cs", NEW_CONTEXT);
    REQUIRE_THROWS_AS(Regenerator::detect_context(ws.scaffold.string(), MergeConfig()), std::runtime_error);

    fs::path empty = ws.tmp.sub("empty");
    REQUIRE_THROWS_AS(Regenerator::detect_context(empty.string(), MergeConfig()), std::runtime_error);
}

TEST_CASE("a full run merges the context, copies models and writes reports", "[regen]") {
    Workspace ws;
    RegenOptions opt = ws.options();
    opt.report_txt = (ws.tmp.path() / "changes.txt").string();
    opt.report_json = (ws.tmp.path() / "changes.json").string();

    Regenerator regen(opt);
    RegenOutcome out = regen.run();

    REQUIRE(out.context_file == "ShopContext.cs");
    REQUIRE(out.merge.ok);
    REQUIRE(out.models.added == std::vector<std::string>{ "Order" });
    REQUIRE(out.models.removed == std::vector<std::string>{ "Legacy" });
    REQUIRE(out.models.common == std::vector<std::string>{ "Customer" });

    std::string ctx = get_file(ws.models / "ShopContext.cs");
    REQUIRE(ctx == out.merge.text);
    REQUIRE(ctx.find("modelBuilder.HasDefaultSchema(\"shop\");") != std::string::npos);
    REQUIRE(ctx.find("modelBuilder.Entity<Order>") != std::string::npos);
    REQUIRE(ctx.find("HasMaxLength(100)") == std::string::npos);

    REQUIRE(get_file(ws.models / "Customer.cs") == NEW_CUSTOMER);
    REQUIRE(get_file(ws.models / "Order.cs") == NEW_ORDER);
    // not pruned
    REQUIRE(fs::exists(ws.models / "Legacy.cs"));
    // the scaffold directory is only read
    REQUIRE(get_file(ws.scaffold / "ShopContext.cs") == NEW_CONTEXT);

    json j = json::parse(get_file(opt.report_json));
    REQUIRE(j["addedModels"] == json::array({ "Order" }));
    REQUIRE(j["removedModels"] == json::array({ "Legacy" }));
    REQUIRE(j["entities"]["Customer"]["changed"][0]["to"] == "string?");
    REQUIRE(j["totals"]["propertiesAdded"] == 6);

    std::string txt = get_file(opt.report_txt);
    REQUIRE(txt.find("    - Email : string\n") != std::string::npos);
}

TEST_CASE("running again on the merged result is stable", "[regen]") {
    Workspace ws;
    Regenerator(ws.options()).run();
    std::string first = get_file(ws.models / "ShopContext.cs");

    RegenOutcome again = Regenerator(ws.options()).run();
    REQUIRE(get_file(ws.models / "ShopContext.cs") == first);
    REQUIRE(again.report.total_added == 0);
    REQUIRE(again.report.total_removed == 0);
    REQUIRE(again.report.total_changed == 0);
}

TEST_CASE("a failed merge aborts before anything is written", "[regen][error]") {
    Workspace ws;
    put_file(ws.models / "ShopContext.cs", "public partial class ShopContext { }\n");
    RegenOptions opt = ws.options();
    opt.context_file = "ShopContext.cs";
    opt.backup_dir = (ws.tmp.path() / "backup").string();
    opt.report_json = (ws.tmp.path() / "changes.json").string();

    REQUIRE_THROWS_AS(Regenerator(opt).run(), std::runtime_error);

    REQUIRE(get_file(ws.models / "ShopContext.cs") == "public partial class ShopContext { }\n");
    REQUIRE(get_file(ws.models / "Customer.cs") == OLD_CUSTOMER);
    REQUIRE_FALSE(fs::exists(ws.models / "Order.cs"));
    REQUIRE_FALSE(fs::exists(opt.backup_dir));
    REQUIRE_FALSE(fs::exists(opt.report_json));
}

TEST_CASE("dry run computes the outcome and writes nothing", "[regen]") {
    Workspace ws;
    RegenOptions opt = ws.options();
    opt.dry_run = true;
    opt.prune = true;
    opt.report_json = (ws.tmp.path() / "changes.json").string();

    RegenOutcome out = Regenerator(opt).run();
    REQUIRE(out.merge.ok);
    REQUIRE(out.written.empty());
    REQUIRE(out.report.total_changed == 1);
    REQUIRE(get_file(ws.models / "ShopContext.cs") == OLD_CONTEXT);
    REQUIRE(fs::exists(ws.models / "Legacy.cs"));
    REQUIRE_FALSE(fs::exists(ws.models / "Order.cs"));
    REQUIRE_FALSE(fs::exists(opt.report_json));
}

TEST_CASE("prune deletes removed models after backing them up", "[regen]") {
    Workspace ws;
    RegenOptions opt = ws.options();
    opt.prune = true;
    opt.backup_dir = (ws.tmp.path() / "backup").string();

    Regenerator(opt).run();

    REQUIRE_FALSE(fs::exists(ws.models / "Legacy.cs"));
    fs::path backup(opt.backup_dir);
    REQUIRE(get_file(backup / "ShopContext.cs") == OLD_CONTEXT);
    REQUIRE(get_file(backup / "Customer.cs") == OLD_CUSTOMER);
    REQUIRE(fs::exists(backup / "Legacy.cs"));
}

TEST_CASE("the configured context file name wins over detection", "[regen]") {
    Workspace ws;
    put_file(ws.scaffold / "OtherContext.cs", NEW_CONTEXT);
    RegenOptions opt = ws.options();
    opt.config.context_file = "ShopContext.cs";
    opt.dry_run = true;

    RegenOutcome out = Regenerator(opt).run();
    REQUIRE(out.context_file == "ShopContext.cs");
    // the other context is treated as a model of its own
    REQUIRE(out.models.added == std::vector<std::string>{ "Order", "OtherContext" });
}

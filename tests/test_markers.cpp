#include "catch.hpp"
#include "strippers.hpp"
#include <string>
#include <vector>

static MarkerPair markers() {
    return MergeConfig().markers();
}

TEST_CASE("strip_markers leaves text without markers untouched", "[markers]") {
    std::string body = "\n        modelBuilder.HasDefaultSchema(\"app\");\n    ";
    REQUIRE(merge::strip_markers(body, markers()) == body);
}

TEST_CASE("strip_markers removes a marker region with its lines", "[markers]") {
    std::string body =
        "\n"
        "        a();\n"
        "        // <ctxmerge:region>\n"
        "        generated();\n"
        "        // </ctxmerge:region>\n"
        "        b();\n";
    REQUIRE(merge::strip_markers(body, markers()) == "\n        a();\n        b();\n");
}

TEST_CASE("strip_markers removes every region", "[markers]") {
    std::string body =
        "// <ctxmerge:region>\nx();\n// </ctxmerge:region>\n"
        "keep();\n"
        "// <ctxmerge:region>\ny();\n// </ctxmerge:region>\n";
    REQUIRE(merge::strip_markers(body, markers()) == "keep();\n");
}

TEST_CASE("strip_markers removes stray marker comment lines only", "[markers]") {
    std::string body =
        "        // ctxmerge: preserved custom configuration\n"
        "        modelBuilder.HasDefaultSchema(\"app\");\n"
        "        // ctxmerge: end preserved custom configuration\n"
        "        // an ordinary comment\n";
    REQUIRE(merge::strip_markers(body, markers()) ==
            "        modelBuilder.HasDefaultSchema(\"app\");\n"
            "        // an ordinary comment\n");
}

TEST_CASE("strip_markers drops a begin marker that is never closed", "[markers][error]") {
    std::string body = "a();\n    // <ctxmerge:region>\nb();\n";
    REQUIRE(merge::strip_markers(body, markers()) == "a();\nb();\n");
}

TEST_CASE("strip_markers is idempotent", "[markers]") {
    std::vector<std::string> bodies = {
        "",
        "plain();\n",
        "// <ctxmerge:region>\nx();\n// </ctxmerge:region>\nkeep();\n",
        "a(); // <ctxmerge:region> inline // </ctxmerge:region> b();\n",
        "    // ctxmerge: stray\nkeep();\n    // <ctxmerge:region>\nunclosed();\n",
        "// </ctxmerge:region>\n// <ctxmerge:region>\nz();\n",
        "x();\r\n// ctxmerge: crlf stray\r\ny();\r\n",
    };
    for (const auto& body : bodies) {
        std::string once = merge::strip_markers(body, markers());
        REQUIRE(merge::strip_markers(once, markers()) == once);
    }
}

TEST_CASE("strip_markers keeps inline code around an inline region", "[markers]") {
    std::string body = "a(); // <ctxmerge:region> inline // </ctxmerge:region> b();\n";
    REQUIRE(merge::strip_markers(body, markers()) == "a();  b();\n");
}

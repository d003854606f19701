#define CATCH_CONFIG_MAIN
#include "catch.hpp"
#include "brace_scanner.hpp"
#include <stdexcept>
#include <string>

TEST_CASE("scan_balanced returns the body between matching braces", "[braces]") {
    std::string text = "void f() { a(); }";
    auto open = text.find('{');
    auto res = merge::scan_balanced(text, open);
    REQUIRE(res.ok);
    REQUIRE(res.span.start == open + 1);
    REQUIRE(text[res.span.end] == '}');
    REQUIRE(text.substr(res.span.start, res.span.size()) == " a(); ");
}

TEST_CASE("scan_balanced skips nested blocks", "[braces]") {
    std::string text = "{ x(e => { if (y) { z(); } }); } tail";
    auto res = merge::scan_balanced(text, 0);
    REQUIRE(res.ok);
    REQUIRE(res.span.end == text.find(" tail") - 1);
}

TEST_CASE("scan_balanced reports unbalanced text", "[braces][error]") {
    std::string text = "{ a { b }";
    auto res = merge::scan_balanced(text, 0);
    REQUIRE_FALSE(res.ok);
}

TEST_CASE("scan_balanced counts braces inside literals", "[braces]") {
    // no lexer: the '}' in the string closes the block early
    std::string text = R"({ s = "}"; t(); })";
    auto res = merge::scan_balanced(text, 0);
    REQUIRE(res.ok);
    REQUIRE(res.span.end == text.find('}'));
}

TEST_CASE("scan_balanced rejects an offset that is not '{'", "[braces][error]") {
    std::string text = "abc { }";
    REQUIRE_THROWS_AS(merge::scan_balanced(text, 0), std::runtime_error);
    REQUIRE_THROWS_AS(merge::scan_balanced(text, 100), std::runtime_error);
}

TEST_CASE("find_open_brace", "[braces]") {
    std::string text = "f(x) \n  { }";
    REQUIRE(merge::find_open_brace(text, 0) == text.find('{'));
    REQUIRE(merge::find_open_brace(text, text.size()) == std::string::npos);
    REQUIRE(merge::find_open_brace("no braces", 0) == std::string::npos);
}

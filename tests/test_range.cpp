#include <catch2/catch.hpp>
#include <weft/range.hpp>

using namespace weft;

static SemVer sv(const std::string& s) {
    return SemVer::parse(s).value();
}

static RangeSet rs(const std::string& s) {
    auto r = RangeSet::parse(s);
    INFO("parsing '" << s << "'");
    REQUIRE(r.is_ok());
    return r.value();
}

static const char* const k_sample[] = {
    "0.0.0", "0.0.1", "0.1.0", "0.9.9", "1.0.0-alpha", "1.0.0", "1.0.1",
    "1.2.0", "1.2.3", "1.2.4", "1.3.0", "1.4.9", "1.5.0", "1.9.9",
    "2.0.0-rc.1", "2.0.0", "2.5.0", "3.0.0", "10.0.0"
};

// ===== Comparison operators =====

TEST_CASE("greater-equal and less-than", "[range]") {
    auto r = rs(">=1.0.0, <2.0.0");
    REQUIRE(r.contains(sv("1.0.0")));
    REQUIRE(r.contains(sv("1.9.9")));
    REQUIRE_FALSE(r.contains(sv("0.9.9")));
    REQUIRE_FALSE(r.contains(sv("2.0.0")));
}

TEST_CASE("strict and inclusive bounds", "[range]") {
    REQUIRE_FALSE(rs(">1.2.3").contains(sv("1.2.3")));
    REQUIRE(rs(">1.2.3").contains(sv("1.2.4")));
    REQUIRE(rs("<=1.2.3").contains(sv("1.2.3")));
    REQUIRE_FALSE(rs("<=1.2.3").contains(sv("1.2.4")));
}

TEST_CASE("partial operands cover their whole block", "[range]") {
    REQUIRE(rs(">1.2").contains(sv("1.3.0")));
    REQUIRE_FALSE(rs(">1.2").contains(sv("1.2.9")));
    REQUIRE(rs("<=1.2").contains(sv("1.2.9")));
    REQUIRE_FALSE(rs("<=1.2").contains(sv("1.3.0")));
    REQUIRE(rs(">=1.2").contains(sv("1.2.0")));
    REQUIRE_FALSE(rs("<1.2").contains(sv("1.2.0")));
}

TEST_CASE("exact and bare versions", "[range]") {
    REQUIRE(rs("=1.2.3") == RangeSet::exactly(sv("1.2.3")));
    REQUIRE(rs("1.2.3") == RangeSet::exactly(sv("1.2.3")));
    REQUIRE(rs("v1.2.3") == RangeSet::exactly(sv("1.2.3")));

    auto block = rs("1.2");
    REQUIRE(block.contains(sv("1.2.0")));
    REQUIRE(block.contains(sv("1.2.99")));
    REQUIRE_FALSE(block.contains(sv("1.3.0")));
    REQUIRE(rs("1.2.x") == block);
}

TEST_CASE("not-equal splits the range", "[range]") {
    auto r = rs("!=1.2.3");
    REQUIRE(r.intervals().size() == 2);
    REQUIRE(r.contains(sv("1.2.2")));
    REQUIRE_FALSE(r.contains(sv("1.2.3")));
    REQUIRE(r.contains(sv("1.2.4")));

    auto block = rs(">=1.0.0, !=1.2");
    REQUIRE(block.contains(sv("1.1.9")));
    REQUIRE_FALSE(block.contains(sv("1.2.5")));
    REQUIRE(block.contains(sv("1.3.0")));
}

// ===== Caret and tilde =====

TEST_CASE("caret ranges", "[range]") {
    REQUIRE(rs("^1.2.3") == rs(">=1.2.3, <2.0.0"));
    REQUIRE(rs("^0.2.3") == rs(">=0.2.3, <0.3.0"));
    REQUIRE(rs("^0.0.3") == rs(">=0.0.3, <0.0.4"));
    REQUIRE(rs("^1.2") == rs(">=1.2.0, <2.0.0"));
    REQUIRE(rs("^0.0") == rs(">=0.0.0, <0.1.0"));
    REQUIRE(rs("^0") == rs(">=0.0.0, <1.0.0"));
}

TEST_CASE("tilde ranges", "[range]") {
    REQUIRE(rs("~1.2.3") == rs(">=1.2.3, <1.3.0"));
    REQUIRE(rs("~1.2") == rs(">=1.2.0, <1.3.0"));
    REQUIRE(rs("~1") == rs(">=1.0.0, <2.0.0"));
    REQUIRE(rs("~>1.2.3") == rs("~1.2.3"));
}

TEST_CASE("bounds at the largest component carry or open up", "[range]") {
    auto top = rs("^2147483647.0.0");
    REQUIRE(top.contains(sv("2147483647.0.0")));
    REQUIRE(top.contains(sv("2147483647.2147483647.2147483647")));
    REQUIRE_FALSE(top.contains(sv("2147483646.9.9")));
    REQUIRE(top.to_string() == ">=2147483647.0.0");

    REQUIRE(rs("<=2147483647").is_everything());
    REQUIRE(rs(">2147483647").is_empty());
    REQUIRE(rs(">1.2147483647") == rs(">=2.0.0"));
    REQUIRE(rs("~1.2147483647.5") == rs(">=1.2147483647.5, <2.0.0"));
    REQUIRE(rs("^0.0.2147483647") == rs(">=0.0.2147483647, <0.1.0"));
    REQUIRE(rs("1 - 2147483647") == rs(">=1.0.0"));
}

// ===== Syntax =====

TEST_CASE("operators may be followed by whitespace", "[range]") {
    REQUIRE(rs(">= 1.0.0 < 2.0.0") == rs(">=1.0.0, <2.0.0"));
    REQUIRE(rs("  >=1.0.0,<2.0.0  ") == rs(">=1.0.0, <2.0.0"));
}

TEST_CASE("hyphen ranges", "[range]") {
    REQUIRE(rs("1.2.3 - 2.3.4") == rs(">=1.2.3, <=2.3.4"));
    REQUIRE(rs("1.2 - 2.3") == rs(">=1.2.0, <2.4.0"));
    REQUIRE(rs("1 - 2") == rs(">=1.0.0, <3.0.0"));
}

TEST_CASE("alternatives with ||", "[range]") {
    auto r = rs("^1.2 || >=3.0.0");
    REQUIRE(r.intervals().size() == 2);
    REQUIRE(r.contains(sv("1.5.0")));
    REQUIRE_FALSE(r.contains(sv("2.5.0")));
    REQUIRE(r.contains(sv("10.0.0")));
}

TEST_CASE("wildcards", "[range]") {
    REQUIRE(rs("*").is_everything());
    REQUIRE(rs("x").is_everything());
    REQUIRE(rs(">=*").is_everything());
    REQUIRE(rs(">*").is_empty());
}

TEST_CASE("range parse errors", "[range]") {
    for (const char* bad : {"", "   ", "master", "not-a-semver-string", ">=",
                            "=>1.0.0", "1.2.3 ||", ">=1.0.0, <", "1.x.3",
                            "release candidate"}) {
        INFO("input: '" << bad << "'");
        auto r = RangeSet::parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == WeftError::Range);
    }
}

// ===== Normalization =====

TEST_CASE("overlapping and touching intervals merge", "[range]") {
    REQUIRE(rs(">=1.0.0, <1.5.0 || >=1.2.0, <2.0.0") == rs(">=1.0.0, <2.0.0"));
    REQUIRE(rs("<1.0.0 || >=1.0.0") == RangeSet::everything());
    REQUIRE(rs("<=1.0.0 || >1.0.0").is_everything());
    // the shared point is excluded on both sides
    REQUIRE(rs("<1.0.0 || >1.0.0").intervals().size() == 2);
}

TEST_CASE("contradictory conjunction parses to an empty set", "[range]") {
    REQUIRE(rs(">=2.0.0, <1.0.0").is_empty());
    REQUIRE(rs(">1.0.0, <1.0.0").is_empty());
    REQUIRE(rs(">=1.0.0, <=1.0.0") == RangeSet::exactly(sv("1.0.0")));
}

TEST_CASE("prereleases order inside intervals", "[range]") {
    REQUIRE(rs("<2.0.0").contains(sv("2.0.0-rc.1")));
    REQUIRE_FALSE(rs(">=1.0.0").contains(sv("1.0.0-alpha")));
    REQUIRE(rs(">=1.0.0-alpha, <1.0.0").contains(sv("1.0.0-beta")));
    REQUIRE(rs(">=1.2.0").contains(sv("1.3.0-beta")));
}

// ===== Intersection =====

TEST_CASE("interval intersection", "[range]") {
    auto r = rs(">=1.0.0, <2.0.0").intersect(rs(">=1.5.0"));
    REQUIRE(r.contains(sv("1.5.0")));
    REQUIRE(r.contains(sv("1.9.9")));
    REQUIRE_FALSE(r.contains(sv("1.4.9")));
    REQUIRE_FALSE(r.contains(sv("2.0.0")));
    REQUIRE(r == rs(">=1.5.0, <2.0.0"));
}

TEST_CASE("disjoint intersection is empty", "[range]") {
    REQUIRE(rs("^1.0.0").intersect(rs("^2.0.0")).is_empty());
    REQUIRE(rs("<1.0.0").intersect(rs(">=1.0.0")).is_empty());
    REQUIRE(rs("<=1.0.0").intersect(rs(">=1.0.0")) == RangeSet::exactly(sv("1.0.0")));
}

TEST_CASE("intersection distributes over alternatives", "[range]") {
    auto r = rs("^1.0.0 || ^3.0.0").intersect(rs(">=1.5.0, <3.5.0"));
    REQUIRE(r == rs(">=1.5.0, <2.0.0 || >=3.0.0, <3.5.0"));
}

TEST_CASE("intersection agrees with membership on both sides", "[range]") {
    const char* exprs[] = {"^1.2", ">=1.0.0, !=1.2.3", "~1.4 || >=2.0.0",
                           "<1.0.0 || >2.0.0", "1.2.3 - 2.0.0", "*"};
    for (const char* a : exprs) {
        for (const char* b : exprs) {
            auto both = rs(a).intersect(rs(b));
            REQUIRE(both == rs(b).intersect(rs(a)));
            for (const char* v : k_sample) {
                INFO(a << " & " << b << " at " << v);
                REQUIRE(both.contains(sv(v)) ==
                        (rs(a).contains(sv(v)) && rs(b).contains(sv(v))));
            }
        }
    }
}

TEST_CASE("unite merges sets", "[range]") {
    auto r = rs("^1.0.0").unite(rs("^2.0.0"));
    REQUIRE(r == rs(">=1.0.0, <3.0.0"));
    REQUIRE(RangeSet{}.unite(rs("^1.0.0")) == rs("^1.0.0"));
}

// ===== Display =====

TEST_CASE("canonical strings", "[range]") {
    REQUIRE(rs("^1.2.3").to_string() == ">=1.2.3, <2.0.0");
    REQUIRE(rs("=1.2.3").to_string() == "=1.2.3");
    REQUIRE(rs("*").to_string() == "*");
    REQUIRE(rs(">1.0.0").to_string() == ">1.0.0");
    REQUIRE(rs("<=3.0.0").to_string() == "<=3.0.0");
    REQUIRE(rs("!=1.0.0").to_string() == "<1.0.0 || >1.0.0");
    REQUIRE(RangeSet{}.to_string().empty());
}

TEST_CASE("canonical string parses back to the same set", "[range]") {
    for (const char* expr : {">=1.0.0, <2.0.0", "^0.2.3 || ~3.1", "!=1.2.3",
                             "1.2 - 2", ">=1.0.0-beta.2", "=4.0.0", "*"}) {
        auto r = rs(expr);
        INFO(expr << " -> " << r.to_string());
        REQUIRE(rs(r.to_string()) == r);
    }
}

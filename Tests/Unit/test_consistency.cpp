#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "TG/Consistency.hpp"
#include "TG/Parser.hpp"
#include <string>

using namespace tg;
using Catch::Matchers::ContainsSubstring;

// One interval tier "words"; every declared value is a parameter so each test can break one.
static std::string wordsGrid(const std::string& docSize, const std::string& docXmax,
                             const std::string& tierXmax, const std::string& tierSize,
                             const std::string& lastEnd = "1.5") {
    return "xmin = 0\nxmax = " + docXmax + "\ntiers? <exists>\nsize = " + docSize + "\nitem []:\n"
           "item [1]:\nclass = \"IntervalTier\"\nname = \"words\"\nxmin = 0\nxmax = " + tierXmax +
           "\nintervals: size = " + tierSize + "\n"
           "intervals [1]:\nxmin = 0\nxmax = 0.5\ntext = \"one\"\n"
           "intervals [2]:\nxmin = 0.5\nxmax = " + lastEnd + "\ntext = \"two\"\n";
}

static ConsistencyError expectConsistencyError(const std::string& src) {
    try {
        parseTextGrid(src);
    } catch (const ConsistencyError& e) {
        return e;
    }
    FAIL("expected ConsistencyError");
    throw;
}

static ParseOptions unchecked() {
    ParseOptions o;
    o.checkConsistency = false;
    return o;
}

TEST_CASE("Consistency: matching metadata passes", "[consistency]") {
    auto tiers = parseTextGrid(wordsGrid("1", "1.5", "1.5", "2"));
    REQUIRE(tiers.size() == 1);
    CHECK(tierSize(tiers[0]) == 2u);
}

TEST_CASE("Consistency: tier count mismatch", "[consistency]") {
    for (const std::string declared : {"0", "2"}) {
        auto e = expectConsistencyError(wordsGrid(declared, "1.5", "1.5", "2"));
        CHECK(e.kind == ConsistencyError::Kind::TierCount);
        CHECK_THAT(std::string(e.what()), ContainsSubstring("Inconsistent number of tiers"));
        CHECK(e.declared == std::stod(declared));
        CHECK(e.found == 1.0);
    }
}

TEST_CASE("Consistency: item count mismatch message", "[consistency]") {
    auto e = expectConsistencyError(wordsGrid("1", "1.5", "1.5", "3"));
    CHECK(e.kind == ConsistencyError::Kind::ItemCount);
    CHECK(e.tier == "words");
    CHECK(e.field == "size");
    CHECK(std::string(e.what()) ==
          "Inconsistent number of items in tier words: 3 declared in tier header, found 2 in file.");
}

TEST_CASE("Consistency: tier extends past the document", "[consistency]") {
    auto e = expectConsistencyError(wordsGrid("1", "1.5", "3", "2", "2.5"));
    CHECK(e.kind == ConsistencyError::Kind::DocumentBounds);
    CHECK(e.tier == "words");
    CHECK(e.field == "xmax");
    CHECK(e.declared == 1.5);
    CHECK(e.found == 2.5);
    CHECK_THAT(std::string(e.what()), ContainsSubstring("words"));
}

TEST_CASE("Consistency: tier extends past its own header", "[consistency]") {
    auto e = expectConsistencyError(wordsGrid("1", "2", "1", "2"));
    CHECK(e.kind == ConsistencyError::Kind::TierBounds);
    CHECK(e.field == "xmax");
    CHECK(e.declared == 1.0);
    CHECK(e.found == 1.5);
}

TEST_CASE("Consistency: tier starts before the document", "[consistency]") {
    const std::string src = "xmin = 1\nxmax = 2\nsize = 1\nitem []:\n"
                            "item [1]:\nclass = \"TextTier\"\nname = \"bell\"\nxmin = 0\nxmax = 2\n"
                            "points: size = 1\npoints [1]:\nnumber = 0.5\nmark = \"early\"\n";
    auto e = expectConsistencyError(src);
    CHECK(e.kind == ConsistencyError::Kind::DocumentBounds);
    CHECK(e.tier == "bell");
    CHECK(e.field == "xmin");
    CHECK(e.declared == 1.0);
    CHECK(e.found == 0.5);
}

TEST_CASE("Consistency: checks run in order and stop at the first failure", "[consistency]") {
    SECTION("tier count before everything else") {
        auto e = expectConsistencyError(wordsGrid("5", "1", "1", "9", "3"));
        CHECK(e.kind == ConsistencyError::Kind::TierCount);
    }
    SECTION("document bounds before item counts") {
        auto e = expectConsistencyError(wordsGrid("1", "1", "1", "9", "3"));
        CHECK(e.kind == ConsistencyError::Kind::DocumentBounds);
    }
    SECTION("item counts before tier bounds") {
        auto e = expectConsistencyError(wordsGrid("1", "5", "1", "9", "3"));
        CHECK(e.kind == ConsistencyError::Kind::ItemCount);
    }
}

TEST_CASE("Consistency: disabled checking returns the tiers", "[consistency]") {
    const auto src = wordsGrid("4", "1", "1", "9", "3");
    CHECK_THROWS_AS(parseTextGrid(src), ConsistencyError);
    auto tiers = parseTextGrid(src, unchecked());
    REQUIRE(tiers.size() == 1);
    CHECK(tierSize(tiers[0]) == 2u);
}

TEST_CASE("Consistency: empty tiers skip bound checks", "[consistency]") {
    // Declared tier bounds lie outside the document, but nothing was built to compare.
    const std::string src = "xmin = 0\nxmax = 1\nsize = 1\nitem []:\n"
                            "item [1]:\nclass = \"TextTier\"\nname = \"bell\"\nxmin = 5\nxmax = 6\n"
                            "points: size = 0\n";
    auto tiers = parseTextGrid(src);
    REQUIRE(tiers.size() == 1);
    CHECK_FALSE(tierBounds(tiers[0]).has_value());
}

TEST_CASE("Consistency: missing header metadata", "[consistency]") {
    SECTION("no tier count") {
        auto e = expectConsistencyError("xmin = 0\nxmax = 1\n");
        CHECK(e.kind == ConsistencyError::Kind::MissingMetadata);
        CHECK(e.field == "size");
    }
    SECTION("no xmax while a tier has items") {
        auto e = expectConsistencyError("xmin = 0\nsize = 1\nitem []:\n"
                                        "item [1]:\nclass = \"TextTier\"\nname = \"bell\"\nxmin = 0\nxmax = 1\n"
                                        "points: size = 1\npoints [1]:\nnumber = 0.5\nmark = \"x\"\n");
        CHECK(e.kind == ConsistencyError::Kind::MissingMetadata);
        CHECK(e.field == "xmax");
    }
    SECTION("unchecked documents need no metadata") {
        CHECK(parseTextGrid("", unchecked()).empty());
    }
}

TEST_CASE("Consistency: minimal dialect tier headers are validated", "[consistency][minimal]") {
    ParseOptions o;
    o.dialect = Dialect::Minimal;
    try {
        parseTextGrid("0 2 <exists> 1\n\"IntervalTier\" \"w\" 0 2 2\n0 1 \"a\"\n", o);
        FAIL("expected ConsistencyError");
    } catch (const ConsistencyError& err) {
        CHECK(err.kind == ConsistencyError::Kind::ItemCount);
        CHECK(std::string(err.what()) ==
              "Inconsistent number of items in tier w: 2 declared in tier header, found 1 in file.");
    }
}

TEST_CASE("Consistency: checker on a hand-built document", "[consistency]") {
    grammar::ParsedTextGrid doc;
    doc.header.xmin = 0.0;
    doc.header.xmax = 3.0;
    doc.header.size = 1;
    // Intervals are stored in file order, not time order
    doc.tiers.emplace_back(IntervalTier("t", {{2.0, 3.0, "b"}, {0.5, 2.0, "a"}}));
    doc.tierHeaders.push_back(grammar::TierHeader{"t", 0.5, 3.0, 2});
    CHECK_NOTHROW(checkConsistency(doc));

    doc.tierHeaders[0].xmin = 1.0;
    try {
        checkConsistency(doc);
        FAIL("expected ConsistencyError");
    } catch (const ConsistencyError& e) {
        CHECK(e.kind == ConsistencyError::Kind::TierBounds);
        CHECK(e.field == "xmin");
        CHECK(e.found == 0.5);
    }
}

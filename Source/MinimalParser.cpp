#include "TG/Grammar.hpp"

namespace tg::grammar {

namespace {

using lex::Token;

// Every field is positional: a value of the wrong kind is reported where it stands.
class MinimalParser : GrammarParser {
public:
    MinimalParser(lex::TokenStream& toks, const ParseOptions& options)
        : GrammarParser(toks, options, "MinimalParser") {}

    ParsedTextGrid parseTextGrid() {
        ParsedTextGrid doc;
        parseHeader(doc.header);
        while (tok_.type != Token::End) {
            parseTier(doc);
        }
        debugLog("Parsed " + std::to_string(doc.tiers.size()) + " tier(s)");
        return doc;
    }

private:
    void parseHeader(DocumentHeader& header) {
        while (tok_.type == Token::Identifier) {
            std::string key = tok_.text;
            advance();
            expect(Token::Equals, "'='");
            header.properties[std::move(key)] = parseString("header property string");
        }
        header.xmin = parseNumber("TextGrid xmin");
        header.xmax = parseNumber("TextGrid xmax");
        expect(Token::Less, "'<'");
        header.hasTiers = parseIdentifier("'exists' or 'absent'") == "exists";
        expect(Token::Greater, "'>'");
        header.size = parseCount("tier count");
    }

    TierHeader parseTierHeader() {
        TierHeader header;
        header.name = parseString("tier name");
        header.xmin = parseNumber("tier xmin");
        header.xmax = parseNumber("tier xmax");
        header.size = parseCount("item count");
        return header;
    }

    void parseTier(ParsedTextGrid& doc) {
        if (accept(Token::TagIntervalTier)) {
            TierHeader header = parseTierHeader();
            std::vector<Interval> intervals;
            while (atNumber()) {
                Interval iv;
                iv.start = parseNumber("interval xmin");
                iv.end = parseNumber("interval xmax");
                iv.text = parseString("interval text");
                intervals.push_back(std::move(iv));
            }
            debugLog("IntervalTier \"" + header.name + "\": " + std::to_string(intervals.size()) + " interval(s)");
            doc.tiers.emplace_back(IntervalTier(header.name, std::move(intervals)));
            doc.tierHeaders.push_back(std::move(header));
        } else if (accept(Token::TagTextTier)) {
            TierHeader header = parseTierHeader();
            std::vector<Point> points;
            while (atNumber()) {
                Point pt;
                pt.number = parseNumber("point time");
                pt.mark = parseString("point mark");
                points.push_back(std::move(pt));
            }
            debugLog("TextTier \"" + header.name + "\": " + std::to_string(points.size()) + " point(s)");
            doc.tiers.emplace_back(TextTier(header.name, std::move(points)));
            doc.tierHeaders.push_back(std::move(header));
        } else {
            errorHere("\"IntervalTier\" or \"TextTier\"");
        }
    }
};

} // namespace

ParsedTextGrid parseMinimal(lex::TokenStream& toks, const ParseOptions& options) {
    MinimalParser p(toks, options);
    return p.parseTextGrid();
}

} // namespace tg::grammar

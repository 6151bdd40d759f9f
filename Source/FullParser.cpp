#include "TG/Grammar.hpp"
#include <map>

namespace tg::grammar {

namespace {

using lex::Token;

// Key -> value token for one block of `key = value` lines.
using PropertyMap = std::map<std::string, Token>;

class FullParser : GrammarParser {
public:
    FullParser(lex::TokenStream& toks, const ParseOptions& options)
        : GrammarParser(toks, options, "FullParser") {}

    ParsedTextGrid parseTextGrid() {
        ParsedTextGrid doc;
        parseHeader(doc.header);
        // "tiers? <absent>" files stop right after the header
        if (tok_.type == Token::KwItem) {
            parseTiersBlock(doc);
        }
        if (tok_.type != Token::End) errorHere("'item' or end of input");
        debugLog("Parsed " + std::to_string(doc.tiers.size()) + " tier(s)");
        return doc;
    }

private:
    void parseHeader(DocumentHeader& header) {
        for (;;) {
            switch (tok_.type) {
                case Token::Identifier: {
                    const Token key = tok_;
                    advance();
                    expect(Token::Equals, "'='");
                    const Token value = parseValue();
                    if (key.text == "xmin" || key.text == "xmax") {
                        if (value.type == Token::String) errorAt(value, "a number for '" + key.text + "'");
                        (key.text == "xmin" ? header.xmin : header.xmax) = toDouble(value);
                    }
                    header.properties[key.text] = value.text;
                    break;
                }
                case Token::KwSize:
                    advance();
                    expect(Token::Equals, "'='");
                    header.size = parseCount("tier count");
                    break;
                case Token::KwTiersExist: {
                    advance();
                    expect(Token::Less, "'<'");
                    header.hasTiers = parseIdentifier("'exists' or 'absent'") == "exists";
                    expect(Token::Greater, "'>'");
                    break;
                }
                default:
                    return;
            }
        }
    }

    void parseTiersBlock(ParsedTextGrid& doc) {
        expect(Token::KwItem, "'item'");
        expect(Token::LBracket, "'['");
        expect(Token::RBracket, "']'");
        expect(Token::Colon, "':'");
        while (tok_.type == Token::KwItem) {
            parseTier(doc);
        }
    }

    // (item|intervals|points) '[' INT ']' ':'
    void parseBlockHeader(const Token::Type keyword, const char* what) {
        expect(keyword, what);
        expect(Token::LBracket, "'['");
        // The index is structural only; it is never checked against the position.
        const Token index = expect(Token::Integer, "block index");
        expect(Token::RBracket, "']'");
        expect(Token::Colon, "':'");
        debugLog(std::string(what) + " [" + index.text + "] at line " + std::to_string(index.loc.line));
    }

    Token parseValue() {
        if (tok_.type != Token::String && !atNumber()) errorHere("string or number value");
        Token value = tok_;
        advance();
        return value;
    }

    PropertyMap parseProperties() {
        PropertyMap props;
        while (tok_.type == Token::Identifier) {
            std::string key = tok_.text;
            advance();
            expect(Token::Equals, "'='");
            props[std::move(key)] = parseValue();
        }
        return props;
    }

    // blockEnd is the token that closed the property group, reported when a key is missing.
    static const Token& requireProperty(const PropertyMap& props, const std::string& key, const Token& blockEnd) {
        const auto it = props.find(key);
        if (it == props.end()) errorAt(blockEnd, "property '" + key + "'");
        return it->second;
    }

    static double requireNumber(const PropertyMap& props, const std::string& key, const Token& blockEnd) {
        const Token& value = requireProperty(props, key, blockEnd);
        if (value.type == Token::String) errorAt(value, "a number for '" + key + "'");
        return toDouble(value);
    }

    static std::string requireString(const PropertyMap& props, const std::string& key, const Token& blockEnd) {
        const Token& value = requireProperty(props, key, blockEnd);
        if (value.type != Token::String) errorAt(value, "a string for '" + key + "'");
        return value.text;
    }

    void parseTier(ParsedTextGrid& doc) {
        parseBlockHeader(Token::KwItem, "item");
        expect(Token::KwClass, "'class'");
        expect(Token::Equals, "'='");
        const Token cls = tok_;
        const std::string tierClass = parseString("tier class string");
        if (tierClass == "IntervalTier") {
            TierHeader header = parseTierHeader(Token::KwIntervals, "'intervals'");
            std::vector<Interval> intervals;
            while (tok_.type == Token::KwIntervals) {
                intervals.push_back(parseInterval());
            }
            debugLog("IntervalTier \"" + header.name + "\": " + std::to_string(intervals.size()) + " interval(s)");
            doc.tiers.emplace_back(IntervalTier(header.name, std::move(intervals)));
            doc.tierHeaders.push_back(std::move(header));
        } else if (tierClass == "TextTier") {
            TierHeader header = parseTierHeader(Token::KwPoints, "'points'");
            std::vector<Point> points;
            while (tok_.type == Token::KwPoints) {
                points.push_back(parsePoint());
            }
            debugLog("TextTier \"" + header.name + "\": " + std::to_string(points.size()) + " point(s)");
            doc.tiers.emplace_back(TextTier(header.name, std::move(points)));
            doc.tierHeaders.push_back(std::move(header));
        } else {
            errorAt(cls, "\"IntervalTier\" or \"TextTier\"");
        }
    }

    // name/xmin/xmax in any order, closed by `intervals: size = N` or `points: size = N`
    TierHeader parseTierHeader(const Token::Type sizeKeyword, const char* what) {
        const PropertyMap props = parseProperties();
        const Token blockEnd = tok_;
        expect(sizeKeyword, what);
        expect(Token::Colon, "':'");
        expect(Token::KwSize, "'size'");
        expect(Token::Equals, "'='");
        TierHeader header;
        header.size = parseCount("item count");
        header.name = requireString(props, "name", blockEnd);
        header.xmin = requireNumber(props, "xmin", blockEnd);
        header.xmax = requireNumber(props, "xmax", blockEnd);
        return header;
    }

    Interval parseInterval() {
        parseBlockHeader(Token::KwIntervals, "intervals");
        const PropertyMap props = parseProperties();
        Interval iv;
        iv.start = requireNumber(props, "xmin", tok_);
        iv.end = requireNumber(props, "xmax", tok_);
        iv.text = requireString(props, "text", tok_);
        return iv;
    }

    Point parsePoint() {
        parseBlockHeader(Token::KwPoints, "points");
        const PropertyMap props = parseProperties();
        Point pt;
        pt.number = requireNumber(props, "number", tok_);
        pt.mark = requireString(props, "mark", tok_);
        return pt;
    }
};

} // namespace

ParsedTextGrid parseFull(lex::TokenStream& toks, const ParseOptions& options) {
    FullParser p(toks, options);
    return p.parseTextGrid();
}

} // namespace tg::grammar

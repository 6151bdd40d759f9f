#pragma once

#include "TG/Lexer.hpp"
#include "TG/Model.hpp"
#include "TG/Parser.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tg::grammar {

// Header metadata as declared in the file. Only lives until validation is done.
struct DocumentHeader {
    std::map<std::string, std::string> properties; // "File type", "Object class", ...
    std::optional<double> xmin;
    std::optional<double> xmax;
    std::optional<size_t> size;
    bool hasTiers{false};
};

struct TierHeader {
    std::string name;
    double xmin{0.0};
    double xmax{0.0};
    size_t size{0};
};

struct ParsedTextGrid {
    DocumentHeader header;
    std::vector<Tier> tiers;
    std::vector<TierHeader> tierHeaders; // one per tier, same order
};

ParsedTextGrid parseFull(lex::TokenStream& toks, const ParseOptions& options);
ParsedTextGrid parseMinimal(lex::TokenStream& toks, const ParseOptions& options);

// Token cursor shared by both dialect grammars.
class GrammarParser {
protected:
    GrammarParser(lex::TokenStream& toks, const ParseOptions& options, const char* logTag);

    lex::TokenStream& toks_;
    const ParseOptions& options_;
    lex::Token tok_;

    void advance() { tok_ = toks_.consume(); }
    bool accept(lex::Token::Type t);
    lex::Token expect(lex::Token::Type t, const char* what);

    [[noreturn]] void errorHere(const std::string& expected) const;
    [[noreturn]] static void errorAt(const lex::Token& tok, const std::string& expected);

    [[nodiscard]] bool atNumber() const {
        return tok_.type == lex::Token::Integer || tok_.type == lex::Token::Float;
    }

    double parseNumber(const char* what);
    size_t parseCount(const char* what);
    std::string parseString(const char* what);
    std::string parseIdentifier(const char* what);

    // Integer and decimal literals both widen to double.
    static double toDouble(const lex::Token& tok);
    static size_t toCount(const lex::Token& tok);

    void debugLog(const std::string& msg) const;

private:
    const char* logTag_;
};

} // namespace tg::grammar

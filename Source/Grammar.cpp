#include "TG/Grammar.hpp"
#include "TG/Errors.hpp"
#include <ostream>
#include <stdexcept>

namespace tg::grammar {

using lex::Token;

GrammarParser::GrammarParser(lex::TokenStream& toks, const ParseOptions& options, const char* logTag)
    : toks_(toks), options_(options), logTag_(logTag) {
    advance();
}

bool GrammarParser::accept(const Token::Type t) {
    if (tok_.type == t) { advance(); return true; }
    return false;
}

Token GrammarParser::expect(const Token::Type t, const char* what) {
    if (tok_.type != t) errorHere(what);
    Token matched = tok_;
    advance();
    return matched;
}

void GrammarParser::errorHere(const std::string& expected) const {
    errorAt(tok_, expected);
}

void GrammarParser::errorAt(const Token& tok, const std::string& expected) {
    throw SyntaxError(tok, expected);
}

double GrammarParser::parseNumber(const char* what) {
    if (!atNumber()) errorHere(what);
    const double v = toDouble(tok_);
    advance();
    return v;
}

size_t GrammarParser::parseCount(const char* what) {
    if (tok_.type != Token::Integer) errorHere(what);
    const size_t n = toCount(tok_);
    advance();
    return n;
}

std::string GrammarParser::parseString(const char* what) {
    if (tok_.type != Token::String) errorHere(what);
    std::string s = tok_.text;
    advance();
    return s;
}

std::string GrammarParser::parseIdentifier(const char* what) {
    if (tok_.type != Token::Identifier) errorHere(what);
    std::string s = tok_.text;
    advance();
    return s;
}

double GrammarParser::toDouble(const Token& tok) {
    try {
        return std::stod(tok.text);
    } catch (const std::out_of_range&) {
        errorAt(tok, "a number within double range");
    } catch (const std::invalid_argument&) {
        errorAt(tok, "a number");
    }
}

size_t GrammarParser::toCount(const Token& tok) {
    if (!tok.text.empty() && tok.text.front() == '-') errorAt(tok, "a non-negative count");
    try {
        return static_cast<size_t>(std::stoull(tok.text));
    } catch (const std::out_of_range&) {
        errorAt(tok, "a count within range");
    } catch (const std::invalid_argument&) {
        errorAt(tok, "a count");
    }
}

void GrammarParser::debugLog(const std::string& msg) const {
    if (options_.debug && options_.log) {
        (*options_.log) << "[" << logTag_ << "] " << msg << std::endl;
    }
}

} // namespace tg::grammar

#include "TG/Errors.hpp"
#include <sstream>

namespace tg {

namespace {

std::string describeChar(const char c) {
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u >= 0x7f) {
        std::ostringstream oss;
        oss << "byte 0x" << std::hex << static_cast<int>(u);
        return oss.str();
    }
    return std::string("'") + c + "'";
}

std::string lexicalMessage(const char c, const SourceLocation& loc) {
    std::ostringstream oss;
    oss << "Lexical error at line " << loc.line << ", offset " << loc.offset
        << ": unexpected character " << describeChar(c);
    return oss.str();
}

std::string syntaxMessage(const lex::Token& tok, const std::string& expected) {
    std::ostringstream oss;
    oss << "Syntax error at line " << tok.loc.line << ", col " << tok.loc.column << ": expected " << expected;
    if (tok.type == lex::Token::End) {
        oss << ", got unexpected end of input";
    } else {
        oss << ", got " << lex::tokenTypeName(tok.type) << " \"" << tok.text << "\"";
    }
    return oss.str();
}

} // namespace

LexicalError::LexicalError(const char character, const SourceLocation loc)
    : TextGridError(lexicalMessage(character, loc)), character(character), loc(loc) {}

SyntaxError::SyntaxError(lex::Token token, std::string expected)
    : TextGridError(syntaxMessage(token, expected)), token(std::move(token)), expected(std::move(expected)) {}

ConsistencyError::ConsistencyError(const Kind kind, std::string tier, std::string field,
                                   const double declared, const double found, const std::string& message)
    : TextGridError(message), kind(kind), tier(std::move(tier)), field(std::move(field)),
      declared(declared), found(found) {}

UnsupportedInputError::UnsupportedInputError(std::string input, const std::string& reason)
    : TextGridError("Unsupported TextGrid input " + input + ": " + reason), input(std::move(input)) {}

} // namespace tg

#pragma once

#include "TG/Lexer.hpp"
#include <stdexcept>
#include <string>

namespace tg {

struct TextGridError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Input text matched no token rule.
struct LexicalError final : TextGridError {
    LexicalError(char character, SourceLocation loc);

    char character;
    SourceLocation loc;
};

// Token stream matched no production at the current position.
struct SyntaxError final : TextGridError {
    SyntaxError(lex::Token token, std::string expected);

    [[nodiscard]] bool atEnd() const { return token.type == lex::Token::End; }

    lex::Token token;
    std::string expected;
};

struct ConsistencyError final : TextGridError {
    enum class Kind {
        MissingMetadata, // header never declared a field the check needs
        TierCount,
        DocumentBounds,
        ItemCount,
        TierBounds
    };

    ConsistencyError(Kind kind, std::string tier, std::string field,
                     double declared, double found, const std::string& message);

    Kind kind;
    std::string tier;  // empty for document level checks
    std::string field; // "size", "xmin" or "xmax"
    double declared;
    double found;
};

// Caller handed over something that cannot be read as a TextGrid source.
struct UnsupportedInputError final : TextGridError {
    UnsupportedInputError(std::string input, const std::string& reason);

    std::string input;
};

} // namespace tg

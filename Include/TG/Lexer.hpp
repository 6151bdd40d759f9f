#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tg {

    struct SourceLocation {
        size_t offset{0}; // byte offset from the start of the buffer
        size_t line{1};
        size_t column{1};
    };

    // The two textual encodings Praat writes a TextGrid in.
    enum class Dialect { Full, Minimal };

}

namespace tg::lex {

    struct Token {
        enum Type {
            Identifier, Integer, Float, String,
            Equals, Colon, LBracket, RBracket, Less, Greater,
            KwSize, KwIntervals, KwPoints, KwClass, KwItem, KwTiersExist, // full dialect only
            TagIntervalTier, TagTextTier,                                 // minimal dialect only
            End
        } type{End};
        std::string text;
        SourceLocation loc{};
    };

    const char* tokenTypeName(Token::Type type);

    class TokenStream {
    public:
        TokenStream(std::string_view src, Dialect dialect);
        [[nodiscard]] const Token& peek() const;
        [[nodiscard]] const Token& lookahead(size_t n) const; // clamps to the End token
        Token consume();
        [[nodiscard]] size_t size() const { return tokens_.size(); }
        [[nodiscard]] Dialect dialect() const { return dialect_; }
    private:
        std::vector<Token> tokens_;
        size_t idx_{0};
        Dialect dialect_;
    };

}

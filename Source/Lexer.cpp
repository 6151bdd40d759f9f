#include "TG/Lexer.hpp"
#include "TG/Errors.hpp"
#include <algorithm>
#include <string_view>
#include <tao/pegtl.hpp>
#include <unordered_map>

namespace tg::lex {

    namespace pegtl = tao::pegtl;

    static SourceLocation locFrom(const pegtl::position& p) {
        SourceLocation l; l.offset = p.byte; l.line = p.line; l.column = p.column; return l;
    }

    // Whitespace (skipped). Line counting is done by the input's position tracking.
    struct blank : pegtl::one<' ', '\t', '\r'> {};
    struct newline : pegtl::one<'\n'> {};
    struct skipped : pegtl::plus< pegtl::sor< blank, newline > > {};

    // Numbers. Float is tried first so "2.3" never lexes as 2 followed by garbage.
    struct digits : pegtl::plus< pegtl::digit > {};
    struct opt_sign : pegtl::opt< pegtl::one<'-'> > {};
    struct expn : pegtl::seq< pegtl::one<'e', 'E'>, pegtl::opt< pegtl::one<'+', '-'> >, digits > {};
    struct float_lit : pegtl::seq< opt_sign, digits,
                                   pegtl::sor< pegtl::seq< pegtl::one<'.'>, digits, pegtl::opt< expn > >, expn > > {};
    struct int_lit : pegtl::seq< opt_sign, digits > {};

    // Strings: everything between a pair of double quotes, no escapes
    struct string_lit : pegtl::seq< pegtl::one<'"'>, pegtl::star< pegtl::not_one<'"'> >, pegtl::one<'"'> > {};

    // Identifiers are runs of letters and spaces ("File type", "item "); "tiers?" keeps its '?'
    struct identifier : pegtl::seq< pegtl::alpha,
                                    pegtl::star< pegtl::sor< pegtl::alpha, pegtl::one<' '> > >,
                                    pegtl::opt< pegtl::one<'?'> > > {};

    struct equals : pegtl::one<'='> {};
    struct colon  : pegtl::one<':'> {};
    struct lbrack : pegtl::one<'['> {};
    struct rbrack : pegtl::one<']'> {};
    struct lt     : pegtl::one<'<'> {};
    struct gt     : pegtl::one<'>'> {};

    struct unknown_char : pegtl::any {};

    struct token_rule : pegtl::sor<
                skipped,
                float_lit, int_lit,
                string_lit,
                identifier,
                equals, colon, lbrack, rbrack, lt, gt,
                unknown_char
            > {};

    struct tokens_grammar : pegtl::seq< pegtl::opt< pegtl::utf8::bom >, pegtl::star< token_rule >, pegtl::eof > {};

    // Identifier spellings with a dedicated token kind in the full dialect.
    static const std::unordered_map<std::string_view, Token::Type>& keywordTable() {
        static const std::unordered_map<std::string_view, Token::Type> table{
            {"size", Token::KwSize},
            {"intervals", Token::KwIntervals},
            {"points", Token::KwPoints},
            {"class", Token::KwClass},
            {"item", Token::KwItem},
            {"tiers?", Token::KwTiersExist},
        };
        return table;
    }

    struct TokenSink {
        Dialect dialect;
        std::vector<Token> out;
    };

    // Actions
    template< typename Rule > struct action : pegtl::nothing< Rule > {};

    template<> struct action< identifier > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Identifier; t.text = in.string(); t.loc = locFrom(in.position());
            t.text.erase(t.text.find_last_not_of(' ') + 1);
            if (sink.dialect == Dialect::Full) {
                const auto& table = keywordTable();
                if (const auto it = table.find(t.text); it != table.end()) t.type = it->second;
            }
            sink.out.push_back(std::move(t));
        }
    };

    template<> struct action< float_lit > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Float; t.text = in.string(); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

    template<> struct action< int_lit > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            Token t; t.type = Token::Integer; t.text = in.string(); t.loc = locFrom(in.position());
            sink.out.push_back(std::move(t));
        }
    };

    template<> struct action< string_lit > {
        template< typename Input >
        static void apply(const Input& in, TokenSink& sink) {
            const std::string raw = in.string();
            Token t; t.type = Token::String; t.text = raw.substr(1, raw.size() - 2); t.loc = locFrom(in.position());
            if (sink.dialect == Dialect::Minimal) {
                if (t.text == "IntervalTier") t.type = Token::TagIntervalTier;
                else if (t.text == "TextTier") t.type = Token::TagTextTier;
            }
            sink.out.push_back(std::move(t));
        }
    };

#define DEFINE_CHAR_TOKEN(rule_name, token_type, ch) \
    template<> struct action< rule_name > { \
        template< typename Input > \
        static void apply(const Input& in, TokenSink& sink) { \
            Token t; t.type = token_type; t.text = std::string(1, ch); t.loc = locFrom(in.position()); \
            sink.out.push_back(std::move(t)); \
        } \
    };

    DEFINE_CHAR_TOKEN(equals, Token::Equals, '=')
    DEFINE_CHAR_TOKEN(colon,  Token::Colon,  ':')
    DEFINE_CHAR_TOKEN(lbrack, Token::LBracket, '[')
    DEFINE_CHAR_TOKEN(rbrack, Token::RBracket, ']')
    DEFINE_CHAR_TOKEN(lt,     Token::Less,    '<')
    DEFINE_CHAR_TOKEN(gt,     Token::Greater, '>')

#undef DEFINE_CHAR_TOKEN

    template<> struct action< unknown_char > {
        template< typename Input >
        static void apply(const Input& in, TokenSink&) {
            throw LexicalError(*in.begin(), locFrom(in.position()));
        }
    };

    const char* tokenTypeName(const Token::Type type) {
        switch (type) {
            case Token::Identifier: return "identifier";
            case Token::Integer: return "integer";
            case Token::Float: return "float";
            case Token::String: return "string";
            case Token::Equals: return "'='";
            case Token::Colon: return "':'";
            case Token::LBracket: return "'['";
            case Token::RBracket: return "']'";
            case Token::Less: return "'<'";
            case Token::Greater: return "'>'";
            case Token::KwSize: return "'size'";
            case Token::KwIntervals: return "'intervals'";
            case Token::KwPoints: return "'points'";
            case Token::KwClass: return "'class'";
            case Token::KwItem: return "'item'";
            case Token::KwTiersExist: return "'tiers?'";
            case Token::TagIntervalTier: return "\"IntervalTier\"";
            case Token::TagTextTier: return "\"TextTier\"";
            case Token::End: return "end of input";
        }
        return "unknown";
    }

    TokenStream::TokenStream(std::string_view src, const Dialect dialect) : dialect_(dialect) {
        pegtl::memory_input<> in(src.data(), src.size(), "<textgrid>");
        TokenSink sink{dialect, {}};
        pegtl::parse< tokens_grammar, action >(in, sink);
        Token end; end.type = Token::End; end.text = "";
        end.loc = locFrom(in.position());
        sink.out.push_back(std::move(end));
        tokens_ = std::move(sink.out);
    }

    const Token& TokenStream::peek() const { return tokens_[idx_]; }
    const Token& TokenStream::lookahead(size_t n) const { return tokens_[std::min(idx_ + n, tokens_.size() - 1)]; }

    Token TokenStream::consume() {
        const Token& t = tokens_[idx_];
        if (idx_ + 1 < tokens_.size()) ++idx_;
        return t;
    }

}

#include "TG/Parser.hpp"
#include <fstream>
#include <sstream>
#include "TG/Consistency.hpp"
#include "TG/Grammar.hpp"
#include "TG/Lexer.hpp"

namespace tg {

namespace {

void debugLog(const ParseOptions& options, const std::string& msg) {
    if (options.debug && options.log) {
        (*options.log) << "[TextGrid] " << msg << std::endl;
    }
}

} // namespace

Dialect dialectFromName(const std::string_view name) {
    if (name == "full") return Dialect::Full;
    if (name == "minimal") return Dialect::Minimal;
    throw UnsupportedInputError("format \"" + std::string(name) + "\"", "expected \"full\" or \"minimal\"");
}

const char* dialectName(const Dialect dialect) {
    return dialect == Dialect::Full ? "full" : "minimal";
}

std::vector<Tier> parseTextGrid(const std::string_view source, const ParseOptions& options) {
    lex::TokenStream toks(source, options.dialect);
    debugLog(options, std::string("Tokenized ") + std::to_string(toks.size()) + " token(s) as "
                      + dialectName(options.dialect) + " TextGrid");

    grammar::ParsedTextGrid doc = options.dialect == Dialect::Full
                                      ? grammar::parseFull(toks, options)
                                      : grammar::parseMinimal(toks, options);

    if (options.checkConsistency) {
        checkConsistency(doc);
        debugLog(options, "Consistency check passed");
    } else {
        debugLog(options, "Consistency check skipped");
    }
    return std::move(doc.tiers);
}

std::vector<Tier> parseTextGridStream(std::istream& in, const ParseOptions& options) {
    if (!in) throw UnsupportedInputError("stream", "stream is not readable");
    std::stringstream buffer; buffer << in.rdbuf();
    if (in.bad()) throw UnsupportedInputError("stream", "read failed");
    return parseTextGrid(buffer.str(), options);
}

std::vector<Tier> parseTextGridFile(const std::string& path, const ParseOptions& options) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw UnsupportedInputError("file \"" + path + "\"", "cannot open file");
    debugLog(options, "Reading " + path);
    return parseTextGridStream(ifs, options);
}

} // namespace tg

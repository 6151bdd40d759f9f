#pragma once

#include "TG/Errors.hpp"
#include "TG/Lexer.hpp"
#include "TG/Model.hpp"
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace tg {

struct ParseOptions {
    Dialect dialect{Dialect::Full};
    bool checkConsistency{true};
    bool debug{false};
    std::ostream* log{&std::cerr}; // debug sink, ignored unless debug is set
};

// Accepts exactly "full" or "minimal"; anything else is an UnsupportedInputError.
Dialect dialectFromName(std::string_view name);
const char* dialectName(Dialect dialect);

// Parse a TextGrid held entirely in memory. Tiers come back in file order.
std::vector<Tier> parseTextGrid(std::string_view source, const ParseOptions& options = {});

// Reads the stream to its end, then parses.
std::vector<Tier> parseTextGridStream(std::istream& in, const ParseOptions& options = {});

// Convenience: parse a file from disk
std::vector<Tier> parseTextGridFile(const std::string& path, const ParseOptions& options = {});

} // namespace tg

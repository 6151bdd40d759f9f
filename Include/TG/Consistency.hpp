#pragma once

#include "TG/Grammar.hpp"

namespace tg {

// Compares header-declared metadata against the tiers actually built and throws
// ConsistencyError on the first disagreement. Checks run in this order:
//   1. document tier count
//   2. tier bounds against the document xmin/xmax
//   3. per-tier item count
//   4. tier bounds against the tier's own declared xmin/xmax
// Empty tiers have no derived bounds and skip 2 and 4.
void checkConsistency(const grammar::ParsedTextGrid& doc);

} // namespace tg

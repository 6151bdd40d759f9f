#include "TG/Consistency.hpp"
#include "TG/Errors.hpp"
#include <sstream>

namespace tg {

namespace {

using Kind = ConsistencyError::Kind;

std::string missing(const std::string& field) {
    return "TextGrid header does not declare " + field + ", cannot check consistency.";
}

void checkTierCount(const grammar::ParsedTextGrid& doc) {
    const auto& header = doc.header;
    if (!header.size) {
        throw ConsistencyError(Kind::MissingMetadata, "", "size", 0.0, static_cast<double>(doc.tiers.size()),
                               missing("a tier count"));
    }
    if (*header.size != doc.tiers.size()) {
        std::ostringstream oss;
        oss << "Inconsistent number of tiers: " << *header.size << " declared in header, found "
            << doc.tiers.size() << " in file.";
        throw ConsistencyError(Kind::TierCount, "", "size", static_cast<double>(*header.size),
                               static_cast<double>(doc.tiers.size()), oss.str());
    }
}

// Shared by the document-level and tier-level bound checks.
void checkBounds(const Kind kind, const std::string& tier, const Bounds& found,
                 const double xmin, const double xmax, const char* scope) {
    if (found.xmin < xmin) {
        std::ostringstream oss;
        oss << "Tier " << tier << " starts at " << found.xmin << ", before " << scope << " xmin " << xmin << ".";
        throw ConsistencyError(kind, tier, "xmin", xmin, found.xmin, oss.str());
    }
    if (found.xmax > xmax) {
        std::ostringstream oss;
        oss << "Tier " << tier << " ends at " << found.xmax << ", after " << scope << " xmax " << xmax << ".";
        throw ConsistencyError(kind, tier, "xmax", xmax, found.xmax, oss.str());
    }
}

void checkDocumentBounds(const grammar::ParsedTextGrid& doc) {
    const auto& header = doc.header;
    for (const auto& tier : doc.tiers) {
        const auto bounds = tierBounds(tier);
        if (!bounds) continue;
        if (!header.xmin) throw ConsistencyError(Kind::MissingMetadata, "", "xmin", 0.0, bounds->xmin, missing("xmin"));
        if (!header.xmax) throw ConsistencyError(Kind::MissingMetadata, "", "xmax", 0.0, bounds->xmax, missing("xmax"));
        checkBounds(Kind::DocumentBounds, tierName(tier), *bounds, *header.xmin, *header.xmax, "the TextGrid");
    }
}

void checkItemCounts(const grammar::ParsedTextGrid& doc) {
    for (size_t i = 0; i < doc.tiers.size(); ++i) {
        const auto& tier = doc.tiers[i];
        const auto& declared = doc.tierHeaders.at(i);
        const size_t found = tierSize(tier);
        if (declared.size != found) {
            std::ostringstream oss;
            oss << "Inconsistent number of items in tier " << tierName(tier) << ": " << declared.size
                << " declared in tier header, found " << found << " in file.";
            throw ConsistencyError(Kind::ItemCount, tierName(tier), "size", static_cast<double>(declared.size),
                                   static_cast<double>(found), oss.str());
        }
    }
}

void checkTierBounds(const grammar::ParsedTextGrid& doc) {
    for (size_t i = 0; i < doc.tiers.size(); ++i) {
        const auto bounds = tierBounds(doc.tiers[i]);
        if (!bounds) continue;
        const auto& declared = doc.tierHeaders.at(i);
        checkBounds(Kind::TierBounds, tierName(doc.tiers[i]), *bounds, declared.xmin, declared.xmax, "its declared");
    }
}

} // namespace

void checkConsistency(const grammar::ParsedTextGrid& doc) {
    checkTierCount(doc);
    checkDocumentBounds(doc);
    checkItemCounts(doc);
    checkTierBounds(doc);
}

} // namespace tg

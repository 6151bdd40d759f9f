#include "TG/Model.hpp"
#include <algorithm>
#include <sstream>

namespace tg {

bool operator==(const Interval& a, const Interval& b) {
    return a.start == b.start && a.end == b.end && a.text == b.text;
}
bool operator!=(const Interval& a, const Interval& b) { return !(a == b); }

bool operator==(const Point& a, const Point& b) {
    return a.number == b.number && a.mark == b.mark;
}
bool operator!=(const Point& a, const Point& b) { return !(a == b); }

IntervalTier::IntervalTier(std::string name, std::vector<Interval> intervals)
    : name_(std::move(name)), intervals_(std::move(intervals)) {}

std::optional<double> IntervalTier::xmin() const {
    if (intervals_.empty()) return std::nullopt;
    const auto it = std::min_element(intervals_.begin(), intervals_.end(),
                                     [](const Interval& a, const Interval& b) { return a.start < b.start; });
    return it->start;
}

std::optional<double> IntervalTier::xmax() const {
    if (intervals_.empty()) return std::nullopt;
    const auto it = std::max_element(intervals_.begin(), intervals_.end(),
                                     [](const Interval& a, const Interval& b) { return a.end < b.end; });
    return it->end;
}

TextTier::TextTier(std::string name, std::vector<Point> points)
    : name_(std::move(name)), points_(std::move(points)) {}

std::optional<double> TextTier::xmin() const {
    if (points_.empty()) return std::nullopt;
    const auto it = std::min_element(points_.begin(), points_.end(),
                                     [](const Point& a, const Point& b) { return a.number < b.number; });
    return it->number;
}

std::optional<double> TextTier::xmax() const {
    if (points_.empty()) return std::nullopt;
    const auto it = std::max_element(points_.begin(), points_.end(),
                                     [](const Point& a, const Point& b) { return a.number < b.number; });
    return it->number;
}

bool operator==(const IntervalTier& a, const IntervalTier& b) {
    return a.name() == b.name() && a.intervals() == b.intervals();
}

bool operator==(const TextTier& a, const TextTier& b) {
    return a.name() == b.name() && a.points() == b.points();
}

const std::string& tierName(const Tier& tier) {
    return std::visit([](const auto& t) -> const std::string& { return t.name(); }, tier);
}

size_t tierSize(const Tier& tier) {
    return std::visit([](const auto& t) { return t.size(); }, tier);
}

std::optional<Bounds> tierBounds(const Tier& tier) {
    return std::visit([](const auto& t) -> std::optional<Bounds> {
        const auto lo = t.xmin();
        const auto hi = t.xmax();
        if (!lo || !hi) return std::nullopt;
        return Bounds{*lo, *hi};
    }, tier);
}

std::string toString(const Interval& interval) {
    std::ostringstream oss;
    oss << "[" << interval.start << ", " << interval.end << "] \"" << interval.text << "\"";
    return oss.str();
}

std::string toString(const Point& point) {
    std::ostringstream oss;
    oss << point.number << " \"" << point.mark << "\"";
    return oss.str();
}

std::string toString(const Tier& tier) {
    std::ostringstream oss;
    if (std::holds_alternative<IntervalTier>(tier)) {
        oss << "IntervalTier \"" << tierName(tier) << "\" (" << tierSize(tier) << " intervals)";
    } else {
        oss << "TextTier \"" << tierName(tier) << "\" (" << tierSize(tier) << " points)";
    }
    if (const auto b = tierBounds(tier)) {
        oss << " " << b->xmin << ".." << b->xmax;
    }
    return oss.str();
}

} // namespace tg

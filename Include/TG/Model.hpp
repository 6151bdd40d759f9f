#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tg {

struct Interval {
    double start{0.0};
    double end{0.0};
    std::string text;
};

struct Point {
    double number{0.0}; // timestamp
    std::string mark;
};

struct Bounds {
    double xmin{0.0};
    double xmax{0.0};
};

bool operator==(const Interval& a, const Interval& b);
bool operator!=(const Interval& a, const Interval& b);
bool operator==(const Point& a, const Point& b);
bool operator!=(const Point& a, const Point& b);

class IntervalTier {
public:
    IntervalTier(std::string name, std::vector<Interval> intervals);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<Interval>& intervals() const { return intervals_; }
    [[nodiscard]] size_t size() const { return intervals_.size(); }

    // Derived from the intervals; empty when the tier has none.
    [[nodiscard]] std::optional<double> xmin() const;
    [[nodiscard]] std::optional<double> xmax() const;

private:
    std::string name_;
    std::vector<Interval> intervals_;
};

class TextTier {
public:
    TextTier(std::string name, std::vector<Point> points);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<Point>& points() const { return points_; }
    [[nodiscard]] size_t size() const { return points_.size(); }

    [[nodiscard]] std::optional<double> xmin() const;
    [[nodiscard]] std::optional<double> xmax() const;

private:
    std::string name_;
    std::vector<Point> points_;
};

bool operator==(const IntervalTier& a, const IntervalTier& b);
bool operator==(const TextTier& a, const TextTier& b);

using Tier = std::variant<IntervalTier, TextTier>;

const std::string& tierName(const Tier& tier);
size_t tierSize(const Tier& tier);
std::optional<Bounds> tierBounds(const Tier& tier);

// Printable summaries (debug output, test diagnostics)
std::string toString(const Interval& interval);
std::string toString(const Point& point);
std::string toString(const Tier& tier);

} // namespace tg

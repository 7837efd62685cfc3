#ifndef SRC_SKED_INTERVAL_HPP_
#define SRC_SKED_INTERVAL_HPP_

#include "sked/NumericTraits.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sked {

// A numeric range [lower, upper]. Intervals are values: every operation returns a new Interval. An Interval with
// lower > upper is invalid but still representable, as it is the natural result of intersecting disjoint intervals.
template<typename T>
struct Interval {
    Interval() = delete;
    Interval(T l, T u): lower(l), upper(u) {}
    ~Interval() = default;

    T length() const { return upper - lower; }
    bool isEmpty() const { return lower == upper; }
    bool isValid() const { return lower <= upper; }
    // True for valid intervals of nonzero length.
    bool hasLength() const { return length() > NumericTraits<T>::zero(); }

    bool after(const Interval& other) const { return lower >= other.upper; }
    bool before(const Interval& other) const { return upper <= other.lower; }
    bool contains(const Interval& other) const {
        return lower <= other.lower && other.lower <= other.upper && other.upper <= upper;
    }
    // Both bounds are included.
    bool containsPoint(T point) const { return lower <= point && point <= upper; }
    // Intervals that only touch at a bound do not overlap.
    bool overlaps(const Interval& other) const { return !(upper <= other.lower || lower >= other.upper); }

    Interval intersection(const Interval& other) const {
        return Interval(std::max(lower, other.lower), std::min(upper, other.upper));
    }

    // Returns the zero, one or two pieces of this interval not covered by |other|, dropping empty pieces.
    std::vector<Interval> difference(const Interval& other) const;

    Interval shifted(T delta) const { return Interval(lower + delta, upper + delta); }

    // Reduces both bounds modulo |period|. An upper bound landing exactly on a period boundary maps to |period|
    // instead of zero, so (0, 50) % 50 stays (0, 50). Intervals straddling a boundary become invalid.
    Interval modulo(T period) const {
        T u = NumericTraits<T>::mod(upper, period);
        if (u == NumericTraits<T>::zero()) {
            u = period;
        }
        return Interval(NumericTraits<T>::mod(lower, period), u);
    }

    template<typename F>
    auto converted(F conversion) const -> Interval<decltype(conversion(std::declval<T>()))> {
        return Interval<decltype(conversion(std::declval<T>()))>(conversion(lower), conversion(upper));
    }

    // Merges |intervals| into a sorted list of mutually non-overlapping intervals covering exactly the same points.
    // Intervals that touch are merged.
    static std::vector<Interval> unionOf(std::vector<Interval> intervals);

    bool operator==(const Interval& other) const { return lower == other.lower && upper == other.upper; }
    bool operator!=(const Interval& other) const { return !(*this == other); }
    bool operator<(const Interval& other) const {
        return lower < other.lower || (lower == other.lower && upper < other.upper);
    }
    bool operator>(const Interval& other) const { return other < *this; }
    bool operator<=(const Interval& other) const { return !(other < *this); }
    bool operator>=(const Interval& other) const { return !(*this < other); }

    T lower;
    T upper;
};

template<typename T>
std::vector<Interval<T>> Interval<T>::difference(const Interval& other) const {
    std::vector<Interval> result;
    Interval isect = intersection(other);
    if (!isect.hasLength()) {
        result.emplace_back(*this);
        return result;
    }
    Interval head(lower, isect.lower);
    if (head.hasLength()) {
        result.emplace_back(head);
    }
    Interval tail(isect.upper, upper);
    if (tail.hasLength()) {
        result.emplace_back(tail);
    }
    return result;
}

template<typename T>
std::vector<Interval<T>> Interval<T>::unionOf(std::vector<Interval> intervals) {
    std::sort(intervals.begin(), intervals.end());
    std::vector<Interval> result;
    auto iter = intervals.begin();
    while (iter != intervals.end()) {
        Interval run = *iter;
        ++iter;
        while (iter != intervals.end() && run.upper >= iter->lower) {
            if (run.upper < iter->upper) {
                run = Interval(run.lower, iter->upper);
            }
            ++iter;
        }
        result.emplace_back(run);
    }
    return result;
}

// Renders a list of intervals as "[(a, b), (c, d)]".
template<typename T>
std::string toString(const std::vector<Interval<T>>& intervals) {
    std::string result("[");
    for (size_t i = 0; i < intervals.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += fmt::format("({}, {})", intervals[i].lower, intervals[i].upper);
    }
    result += "]";
    return result;
}

extern template struct Interval<double>;
extern template struct Interval<int64_t>;

} // namespace sked

template<typename T>
struct fmt::formatter<sked::Interval<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const sked::Interval<T>& interval, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "({}, {})", interval.lower, interval.upper);
    }
};

#endif // SRC_SKED_INTERVAL_HPP_

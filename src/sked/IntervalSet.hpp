#ifndef SRC_SKED_INTERVAL_SET_HPP_
#define SRC_SKED_INTERVAL_SET_HPP_

#include "sked/ErrorReporter.hpp"
#include "sked/Interval.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sked {

// Forward cursor over one sorted list of interval-like elements, skipping any element shorter than |minSize|. The
// element type E needs public |lower| and |upper| members and a length() method.
template<typename E, typename T>
class IntervalCursor {
public:
    IntervalCursor() = delete;
    IntervalCursor(const std::vector<E>* elements, T minSize):
        m_elements(elements), m_minSize(minSize), m_next(0), m_value(nullptr) {
        advance();
    }
    ~IntervalCursor() = default;

    // Moves to the next element of at least |minSize| length. Returns false if the elements are exhausted.
    bool advance() {
        while (m_next < m_elements->size()) {
            const E& element = (*m_elements)[m_next];
            ++m_next;
            if (!(element.length() < m_minSize)) {
                m_value = &element;
                return true;
            }
        }
        m_value = nullptr;
        return false;
    }

    bool isDone() const { return m_value == nullptr; }
    const E& value() const {
        assert(m_value);
        return *m_value;
    }

private:
    const std::vector<E>* m_elements;
    T m_minSize;
    size_t m_next;
    const E* m_value;
};

// A sorted set of non-overlapping intervals. Construction normalizes the input through Interval::unionOf.
template<typename T>
class IntervalSet {
public:
    using Span = Interval<T>;

    IntervalSet() = default;
    explicit IntervalSet(std::vector<Span> intervals): m_intervals(Span::unionOf(std::move(intervals))) {}
    IntervalSet(std::initializer_list<Span> intervals): m_intervals(Span::unionOf(intervals)) {}
    ~IntervalSet() = default;

    // Wraps |intervals| without normalizing them. They must already be sorted and non-overlapping.
    static IntervalSet fromNormalized(std::vector<Span> intervals) {
        IntervalSet result;
        result.m_intervals = std::move(intervals);
        return result;
    }

    const std::vector<Span>& intervals() const { return m_intervals; }
    typename std::vector<Span>::const_iterator begin() const { return m_intervals.begin(); }
    typename std::vector<Span>::const_iterator end() const { return m_intervals.end(); }
    size_t size() const { return m_intervals.size(); }
    bool isEmpty() const { return m_intervals.size() == 0; }

    // Sum of the lengths of all intervals.
    T length() const;

    bool containsInterval(const Span& interval) const;
    bool containsPoint(T point) const { return nextPointUp(point) == std::optional<T>(point); }

    // Returns |point| if it lies within the set, otherwise the lower bound of the first interval above it, or nullopt
    // if there is none. O(log n).
    std::optional<T> nextPointUp(T point) const;

    bool overlaps(const IntervalSet& other) const;

    IntervalSet unionWith(const IntervalSet& other) const;
    IntervalSet intersection(const IntervalSet& other) const;
    IntervalSet difference(const IntervalSet& other) const;
    IntervalSet shifted(T delta) const;

    // Intersection of all |sets| at once, keeping only pieces at least |minSize| long. Each set must be sorted and
    // non-overlapping. E is Interval<T> or any interval-like type whose intersection() carries its own payload along.
    template<typename E = Span>
    static std::vector<E> intersectionIter(const std::vector<std::vector<E>>& sets, T minSize = T(0));

    // All pieces at least |minSize| long that are covered by at least |k| of the |sets|. For k == 1 this is every
    // qualifying input interval, ordered by lower bound. Returns nullopt for k == 0 or a negative |minSize|.
    static std::optional<std::vector<Span>> kOfNIntersectionIter(size_t k, T minSize,
                                                                 const std::vector<std::vector<Span>>& sets,
                                                                 ErrorReporter* errorReporter = nullptr);

    bool operator==(const IntervalSet& other) const { return m_intervals == other.m_intervals; }
    bool operator!=(const IntervalSet& other) const { return m_intervals != other.m_intervals; }

private:
    // Calls |visit| with each valid intersection of the two sweeps until |visit| returns false.
    template<typename F>
    void sweepIntersection(const IntervalSet& other, F visit) const;

    std::vector<Span> m_intervals;
};

template<typename T>
T IntervalSet<T>::length() const {
    T total = NumericTraits<T>::zero();
    for (const auto& interval : m_intervals) {
        total += interval.length();
    }
    return total;
}

template<typename T>
bool IntervalSet<T>::containsInterval(const Span& interval) const {
    return std::any_of(m_intervals.begin(), m_intervals.end(),
                       [&interval](const Span& iv) { return iv.contains(interval); });
}

template<typename T>
std::optional<T> IntervalSet<T>::nextPointUp(T point) const {
    if (isEmpty()) {
        return std::nullopt;
    }
    auto upper = std::upper_bound(m_intervals.begin(), m_intervals.end(), Span(point, point));
    if (upper != m_intervals.begin() && std::prev(upper)->containsPoint(point)) {
        return point;
    }
    if (upper != m_intervals.end()) {
        return upper->lower;
    }
    return std::nullopt;
}

template<typename T>
template<typename F>
void IntervalSet<T>::sweepIntersection(const IntervalSet& other, F visit) const {
    auto l = m_intervals.begin();
    auto r = other.m_intervals.begin();
    while (l != m_intervals.end() && r != other.m_intervals.end()) {
        Span isect = r->intersection(*l);
        if (isect.isValid() && !visit(isect)) {
            return;
        }
        if (l->upper < r->upper) {
            ++l;
        } else {
            ++r;
        }
    }
}

template<typename T>
bool IntervalSet<T>::overlaps(const IntervalSet& other) const {
    bool found = false;
    sweepIntersection(other, [&found](const Span&) {
        found = true;
        return false;
    });
    return found;
}

template<typename T>
IntervalSet<T> IntervalSet<T>::unionWith(const IntervalSet& other) const {
    std::vector<Span> all(m_intervals);
    all.insert(all.end(), other.m_intervals.begin(), other.m_intervals.end());
    return IntervalSet(std::move(all));
}

template<typename T>
IntervalSet<T> IntervalSet<T>::intersection(const IntervalSet& other) const {
    std::vector<Span> result;
    sweepIntersection(other, [&result](const Span& isect) {
        result.emplace_back(isect);
        return true;
    });
    return fromNormalized(std::move(result));
}

template<typename T>
IntervalSet<T> IntervalSet<T>::difference(const IntervalSet& other) const {
    std::vector<Span> result;
    auto next = m_intervals.begin();
    if (next == m_intervals.end()) {
        return IntervalSet();
    }
    // |remainder| is the part of the current interval not yet subtracted from or emitted.
    Span remainder = *next;
    ++next;

    for (const auto& r : other.m_intervals) {
        if (!r.hasLength()) {
            continue;
        }
        while (remainder.upper <= r.lower) {
            result.emplace_back(remainder);
            if (next == m_intervals.end()) {
                return fromNormalized(std::move(result));
            }
            remainder = *next;
            ++next;
        }
        while (remainder.lower < r.upper) {
            if (remainder.lower < r.lower) {
                result.emplace_back(Span(remainder.lower, r.lower));
            }
            if (r.upper < remainder.upper) {
                remainder = Span(r.upper, remainder.upper);
                break;
            }
            // |r| swallows the rest of this interval.
            if (next == m_intervals.end()) {
                return fromNormalized(std::move(result));
            }
            remainder = *next;
            ++next;
        }
    }

    result.emplace_back(remainder);
    result.insert(result.end(), next, m_intervals.end());
    return fromNormalized(std::move(result));
}

template<typename T>
IntervalSet<T> IntervalSet<T>::shifted(T delta) const {
    std::vector<Span> result;
    result.reserve(m_intervals.size());
    for (const auto& interval : m_intervals) {
        result.emplace_back(interval.shifted(delta));
    }
    return fromNormalized(std::move(result));
}

template<typename T>
template<typename E>
std::vector<E> IntervalSet<T>::intersectionIter(const std::vector<std::vector<E>>& sets, T minSize) {
    std::vector<E> result;
    if (sets.size() == 0) {
        return result;
    }

    std::vector<IntervalCursor<E, T>> cursors;
    cursors.reserve(sets.size());
    for (const auto& set : sets) {
        cursors.emplace_back(IntervalCursor<E, T>(&set, minSize));
        if (cursors.back().isDone()) {
            return result;
        }
    }

    while (true) {
        E isect = cursors[0].value();
        bool qualifies = true;
        for (size_t i = 1; i < cursors.size(); ++i) {
            isect = isect.intersection(cursors[i].value());
            if (isect.length() < minSize) {
                qualifies = false;
                break;
            }
        }
        if (qualifies) {
            result.emplace_back(std::move(isect));
        }

        // Advance the cursor ending soonest. Among those, prefer the one that started latest.
        auto soonest = std::min_element(cursors.begin(), cursors.end(),
                                        [](const IntervalCursor<E, T>& a, const IntervalCursor<E, T>& b) {
                                            const E& x = a.value();
                                            const E& y = b.value();
                                            if (x.upper != y.upper) {
                                                return x.upper < y.upper;
                                            }
                                            return x.lower > y.lower;
                                        });
        if (!soonest->advance()) {
            break;
        }
    }

    return result;
}

template<typename T>
std::optional<std::vector<Interval<T>>> IntervalSet<T>::kOfNIntersectionIter(size_t k, T minSize,
                                                                             const std::vector<std::vector<Span>>& sets,
                                                                             ErrorReporter* errorReporter) {
    if (k == 0 || minSize < NumericTraits<T>::zero()) {
        std::string message = fmt::format("Invalid quorum k = {} with minimum size {}", k, minSize);
        if (errorReporter) {
            errorReporter->addValueError(message);
        } else {
            SPDLOG_ERROR("{}", message);
        }
        return std::nullopt;
    }

    std::vector<Span> result;
    if (k == 1) {
        for (const auto& set : sets) {
            for (const auto& interval : set) {
                if (!(interval.length() < minSize)) {
                    result.emplace_back(interval);
                }
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const Span& a, const Span& b) { return a.lower < b.lower; });
        return result;
    }

    using Cursor = IntervalCursor<Span, T>;
    auto endsFirst = [](const Cursor& a, const Cursor& b) {
        const Span& x = a.value();
        const Span& y = b.value();
        return x.upper < y.upper || (x.upper == y.upper && x.lower < y.lower);
    };

    std::vector<Cursor> cursors;
    for (const auto& set : sets) {
        Cursor cursor(&set, minSize);
        if (!cursor.isDone()) {
            cursors.emplace_back(cursor);
        }
    }
    std::stable_sort(cursors.begin(), cursors.end(), endsFirst);

    std::set<std::pair<T, T>> seen;
    while (cursors.size() >= k) {
        // Number of cursors a window may miss and still reach |k| hits.
        size_t slack = cursors.size() - k;
        for (size_t j = 0; j <= slack; ++j) {
            size_t hits = 1;
            size_t misses = j;
            Span isect = cursors[j].value();
            for (size_t i = j + 1; i < cursors.size(); ++i) {
                Span candidate = isect.intersection(cursors[i].value());
                if (!(candidate.length() < minSize)) {
                    ++hits;
                    if (hits >= k && seen.emplace(candidate.lower, candidate.upper).second) {
                        result.emplace_back(candidate);
                    }
                    isect = candidate;
                } else {
                    ++misses;
                    if (misses > slack) {
                        break;
                    }
                }
            }
        }

        // Cursors are sorted, so the front one ends first.
        cursors.front().advance();
        cursors.erase(std::remove_if(cursors.begin(), cursors.end(), [](const Cursor& c) { return c.isDone(); }),
                      cursors.end());
        std::stable_sort(cursors.begin(), cursors.end(), endsFirst);
    }

    return result;
}

extern template class IntervalSet<double>;
extern template class IntervalSet<int64_t>;

} // namespace sked

template<typename T>
struct fmt::formatter<sked::IntervalSet<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const sked::IntervalSet<T>& set, FormatContext& ctx) const {
        auto out = fmt::format_to(ctx.out(), "IntervalSet (");
        bool first = true;
        for (const auto& interval : set) {
            if (!first) {
                out = fmt::format_to(out, ", ");
            }
            out = fmt::format_to(out, "({}, {})", interval.lower, interval.upper);
            first = false;
        }
        return fmt::format_to(out, ")");
    }
};

#endif // SRC_SKED_INTERVAL_SET_HPP_

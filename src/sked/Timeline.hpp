#ifndef SRC_SKED_TIMELINE_HPP_
#define SRC_SKED_TIMELINE_HPP_

#include "sked/ErrorReporter.hpp"
#include "sked/Interval.hpp"
#include "sked/PeriodicSections.hpp"
#include "sked/TimelineSection.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sked {

// A bounded numeric axis managed as a sorted list of disjoint free intervals, for scheduling. Queries return
// TimelineSections, candidates that can be prepared and cut from the free list. Every cut (successful or not) and
// every reset advances the Timeline's sid, which invalidates every section issued before. So the usage pattern is
// always query, decide, cut, and query again.
//
// Timelines are not synchronized. Callers sharing one between threads must hold a lock from query through cut.
template<typename T>
class Timeline {
public:
    using Span = Interval<T>;
    using Section = TimelineSection<T>;

    struct Intersection {
        std::vector<Section> sections;
        T total;
    };

    Timeline() = delete;
    // |epsilon| is the tolerance for matching cut edges against free interval edges. Errors are added to
    // |errorReporter|, a default one is made if none is provided.
    Timeline(T lower, T upper, T epsilon = NumericTraits<T>::defaultEpsilon(),
             std::shared_ptr<ErrorReporter> errorReporter = nullptr);
    Timeline(const Timeline&) = delete;
    Timeline& operator=(const Timeline&) = delete;
    ~Timeline() = default;

    // Returns the pieces of free intervals overlapping |span| at least |minSize| long, with their total length. If
    // nothing qualifies and |minSize| is zero (always the case for a zero-length |span|) returns a single zero-length
    // section at |span|.upper with a total of 1,
    // which cuts as a no-op.
    Intersection intersection(const Span& span, T minSize = T(1)) const;

    // Repeats |span| every |period| up to the end of the Timeline and intersects each repetition. Fails if |span| is
    // longer than |period| or no repetition starts inside the Timeline.
    std::optional<PeriodicSections<T>> intersectionP(const Span& span, T period, T minSize = T(1)) const;

    // As intersectionP, with the repetitions supplied by the caller. They should be periodic with |period| but may
    // jitter.
    std::optional<PeriodicSections<T>> multiIntersection(const std::vector<Span>& spans, T period, T minSize) const;

    // Removes the prepared part of every section from the free list. All sections are checked before anything is
    // removed, so on failure the free list is unchanged. Succeeds or not, all sections issued so far become stale.
    bool cut(std::vector<Section> sections);
    bool cut(const Section& section) { return cut(std::vector<Section>{section}); }
    bool cutP(const PeriodicSections<T>& periodic) { return cut(periodic.toCut()); }

    // Cuts each of |spans| with positive length, each of which must be exactly covered by one free interval. Spans are
    // cut one by one, a failure leaves the preceding ones cut.
    bool snip(const std::vector<Span>& spans);

    // Frees the whole Timeline again.
    void reset();

    const Span& orig() const { return m_orig; }
    const std::vector<Span>& free() const { return m_free; }
    // Total length of the free intervals.
    T length() const;
    uint64_t sid() const { return m_sid; }
    T epsilon() const { return m_epsilon; }
    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

    std::string toString() const { return "Timeline free: " + sked::toString(m_free); }

private:
    bool matches(T a, T b) const { return NumericTraits<T>::abs(a - b) <= m_epsilon; }
    bool withinFree(const Span& free, const Span& piece) const {
        return (free.lower <= piece.lower || matches(free.lower, piece.lower))
            && (piece.upper <= free.upper || matches(free.upper, piece.upper));
    }
    bool validateCut(const Section& section) const;

    Span m_orig;
    std::vector<Span> m_free;
    uint64_t m_sid;
    T m_epsilon;
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

template<typename T>
Timeline<T>::Timeline(T lower, T upper, T epsilon, std::shared_ptr<ErrorReporter> errorReporter):
    m_orig(lower, upper),
    m_sid(0),
    m_epsilon(epsilon),
    m_errorReporter(errorReporter ? std::move(errorReporter) : std::make_shared<ErrorReporter>()) {
    reset();
}

template<typename T>
typename Timeline<T>::Intersection Timeline<T>::intersection(const Span& span, T minSize) const {
    Intersection result{{}, NumericTraits<T>::zero()};
    if (span.hasLength()) {
        auto first = std::upper_bound(m_free.begin(), m_free.end(), Span(span.lower, span.lower));
        if (first != m_free.begin() && std::prev(first)->containsPoint(span.lower)) {
            --first;
        }
        for (auto iter = first; iter != m_free.end(); ++iter) {
            if (iter->lower > span.upper) {
                break;
            }
            Span piece = iter->intersection(span);
            T l = piece.length();
            if (l >= minSize) {
                result.sections.emplace_back(
                    Section(piece, static_cast<size_t>(std::distance(m_free.begin(), iter)), m_sid, this));
                result.total += l;
                if (l == NumericTraits<T>::zero() && minSize == NumericTraits<T>::zero()) {
                    break;
                }
            }
        }
    } else {
        minSize = NumericTraits<T>::zero();
    }

    if (result.sections.empty() && minSize == NumericTraits<T>::zero()) {
        result.sections.emplace_back(Section(Span(span.upper, span.upper), 0, m_sid, this));
        result.total = T(1);
    }
    return result;
}

template<typename T>
std::optional<PeriodicSections<T>> Timeline<T>::intersectionP(const Span& span, T period, T minSize) const {
    if (span.length() > period) {
        m_errorReporter->addTimelineError(
            fmt::format("Length of span must be shorter than period: ({}, {})", span, period));
        return std::nullopt;
    }
    if (!(period > NumericTraits<T>::zero())) {
        m_errorReporter->addValueError(fmt::format("Period {} of span {} must be positive", period, span));
        return std::nullopt;
    }

    std::vector<Span> spans;
    for (Span generation = span; generation.lower < m_orig.upper; generation = generation.shifted(period)) {
        spans.emplace_back(generation);
    }
    if (spans.empty()) {
        m_errorReporter->addValueError(
            fmt::format("Expansion of span {} to period {} must not be empty", span, period));
        return std::nullopt;
    }
    return multiIntersection(spans, period, minSize);
}

template<typename T>
std::optional<PeriodicSections<T>> Timeline<T>::multiIntersection(const std::vector<Span>& spans, T period,
                                                                  T minSize) const {
    if (spans.empty()) {
        m_errorReporter->addValueError("Generations of a periodic span must not be empty");
        return std::nullopt;
    }
    std::vector<std::vector<Section>> generations;
    generations.reserve(spans.size());
    for (const auto& span : spans) {
        generations.emplace_back(intersection(span, minSize).sections);
    }
    return PeriodicSections<T>(period, minSize, std::move(generations), m_errorReporter);
}

template<typename T>
bool Timeline<T>::validateCut(const Section& section) const {
    if (section.timeline() != this) {
        m_errorReporter->addTimelineError(fmt::format("Section {} was issued by another Timeline", section));
        return false;
    }
    if (section.sid() != m_sid) {
        m_errorReporter->addTimelineError(
            fmt::format("Wrong use of Timeline (intersection vs. cut)\n    {} <--> {}", sked::toString(m_free),
                        section.isPrepared() ? fmt::format("{}", *section.toCut()) : fmt::format("{}", section)));
        return false;
    }
    if (!section.isPrepared()) {
        m_errorReporter->addTimelineError(fmt::format("Section {} has no prepared cut", section));
        return false;
    }
    return true;
}

template<typename T>
bool Timeline<T>::cut(std::vector<Section> sections) {
    bool valid = std::all_of(sections.begin(), sections.end(),
                             [this](const Section& section) { return validateCut(section); });

    if (valid) {
        // Apply cuts tail-first, so cutting one piece never moves the free interval another piece refers to.
        std::stable_sort(sections.begin(), sections.end(), [](const Section& a, const Section& b) {
            if (a.index() != b.index()) {
                return a.index() > b.index();
            }
            return *a.toCut() > *b.toCut();
        });
    }

    std::vector<Span> remaining(m_free);
    for (auto section = sections.begin(); valid && section != sections.end(); ++section) {
        const Span& piece = *section->toCut();
        if (!piece.hasLength()) {
            continue;
        }

        size_t index = section->index();
        if (index >= remaining.size() || !withinFree(remaining[index], piece)) {
            m_errorReporter->addTimelineError(fmt::format("Cut {} does not lie within free interval {} of {}", piece,
                                                          index, sked::toString(remaining)));
            valid = false;
            break;
        }

        Span& f = remaining[index];
        if (matches(f.lower, piece.lower)) {
            f = Span(piece.upper, f.upper);
        } else if (matches(f.upper, piece.upper)) {
            f = Span(f.lower, piece.lower);
        } else {
            Span head(f.lower, piece.lower);
            Span tail(piece.upper, f.upper);
            assert(head.hasLength() && tail.hasLength());
            f = head;
            remaining.insert(remaining.begin() + index + 1, tail);
            continue;
        }
        if (!f.hasLength()) {
            remaining.erase(remaining.begin() + index);
        }
    }

    if (valid) {
        SPDLOG_DEBUG("Cut {} sections, free now {}", sections.size(), sked::toString(remaining));
        m_free = std::move(remaining);
    }
    ++m_sid;
    return valid;
}

template<typename T>
bool Timeline<T>::snip(const std::vector<Span>& spans) {
    for (const auto& span : spans) {
        if (!span.hasLength()) {
            continue;
        }
        auto found = intersection(span);
        if (found.sections.size() != 1 || !matches(found.total, span.length())) {
            m_errorReporter->addValueError(
                fmt::format("Span {} is not exactly covered by free intervals {}", span, sked::toString(m_free)));
            return false;
        }
        found.sections.front().prepareCutL(found.total);
        if (!cut(std::move(found.sections))) {
            return false;
        }
    }
    return true;
}

template<typename T>
void Timeline<T>::reset() {
    ++m_sid;
    m_free.clear();
    m_free.emplace_back(m_orig);
    SPDLOG_TRACE("Timeline reset to {}, sid {}", m_orig, m_sid);
}

template<typename T>
T Timeline<T>::length() const {
    T total = NumericTraits<T>::zero();
    for (const auto& interval : m_free) {
        total += interval.length();
    }
    return total;
}

extern template class Timeline<double>;
extern template class Timeline<int64_t>;

} // namespace sked

#endif // SRC_SKED_TIMELINE_HPP_

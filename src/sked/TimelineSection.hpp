#ifndef SRC_SKED_TIMELINE_SECTION_HPP_
#define SRC_SKED_TIMELINE_SECTION_HPP_

#include "sked/Interval.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <optional>
#include <vector>

namespace sked {

template<typename T>
class Timeline;

// A candidate slice of one free interval of a Timeline. Sections are only issued by Timeline queries, and remember the
// Timeline generation (sid) they were issued in. A section stays usable until the next cut or reset of its Timeline.
//
// Before a section can be cut one of the prepareCut* methods must choose the part of it to remove.
template<typename T>
class TimelineSection {
public:
    using Span = Interval<T>;

    TimelineSection() = delete;
    ~TimelineSection() = default;

    const Span& span() const { return m_span; }
    T lower() const { return m_span.lower; }
    T upper() const { return m_span.upper; }
    T length() const { return m_span.length(); }
    // Position of the free interval this section was taken from.
    size_t index() const { return m_index; }
    uint64_t sid() const { return m_sid; }
    const Timeline<T>* timeline() const { return m_timeline; }

    const std::optional<Span>& toCut() const { return m_toCut; }
    bool isPrepared() const { return m_toCut.has_value(); }

    // Anchor a |size|-length window at the lower (L) or upper (U) edge of the section.
    const Span& prepareCutL(T size) {
        m_toCut = Span(m_span.lower, m_span.lower + size);
        return *m_toCut;
    }
    const Span& prepareCutU(T size) {
        m_toCut = Span(m_span.upper - size, m_span.upper);
        return *m_toCut;
    }

    // Choose a |size|-length window as close to |span| as possible, clamped to the section. If |size| exceeds the
    // length of |span| the window may slide by up to the difference towards the section's lower (L) or upper (U)
    // bound.
    const Span& prepareCutAroundL(const Span& span, T size) {
        T jitter = size - span.length();
        T l = jitter <= NumericTraits<T>::zero() ? span.lower : std::max(m_span.lower, span.lower - jitter);
        return prepareCut(Span(l, l + size));
    }
    const Span& prepareCutAroundU(const Span& span, T size) {
        T jitter = size - span.length();
        T u = jitter <= NumericTraits<T>::zero() ? span.upper : std::min(m_span.upper, span.upper + jitter);
        return prepareCut(Span(u - size, u));
    }

private:
    friend class Timeline<T>;

    TimelineSection(Span span, size_t index, uint64_t sid, const Timeline<T>* timeline):
        m_span(span), m_index(index), m_sid(sid), m_timeline(timeline) {}

    const Span& prepareCut(const Span& span) {
        m_toCut = m_span.intersection(span);
        return *m_toCut;
    }

    Span m_span;
    size_t m_index;
    uint64_t m_sid;
    const Timeline<T>* m_timeline;
    std::optional<Span> m_toCut;
};

// Identifies one concrete section of a PeriodicSections by generation and position, and how far it was shifted down
// when reduced modulo the period.
template<typename T>
struct ParentHandle {
    size_t generation;
    size_t section;
    T offset;
};

// A section reduced modulo a period, so that sections of different generations can be compared as if they occupied
// the same period-relative slot. Intersecting two of them keeps the parents of both, so a common slot maps back to
// one concrete section per generation.
template<typename T>
struct SectionModP : public Interval<T> {
    SectionModP() = delete;
    SectionModP(const Interval<T>& span, std::vector<ParentHandle<T>> p): Interval<T>(span), parents(std::move(p)) {}
    ~SectionModP() = default;

    static SectionModP reduce(const TimelineSection<T>& parent, T period, size_t generation, size_t section) {
        Interval<T> reduced = parent.span().modulo(period);
        return SectionModP(reduced, {ParentHandle<T>{generation, section, parent.lower() - reduced.lower}});
    }

    Interval<T> span() const { return Interval<T>(this->lower, this->upper); }

    SectionModP intersection(const SectionModP& other) const {
        std::vector<ParentHandle<T>> merged(parents);
        merged.insert(merged.end(), other.parents.begin(), other.parents.end());
        return SectionModP(Interval<T>::intersection(other), std::move(merged));
    }

    std::vector<ParentHandle<T>> parents;
};

extern template class TimelineSection<double>;
extern template class TimelineSection<int64_t>;
extern template struct SectionModP<double>;
extern template struct SectionModP<int64_t>;

} // namespace sked

template<typename T>
struct fmt::formatter<sked::TimelineSection<T>> {
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const sked::TimelineSection<T>& section, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "({}, {})", section.lower(), section.upper());
    }
};

#endif // SRC_SKED_TIMELINE_SECTION_HPP_

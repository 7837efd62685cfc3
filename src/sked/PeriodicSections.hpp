#ifndef SRC_SKED_PERIODIC_SECTIONS_HPP_
#define SRC_SKED_PERIODIC_SECTIONS_HPP_

#include "sked/ErrorReporter.hpp"
#include "sked/IntervalSet.hpp"
#include "sked/TimelineSection.hpp"

#include "fmt/format.h"

#include <algorithm>
#include <cassert>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace sked {

// The sections found for each repetition ("generation") of a periodic span, as returned by Timeline::intersectionP.
// Offers the period-relative slots shared by all generations and prepares one cut per generation, to be committed
// together with Timeline::cutP.
template<typename T>
class PeriodicSections {
public:
    using Span = Interval<T>;
    using Section = TimelineSection<T>;
    using Generation = std::vector<Section>;

    PeriodicSections() = delete;
    // |generations| must not be empty, Timeline::multiIntersection checks that before constructing.
    PeriodicSections(T period, T minSize, std::vector<Generation> generations,
                     std::shared_ptr<ErrorReporter> errorReporter):
        m_period(period),
        m_minSize(minSize),
        m_generations(std::move(generations)),
        m_errorReporter(std::move(errorReporter)) {
        assert(m_generations.size());
    }
    ~PeriodicSections() = default;

    T period() const { return m_period; }
    T minSize() const { return m_minSize; }
    const std::vector<Generation>& generations() const { return m_generations; }
    typename std::vector<Generation>::const_iterator begin() const { return m_generations.begin(); }
    typename std::vector<Generation>::const_iterator end() const { return m_generations.end(); }
    size_t size() const { return m_generations.size(); }

    // The slots, taken modulo the period, that are free in every generation and at least |minSize| long. Cached per
    // |minSize|.
    const std::vector<SectionModP<T>>& intersectionsModP() { return intersectionsModP(m_minSize); }
    const std::vector<SectionModP<T>>& intersectionsModP(T minSize);

    // The smallest, over all generations, of the longest section in that generation. Cached.
    T minmax();
    bool hasCapacity() { return minmax() > NumericTraits<T>::zero(); }

    // Map the period-relative slot |tsmp| back onto each generation and prepare a |size|-length cut around it, aligned
    // to the lower (L) or upper (U) side. Returns the prepared sections, which also become toCut().
    const std::vector<Section>& prepareCutModPL(const SectionModP<T>& tsmp, T size) {
        return prepareCutModP(tsmp, size, [](Section& s, const Span& span, T sz) { s.prepareCutAroundL(span, sz); });
    }
    const std::vector<Section>& prepareCutModPU(const SectionModP<T>& tsmp, T size) {
        return prepareCutModP(tsmp, size, [](Section& s, const Span& span, T sz) { s.prepareCutAroundU(span, sz); });
    }

    // Without any period alignment, prepare a |size|-length cut at the lower edge of the longest section of every
    // generation. Fails if a generation has no sections.
    bool prepareCutSomewhere(T size);

    const std::vector<Section>& toCut() const { return m_toCut; }

private:
    template<typename F>
    const std::vector<Section>& prepareCutModP(const SectionModP<T>& tsmp, T size, F preparer);

    T m_period;
    T m_minSize;
    std::vector<Generation> m_generations;
    std::shared_ptr<ErrorReporter> m_errorReporter;

    std::map<T, std::vector<SectionModP<T>>> m_intersectionsModP;
    std::optional<T> m_minmax;
    std::vector<Section> m_toCut;
};

template<typename T>
const std::vector<SectionModP<T>>& PeriodicSections<T>::intersectionsModP(T minSize) {
    auto cached = m_intersectionsModP.find(minSize);
    if (cached != m_intersectionsModP.end()) {
        return cached->second;
    }

    std::vector<std::vector<SectionModP<T>>> reduced;
    reduced.reserve(m_generations.size());
    for (size_t g = 0; g < m_generations.size(); ++g) {
        std::vector<SectionModP<T>> generation;
        generation.reserve(m_generations[g].size());
        for (size_t s = 0; s < m_generations[g].size(); ++s) {
            generation.emplace_back(SectionModP<T>::reduce(m_generations[g][s], m_period, g, s));
        }
        reduced.emplace_back(std::move(generation));
    }

    auto inserted = m_intersectionsModP.emplace(minSize, IntervalSet<T>::intersectionIter(reduced, minSize));
    return inserted.first->second;
}

template<typename T>
T PeriodicSections<T>::minmax() {
    if (!m_minmax) {
        std::optional<T> result;
        for (const auto& generation : m_generations) {
            T longest = NumericTraits<T>::zero();
            for (const auto& section : generation) {
                longest = std::max(longest, section.length());
            }
            if (!result || longest < *result) {
                result = longest;
            }
        }
        m_minmax = result;
    }
    return *m_minmax;
}

template<typename T>
bool PeriodicSections<T>::prepareCutSomewhere(T size) {
    m_toCut.clear();
    for (auto& generation : m_generations) {
        if (generation.empty()) {
            m_errorReporter->addValueError(
                fmt::format("Generations of a periodic span must not be empty to cut {} somewhere", size));
            m_toCut.clear();
            return false;
        }
        auto longest = std::max_element(generation.begin(), generation.end(),
                                        [](const Section& a, const Section& b) { return a.length() < b.length(); });
        longest->prepareCutAroundL(longest->span(), size);
        m_toCut.emplace_back(*longest);
    }
    return true;
}

template<typename T>
template<typename F>
const std::vector<TimelineSection<T>>& PeriodicSections<T>::prepareCutModP(const SectionModP<T>& tsmp, T size,
                                                                           F preparer) {
    m_toCut.clear();
    for (const auto& parent : tsmp.parents) {
        assert(parent.generation < m_generations.size());
        assert(parent.section < m_generations[parent.generation].size());
        Section& section = m_generations[parent.generation][parent.section];
        preparer(section, tsmp.span().shifted(parent.offset), size);
        m_toCut.emplace_back(section);
    }
    return m_toCut;
}

extern template class PeriodicSections<double>;
extern template class PeriodicSections<int64_t>;

} // namespace sked

#endif // SRC_SKED_PERIODIC_SECTIONS_HPP_

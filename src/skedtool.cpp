// skedtool, command line driver for a sked Timeline. Blocks out the --snip spans, then either lists the free sections
// of the --query span, or finds a slot repeating every --period and optionally cuts it.
#include "sked/ErrorReporter.hpp"
#include "sked/Interval.hpp"
#include "sked/PeriodicSections.hpp"
#include "sked/SpanParser.hpp"
#include "sked/Timeline.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

DEFINE_double(lower, 0, "Lower bound of the timeline.");
DEFINE_double(upper, 1440, "Upper bound of the timeline.");
DEFINE_double(epsilon, 0.001, "Tolerance when matching cut edges against free intervals.");
DEFINE_string(snip, "", "Spans to remove from the timeline before querying, as lower:upper,lower:upper.");
DEFINE_string(query, "", "Span to intersect with the free intervals, as lower:upper.");
DEFINE_double(minSize, 1, "Minimum length of a free section to report.");
DEFINE_double(period, 0, "If nonzero, repeat the query span every period up to the end of the timeline.");
DEFINE_double(cutSize, 0, "If nonzero, cut a slot of this length from every repetition of a periodic query.");
DEFINE_string(align, "l", "Align periodic cuts to the lower (l) or upper (u) edge of the matched slot.");
DEFINE_bool(verbose, false, "Log cut and snip activity.");

namespace {

void printSections(const std::vector<sked::TimelineSection<double>>& sections) {
    for (const auto& section : sections) {
        std::cout << fmt::format("    {} in free interval {}", section, section.index()) << std::endl;
    }
}

bool runPeriodic(sked::Timeline<double>& timeline, const sked::Interval<double>& span) {
    auto periodic = timeline.intersectionP(span, FLAGS_period, FLAGS_minSize);
    if (!periodic) {
        return false;
    }

    size_t generation = 0;
    for (const auto& sections : *periodic) {
        std::cout << fmt::format("generation {}:", generation) << std::endl;
        printSections(sections);
        ++generation;
    }
    std::cout << fmt::format("minmax: {}", periodic->minmax()) << std::endl;

    const auto& matches = periodic->intersectionsModP();
    for (const auto& match : matches) {
        std::cout << fmt::format("match modulo {}: {}", FLAGS_period, match.span()) << std::endl;
    }

    if (FLAGS_cutSize <= 0) {
        return true;
    }
    if (matches.size()) {
        if (FLAGS_align == "u") {
            periodic->prepareCutModPU(matches.front(), FLAGS_cutSize);
        } else {
            periodic->prepareCutModPL(matches.front(), FLAGS_cutSize);
        }
    } else {
        spdlog::warn("No slot is free in every generation, cutting in the longest section of each instead.");
        if (!periodic->prepareCutSomewhere(FLAGS_cutSize)) {
            return false;
        }
    }
    return timeline.cutP(*periodic);
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    spdlog::set_level(FLAGS_verbose ? spdlog::level::trace : spdlog::level::warn);

    if (FLAGS_align != "l" && FLAGS_align != "u") {
        spdlog::error("--align must be 'l' or 'u', got '{}'", FLAGS_align);
        return -1;
    }
    if (FLAGS_upper < FLAGS_lower) {
        spdlog::error("Timeline upper bound {} is below lower bound {}", FLAGS_upper, FLAGS_lower);
        return -1;
    }

    auto errorReporter = std::make_shared<sked::ErrorReporter>();
    sked::Timeline<double> timeline(FLAGS_lower, FLAGS_upper, FLAGS_epsilon, errorReporter);

    sked::SpanParser snips(FLAGS_snip, errorReporter);
    if (!snips.parse() || !timeline.snip(snips.spans())) {
        spdlog::error("Failed to snip '{}'", FLAGS_snip);
        return -1;
    }

    if (FLAGS_query.size()) {
        sked::SpanParser query(FLAGS_query, errorReporter);
        if (!query.parse()) {
            return -1;
        }
        if (query.spans().size() != 1) {
            spdlog::error("--query takes exactly one span, got '{}'", FLAGS_query);
            return -1;
        }
        const auto& span = query.spans().front();

        if (FLAGS_period > 0) {
            if (!runPeriodic(timeline, span)) {
                spdlog::error("Periodic query of {} every {} failed", span, FLAGS_period);
                return -1;
            }
        } else {
            auto found = timeline.intersection(span, FLAGS_minSize);
            std::cout << fmt::format("sections of {}, total {}:", span, found.total) << std::endl;
            printSections(found.sections);
        }
    }

    std::cout << timeline.toString() << std::endl;
    return errorReporter->ok() ? 0 : -1;
}

#include "sked/TimelineSection.hpp"

#include "sked/Timeline.hpp"

#include "doctest/doctest.h"

namespace sked {

TEST_CASE("TimelineSection Prepare") {
    Timeline<double> tl(0, 1000);
    auto found = tl.intersection(Interval<double>(100, 200));
    REQUIRE(found.sections.size() == 1);
    TimelineSection<double> section = found.sections.front();

    SUBCASE("issued by the timeline") {
        CHECK(section.span() == Interval<double>(100, 200));
        CHECK(section.length() == 100);
        CHECK(section.index() == 0);
        CHECK(section.sid() == tl.sid());
        CHECK(section.timeline() == &tl);
        CHECK(!section.isPrepared());
        CHECK(fmt::format("{}", section) == "(100, 200)");
    }

    SUBCASE("at the edges") {
        CHECK(section.prepareCutL(30) == Interval<double>(100, 130));
        CHECK(section.isPrepared());
        CHECK(*section.toCut() == Interval<double>(100, 130));
        CHECK(section.prepareCutU(30) == Interval<double>(170, 200));
        CHECK(*section.toCut() == Interval<double>(170, 200));
    }

    SUBCASE("around a span without jitter") {
        CHECK(section.prepareCutAroundL(Interval<double>(120, 130), 10) == Interval<double>(120, 130));
        CHECK(section.prepareCutAroundU(Interval<double>(120, 130), 10) == Interval<double>(120, 130));
        CHECK(section.prepareCutAroundL(Interval<double>(190, 200), 5) == Interval<double>(190, 195));
        CHECK(section.prepareCutAroundU(Interval<double>(190, 200), 5) == Interval<double>(195, 200));
    }

    SUBCASE("around a span with jitter") {
        CHECK(section.prepareCutAroundL(Interval<double>(120, 130), 30) == Interval<double>(100, 130));
        CHECK(section.prepareCutAroundL(Interval<double>(110, 130), 40) == Interval<double>(100, 140));
        CHECK(section.prepareCutAroundU(Interval<double>(170, 180), 30) == Interval<double>(170, 200));
        CHECK(section.prepareCutAroundU(Interval<double>(100, 105), 20) == Interval<double>(100, 120));
    }

    SUBCASE("clamped to the section") {
        CHECK(section.prepareCutAroundL(Interval<double>(190, 210), 20) == Interval<double>(190, 200));
        CHECK(section.prepareCutAroundU(Interval<double>(90, 110), 20) == Interval<double>(100, 110));
    }
}

TEST_CASE("SectionModP") {
    Timeline<int64_t> tl(0, 1000);
    auto first = tl.intersection(Interval<int64_t>(50, 100));
    auto second = tl.intersection(Interval<int64_t>(460, 500));
    REQUIRE(first.sections.size() == 1);
    REQUIRE(second.sections.size() == 1);

    SUBCASE("reduce") {
        auto reduced = SectionModP<int64_t>::reduce(second.sections.front(), 400, 1, 0);
        CHECK(reduced.span() == Interval<int64_t>(60, 100));
        REQUIRE(reduced.parents.size() == 1);
        CHECK(reduced.parents[0].generation == 1);
        CHECK(reduced.parents[0].section == 0);
        CHECK(reduced.parents[0].offset == 400);
    }

    SUBCASE("intersection merges parents") {
        auto a = SectionModP<int64_t>::reduce(first.sections.front(), 400, 0, 0);
        auto b = SectionModP<int64_t>::reduce(second.sections.front(), 400, 1, 0);
        auto isect = a.intersection(b);
        CHECK(isect.span() == Interval<int64_t>(60, 100));
        REQUIRE(isect.parents.size() == 2);
        CHECK(isect.parents[0].generation == 0);
        CHECK(isect.parents[0].offset == 0);
        CHECK(isect.parents[1].generation == 1);
        CHECK(isect.parents[1].offset == 400);
        // Mapping the slot back through each parent lands inside that parent's section.
        CHECK(first.sections.front().span().contains(isect.span().shifted(isect.parents[0].offset)));
        CHECK(second.sections.front().span().contains(isect.span().shifted(isect.parents[1].offset)));
    }
}

} // namespace sked

#include "sked/PeriodicSections.hpp"

#include "sked/Timeline.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <vector>

namespace sked {

namespace {

using Span = Interval<double>;

std::vector<std::vector<Span>> generationSpans(const PeriodicSections<double>& periodic) {
    std::vector<std::vector<Span>> result;
    for (const auto& generation : periodic) {
        std::vector<Span> spans;
        for (const auto& section : generation) {
            spans.emplace_back(section.span());
        }
        result.emplace_back(std::move(spans));
    }
    return result;
}

std::vector<Span> preparedCuts(const PeriodicSections<double>& periodic) {
    std::vector<Span> result;
    for (const auto& section : periodic.toCut()) {
        result.emplace_back(*section.toCut());
    }
    return result;
}

} // namespace

TEST_CASE("PeriodicSections ModP") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<double> tl(0, 1000, 0.001, errorReporter);
    REQUIRE(tl.snip({Span(100, 120), Span(300, 330), Span(360, 370), Span(550, 590)}));
    REQUIRE(tl.free() == std::vector<Span>{Span(0, 100), Span(120, 300), Span(330, 360), Span(370, 550),
                                           Span(590, 1000)});

    auto periodic = tl.intersectionP(Span(50, 150), 250);
    REQUIRE(periodic);

    SUBCASE("generations") {
        CHECK(periodic->period() == 250);
        CHECK(periodic->minSize() == 1);
        CHECK(generationSpans(*periodic)
              == std::vector<std::vector<Span>>{{Span(50, 100), Span(120, 150)},
                                                {Span(330, 360), Span(370, 400)},
                                                {Span(590, 650)},
                                                {Span(800, 900)}});
        CHECK(periodic->minmax() == 30);
        CHECK(periodic->hasCapacity());
    }

    SUBCASE("matches modulo period") {
        const auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 2);
        CHECK(matches[0].span() == Span(90, 100));
        CHECK(matches[1].span() == Span(120, 150));

        // One parent per generation.
        REQUIRE(matches[0].parents.size() == 4);
        for (size_t g = 0; g < 4; ++g) {
            CHECK(matches[0].parents[g].generation == g);
            CHECK(matches[0].parents[g].offset == 250 * static_cast<double>(g));
        }
        CHECK(matches[1].parents[0].section == 1);
        CHECK(matches[1].parents[1].section == 1);

        // Cached per minimum size.
        CHECK(&periodic->intersectionsModP() == &matches);
        CHECK(&periodic->intersectionsModP(1) == &matches);
        const auto& wide = periodic->intersectionsModP(20);
        REQUIRE(wide.size() == 1);
        CHECK(wide[0].span() == Span(120, 150));
    }

    SUBCASE("cut lower aligned") {
        const auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 2);
        periodic->prepareCutModPL(matches[0], 30);
        CHECK(preparedCuts(*periodic) == std::vector<Span>{Span(70, 100), Span(330, 360), Span(590, 620),
                                                           Span(820, 850)});
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString() == "Timeline free: [(0, 70), (120, 300), (370, 550), (620, 820), (850, 1000)]");
    }

    SUBCASE("cut upper aligned") {
        const auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 2);
        periodic->prepareCutModPU(matches[0], 25);
        CHECK(preparedCuts(*periodic) == std::vector<Span>{Span(75, 100), Span(335, 360), Span(590, 615),
                                                           Span(840, 865)});
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString()
              == "Timeline free: [(0, 75), (120, 300), (330, 335), (370, 550), (615, 840), (865, 1000)]");
    }

    SUBCASE("cut second match") {
        const auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 2);
        periodic->prepareCutModPL(matches[1], 30);
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString()
              == "Timeline free: [(0, 100), (150, 300), (330, 360), (400, 550), (590, 620), (650, 870), (900, 1000)]");
        CHECK(errorReporter->ok());
    }

    SUBCASE("cut somewhere") {
        REQUIRE(periodic->prepareCutSomewhere(20));
        CHECK(preparedCuts(*periodic) == std::vector<Span>{Span(50, 70), Span(330, 350), Span(590, 610),
                                                           Span(800, 820)});
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString()
              == "Timeline free: [(0, 50), (70, 100), (120, 300), (350, 360), (370, 550), (610, 800), (820, 1000)]");
    }

    SUBCASE("prepared cuts go stale") {
        const auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 2);
        periodic->prepareCutModPL(matches[0], 30);
        CHECK(tl.cutP(*periodic));
        CHECK(!tl.cutP(*periodic));
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kTimeline);
    }

    SUBCASE("narrower free space") {
        REQUIRE(tl.snip({Span(70, 100), Span(120, 130)}));
        CHECK(tl.toString() == "Timeline free: [(0, 70), (130, 300), (330, 360), (370, 550), (590, 1000)]");
        auto narrower = tl.intersectionP(Span(50, 150), 250);
        REQUIRE(narrower);
        CHECK(narrower->minmax() == 20);
        CHECK(generationSpans(*narrower)
              == std::vector<std::vector<Span>>{{Span(50, 70), Span(130, 150)},
                                                {Span(330, 360), Span(370, 400)},
                                                {Span(590, 650)},
                                                {Span(800, 900)}});
        const auto& matches = narrower->intersectionsModP();
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].span() == Span(130, 150));
    }
}

TEST_CASE("PeriodicSections Empty Generation") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<double> tl(0, 1000, 0.001, errorReporter);
    REQUIRE(tl.snip({Span(400, 500)}));

    auto periodic = tl.intersectionP(Span(0, 100), 400, 10);
    REQUIRE(periodic);
    REQUIRE(periodic->size() == 3);
    CHECK(periodic->generations()[1].empty());
    CHECK(periodic->minmax() == 0);
    CHECK(!periodic->hasCapacity());
    CHECK(periodic->intersectionsModP().empty());

    CHECK(!periodic->prepareCutSomewhere(10));
    CHECK(periodic->toCut().empty());
    CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kValue);
}

} // namespace sked

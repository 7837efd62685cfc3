#include "sked/Timeline.hpp"

#include "doctest/doctest.h"
#include "spdlog/sinks/ringbuffer_sink.h"
#include "spdlog/spdlog.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sked {

namespace {

template<typename T>
T cutLength(const std::vector<TimelineSection<T>>& sections) {
    T total = T(0);
    for (const auto& section : sections) {
        total += section.toCut()->length();
    }
    return total;
}

} // namespace

TEST_CASE("Timeline Intersection") {
    Timeline<double> tl(0, 1000, 0.001, std::make_shared<ErrorReporter>(true));

    SUBCASE("fresh timeline") {
        CHECK(tl.orig() == Interval<double>(0, 1000));
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
        CHECK(tl.length() == 1000);
        CHECK(tl.epsilon() == 0.001);
        CHECK(tl.toString() == "Timeline free: [(0, 1000)]");
    }

    SUBCASE("sections carry their free interval") {
        REQUIRE(tl.snip({Interval<double>(100, 150), Interval<double>(300, 400)}));
        auto found = tl.intersection(Interval<double>(120, 500));
        REQUIRE(found.sections.size() == 2);
        CHECK(found.sections[0].span() == Interval<double>(150, 300));
        CHECK(found.sections[0].index() == 1);
        CHECK(found.sections[1].span() == Interval<double>(400, 500));
        CHECK(found.sections[1].index() == 2);
        CHECK(found.total == 250);
    }

    SUBCASE("minimum size filters pieces") {
        REQUIRE(tl.snip({Interval<double>(100, 150)}));
        auto found = tl.intersection(Interval<double>(90, 300), 20);
        REQUIRE(found.sections.size() == 1);
        CHECK(found.sections[0].span() == Interval<double>(150, 300));
        CHECK(found.total == 150);
    }

    SUBCASE("zero length span returns sentinel") {
        auto found = tl.intersection(Interval<double>(0, 0));
        REQUIRE(found.sections.size() == 1);
        CHECK(found.sections[0].span() == Interval<double>(0, 0));
        CHECK(found.sections[0].index() == 0);
        CHECK(found.total == 1);
    }

    SUBCASE("sentinel only with zero minimum") {
        REQUIRE(tl.snip({Interval<double>(100, 200)}));
        CHECK(tl.intersection(Interval<double>(120, 180)).sections.empty());
        auto found = tl.intersection(Interval<double>(120, 180), 0);
        REQUIRE(found.sections.size() == 1);
        CHECK(found.sections[0].span() == Interval<double>(180, 180));
        CHECK(found.total == 1);
    }
}

TEST_CASE("Timeline Cut") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<double> tl(0, 1000, 0.001, errorReporter);

    SUBCASE("sequence of cuts") {
        auto found = tl.intersection(Interval<double>(0, 0));
        REQUIRE(found.sections.size() == 1);
        found.sections[0].prepareCutL(0);
        CHECK(tl.cut(found.sections));
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});

        found = tl.intersection(Interval<double>(100, 300));
        REQUIRE(found.sections.size() == 1);
        found.sections[0].prepareCutL(50);
        CHECK(tl.cut(found.sections));
        CHECK(tl.toString() == "Timeline free: [(0, 100), (150, 1000)]");

        found = tl.intersection(Interval<double>(80, 120));
        REQUIRE(found.sections.size() == 1);
        CHECK(found.sections[0].span() == Interval<double>(80, 100));
        CHECK(found.total == 20);

        found = tl.intersection(Interval<double>(70, 100));
        REQUIRE(found.sections.size() == 1);
        found.sections[0].prepareCutU(15);
        CHECK(tl.cut(found.sections));
        CHECK(tl.toString() == "Timeline free: [(0, 85), (150, 1000)]");

        found = tl.intersection(Interval<double>(150, 200));
        REQUIRE(found.sections.size() == 1);
        found.sections[0].prepareCutL(50);
        CHECK(tl.cut(found.sections[0]));
        CHECK(tl.toString() == "Timeline free: [(0, 85), (200, 1000)]");

        found = tl.intersection(Interval<double>(500, 600));
        REQUIRE(found.sections.size() == 1);
        found.sections[0].prepareCutL(50);
        CHECK(tl.cut(found.sections));
        CHECK(tl.toString() == "Timeline free: [(0, 85), (200, 500), (550, 1000)]");

        found = tl.intersection(Interval<double>(50, 300));
        REQUIRE(found.sections.size() == 2);
        CHECK(found.sections[0].span() == Interval<double>(50, 85));
        CHECK(found.sections[1].span() == Interval<double>(200, 300));
        found.sections[0].prepareCutU(15);
        found.sections[1].prepareCutL(15);
        CHECK(tl.cut(found.sections));
        CHECK(tl.toString() == "Timeline free: [(0, 70), (215, 500), (550, 1000)]");
        CHECK(errorReporter->ok());

        // The sections are stale now.
        CHECK(!tl.cut(found.sections));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kTimeline);
        CHECK(errorReporter->lastError().message.find("Wrong use of Timeline (intersection vs. cut)") == 0);
        CHECK(tl.toString() == "Timeline free: [(0, 70), (215, 500), (550, 1000)]");
    }

    SUBCASE("several cuts in one free interval") {
        auto found = tl.intersection(Interval<double>(100, 900));
        REQUIRE(found.sections.size() == 1);
        TimelineSection<double> low = found.sections[0];
        TimelineSection<double> middle = found.sections[0];
        TimelineSection<double> high = found.sections[0];
        low.prepareCutL(50);
        middle.prepareCutAroundL(Interval<double>(400, 500), 100);
        high.prepareCutU(100);
        CHECK(tl.cut({low, middle, high}));
        CHECK(tl.free()
              == std::vector<Interval<double>>{Interval<double>(0, 100), Interval<double>(150, 400),
                                               Interval<double>(500, 800), Interval<double>(900, 1000)});
    }

    SUBCASE("cut length is conserved") {
        double cut = 0;
        for (auto span : {Interval<double>(10, 90), Interval<double>(200, 700), Interval<double>(650, 800)}) {
            auto found = tl.intersection(span);
            for (auto& section : found.sections) {
                section.prepareCutAroundL(Interval<double>(section.lower() + 5, section.lower() + 15), 10);
            }
            REQUIRE(tl.cut(found.sections));
            cut += cutLength(found.sections);
            CHECK(tl.length() + cut == tl.orig().length());
        }
    }

    SUBCASE("every cut attempt advances sid") {
        uint64_t sid = tl.sid();
        auto found = tl.intersection(Interval<double>(100, 200));
        CHECK(found.sections[0].sid() == sid);
        found.sections[0].prepareCutL(10);
        CHECK(tl.cut(found.sections));
        CHECK(tl.sid() == sid + 1);
        CHECK(!tl.cut(found.sections));
        CHECK(tl.sid() == sid + 2);
        CHECK(tl.cut(std::vector<TimelineSection<double>>{}));
        CHECK(tl.sid() == sid + 3);
    }

    SUBCASE("failed cut changes nothing") {
        auto found = tl.intersection(Interval<double>(100, 300));
        REQUIRE(found.sections.size() == 1);
        TimelineSection<double> good = found.sections[0];
        TimelineSection<double> unprepared = found.sections[0];
        good.prepareCutL(50);
        CHECK(!tl.cut({good, unprepared}));
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kTimeline);
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
    }

    SUBCASE("overlapping cuts fail as a whole") {
        auto found = tl.intersection(Interval<double>(100, 300));
        REQUIRE(found.sections.size() == 1);
        TimelineSection<double> first = found.sections[0];
        TimelineSection<double> second = found.sections[0];
        first.prepareCutL(100);
        second.prepareCutL(50);
        CHECK(!tl.cut({first, second}));
        CHECK(errorReporter->lastError().message.find("does not lie within free interval") != std::string::npos);
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
    }

    SUBCASE("sections of another timeline") {
        Timeline<double> other(0, 1000, 0.001, errorReporter);
        auto found = other.intersection(Interval<double>(100, 300));
        found.sections[0].prepareCutL(50);
        CHECK(!tl.cut(found.sections));
        CHECK(errorReporter->lastError().message.find("another Timeline") != std::string::npos);
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
    }

    SUBCASE("reset") {
        REQUIRE(tl.snip({Interval<double>(100, 200)}));
        auto found = tl.intersection(Interval<double>(300, 400));
        found.sections[0].prepareCutL(10);
        uint64_t sid = tl.sid();
        tl.reset();
        CHECK(tl.sid() == sid + 1);
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
        CHECK(!tl.cut(found.sections));
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 1000)});
    }
}

TEST_CASE("Timeline Snip") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<double> tl(0, 100, 0.001, errorReporter);

    SUBCASE("query after snips") {
        uint64_t sid = tl.sid();
        REQUIRE(tl.snip({Interval<double>(5, 7), Interval<double>(10, 20), Interval<double>(23, 37),
                         Interval<double>(42, 100)}));
        CHECK(tl.sid() == sid + 4);
        CHECK(tl.toString() == "Timeline free: [(0, 5), (7, 10), (20, 23), (37, 42)]");

        auto found = tl.intersection(Interval<double>(0, 50), 6);
        CHECK(found.sections.empty());
        CHECK(found.total == 0);

        found = tl.intersection(Interval<double>(0, 50), 4);
        REQUIRE(found.sections.size() == 2);
        CHECK(found.sections[0].span() == Interval<double>(0, 5));
        CHECK(found.sections[1].span() == Interval<double>(37, 42));
        CHECK(found.total == 10);

        found = tl.intersection(Interval<double>(0, 50), 3);
        REQUIRE(found.sections.size() == 4);
        CHECK(found.sections[1].span() == Interval<double>(7, 10));
        CHECK(found.sections[2].span() == Interval<double>(20, 23));
        CHECK(found.total == 16);
    }

    SUBCASE("snips on a longer timeline") {
        Timeline<double> day(0, 1000, 0.001, errorReporter);
        REQUIRE(day.snip({Interval<double>(10, 20), Interval<double>(25, 25), Interval<double>(42, 400),
                          Interval<double>(900, 990)}));
        CHECK(day.toString() == "Timeline free: [(0, 10), (20, 42), (400, 900), (990, 1000)]");

        REQUIRE(day.snip({Interval<double>(995, 1000), Interval<double>(5, 7), Interval<double>(400, 410),
                          Interval<double>(23, 37)}));
        CHECK(day.toString() == "Timeline free: [(0, 5), (7, 10), (20, 23), (37, 42), (410, 900), (990, 995)]");

        auto found = day.intersection(Interval<double>(0, 50), 4);
        REQUIRE(found.sections.size() == 2);
        CHECK(found.sections[0].span() == Interval<double>(0, 5));
        CHECK(found.sections[1].span() == Interval<double>(37, 42));
        CHECK(found.total == 10);
        CHECK(errorReporter->ok());
    }

    SUBCASE("zero length spans are skipped") {
        uint64_t sid = tl.sid();
        CHECK(tl.snip({Interval<double>(30, 30)}));
        CHECK(tl.sid() == sid);
        CHECK(tl.free() == std::vector<Interval<double>>{Interval<double>(0, 100)});
    }

    SUBCASE("span must be covered by free space") {
        REQUIRE(tl.snip({Interval<double>(10, 20)}));
        CHECK(!tl.snip({Interval<double>(15, 30)}));
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kValue);
        CHECK(!tl.snip({Interval<double>(5, 25)}));
        CHECK(errorReporter->errorCount(ErrorReporter::Kind::kValue) == 2);
        CHECK(tl.toString() == "Timeline free: [(0, 10), (20, 100)]");
    }

    SUBCASE("earlier spans stay snipped on failure") {
        CHECK(!tl.snip({Interval<double>(10, 20), Interval<double>(15, 30), Interval<double>(40, 50)}));
        CHECK(tl.toString() == "Timeline free: [(0, 10), (20, 100)]");
    }
}

TEST_CASE("Timeline Integral") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<int64_t> tl(0, 1440, NumericTraits<int64_t>::defaultEpsilon(), errorReporter);
    CHECK(tl.epsilon() == 0);

    SUBCASE("exact edges") {
        REQUIRE(tl.snip({Interval<int64_t>(0, 480), Interval<int64_t>(720, 780), Interval<int64_t>(1080, 1440)}));
        CHECK(tl.toString() == "Timeline free: [(480, 720), (780, 1080)]");
        auto found = tl.intersection(Interval<int64_t>(600, 900), 60);
        REQUIRE(found.sections.size() == 2);
        CHECK(found.total == 240);
        found.sections[0].prepareCutU(30);
        found.sections[1].prepareCutL(30);
        CHECK(tl.cut(found.sections));
        CHECK(tl.toString() == "Timeline free: [(480, 690), (810, 1080)]");
        CHECK(tl.length() + 480 + 60 + 360 + 60 == tl.orig().length());
    }

    SUBCASE("periodic") {
        auto periodic = tl.intersectionP(Interval<int64_t>(60, 120), 360);
        REQUIRE(periodic);
        CHECK(periodic->size() == 4);
        auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 1);
        periodic->prepareCutModPU(matches[0], 15);
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString() == "Timeline free: [(0, 105), (120, 465), (480, 825), (840, 1185), (1200, 1440)]");
    }
}

TEST_CASE("Timeline Periodic") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Timeline<double> tl(0, 1000, 0.001, errorReporter);

    SUBCASE("generations") {
        auto periodic = tl.intersectionP(Interval<double>(50, 100), 400);
        REQUIRE(periodic);
        REQUIRE(periodic->size() == 3);
        CHECK(periodic->period() == 400);
        const auto& generations = periodic->generations();
        for (size_t g = 0; g < generations.size(); ++g) {
            REQUIRE(generations[g].size() == 1);
            CHECK(generations[g][0].index() == 0);
            CHECK(generations[g][0].span() == Interval<double>(50, 100).shifted(400 * static_cast<double>(g)));
        }
    }

    SUBCASE("left aligned cut in every generation") {
        auto periodic = tl.intersectionP(Interval<double>(50, 100), 400);
        REQUIRE(periodic);
        REQUIRE(periodic->size() == 3);
        auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].span() == Interval<double>(50, 100));
        const auto& prepared = periodic->prepareCutModPL(matches[0], 50);
        REQUIRE(prepared.size() == 3);
        CHECK(prepared[2].toCut() == Interval<double>(850, 900));
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString() == "Timeline free: [(0, 50), (100, 450), (500, 850), (900, 1000)]");
        CHECK(errorReporter->ok());
    }

    SUBCASE("span longer than period") {
        CHECK(!tl.intersectionP(Interval<double>(50, 100), 40));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kTimeline);
        CHECK(errorReporter->lastError().message == "Length of span must be shorter than period: ((50, 100), 40)");
    }

    SUBCASE("empty expansion") {
        CHECK(!tl.intersectionP(Interval<double>(1000, 1010), 100));
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kValue);
        CHECK(!tl.intersectionP(Interval<double>(10, 10), 0));
        CHECK(errorReporter->errorCount(ErrorReporter::Kind::kValue) == 2);
        CHECK(!tl.multiIntersection({}, 100, 1));
        CHECK(errorReporter->errorCount(ErrorReporter::Kind::kValue) == 3);
    }

    SUBCASE("jittered generations") {
        auto periodic = tl.multiIntersection(
            {Interval<double>(50, 100), Interval<double>(455, 505), Interval<double>(845, 895)}, 400, 1);
        REQUIRE(periodic);
        auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 1);
        CHECK(matches[0].span() == Interval<double>(55, 95));
        periodic->prepareCutModPL(matches[0], 20);
        CHECK(tl.cutP(*periodic));
        CHECK(tl.toString() == "Timeline free: [(0, 55), (75, 455), (475, 855), (875, 1000)]");
    }

    SUBCASE("periodic cut is stale after another cut") {
        auto periodic = tl.intersectionP(Interval<double>(50, 100), 400);
        REQUIRE(periodic);
        REQUIRE(tl.snip({Interval<double>(500, 600)}));
        auto& matches = periodic->intersectionsModP();
        REQUIRE(matches.size() == 1);
        periodic->prepareCutModPL(matches[0], 10);
        CHECK(!tl.cutP(*periodic));
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kTimeline);
        CHECK(tl.toString() == "Timeline free: [(0, 500), (600, 1000)]");
    }
}

TEST_CASE("Timeline Logging") {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    auto logger = std::make_shared<spdlog::logger>("sked", sink);
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("%v");
    auto previous = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    Timeline<double> tl(0, 100, 0.001, std::make_shared<ErrorReporter>(true));
    CHECK(tl.snip({Interval<double>(10, 20)}));

    spdlog::set_default_logger(previous);
    std::string lines;
    for (const auto& line : sink->last_formatted()) {
        lines += line;
    }
    CHECK(lines.find("Timeline reset to (0, 100)") != std::string::npos);
    CHECK(lines.find("Cut 1 sections, free now [(0, 10), (20, 100)]") != std::string::npos);
}

} // namespace sked

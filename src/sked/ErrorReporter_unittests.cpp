#include "sked/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "spdlog/sinks/ringbuffer_sink.h"
#include "spdlog/spdlog.h"

#include <memory>
#include <string>

namespace sked {

TEST_CASE("ErrorReporter") {
    SUBCASE("starts empty") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
        CHECK(er.errors().empty());
    }
    SUBCASE("counts by kind") {
        ErrorReporter er(true);
        er.addTimelineError("stale section");
        er.addValueError("not covered");
        er.addValueError("empty generation");
        CHECK(!er.ok());
        CHECK(er.errorCount() == 3);
        CHECK(er.errorCount(ErrorReporter::Kind::kTimeline) == 1);
        CHECK(er.errorCount(ErrorReporter::Kind::kValue) == 2);
        CHECK(er.lastError().kind == ErrorReporter::Kind::kValue);
        CHECK(er.lastError().message == "empty generation");
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::Kind::kTimeline, "oops");
        REQUIRE(er.errorCount() == 1);
        er.clear();
        CHECK(er.ok());
    }
    SUBCASE("only unsuppressed reporters log") {
        auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(4);
        auto logger = std::make_shared<spdlog::logger>("errors", sink);
        logger->set_pattern("%v");
        auto previous = spdlog::default_logger();
        spdlog::set_default_logger(logger);

        ErrorReporter quiet(true);
        quiet.addValueError("quiet failure");
        ErrorReporter loud;
        loud.addTimelineError("loud failure");

        spdlog::set_default_logger(previous);
        CHECK(quiet.errorCount() == 1);
        CHECK(loud.errorCount() == 1);
        auto lines = sink->last_formatted();
        REQUIRE(lines.size() == 1);
        CHECK(lines[0].find("Timeline_Error: loud failure") != std::string::npos);
    }
    SUBCASE("kind names") {
        CHECK(std::string(ErrorReporter::kindName(ErrorReporter::Kind::kTimeline)) == "Timeline_Error");
        CHECK(std::string(ErrorReporter::kindName(ErrorReporter::Kind::kValue)) == "ValueError");
    }
}

} // namespace sked

#include "sked/SpanParser.hpp"

#include "sked/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <vector>

namespace sked {

TEST_CASE("SpanParser") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("empty") {
        SpanParser parser("  ", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.spans().empty());
    }
    SUBCASE("list") {
        SpanParser parser("100:120, 300:330 ,5.5:7", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.spans()
              == std::vector<Interval<double>>{Interval<double>(100, 120), Interval<double>(300, 330),
                                               Interval<double>(5.5, 7)});
        CHECK(errorReporter->ok());
    }
    SUBCASE("zero length and negative bounds") {
        SpanParser parser("-10:-5,3:3", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.spans() == std::vector<Interval<double>>{Interval<double>(-10, -5), Interval<double>(3, 3)});
    }
    SUBCASE("missing colon") {
        SpanParser parser("1:2,34", errorReporter);
        CHECK(!parser.parse());
        CHECK(parser.spans().size() == 1);
        CHECK(errorReporter->lastError().kind == ErrorReporter::Kind::kValue);
    }
    SUBCASE("bad numbers") {
        CHECK(!SpanParser("1:x", errorReporter).parse());
        CHECK(!SpanParser(":4", errorReporter).parse());
        CHECK(!SpanParser("1:2,", errorReporter).parse());
        CHECK(!SpanParser("9:4", errorReporter).parse());
        CHECK(errorReporter->errorCount(ErrorReporter::Kind::kValue) == 4);
    }
}

} // namespace sked

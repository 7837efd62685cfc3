#include "sked/IntervalSet.hpp"

#include "sked/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace sked {

using Span = Interval<int64_t>;
using Set = IntervalSet<int64_t>;

TEST_CASE("IntervalSet Construction") {
    SUBCASE("normalizes input") {
        Set s{Span(20, 30), Span(1, 5), Span(4, 8), Span(8, 9)};
        REQUIRE(s.size() == 2);
        CHECK(s.intervals()[0] == Span(1, 9));
        CHECK(s.intervals()[1] == Span(20, 30));
        CHECK(s.length() == 18);
        CHECK(!s.isEmpty());
    }
    SUBCASE("empty") {
        Set s;
        CHECK(s.isEmpty());
        CHECK(s.size() == 0);
        CHECK(s.length() == 0);
        CHECK(!s.nextPointUp(0));
        CHECK(!s.containsPoint(0));
    }
    SUBCASE("iteration") {
        Set s{Span(1, 2), Span(5, 6)};
        std::vector<Span> seen;
        for (const auto& iv : s) {
            seen.emplace_back(iv);
        }
        CHECK(seen == s.intervals());
        CHECK(fmt::format("{}", s) == "IntervalSet ((1, 2), (5, 6))");
    }
}

TEST_CASE("IntervalSet Queries") {
    Set m{Span(1, 2), Span(5, 6), Span(7, 9)};

    SUBCASE("nextPointUp") {
        CHECK(m.nextPointUp(0) == 1);
        CHECK(m.nextPointUp(1) == 1);
        CHECK(m.nextPointUp(3) == 5);
        CHECK(m.nextPointUp(9) == 9);
        CHECK(!m.nextPointUp(10));
    }
    SUBCASE("containsPoint agrees with nextPointUp") {
        for (int64_t p = -2; p < 12; ++p) {
            auto next = m.nextPointUp(p);
            CHECK(m.containsPoint(p) == (next && *next == p));
        }
        CHECK(m.containsPoint(6));
        CHECK(!m.containsPoint(4));
    }
    SUBCASE("containsInterval") {
        CHECK(m.containsInterval(Span(7, 8)));
        CHECK(m.containsInterval(Span(5, 6)));
        CHECK(!m.containsInterval(Span(5, 8)));
        CHECK(!m.containsInterval(Span(3, 4)));
    }
    SUBCASE("overlaps") {
        CHECK(m.overlaps(Set{Span(8, 20)}));
        CHECK(!m.overlaps(Set{Span(10, 20)}));
        CHECK(!m.overlaps(Set()));
    }
    SUBCASE("shifted") {
        Set s = m.shifted(10);
        CHECK(s == Set{Span(11, 12), Span(15, 16), Span(17, 19)});
        CHECK(s.length() == m.length());
    }
}

TEST_CASE("IntervalSet Intersection") {
    SUBCASE("keeps touching points") {
        Set n{Span(1, 5), Span(6, 6), Span(9, 11), Span(20, 30)};
        Set m{Span(1, 2), Span(5, 6), Span(7, 9)};
        Set isect = n.intersection(m);
        REQUIRE(isect.size() == 4);
        CHECK(isect.intervals()[0] == Span(1, 2));
        CHECK(isect.intervals()[1] == Span(5, 5));
        CHECK(isect.intervals()[2] == Span(6, 6));
        CHECK(isect.intervals()[3] == Span(9, 9));
    }
    SUBCASE("with empty") {
        Set n{Span(1, 5)};
        CHECK(n.intersection(Set()).isEmpty());
        CHECK(Set().intersection(n).isEmpty());
    }
}

TEST_CASE("IntervalSet Difference") {
    SUBCASE("simple") {
        Set o{Span(0, 5), Span(10, 15), Span(20, 25)};
        Set p{Span(3, 6), Span(12, 13), Span(20, 25)};
        CHECK(o.difference(p) == Set{Span(0, 3), Span(10, 12), Span(13, 15)});
    }
    SUBCASE("chained") {
        Set a{Span(0, 5), Span(10, 20), Span(40, 60), Span(65, 70)};
        Set b{Span(7, 8), Span(10, 12), Span(18, 20), Span(33, 37), Span(45, 48)};
        Set c = a.difference(b);
        CHECK(c == Set{Span(0, 5), Span(12, 18), Span(40, 45), Span(48, 60), Span(65, 70)});

        Set d{Span(10, 20), Span(60, 75)};
        CHECK(c.difference(d) == Set{Span(0, 5), Span(40, 45), Span(48, 60)});
        CHECK(d.difference(Set{Span(0, 11)}) == Set{Span(11, 20), Span(60, 75)});
        CHECK(c.unionWith(d) == Set{Span(0, 5), Span(10, 20), Span(40, 45), Span(48, 75)});
    }
    SUBCASE("subtracted interval swallows several") {
        Set s{Span(0, 390), Span(585, 5000), Span(6000, 6200), Span(7000, 7500)};
        Set t{Span(0, 600), Span(5900, 6100), Span(6250, 7100)};
        CHECK(s.difference(t) == Set{Span(600, 5000), Span(6100, 6200), Span(7100, 7500)});
    }
    SUBCASE("zero length subtrahends are ignored") {
        Set t{Span(0, 1000)};
        Set u{Span(10, 20), Span(25, 25), Span(42, 400), Span(900, 990)};
        CHECK(t.difference(u) == Set{Span(0, 10), Span(20, 42), Span(400, 900), Span(990, 1000)});
    }
    SUBCASE("interior and total removal") {
        CHECK(Set{Span(0, 10)}.difference(Set{Span(2, 3), Span(20, 30)}) == Set{Span(0, 2), Span(3, 10)});
        CHECK(Set{Span(0, 10), Span(20, 30)}.difference(Set{Span(-5, 50)}).isEmpty());
        CHECK(Set{Span(0, 10)}.difference(Set()) == Set{Span(0, 10)});
        CHECK(Set().difference(Set{Span(0, 10)}).isEmpty());
    }
    SUBCASE("difference and intersection rebuild the set") {
        std::vector<std::pair<Set, Set>> cases{
            {Set{Span(0, 5), Span(10, 15), Span(20, 25)}, Set{Span(3, 6), Span(12, 13), Span(20, 25)}},
            {Set{Span(0, 5), Span(10, 20), Span(40, 60), Span(65, 70)},
             Set{Span(7, 8), Span(10, 12), Span(18, 20), Span(33, 37), Span(45, 48)}},
            {Set{Span(0, 1000)}, Set{Span(10, 20), Span(42, 400), Span(900, 990)}},
            {Set{Span(0, 10)}, Set{Span(10, 20)}}};
        for (const auto& c : cases) {
            Set rebuilt = c.first.difference(c.second).unionWith(c.first.intersection(c.second));
            CHECK(rebuilt == c.first);
        }
    }
}

TEST_CASE("IntervalSet intersectionIter") {
    std::vector<Span> o{Span(0, 5), Span(10, 15), Span(20, 25)};
    std::vector<Span> p{Span(3, 6), Span(12, 13), Span(20, 25)};

    SUBCASE("two sets") {
        auto isect = Set::intersectionIter({o, p});
        CHECK(isect == std::vector<Span>{Span(3, 5), Span(12, 13), Span(20, 25)});
        CHECK(Set::intersectionIter({o, p}, 2) == std::vector<Span>{Span(3, 5), Span(20, 25)});
    }
    SUBCASE("matches pairwise intersection") {
        auto isect = Set::intersectionIter({o, p});
        CHECK(Set::fromNormalized(isect) == Set(o).intersection(Set(p)));
    }
    SUBCASE("three sets") {
        std::vector<Span> q{Span(4, 6), Span(12, 12)};
        CHECK(Set::intersectionIter({o, p, q}) == std::vector<Span>{Span(4, 5), Span(12, 12)});
    }
    SUBCASE("single set") {
        std::vector<Span> q{Span(3, 6), Span(12, 13)};
        CHECK(Set::intersectionIter({q}, 1) == q);
        CHECK(Set::intersectionIter({q}, 2) == std::vector<Span>{Span(3, 6)});
    }
    SUBCASE("empty inputs") {
        CHECK(Set::intersectionIter(std::vector<std::vector<Span>>{}).empty());
        CHECK(Set::intersectionIter({o, std::vector<Span>{}}).empty());
    }
}

TEST_CASE("IntervalSet kOfNIntersectionIter") {
    std::vector<Span> ivs1{Span(10, 20), Span(25, 40), Span(100, 150)};
    std::vector<Span> ivs2{Span(20, 50), Span(120, 140)};
    std::vector<Span> ivs3{Span(0, 50), Span(110, 140)};
    std::vector<Span> ivs4{Span(5, 20), Span(22, 38), Span(125, 150)};
    std::vector<std::vector<Span>> sets{ivs1, ivs2, ivs3, ivs4};

    SUBCASE("k = 1") {
        auto result = Set::kOfNIntersectionIter(1, 15, sets);
        REQUIRE(result);
        CHECK(*result
              == std::vector<Span>{Span(0, 50), Span(5, 20), Span(20, 50), Span(22, 38), Span(25, 40),
                                   Span(100, 150), Span(110, 140), Span(120, 140), Span(125, 150)});
    }
    SUBCASE("k = 2") {
        auto result = Set::kOfNIntersectionIter(2, 15, sets);
        REQUIRE(result);
        CHECK(*result
              == std::vector<Span>{Span(5, 20), Span(25, 40), Span(20, 50), Span(22, 38), Span(125, 150),
                                   Span(110, 140), Span(125, 140), Span(120, 140)});
    }
    SUBCASE("k = 3") {
        auto result = Set::kOfNIntersectionIter(3, 15, sets);
        REQUIRE(result);
        CHECK(*result == std::vector<Span>{Span(25, 40), Span(22, 38), Span(125, 140), Span(120, 140)});
    }
    SUBCASE("k = 4") {
        auto result = Set::kOfNIntersectionIter(4, 15, sets);
        REQUIRE(result);
        CHECK(*result == std::vector<Span>{Span(125, 140)});
    }
    SUBCASE("k larger than the number of sets") {
        auto result = Set::kOfNIntersectionIter(5, 15, sets);
        REQUIRE(result);
        CHECK(result->empty());
    }
    SUBCASE("k = 1 without minimum is the sorted concatenation") {
        std::vector<std::vector<Span>> small{{Span(3, 4)}, {Span(1, 2), Span(5, 6)}, {Span(1, 9)}};
        auto result = Set::kOfNIntersectionIter(1, 0, small);
        REQUIRE(result);
        CHECK(*result == std::vector<Span>{Span(1, 2), Span(1, 9), Span(3, 4), Span(5, 6)});
    }
    SUBCASE("invalid arguments") {
        ErrorReporter errorReporter(true);
        CHECK(!Set::kOfNIntersectionIter(0, 15, sets, &errorReporter));
        CHECK(!Set::kOfNIntersectionIter(2, -1, sets, &errorReporter));
        CHECK(errorReporter.errorCount(ErrorReporter::Kind::kValue) == 2);
    }
}

} // namespace sked

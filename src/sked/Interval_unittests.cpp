#include "sked/Interval.hpp"

#include "doctest/doctest.h"

#include <cmath>
#include <cstdint>
#include <vector>

namespace sked {

TEST_CASE("Interval Basics") {
    Interval<double> i(0, 100);
    Interval<double> j(100, 200);
    Interval<double> k(20, 50);

    SUBCASE("length and emptiness") {
        CHECK(i.length() == 100);
        CHECK(!i.isEmpty());
        CHECK(i.isValid());
        CHECK(i.hasLength());
        Interval<double> point(7, 7);
        CHECK(point.isEmpty());
        CHECK(point.isValid());
        CHECK(!point.hasLength());
        Interval<double> inverted(8, 7);
        CHECK(!inverted.isValid());
        CHECK(!inverted.hasLength());
    }

    SUBCASE("after and before") {
        CHECK(j.after(i));
        CHECK(i.before(j));
        CHECK(!i.after(j));
        CHECK(!j.before(i));
        CHECK(!k.after(i));
        CHECK(!k.before(i));
    }

    SUBCASE("containment") {
        CHECK(i.contains(k));
        CHECK(!k.contains(i));
        CHECK(i.contains(i));
        CHECK(!i.contains(Interval<double>(50, 20)));
        CHECK(i.containsPoint(0));
        CHECK(i.containsPoint(100));
        CHECK(!i.containsPoint(100.5));
        CHECK(!i.containsPoint(-1));
    }

    SUBCASE("overlaps is open") {
        CHECK(i.overlaps(k));
        CHECK(k.overlaps(i));
        CHECK(!i.overlaps(j));
        CHECK(!j.overlaps(i));
        CHECK(!i.overlaps(Interval<double>(150, 160)));
    }

    SUBCASE("intersection") {
        CHECK(i.intersection(j) == Interval<double>(100, 100));
        CHECK(i.intersection(k) == k);
        Interval<double> disjoint = k.intersection(j);
        CHECK(!disjoint.isValid());
        CHECK(disjoint.length() < 0);
    }

    SUBCASE("intersection length tracks overlap") {
        std::vector<Interval<double>> ivs{i, j, k, Interval<double>(150, 160), Interval<double>(40, 120)};
        for (const auto& a : ivs) {
            for (const auto& b : ivs) {
                CHECK((a.intersection(b).length() <= 0) == !a.overlaps(b));
            }
        }
    }

    SUBCASE("difference") {
        auto pieces = i.difference(k);
        REQUIRE(pieces.size() == 2);
        CHECK(pieces[0] == Interval<double>(0, 20));
        CHECK(pieces[1] == Interval<double>(50, 100));

        pieces = i.difference(j);
        REQUIRE(pieces.size() == 1);
        CHECK(pieces[0] == i);

        pieces = k.difference(i);
        CHECK(pieces.empty());

        pieces = i.difference(Interval<double>(0, 30));
        REQUIRE(pieces.size() == 1);
        CHECK(pieces[0] == Interval<double>(30, 100));
    }

    SUBCASE("shifted") {
        CHECK(k.shifted(10) == Interval<double>(30, 60));
        CHECK(k.shifted(-20) == Interval<double>(0, 30));
    }
}

TEST_CASE("Interval unionOf") {
    Interval<double> i(0, 100);
    Interval<double> j(100, 200);
    Interval<double> k(20, 50);
    Interval<double> l(210, 250);
    Interval<double> m(240, 260);
    Interval<double> n(280, 300);

    SUBCASE("merges touching and overlapping") {
        auto merged = Interval<double>::unionOf({i, j, k, l, m, n});
        REQUIRE(merged.size() == 3);
        CHECK(merged[0] == Interval<double>(0, 200));
        CHECK(merged[1] == Interval<double>(210, 260));
        CHECK(merged[2] == Interval<double>(280, 300));
    }

    SUBCASE("input order does not matter") {
        auto merged = Interval<double>::unionOf({n, m, l, k, j, i});
        CHECK(merged == Interval<double>::unionOf({i, j, k, l, m, n}));
    }

    SUBCASE("output is sorted and disjoint") {
        auto merged = Interval<double>::unionOf(
            {Interval<double>(5, 9), Interval<double>(1, 3), Interval<double>(8, 12), Interval<double>(2, 4)});
        REQUIRE(merged.size() == 2);
        CHECK(merged[0] == Interval<double>(1, 4));
        CHECK(merged[1] == Interval<double>(5, 12));
        for (size_t x = 1; x < merged.size(); ++x) {
            CHECK(merged[x - 1].upper < merged[x].lower);
        }
    }

    SUBCASE("empty input") { CHECK(Interval<double>::unionOf({}).empty()); }
}

TEST_CASE("Interval modulo") {
    SUBCASE("upper on a boundary maps to the period") {
        CHECK(Interval<double>(100, 200).modulo(50) == Interval<double>(0, 50));
        CHECK(Interval<double>(20, 50).modulo(10) == Interval<double>(0, 10));
        CHECK(Interval<double>(210, 250).modulo(50) == Interval<double>(10, 50));
    }
    SUBCASE("straddling a boundary") {
        Interval<double> reduced = Interval<double>(240, 260).modulo(50);
        CHECK(reduced == Interval<double>(40, 10));
        CHECK(!reduced.isValid());
    }
    SUBCASE("integral") {
        CHECK(Interval<int64_t>(280, 300).modulo(250) == Interval<int64_t>(30, 50));
        CHECK(Interval<int64_t>(-30, -10).modulo(25) == Interval<int64_t>(20, 15));
    }
}

TEST_CASE("Interval ordering and conversion") {
    SUBCASE("ordering") {
        CHECK(Interval<int64_t>(0, 5) < Interval<int64_t>(0, 6));
        CHECK(Interval<int64_t>(0, 6) < Interval<int64_t>(1, 2));
        CHECK(Interval<int64_t>(1, 2) > Interval<int64_t>(0, 6));
        CHECK(Interval<int64_t>(1, 2) >= Interval<int64_t>(1, 2));
        CHECK(Interval<int64_t>(1, 2) <= Interval<int64_t>(1, 2));
        CHECK(Interval<int64_t>(1, 2) != Interval<int64_t>(1, 3));
    }
    SUBCASE("converted") {
        Interval<double> j(100, 200);
        auto thirds = j.converted([](double x) { return static_cast<int64_t>(std::floor(x / 3)); });
        CHECK(thirds == Interval<int64_t>(33, 66));
        auto halves = Interval<int64_t>(3, 9).converted([](int64_t x) { return x / 2.0; });
        CHECK(halves == Interval<double>(1.5, 4.5));
    }
    SUBCASE("formatting") {
        CHECK(fmt::format("{}", Interval<int64_t>(3, 9)) == "(3, 9)");
        CHECK(toString(std::vector<Interval<int64_t>>{{1, 2}, {5, 8}}) == "[(1, 2), (5, 8)]");
        CHECK(toString(std::vector<Interval<int64_t>>{}) == "[]");
    }
}

} // namespace sked

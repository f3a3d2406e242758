#include <doctest/doctest.h>

#include "shapegeo/shapegeo.hpp"
#include <variant>

TEST_CASE("Processor - Dispatch by shape type") {
    SUBCASE("Point") {
        auto g = shapegeo::process_geometry(1, {1.0, 2.0});
        REQUIRE(std::holds_alternative<shapegeo::Coordinate>(g));
        CHECK(std::get<shapegeo::Coordinate>(g).x == 1.0);
        CHECK(std::get<shapegeo::Coordinate>(g).y == 2.0);
    }

    SUBCASE("Point needs exactly two values") {
        CHECK_THROWS_AS(shapegeo::process_geometry(1, {1.0}), shapegeo::GeometryError);
        CHECK_THROWS_AS(shapegeo::process_geometry(1, {1.0, 2.0, 3.0, 4.0}), shapegeo::GeometryError);
    }

    SUBCASE("PolyLine") {
        auto g = shapegeo::process_geometry(3, {0, 0, 1, 1, 2, 0});
        REQUIRE(std::holds_alternative<shapegeo::LineString>(g));
        CHECK(std::get<shapegeo::LineString>(g).points.size() == 3);
    }

    SUBCASE("MultiPoint") {
        auto g = shapegeo::process_geometry(8, {0, 0, 1, 1});
        REQUIRE(std::holds_alternative<shapegeo::MultiPoint>(g));
        CHECK(std::get<shapegeo::MultiPoint>(g).points.size() == 2);
    }

    SUBCASE("Polygon without part sizes is one ring") {
        auto g = shapegeo::process_geometry(5, {0, 0, 0, 1, 1, 1, 1, 0, 0, 0});
        REQUIRE(std::holds_alternative<shapegeo::Polygon>(g));
        CHECK(std::get<shapegeo::Polygon>(g).rings.size() == 1);
    }

    SUBCASE("Z and M variants route like their base type") {
        CHECK(std::holds_alternative<shapegeo::Coordinate>(shapegeo::process_geometry(11, {1, 2})));
        CHECK(std::holds_alternative<shapegeo::Coordinate>(shapegeo::process_geometry(21, {1, 2})));
        CHECK(std::holds_alternative<shapegeo::LineString>(shapegeo::process_geometry(13, {0, 0, 1, 1})));
        CHECK(std::holds_alternative<shapegeo::MultiPoint>(shapegeo::process_geometry(28, {0, 0, 1, 1})));
        CHECK(std::holds_alternative<shapegeo::Polygon>(
            shapegeo::process_geometry(25, {0, 0, 0, 1, 1, 1, 1, 0, 0, 0})));
    }

    SUBCASE("Null shape is rejected") {
        CHECK_THROWS_WITH_AS(shapegeo::process_geometry(0, {1.0, 2.0}), "Invalid or null shape type",
                             shapegeo::GeometryError);
    }

    SUBCASE("Unknown code fails validation") {
        CHECK_THROWS_AS(shapegeo::process_geometry(999, {1.0, 2.0}), shapegeo::ValidationError);
    }

    SUBCASE("MultiPatch is recognized but unsupported") {
        CHECK_THROWS_WITH_AS(shapegeo::process_geometry(31, {0, 0, 1, 1, 2, 2}), "Unsupported shape type: MULTIPATCH",
                             shapegeo::GeometryError);
    }

    SUBCASE("Odd length propagates") {
        CHECK_THROWS_AS(shapegeo::process_geometry(3, {0, 0, 1}), shapegeo::GeometryError);
        CHECK_THROWS_AS(shapegeo::process_geometry(5, {0, 0, 0, 1, 1, 1, 1}), shapegeo::GeometryError);
    }
}

TEST_CASE("Processor - Dispatch with part sizes") {
    SUBCASE("Polygon with a hole") {
        std::vector<double> coords = {0, 0, 0, 10, 10, 10, 10, 0, 0, 0, 2, 2, 8, 2, 8, 8, 2, 8, 2, 2};
        auto g = shapegeo::process_geometry(5, coords, {5, 5});
        REQUIRE(std::holds_alternative<shapegeo::Polygon>(g));
        CHECK(std::get<shapegeo::Polygon>(g).rings.size() == 2);
    }

    SUBCASE("Two-part polyline") {
        auto g = shapegeo::process_geometry(3, {0, 0, 1, 1, 5, 5, 6, 6}, {2, 2});
        REQUIRE(std::holds_alternative<shapegeo::MultiLineString>(g));
        CHECK(std::get<shapegeo::MultiLineString>(g).lines.size() == 2);
    }

    SUBCASE("Point ignores part sizes") {
        auto g = shapegeo::process_geometry(1, {3, 4}, {1});
        CHECK(std::holds_alternative<shapegeo::Coordinate>(g));
    }
}

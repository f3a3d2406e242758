#include <doctest/doctest.h>

#include "shapegeo/shapegeo.hpp"
#include <limits>
#include <variant>

namespace {
    shapegeo::ShapeRecord polygon_record(std::int32_t number) {
        shapegeo::ShapeRecord r;
        r.record_number = number;
        r.content_length = 128;
        r.shape_type = 5;
        r.num_parts = 2;
        r.num_points = 10;
        r.parts = {0, 5};
        r.coordinates = {0, 0, 0, 10, 10, 10, 10, 0, 0, 0, 2, 2, 8, 2, 8, 8, 2, 8, 2, 2};
        return r;
    }

    shapegeo::ShapeRecord point_record(std::int32_t number, double x, double y) {
        shapegeo::ShapeRecord r;
        r.record_number = number;
        r.content_length = 10;
        r.shape_type = 1;
        r.num_points = 1;
        r.coordinates = {x, y};
        return r;
    }
} // namespace

TEST_CASE("Record - Part sizes") {
    SUBCASE("Consecutive start indices") {
        auto sizes = shapegeo::part_sizes({0, 5, 9}, 12);
        REQUIRE(sizes.size() == 3);
        CHECK(sizes[0] == 5);
        CHECK(sizes[1] == 4);
        CHECK(sizes[2] == 3);
    }

    SUBCASE("Index out of range") {
        CHECK_THROWS_AS(shapegeo::part_sizes({0, 12}, 12), shapegeo::ValidationError);
        CHECK_THROWS_AS(shapegeo::part_sizes({-1}, 12), shapegeo::ValidationError);
    }

    SUBCASE("First start index must be zero") {
        auto issue = shapegeo::check([] { shapegeo::part_sizes({2, 5}, 8); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartIndex);
        CHECK(shapegeo::part_sizes({}, 8).empty());
    }

    SUBCASE("Empty or inverted part") {
        auto issue = shapegeo::check([] { shapegeo::part_sizes({0, 4, 4}, 8); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartRange);

        CHECK_THROWS_AS(shapegeo::part_sizes({0, 6, 3}, 8), shapegeo::ValidationError);
    }
}

TEST_CASE("Record - Decode") {
    SUBCASE("Polygon with hole") {
        auto f = shapegeo::decode_record(polygon_record(7));
        REQUIRE(f.geometry.has_value());
        REQUIRE(std::holds_alternative<shapegeo::Polygon>(*f.geometry));
        CHECK(std::get<shapegeo::Polygon>(*f.geometry).rings.size() == 2);
        REQUIRE(f.bbox.has_value());
        CHECK(*f.bbox == shapegeo::Bounds{0, 0, 10, 10});
        CHECK(f.properties.at("recordNumber") == "7");
        CHECK(f.properties.at("shapeType") == "5");
    }

    SUBCASE("Point") {
        auto f = shapegeo::decode_record(point_record(1, 4.0, 5.0));
        REQUIRE(f.geometry.has_value());
        CHECK(std::holds_alternative<shapegeo::Coordinate>(*f.geometry));
        CHECK(*f.bbox == shapegeo::Bounds{4, 5, 4, 5});
    }

    SUBCASE("MultiPointZ") {
        shapegeo::ShapeRecord r;
        r.record_number = 2;
        r.content_length = 40;
        r.shape_type = 18;
        r.num_points = 3;
        r.coordinates = {0, 0, 1, 1, 2, 2};
        auto f = shapegeo::decode_record(r);
        REQUIRE(f.geometry.has_value());
        CHECK(std::get<shapegeo::MultiPoint>(*f.geometry).points.size() == 3);
    }

    SUBCASE("Null shape has no geometry") {
        shapegeo::ShapeRecord r;
        r.record_number = 3;
        r.content_length = 2;
        r.shape_type = 0;
        auto f = shapegeo::decode_record(r);
        CHECK_FALSE(f.geometry.has_value());
        CHECK_FALSE(f.bbox.has_value());
        CHECK(f.properties.at("recordNumber") == "3");
    }

    SUBCASE("Content length checked first") {
        auto r = polygon_record(4);
        r.content_length = -1;
        r.shape_type = 999;
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::RecordLength);
    }

    SUBCASE("Counts are checked before the parts array is read") {
        auto r = polygon_record(5);
        r.num_parts = 2000000;
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartsPoints);
    }

    SUBCASE("Bad part index") {
        auto r = polygon_record(6);
        r.parts = {0, 10};
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartIndex);
    }

    SUBCASE("Non-finite coordinate reports part and point") {
        auto r = polygon_record(8);
        r.coordinates[13] = std::numeric_limits<double>::infinity(); // part 1, point 1, y
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PointCoordinates);
        CHECK(issue->details->info == "partIndex=1, pointIndex=1");
    }

    SUBCASE("Coordinate count must match the declared points") {
        auto r = polygon_record(9);
        r.coordinates.resize(18);
        CHECK_THROWS_AS(shapegeo::decode_record(r), shapegeo::GeometryError);
    }

    SUBCASE("Part index count must match the declared parts") {
        auto r = polygon_record(10);
        r.parts = {0};
        CHECK_THROWS_AS(shapegeo::decode_record(r), shapegeo::GeometryError);
    }

    SUBCASE("Ring shorter than three points") {
        auto r = polygon_record(11);
        r.parts = {0, 8};
        CHECK_THROWS_AS(shapegeo::decode_record(r), shapegeo::GeometryError);
    }

    SUBCASE("First part not starting at zero") {
        auto r = polygon_record(12);
        r.num_parts = 1;
        r.parts = {1};
        r.num_points = 10;
        r.coordinates[0] = std::numeric_limits<double>::infinity();
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartIndex);
        CHECK(issue->scope() == shapegeo::ErrorScope::Record);
        CHECK(issue->message == "Invalid shapefile: first part starts at point 1 (expected 0)");
    }

    SUBCASE("MultiPoint without points") {
        shapegeo::ShapeRecord r;
        r.record_number = 13;
        r.content_length = 20;
        r.shape_type = 8;
        r.num_points = 0;
        auto f = shapegeo::decode_record(r);
        REQUIRE(f.geometry.has_value());
        CHECK(std::get<shapegeo::MultiPoint>(*f.geometry).points.empty());
        REQUIRE(f.bbox.has_value());
        CHECK(*f.bbox == shapegeo::Bounds{});
    }

    SUBCASE("MultiPoint point count out of range") {
        shapegeo::ShapeRecord r;
        r.record_number = 14;
        r.content_length = 20;
        r.shape_type = 28;
        r.num_points = -1;
        auto issue = shapegeo::check([&] { shapegeo::decode_record(r); });
        REQUIRE(issue.has_value());
        CHECK(issue->type == shapegeo::IssueType::PartsPoints);
        CHECK(issue->message == "Invalid multipoint: unreasonable number of points (-1)");

        r.num_points = 1000001;
        CHECK_THROWS_AS(shapegeo::decode_record(r), shapegeo::ValidationError);
    }
}

TEST_CASE("Record - Decode many") {
    std::vector<shapegeo::ShapeRecord> records;
    records.push_back(polygon_record(1));
    auto broken = polygon_record(2);
    broken.parts = {0, 42};
    records.push_back(broken);
    records.push_back(point_record(3, 1.0, 1.0));
    auto odd = point_record(4, 0.0, 0.0);
    odd.coordinates.push_back(1.0);
    records.push_back(odd);

    auto result = shapegeo::decode_records(records);
    CHECK(result.collection.features.size() == 2);
    REQUIRE(result.skipped.size() == 2);
    CHECK(result.skipped[0].record_number == 2);
    CHECK(result.skipped[1].record_number == 4);
    CHECK(result.collection.features[1].properties.at("recordNumber") == "3");
}

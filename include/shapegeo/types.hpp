#pragma once

#include <concord/concord.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace shapegeo {

    // Fixed framing constants of the .shp container
    constexpr std::size_t HEADER_LENGTH = 100;
    constexpr std::int32_t FILE_CODE = 9994;
    constexpr std::int32_t VERSION = 1000;
    constexpr std::int32_t MAX_RECORD_CONTENT_LENGTH = 1000000;
    constexpr std::int32_t MAX_PARTS_OR_POINTS = 1000000;

    enum class ShapeType : std::uint32_t {
        Null = 0,
        Point = 1,
        PolyLine = 3,
        Polygon = 5,
        MultiPoint = 8,
        PointZ = 11,
        PolyLineZ = 13,
        PolygonZ = 15,
        MultiPointZ = 18,
        PointM = 21,
        PolyLineM = 23,
        PolygonM = 25,
        MultiPointM = 28,
        MultiPatch = 31
    };

    bool has_z_values(ShapeType type);
    bool has_m_values(ShapeType type);

    // Strips the Z/M variant, e.g. PolygonZ -> Polygon. Other types map to themselves.
    ShapeType base_shape_type(ShapeType type);

    // "POLYGON", "POLYLINE with Z values", ...
    std::string shape_type_name(ShapeType type);

    // All coordinates are planar (x, y); z is always 0
    using Coordinate = concord::Point;
    using Ring = std::vector<Coordinate>;

    struct Bounds {
        double min_x = 0.0;
        double min_y = 0.0;
        double max_x = 0.0;
        double max_y = 0.0;

        bool operator==(const Bounds &other) const {
            return min_x == other.min_x && min_y == other.min_y && max_x == other.max_x && max_y == other.max_y;
        }
        bool operator!=(const Bounds &other) const { return !(*this == other); }
    };

    struct MultiPoint {
        std::vector<Coordinate> points;
    };

    struct LineString {
        std::vector<Coordinate> points;
    };

    struct MultiLineString {
        std::vector<LineString> lines;
    };

    // First ring is the exterior, the rest are holes
    struct Polygon {
        std::vector<Ring> rings;
    };

    struct MultiPolygon {
        std::vector<Polygon> polygons;
    };

    using Geometry = std::variant<Coordinate, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon>;

    struct ShapefileHeader {
        std::int32_t file_code = 0;
        std::size_t file_length = 0; // bytes, already converted from 16-bit words
        std::int32_t version = 0;
        std::uint32_t shape_type = 0;
        Bounds bbox;
    };

    // Numeric fields of one record as pulled out of the byte stream by the reader
    struct ShapeRecord {
        std::int32_t record_number = 0;
        std::int32_t content_length = 0;
        std::uint32_t shape_type = 0;
        std::int32_t num_parts = 0;
        std::int32_t num_points = 0;
        std::vector<std::int32_t> parts;
        std::vector<double> coordinates;
    };

    struct Feature {
        std::optional<Geometry> geometry; // empty for null shapes
        std::unordered_map<std::string, std::string> properties;
        std::optional<Bounds> bbox;
    };

    struct FeatureCollection {
        std::vector<Feature> features;
    };

} // namespace shapegeo

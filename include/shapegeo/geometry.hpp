#pragma once

#include "shapegeo/error.hpp"
#include "shapegeo/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace shapegeo {

    // All builders take flat coordinate arrays laid out as x0, y0, x1, y1, ...
    // and throw GeometryError on malformed input. Finiteness is not checked here.

    // Empty input yields the all-zero box
    Bounds calculate_bounds(const std::vector<double> &coords);

    // Shoelace sign over consecutive vertices, closing edge included; positive means
    // clockwise. Clockwise rings are exteriors, counter-clockwise rings are holes.
    bool is_clockwise(const std::vector<double> &coords);

    Coordinate convert_point(double x, double y);

    MultiPoint convert_multi_point(const std::vector<double> &coords);

    LineString convert_polyline(const std::vector<double> &coords);

    // One part yields a LineString, more yield a MultiLineString
    Geometry convert_multi_polyline(const std::vector<double> &coords, const std::vector<std::size_t> &part_sizes);

    /**
     * Slices coords into rings of ring_sizes points and groups them by orientation.
     *
     * Each clockwise ring opens a new polygon; the counter-clockwise rings that follow
     * are its holes. A leading counter-clockwise ring opens the first polygon. A single
     * resulting polygon is returned as Polygon, several as MultiPolygon.
     */
    Geometry convert_polygon(const std::vector<double> &coords, const std::vector<std::size_t> &ring_sizes);

    // Union of two boxes
    Bounds merge_bounds(const Bounds &a, const Bounds &b);

    Bounds geometry_bounds(const Geometry &geometry);

    // GeoJSON "type" discriminator
    std::string geometry_type_name(const Geometry &geometry);

} // namespace shapegeo

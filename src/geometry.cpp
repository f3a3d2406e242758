#include "shapegeo/geometry.hpp"

#include <algorithm>
#include <utility>
#include <type_traits>
#include <variant>

namespace shapegeo {

    namespace {
        void require_even(const std::vector<double> &coords) {
            if (coords.size() % 2 != 0) {
                throw GeometryError(GeometryErrorKind::OddLength,
                                    "Coordinates array must have even length (got " + std::to_string(coords.size()) +
                                        ")");
            }
        }

        // Caller guarantees count >= 3
        bool ring_is_clockwise(const double *xy, std::size_t count) {
            double sum = 0.0;
            for (std::size_t i = 0; i < count; ++i) {
                std::size_t j = (i + 1) % count;
                double x1 = xy[2 * i];
                double y1 = xy[2 * i + 1];
                double x2 = xy[2 * j];
                double y2 = xy[2 * j + 1];
                sum += (x2 - x1) * (y2 + y1);
            }
            return sum > 0.0;
        }

        std::vector<Coordinate> to_points(const double *xy, std::size_t count) {
            std::vector<Coordinate> pts;
            pts.reserve(count);
            for (std::size_t i = 0; i < count; ++i)
                pts.push_back(Coordinate{xy[2 * i], xy[2 * i + 1], 0.0});
            return pts;
        }

        // Checks that the parts tile coords exactly before anything is allocated
        void check_slices(const std::vector<double> &coords, const std::vector<std::size_t> &sizes,
                          std::size_t min_points, const char *what) {
            if (sizes.empty()) {
                throw GeometryError(GeometryErrorKind::EmptyGeometry, std::string("No ") + what + " sizes supplied");
            }
            std::size_t remaining = coords.size() / 2;
            for (std::size_t i = 0; i < sizes.size(); ++i) {
                if (sizes[i] < min_points) {
                    throw GeometryError(GeometryErrorKind::TooFewPoints,
                                        std::string(what) + " " + std::to_string(i) + " must have at least " +
                                            std::to_string(min_points) + " points (got " + std::to_string(sizes[i]) +
                                            ")");
                }
                if (sizes[i] > remaining) {
                    throw GeometryError(GeometryErrorKind::SliceOutOfBounds,
                                        std::string(what) + " " + std::to_string(i) + " of " +
                                            std::to_string(sizes[i]) + " points exceeds coordinate array (" +
                                            std::to_string(remaining) + " points left)");
                }
                remaining -= sizes[i];
            }
            if (remaining != 0) {
                throw GeometryError(GeometryErrorKind::UnconsumedCoordinates,
                                    std::to_string(remaining) + " points left over after the last " + what);
            }
        }

        void expand(Bounds &b, bool &seeded, const Coordinate &p) {
            if (!seeded) {
                b = Bounds{p.x, p.y, p.x, p.y};
                seeded = true;
                return;
            }
            b.min_x = std::min(b.min_x, p.x);
            b.min_y = std::min(b.min_y, p.y);
            b.max_x = std::max(b.max_x, p.x);
            b.max_y = std::max(b.max_y, p.y);
        }
    } // namespace

    Bounds calculate_bounds(const std::vector<double> &coords) {
        require_even(coords);
        if (coords.empty())
            return Bounds{};

        Bounds b{coords[0], coords[1], coords[0], coords[1]};
        for (std::size_t i = 2; i < coords.size(); i += 2) {
            b.min_x = std::min(b.min_x, coords[i]);
            b.min_y = std::min(b.min_y, coords[i + 1]);
            b.max_x = std::max(b.max_x, coords[i]);
            b.max_y = std::max(b.max_y, coords[i + 1]);
        }
        return b;
    }

    bool is_clockwise(const std::vector<double> &coords) {
        if (coords.size() < 6) {
            throw GeometryError(GeometryErrorKind::TooFewPoints,
                                "Ring must have at least 3 points (got " + std::to_string(coords.size()) +
                                    " values)");
        }
        require_even(coords);
        return ring_is_clockwise(coords.data(), coords.size() / 2);
    }

    Coordinate convert_point(double x, double y) { return Coordinate{x, y, 0.0}; }

    MultiPoint convert_multi_point(const std::vector<double> &coords) {
        require_even(coords);
        return MultiPoint{to_points(coords.data(), coords.size() / 2)};
    }

    LineString convert_polyline(const std::vector<double> &coords) {
        require_even(coords);
        return LineString{to_points(coords.data(), coords.size() / 2)};
    }

    Geometry convert_multi_polyline(const std::vector<double> &coords, const std::vector<std::size_t> &part_sizes) {
        require_even(coords);
        check_slices(coords, part_sizes, 2, "part");

        MultiLineString mls;
        mls.lines.reserve(part_sizes.size());
        const double *cursor = coords.data();
        for (auto size : part_sizes) {
            mls.lines.push_back(LineString{to_points(cursor, size)});
            cursor += 2 * size;
        }

        if (mls.lines.size() == 1)
            return std::move(mls.lines.front());
        return mls;
    }

    Geometry convert_polygon(const std::vector<double> &coords, const std::vector<std::size_t> &ring_sizes) {
        require_even(coords);
        check_slices(coords, ring_sizes, 3, "ring");

        std::vector<Polygon> polygons;
        Polygon current;
        const double *cursor = coords.data();
        for (auto size : ring_sizes) {
            bool exterior = ring_is_clockwise(cursor, size);
            if (exterior && !current.rings.empty()) {
                polygons.push_back(std::move(current));
                current = Polygon{};
            }
            current.rings.push_back(to_points(cursor, size));
            cursor += 2 * size;
        }
        if (!current.rings.empty())
            polygons.push_back(std::move(current));

        if (polygons.size() == 1)
            return std::move(polygons.front());
        return MultiPolygon{std::move(polygons)};
    }

    Bounds merge_bounds(const Bounds &a, const Bounds &b) {
        return Bounds{std::min(a.min_x, b.min_x), std::min(a.min_y, b.min_y), std::max(a.max_x, b.max_x),
                      std::max(a.max_y, b.max_y)};
    }

    Bounds geometry_bounds(const Geometry &geometry) {
        Bounds b;
        bool seeded = false;
        auto add_all = [&](const std::vector<Coordinate> &pts) {
            for (auto const &p : pts)
                expand(b, seeded, p);
        };

        std::visit(
            [&](auto const &shape) {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, Coordinate>) {
                    expand(b, seeded, shape);
                } else if constexpr (std::is_same_v<T, MultiPoint> || std::is_same_v<T, LineString>) {
                    add_all(shape.points);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    for (auto const &line : shape.lines)
                        add_all(line.points);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    for (auto const &ring : shape.rings)
                        add_all(ring);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    for (auto const &poly : shape.polygons)
                        for (auto const &ring : poly.rings)
                            add_all(ring);
                }
            },
            geometry);
        return b;
    }

    std::string geometry_type_name(const Geometry &geometry) {
        return std::visit(
            [](auto const &shape) -> std::string {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, Coordinate>)
                    return "Point";
                else if constexpr (std::is_same_v<T, MultiPoint>)
                    return "MultiPoint";
                else if constexpr (std::is_same_v<T, LineString>)
                    return "LineString";
                else if constexpr (std::is_same_v<T, MultiLineString>)
                    return "MultiLineString";
                else if constexpr (std::is_same_v<T, Polygon>)
                    return "Polygon";
                else
                    return "MultiPolygon";
            },
            geometry);
    }

} // namespace shapegeo

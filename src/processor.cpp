#include "shapegeo/processor.hpp"
#include "shapegeo/validation.hpp"

#include <optional>
#include <string>

namespace shapegeo {

    namespace {
        Geometry dispatch(std::uint32_t shape_type, const std::vector<double> &coords,
                          const std::optional<std::vector<std::size_t>> &part_sizes) {
            if (!validate_shape_type(shape_type)) {
                throw GeometryError(GeometryErrorKind::UnsupportedShapeType, "Invalid or null shape type");
            }

            switch (base_shape_type(static_cast<ShapeType>(shape_type))) {
            case ShapeType::Point:
                if (coords.size() != 2) {
                    throw GeometryError(GeometryErrorKind::CoordinateCount,
                                        "Point must have exactly 2 coordinates (got " +
                                            std::to_string(coords.size()) + ")");
                }
                return convert_point(coords[0], coords[1]);
            case ShapeType::PolyLine:
                if (part_sizes)
                    return convert_multi_polyline(coords, *part_sizes);
                return convert_polyline(coords);
            case ShapeType::Polygon:
                if (part_sizes)
                    return convert_polygon(coords, *part_sizes);
                return convert_polygon(coords, {coords.size() / 2});
            case ShapeType::MultiPoint:
                return convert_multi_point(coords);
            default:
                break;
            }
            throw GeometryError(GeometryErrorKind::UnsupportedShapeType,
                                "Unsupported shape type: " + shape_type_name(static_cast<ShapeType>(shape_type)));
        }
    } // namespace

    Geometry process_geometry(std::uint32_t shape_type, const std::vector<double> &coords) {
        return dispatch(shape_type, coords, std::nullopt);
    }

    Geometry process_geometry(std::uint32_t shape_type, const std::vector<double> &coords,
                              const std::vector<std::size_t> &part_sizes) {
        return dispatch(shape_type, coords, part_sizes);
    }

} // namespace shapegeo

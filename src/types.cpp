#include "shapegeo/types.hpp"

namespace shapegeo {

    bool has_z_values(ShapeType type) {
        return type == ShapeType::PointZ || type == ShapeType::PolyLineZ || type == ShapeType::PolygonZ ||
               type == ShapeType::MultiPointZ;
    }

    bool has_m_values(ShapeType type) {
        return type == ShapeType::PointM || type == ShapeType::PolyLineM || type == ShapeType::PolygonM ||
               type == ShapeType::MultiPointM;
    }

    ShapeType base_shape_type(ShapeType type) {
        switch (type) {
        case ShapeType::PointZ:
        case ShapeType::PointM:
            return ShapeType::Point;
        case ShapeType::PolyLineZ:
        case ShapeType::PolyLineM:
            return ShapeType::PolyLine;
        case ShapeType::PolygonZ:
        case ShapeType::PolygonM:
            return ShapeType::Polygon;
        case ShapeType::MultiPointZ:
        case ShapeType::MultiPointM:
            return ShapeType::MultiPoint;
        default:
            return type;
        }
    }

    std::string shape_type_name(ShapeType type) {
        std::string name;
        switch (base_shape_type(type)) {
        case ShapeType::Null:
            name = "NULL";
            break;
        case ShapeType::Point:
            name = "POINT";
            break;
        case ShapeType::PolyLine:
            name = "POLYLINE";
            break;
        case ShapeType::Polygon:
            name = "POLYGON";
            break;
        case ShapeType::MultiPoint:
            name = "MULTIPOINT";
            break;
        case ShapeType::MultiPatch:
            name = "MULTIPATCH";
            break;
        default:
            name = "UNKNOWN";
            break;
        }
        if (has_z_values(type))
            name += " with Z values";
        if (has_m_values(type))
            name += " with M values";
        return name;
    }

} // namespace shapegeo

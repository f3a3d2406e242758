#include "shapegeo/writter.hpp"
#include "shapegeo/geometry.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace shapegeo {

    namespace {
        boost::json::array ptCoords(Coordinate const &p) {
            boost::json::array arr;
            arr.push_back(p.x);
            arr.push_back(p.y);
            return arr;
        }

        boost::json::array pathCoords(std::vector<Coordinate> const &pts) {
            boost::json::array arr;
            arr.reserve(pts.size());
            for (auto const &p : pts)
                arr.push_back(ptCoords(p));
            return arr;
        }

        boost::json::array polygonCoords(Polygon const &poly) {
            boost::json::array rings;
            rings.reserve(poly.rings.size());
            for (auto const &ring : poly.rings)
                rings.push_back(pathCoords(ring));
            return rings;
        }

        boost::json::array bboxToJson(Bounds const &b) {
            boost::json::array arr;
            arr.push_back(b.min_x);
            arr.push_back(b.min_y);
            arr.push_back(b.max_x);
            arr.push_back(b.max_y);
            return arr;
        }
    } // namespace

    boost::json::value geometryToJson(Geometry const &geom) {
        return std::visit(
            [&](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                j["type"] = geometry_type_name(geom);
                if constexpr (std::is_same_v<T, Coordinate>) {
                    j["coordinates"] = ptCoords(shape);
                } else if constexpr (std::is_same_v<T, MultiPoint> || std::is_same_v<T, LineString>) {
                    j["coordinates"] = pathCoords(shape.points);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    boost::json::array lines;
                    for (auto const &line : shape.lines)
                        lines.push_back(pathCoords(line.points));
                    j["coordinates"] = std::move(lines);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["coordinates"] = polygonCoords(shape);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    boost::json::array polys;
                    for (auto const &poly : shape.polygons)
                        polys.push_back(polygonCoords(poly));
                    j["coordinates"] = std::move(polys);
                }
                return j;
            },
            geom);
    }

    boost::json::value featureToJson(Feature const &f) {
        boost::json::object j;
        j["type"] = "Feature";
        if (f.bbox)
            j["bbox"] = bboxToJson(*f.bbox);
        boost::json::object props;
        for (auto const &kv : f.properties)
            props[kv.first] = kv.second;
        j["properties"] = std::move(props);
        if (f.geometry)
            j["geometry"] = geometryToJson(*f.geometry);
        else
            j["geometry"] = nullptr;
        return j;
    }

    boost::json::value toJson(FeatureCollection const &fc) {
        boost::json::object j;
        j["type"] = "FeatureCollection";

        std::optional<Bounds> extent;
        for (auto const &f : fc.features) {
            if (!f.bbox)
                continue;
            extent = extent ? merge_bounds(*extent, *f.bbox) : *f.bbox;
        }
        if (extent)
            j["bbox"] = bboxToJson(*extent);

        boost::json::array features;
        for (auto const &f : fc.features)
            features.push_back(featureToJson(f));
        j["features"] = std::move(features);

        return j;
    }

    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath) {
        auto j = toJson(fc);
        std::ofstream ofs(outPath);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + outPath.string());
        ofs << boost::json::serialize(j) << "\n";
    }

} // namespace shapegeo

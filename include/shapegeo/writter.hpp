#pragma once

#include "shapegeo/types.hpp"

#include <boost/json.hpp>
#include <filesystem>

namespace shapegeo {

    // GeoJSON: {"type": ..., "coordinates": ...} nested to the arity of the type,
    // positions written as [x, y]
    boost::json::value geometryToJson(Geometry const &geom);

    // "bbox" is omitted when the feature has none; a null shape writes "geometry": null
    boost::json::value featureToJson(Feature const &f);

    boost::json::value toJson(FeatureCollection const &fc);

    void WriteFeatureCollection(FeatureCollection const &fc, std::filesystem::path const &outPath);

} // namespace shapegeo

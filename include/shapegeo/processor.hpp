#pragma once

#include "shapegeo/geometry.hpp"
#include "shapegeo/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shapegeo {

    // Routes a shape-type code to the matching builder. Z and M variants route like
    // their base type. Null and MultiPatch are rejected.
    //
    // Without part sizes, PolyLine becomes one LineString and Polygon is read as a
    // single ring. Multi-part shapes need the overload below with sizes taken from the
    // record's part index array (see part_sizes()).
    Geometry process_geometry(std::uint32_t shape_type, const std::vector<double> &coords);

    Geometry process_geometry(std::uint32_t shape_type, const std::vector<double> &coords,
                              const std::vector<std::size_t> &part_sizes);

} // namespace shapegeo

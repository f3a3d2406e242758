#pragma once

#include "shapegeo/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shapegeo {

    struct SkippedRecord {
        std::int32_t record_number;
        std::string reason;
    };

    struct DecodeResult {
        FeatureCollection collection;
        std::vector<SkippedRecord> skipped;
    };

    // Turns a record's part start indices into per-part point counts. Every index is
    // checked against num_points and every part must be non-empty.
    std::vector<std::size_t> part_sizes(const std::vector<std::int32_t> &parts, std::int32_t num_points);

    // Validates one record in framing order and builds its feature. Counts are checked
    // before anything sized by them is allocated. A null shape yields a feature with no
    // geometry. Properties: recordNumber, shapeType.
    Feature decode_record(const ShapeRecord &record);

    // Record-scope failures are collected in DecodeResult::skipped and decoding moves on
    // to the next record; file-scope failures propagate.
    DecodeResult decode_records(const std::vector<ShapeRecord> &records);

} // namespace shapegeo

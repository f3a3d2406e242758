#pragma once

#include "error.hpp"
#include "geometry.hpp"
#include "processor.hpp"
#include "record.hpp"
#include "types.hpp"
#include "validation.hpp"
#include "writter.hpp"

namespace shapegeo {

    // Decodes the records and writes the ones that decoded to outPath. Returns what was skipped.
    std::vector<SkippedRecord> write(const std::vector<ShapeRecord> &records, const std::filesystem::path &outPath);

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath);

} // namespace shapegeo

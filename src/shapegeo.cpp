#include "shapegeo/shapegeo.hpp"

namespace shapegeo {

    std::vector<SkippedRecord> write(const std::vector<ShapeRecord> &records, const std::filesystem::path &outPath) {
        auto result = decode_records(records);
        WriteFeatureCollection(result.collection, outPath);
        return result.skipped;
    }

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath) { WriteFeatureCollection(fc, outPath); }

} // namespace shapegeo

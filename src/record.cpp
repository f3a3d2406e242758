#include "shapegeo/record.hpp"
#include "shapegeo/error.hpp"
#include "shapegeo/geometry.hpp"
#include "shapegeo/processor.hpp"
#include "shapegeo/validation.hpp"

#include <algorithm>
#include <cctype>

namespace shapegeo {

    namespace {
        std::string label_for(ShapeType type) {
            auto name = shape_type_name(base_shape_type(type));
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return name;
        }

        void require_point_count(const ShapeRecord &record, std::size_t expected_points) {
            if (record.coordinates.size() != 2 * expected_points) {
                throw GeometryError(GeometryErrorKind::CoordinateCount,
                                    "Record " + std::to_string(record.record_number) + " declares " +
                                        std::to_string(expected_points) + " points but carries " +
                                        std::to_string(record.coordinates.size()) + " coordinate values");
            }
        }

        // Point index restarts at 0 for every part
        void validate_points(const std::vector<double> &coords, const std::vector<std::size_t> &sizes) {
            std::size_t offset = 0;
            for (std::size_t part = 0; part < sizes.size(); ++part) {
                for (std::size_t i = 0; i < sizes[part]; ++i, offset += 2) {
                    validate_point_coordinates(coords[offset], coords[offset + 1], static_cast<std::int32_t>(part),
                                               static_cast<std::int32_t>(i));
                }
            }
        }
    } // namespace

    std::vector<std::size_t> part_sizes(const std::vector<std::int32_t> &parts, std::int32_t num_points) {
        if (!parts.empty())
            validate_first_part_index(parts.front());
        for (auto index : parts)
            validate_part_index(index, num_points);

        std::vector<std::size_t> sizes;
        sizes.reserve(parts.size());
        for (std::size_t i = 0; i < parts.size(); ++i) {
            std::int32_t start = parts[i];
            std::int32_t end = i + 1 < parts.size() ? parts[i + 1] : num_points;
            validate_part_range(start, end, static_cast<std::int32_t>(i));
            sizes.push_back(static_cast<std::size_t>(end - start));
        }
        return sizes;
    }

    Feature decode_record(const ShapeRecord &record) {
        validate_record_content_length(record.content_length, record.record_number);

        Feature feature;
        feature.properties["recordNumber"] = std::to_string(record.record_number);
        feature.properties["shapeType"] = std::to_string(record.shape_type);

        if (!validate_shape_type(record.shape_type))
            return feature;

        auto type = static_cast<ShapeType>(record.shape_type);
        std::vector<std::size_t> sizes;

        switch (base_shape_type(type)) {
        case ShapeType::Point:
            require_point_count(record, 1);
            sizes = {1};
            break;
        case ShapeType::MultiPoint:
            validate_point_count(record.num_points, label_for(type));
            require_point_count(record, static_cast<std::size_t>(record.num_points));
            sizes = {static_cast<std::size_t>(record.num_points)};
            break;
        case ShapeType::PolyLine:
        case ShapeType::Polygon:
            validate_parts_and_points(record.num_parts, record.num_points, label_for(type));
            if (record.parts.size() != static_cast<std::size_t>(record.num_parts)) {
                throw GeometryError(GeometryErrorKind::CoordinateCount,
                                    "Record " + std::to_string(record.record_number) + " declares " +
                                        std::to_string(record.num_parts) + " parts but carries " +
                                        std::to_string(record.parts.size()) + " part indices");
            }
            sizes = part_sizes(record.parts, record.num_points);
            require_point_count(record, static_cast<std::size_t>(record.num_points));
            break;
        default:
            throw GeometryError(GeometryErrorKind::UnsupportedShapeType,
                                "Unsupported shape type: " + shape_type_name(type));
        }

        validate_points(record.coordinates, sizes);

        feature.geometry = process_geometry(record.shape_type, record.coordinates, sizes);
        feature.bbox = geometry_bounds(*feature.geometry);
        return feature;
    }

    DecodeResult decode_records(const std::vector<ShapeRecord> &records) {
        DecodeResult result;
        result.collection.features.reserve(records.size());
        for (auto const &record : records) {
            try {
                result.collection.features.push_back(decode_record(record));
            } catch (const ValidationError &e) {
                if (e.issue().scope() == ErrorScope::File)
                    throw;
                result.skipped.push_back(SkippedRecord{record.record_number, e.what()});
            } catch (const GeometryError &e) {
                result.skipped.push_back(SkippedRecord{record.record_number, e.what()});
            }
        }
        return result;
    }

} // namespace shapegeo

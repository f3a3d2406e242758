#include "shapegeo/validation.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace shapegeo {

    namespace {
        [[noreturn]] void fail(IssueType type, const std::string &message, const std::string &info) {
            throw ValidationError(ValidationIssue{type, message, ValidationDetails{to_string(type), info}});
        }

        bool all_finite(double a, double b) { return std::isfinite(a) && std::isfinite(b); }
    } // namespace

    void validate_header_buffer(std::size_t buffer_length) {
        if (buffer_length < HEADER_LENGTH) {
            std::ostringstream oss;
            oss << "Invalid shapefile: buffer too small for header (got " << buffer_length << ", need "
                << HEADER_LENGTH << ")";
            fail(IssueType::HeaderBuffer, oss.str(), "bufferLength=" + std::to_string(buffer_length));
        }
    }

    void validate_file_code(std::int32_t file_code) {
        if (file_code != FILE_CODE) {
            std::ostringstream oss;
            oss << "Invalid shapefile: incorrect file code (got " << file_code << ", expected " << FILE_CODE << ")";
            fail(IssueType::FileCode, oss.str(), "fileCode=" + std::to_string(file_code));
        }
    }

    void validate_file_length(std::size_t file_length, std::size_t buffer_length) {
        if (file_length < HEADER_LENGTH || file_length > buffer_length) {
            std::ostringstream oss;
            oss << "Invalid shapefile: incorrect file length (got " << file_length << ", buffer size "
                << buffer_length << ")";
            fail(IssueType::FileLength, oss.str(),
                 "fileLength=" + std::to_string(file_length) + ", bufferLength=" + std::to_string(buffer_length));
        }
    }

    void validate_version(std::int32_t version) {
        if (version != VERSION) {
            std::ostringstream oss;
            oss << "Invalid shapefile: unsupported version (got " << version << ", expected " << VERSION << ")";
            fail(IssueType::Version, oss.str(), "version=" + std::to_string(version));
        }
    }

    void validate_bounding_box(double x_min, double y_min, double x_max, double y_max) {
        if (!all_finite(x_min, y_min) || !all_finite(x_max, y_max)) {
            std::ostringstream oss;
            oss << std::setprecision(15);
            oss << "Invalid shapefile: invalid bounding box coordinates (" << x_min << ", " << y_min << ", " << x_max
                << ", " << y_max << ")";
            std::ostringstream info;
            info << std::setprecision(15);
            info << "xMin=" << x_min << ", yMin=" << y_min << ", xMax=" << x_max << ", yMax=" << y_max;
            fail(IssueType::BoundingBox, oss.str(), info.str());
        }
    }

    void validate_record_content_length(std::int32_t content_length, std::int32_t record_number) {
        if (content_length < 0 || content_length > MAX_RECORD_CONTENT_LENGTH) {
            std::ostringstream oss;
            oss << "Invalid shapefile: unreasonable record content length " << content_length << " for record "
                << record_number;
            fail(IssueType::RecordLength, oss.str(),
                 "contentLength=" + std::to_string(content_length) + ", recordNumber=" +
                     std::to_string(record_number));
        }
    }

    void validate_record_buffer_space(std::size_t offset, std::size_t record_size, std::size_t buffer_length,
                                      std::int32_t record_number) {
        // offset + record_size > buffer_length, written so the sum cannot wrap
        if (offset > buffer_length || record_size > buffer_length - offset) {
            std::size_t available = offset > buffer_length ? 0 : buffer_length - offset;
            std::ostringstream oss;
            oss << "Invalid shapefile: truncated record content for record " << record_number << " (need "
                << record_size << " bytes, have " << available << ")";
            fail(IssueType::BufferSpace, oss.str(),
                 "offset=" + std::to_string(offset) + ", recordSize=" + std::to_string(record_size) +
                     ", bufferLength=" + std::to_string(buffer_length));
        }
    }

    void validate_point_coordinates(double x, double y, std::int32_t part_index, std::int32_t point_index) {
        if (!all_finite(x, y)) {
            std::ostringstream oss;
            oss << std::setprecision(15);
            oss << "Invalid shapefile: non-finite coordinates (" << x << ", " << y << ") at part " << part_index
                << ", point " << point_index;
            fail(IssueType::PointCoordinates, oss.str(),
                 "partIndex=" + std::to_string(part_index) + ", pointIndex=" + std::to_string(point_index));
        }
    }

    void validate_parts_and_points(std::int32_t num_parts, std::int32_t num_points, const std::string &shape_type) {
        if (num_parts <= 0 || num_parts > MAX_PARTS_OR_POINTS || num_points <= 0 ||
            num_points > MAX_PARTS_OR_POINTS) {
            std::ostringstream oss;
            oss << "Invalid " << shape_type << ": unreasonable number of parts (" << num_parts << ") or points ("
                << num_points << ")";
            fail(IssueType::PartsPoints, oss.str(),
                 "numParts=" + std::to_string(num_parts) + ", numPoints=" + std::to_string(num_points));
        }
    }

    void validate_point_count(std::int32_t num_points, const std::string &shape_type) {
        if (num_points < 0 || num_points > MAX_PARTS_OR_POINTS) {
            std::ostringstream oss;
            oss << "Invalid " << shape_type << ": unreasonable number of points (" << num_points << ")";
            fail(IssueType::PartsPoints, oss.str(), "numPoints=" + std::to_string(num_points));
        }
    }

    void validate_first_part_index(std::int32_t part_index) {
        if (part_index != 0) {
            std::ostringstream oss;
            oss << "Invalid shapefile: first part starts at point " << part_index << " (expected 0)";
            fail(IssueType::PartIndex, oss.str(), "partIndex=0, start=" + std::to_string(part_index));
        }
    }

    void validate_part_index(std::int32_t part_index, std::int32_t num_points) {
        if (part_index < 0 || part_index >= num_points) {
            std::ostringstream oss;
            oss << "Invalid shapefile: part index " << part_index << " out of bounds (num points: " << num_points
                << ")";
            fail(IssueType::PartIndex, oss.str(),
                 "partIndex=" + std::to_string(part_index) + ", numPoints=" + std::to_string(num_points));
        }
    }

    void validate_part_range(std::int32_t start, std::int32_t end, std::int32_t part_index) {
        if (start >= end) {
            std::ostringstream oss;
            oss << "Invalid shapefile: part " << part_index << " has invalid range (" << start << " >= " << end
                << ")";
            fail(IssueType::PartRange, oss.str(),
                 "start=" + std::to_string(start) + ", end=" + std::to_string(end) + ", partIndex=" +
                     std::to_string(part_index));
        }
    }

    bool validate_shape_type(std::uint32_t shape_type) {
        switch (static_cast<ShapeType>(shape_type)) {
        case ShapeType::Null:
            return false;
        case ShapeType::Point:
        case ShapeType::PolyLine:
        case ShapeType::Polygon:
        case ShapeType::MultiPoint:
        case ShapeType::PointZ:
        case ShapeType::PolyLineZ:
        case ShapeType::PolygonZ:
        case ShapeType::MultiPointZ:
        case ShapeType::PointM:
        case ShapeType::PolyLineM:
        case ShapeType::PolygonM:
        case ShapeType::MultiPointM:
        case ShapeType::MultiPatch:
            return true;
        }
        fail(IssueType::ShapeType, "Invalid shape type: " + std::to_string(shape_type),
             "shapeType=" + std::to_string(shape_type));
    }

    void validate_header(const ShapefileHeader &header, std::size_t buffer_length) {
        validate_header_buffer(buffer_length);
        validate_file_code(header.file_code);
        validate_file_length(header.file_length, buffer_length);
        validate_version(header.version);
        validate_bounding_box(header.bbox.min_x, header.bbox.min_y, header.bbox.max_x, header.bbox.max_y);
        validate_shape_type(header.shape_type);
    }

} // namespace shapegeo

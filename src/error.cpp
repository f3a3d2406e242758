#include "shapegeo/error.hpp"

#include <utility>

namespace shapegeo {

    std::string to_string(IssueType type) {
        switch (type) {
        case IssueType::HeaderBuffer:
            return "HEADER_VALIDATION_ERROR";
        case IssueType::FileCode:
            return "FILE_CODE_ERROR";
        case IssueType::FileLength:
            return "FILE_LENGTH_ERROR";
        case IssueType::Version:
            return "VERSION_ERROR";
        case IssueType::BoundingBox:
            return "BBOX_ERROR";
        case IssueType::RecordLength:
            return "RECORD_LENGTH_ERROR";
        case IssueType::BufferSpace:
            return "BUFFER_SPACE_ERROR";
        case IssueType::PointCoordinates:
            return "POINT_COORDINATES_ERROR";
        case IssueType::PartsPoints:
            return "PARTS_POINTS_ERROR";
        case IssueType::PartIndex:
            return "PART_INDEX_ERROR";
        case IssueType::PartRange:
            return "PART_RANGE_ERROR";
        case IssueType::ShapeType:
            return "SHAPE_TYPE_ERROR";
        }
        return "UNKNOWN_ERROR";
    }

    ErrorScope scope_of(IssueType type) {
        switch (type) {
        case IssueType::HeaderBuffer:
        case IssueType::FileCode:
        case IssueType::FileLength:
        case IssueType::Version:
        case IssueType::BoundingBox:
            return ErrorScope::File;
        case IssueType::RecordLength:
        case IssueType::BufferSpace:
        case IssueType::PointCoordinates:
        case IssueType::PartsPoints:
        case IssueType::PartIndex:
        case IssueType::PartRange:
        case IssueType::ShapeType:
            return ErrorScope::Record;
        }
        return ErrorScope::File;
    }

    ErrorScope ValidationIssue::scope() const { return scope_of(type); }

    ValidationError::ValidationError(ValidationIssue issue)
        : std::runtime_error(issue.message), issue_(std::move(issue)) {}

} // namespace shapegeo

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace shapegeo {

    enum class IssueType {
        HeaderBuffer,
        FileCode,
        FileLength,
        Version,
        BoundingBox,
        RecordLength,
        BufferSpace,
        PointCoordinates,
        PartsPoints,
        PartIndex,
        PartRange,
        ShapeType
    };

    // File errors abort the whole file, record and geometry errors only the current record
    enum class ErrorScope { File, Record, Geometry };

    struct ValidationDetails {
        std::string code;
        std::string info;
    };

    struct ValidationIssue {
        IssueType type;
        std::string message;
        std::optional<ValidationDetails> details;

        ErrorScope scope() const;
    };

    // "HEADER_VALIDATION_ERROR", "FILE_CODE_ERROR", ...
    std::string to_string(IssueType type);

    ErrorScope scope_of(IssueType type);

    class ValidationError : public std::runtime_error {
      public:
        explicit ValidationError(ValidationIssue issue);

        const ValidationIssue &issue() const noexcept { return issue_; }

      private:
        ValidationIssue issue_;
    };

    enum class GeometryErrorKind {
        OddLength,
        TooFewPoints,
        SliceOutOfBounds,
        UnconsumedCoordinates,
        EmptyGeometry,
        UnsupportedShapeType,
        CoordinateCount
    };

    class GeometryError : public std::runtime_error {
      public:
        GeometryError(GeometryErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {}

        GeometryErrorKind kind() const noexcept { return kind_; }
        // Malformed geometry only ever costs the record it came from
        ErrorScope scope() const noexcept { return ErrorScope::Geometry; }

      private:
        GeometryErrorKind kind_;
    };

} // namespace shapegeo

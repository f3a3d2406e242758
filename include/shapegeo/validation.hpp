#pragma once

#include "shapegeo/error.hpp"
#include "shapegeo/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace shapegeo {

    // Each validator checks one framing or numeric invariant and throws ValidationError
    // describing the first violation. None of them keep state.

    void validate_header_buffer(std::size_t buffer_length);

    void validate_file_code(std::int32_t file_code);

    // file_length is in bytes
    void validate_file_length(std::size_t file_length, std::size_t buffer_length);

    void validate_version(std::int32_t version);

    void validate_bounding_box(double x_min, double y_min, double x_max, double y_max);

    // Content length is capped so a corrupt length field cannot drive a huge allocation
    void validate_record_content_length(std::int32_t content_length, std::int32_t record_number);

    void validate_record_buffer_space(std::size_t offset, std::size_t record_size, std::size_t buffer_length,
                                      std::int32_t record_number);

    void validate_point_coordinates(double x, double y, std::int32_t part_index, std::int32_t point_index);

    void validate_parts_and_points(std::int32_t num_parts, std::int32_t num_points, const std::string &shape_type);

    // Point-only shapes declare no parts; zero points is an empty shape
    void validate_point_count(std::int32_t num_points, const std::string &shape_type);

    // Parts tile the point array, so the first one starts at point 0
    void validate_first_part_index(std::int32_t part_index);

    void validate_part_index(std::int32_t part_index, std::int32_t num_points);

    void validate_part_range(std::int32_t start, std::int32_t end, std::int32_t part_index);

    // Returns false for the null shape (valid code, no geometry), true for any other
    // recognized code, throws for anything else.
    bool validate_shape_type(std::uint32_t shape_type);

    // Runs the header checks in the order a reader meets the fields
    void validate_header(const ShapefileHeader &header, std::size_t buffer_length);

    // Non-throwing form for callers that collect issues while streaming:
    //   if (auto issue = check([&] { validate_version(v); })) { ... }
    template <typename Fn> std::optional<ValidationIssue> check(Fn &&fn) {
        try {
            std::forward<Fn>(fn)();
        } catch (const ValidationError &e) {
            return e.issue();
        }
        return std::nullopt;
    }

} // namespace shapegeo

#include "shapegeo/shapegeo.hpp"
#include <iostream>

int main(int argc, char **argv) {
    std::filesystem::path out = argc > 1 ? argv[1] : "shapes.geojson";

    try {
        // 1) Header fields as a byte reader would hand them over
        shapegeo::ShapefileHeader header;
        header.file_code = shapegeo::FILE_CODE;
        header.file_length = 420;
        header.version = shapegeo::VERSION;
        header.shape_type = static_cast<std::uint32_t>(shapegeo::ShapeType::Polygon);
        header.bbox = shapegeo::Bounds{0.0, 0.0, 30.0, 10.0};

        if (auto issue = shapegeo::check([&] { shapegeo::validate_header(header, 420); })) {
            std::cerr << "ERROR: " << shapegeo::to_string(issue->type) << ": " << issue->message << "\n";
            return 1;
        }

        // 2) Records: a square with a hole, two disjoint squares, and a broken one
        std::vector<shapegeo::ShapeRecord> records(3);

        records[0].record_number = 1;
        records[0].content_length = 128;
        records[0].shape_type = 5;
        records[0].num_parts = 2;
        records[0].num_points = 10;
        records[0].parts = {0, 5};
        records[0].coordinates = {0, 0, 0, 10, 10, 10, 10, 0, 0, 0, 2, 2, 8, 2, 8, 8, 2, 8, 2, 2};

        records[1].record_number = 2;
        records[1].content_length = 128;
        records[1].shape_type = 5;
        records[1].num_parts = 2;
        records[1].num_points = 10;
        records[1].parts = {0, 5};
        records[1].coordinates = {20, 0, 20, 4, 24, 4, 24, 0, 20, 0, 26, 0, 26, 4, 30, 4, 30, 0, 26, 0};

        records[2].record_number = 3;
        records[2].content_length = 64;
        records[2].shape_type = 3;
        records[2].num_parts = 1;
        records[2].num_points = 2;
        records[2].parts = {7};
        records[2].coordinates = {0, 0, 1, 1};

        // 3) Decode and save
        auto skipped = shapegeo::write(records, out);
        for (auto const &s : skipped)
            std::cout << "Skipped record " << s.record_number << ": " << s.reason << "\n";
        std::cout << "Saved " << records.size() - skipped.size() << " features to " << out.string() << "\n";
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

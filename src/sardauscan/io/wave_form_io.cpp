#include "sardauscan/io/format_io.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/ostream.h>

namespace sardauscan {

std::string WaveFormIO::format_name() const {
    return "Wavefront OBJ files";
}

std::string WaveFormIO::extension() const {
    return ".obj";
}

void WaveFormIO::write(const std::string& filename, const ScanData& data) const {
    if (!data.has_mesh()) {
        throw std::runtime_error("Cannot write OBJ file " + filename + ": scan data has no faces");
    }

    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    auto cloud = data.cloud();
    out_file << "# Sardauscan\n";
    for (const auto& p : *cloud) {
        fmt::print(out_file, "v {} {} {}\n", p.x, p.y, p.z);
    }
    for (const auto& p : *cloud) {
        fmt::print(out_file, "vn {} {} {}\n", p.normal_x, p.normal_y, p.normal_z);
    }
    // OBJ indices are 1-based
    for (const auto& face : data.get_faces()) {
        const auto a = face.vertices[0] + 1;
        const auto b = face.vertices[1] + 1;
        const auto c = face.vertices[2] + 1;
        fmt::print(out_file, "f {}//{} {}//{} {}//{}\n", a, a, b, b, c, c);
    }

    if (!out_file.good()) {
        throw std::runtime_error("Error while writing OBJ file: " + filename);
    }
}

}  // namespace sardauscan

#include "sardauscan/io/format_io.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace sardauscan {

std::string PlyIO::format_name() const {
    return "PLY files";
}

std::string PlyIO::extension() const {
    return ".ply";
}

void PlyIO::write(const std::string& filename, const ScanData& data) const {
    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    auto cloud = data.cloud();
    const auto& faces = data.get_faces();

    out_file << "ply\n"
             << "format ascii 1.0\n"
             << "comment Sardauscan\n"
             << "element vertex " << cloud->size() << "\n"
             << "property float x\n"
             << "property float y\n"
             << "property float z\n"
             << "property float nx\n"
             << "property float ny\n"
             << "property float nz\n"
             << "property uchar red\n"
             << "property uchar green\n"
             << "property uchar blue\n";
    if (!faces.empty()) {
        out_file << "element face " << faces.size() << "\n"
                 << "property list uchar int vertex_indices\n";
    }
    out_file << "end_header\n";

    for (const auto& p : *cloud) {
        fmt::print(out_file, "{} {} {} {} {} {} {} {} {}\n",
                   p.x, p.y, p.z, p.normal_x, p.normal_y, p.normal_z,
                   static_cast<int>(p.r), static_cast<int>(p.g), static_cast<int>(p.b));
    }
    for (const auto& face : faces) {
        fmt::print(out_file, "3 {} {} {}\n", face.vertices[0], face.vertices[1], face.vertices[2]);
    }

    if (!out_file.good()) {
        throw std::runtime_error("Error while writing PLY file: " + filename);
    }
}

}  // namespace sardauscan

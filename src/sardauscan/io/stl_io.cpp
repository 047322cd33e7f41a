#include "sardauscan/io/format_io.hpp"

#include <array>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <Eigen/Geometry>
#include <boost/endian/conversion.hpp>

namespace sardauscan {

namespace {

constexpr size_t HEADER_SIZE = 80;

void write_uint32(std::ofstream& out, uint32_t value) {
    boost::endian::native_to_little_inplace(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

void write_float(std::ofstream& out, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    write_uint32(out, bits);
}

void write_vector(std::ofstream& out, const Eigen::Vector3f& v) {
    write_float(out, v.x());
    write_float(out, v.y());
    write_float(out, v.z());
}

}  // namespace

std::string StlIO::format_name() const {
    return "STL files";
}

std::string StlIO::extension() const {
    return ".stl";
}

/**
 * @brief Write the faces of a meshed ScanData as a binary STL file.
 *
 * Facet normals are recomputed from the triangle winding; degenerated triangles get a null normal.
 *
 * @throws std::runtime_error If the data has no faces or the file cannot be opened.
 */
void StlIO::write(const std::string& filename, const ScanData& data) const {
    if (!data.has_mesh()) {
        throw std::runtime_error("Cannot write STL file " + filename + ": scan data has no faces");
    }

    std::ofstream out_file(filename, std::ios::binary);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    std::array<char, HEADER_SIZE> header{};
    const char title[] = "Sardauscan binary STL";
    std::memcpy(header.data(), title, sizeof(title) - 1);
    out_file.write(header.data(), header.size());

    const auto& faces = data.get_faces();
    write_uint32(out_file, static_cast<uint32_t>(faces.size()));

    auto cloud = data.cloud();
    for (const auto& face : faces) {
        const Eigen::Vector3f a = (*cloud)[face.vertices[0]].getVector3fMap();
        const Eigen::Vector3f b = (*cloud)[face.vertices[1]].getVector3fMap();
        const Eigen::Vector3f c = (*cloud)[face.vertices[2]].getVector3fMap();

        Eigen::Vector3f normal = (b - a).cross(c - a);
        if (normal.norm() > 0.f) {
            normal.normalize();
        }

        write_vector(out_file, normal);
        write_vector(out_file, a);
        write_vector(out_file, b);
        write_vector(out_file, c);
        const uint16_t attribute = 0;
        out_file.write(reinterpret_cast<const char*>(&attribute), sizeof(attribute));
    }

    if (!out_file.good()) {
        throw std::runtime_error("Error while writing STL file: " + filename);
    }
}

}  // namespace sardauscan

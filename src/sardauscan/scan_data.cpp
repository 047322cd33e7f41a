#include "sardauscan/scan_data.hpp"

#include <stdexcept>
#include <fmt/format.h>

namespace sardauscan {

ScanPoint make_scan_point(float x, float y, float z, float nx, float ny, float nz, uint8_t r, uint8_t g, uint8_t b) {
    ScanPoint point;
    point.x = x;
    point.y = y;
    point.z = z;
    point.normal_x = nx;
    point.normal_y = ny;
    point.normal_z = nz;
    point.r = r;
    point.g = g;
    point.b = b;
    return point;
}

const std::vector<ScanLine>& ScanData::get_lines() const{
    return lines;
}

const std::vector<pcl::Vertices>& ScanData::get_faces() const{
    return faces;
}

void ScanData::add_line(const ScanLine& line){
    lines.push_back(line);
}

void ScanData::add_line(ScanLine&& line){
    lines.push_back(std::move(line));
}

void ScanData::add_face(uint32_t a, uint32_t b, uint32_t c){
    const size_t count = point_count();
    if (a >= count || b >= count || c >= count) {
        throw std::out_of_range(fmt::format("Face ({}, {}, {}) references a point outside [0, {})", a, b, c, count));
    }
    pcl::Vertices face;
    using Index = decltype(face.vertices)::value_type;
    face.vertices.push_back(static_cast<Index>(a));
    face.vertices.push_back(static_cast<Index>(b));
    face.vertices.push_back(static_cast<Index>(c));
    faces.push_back(face);
}

size_t ScanData::point_count() const{
    size_t count = 0;
    for (const auto& line : lines){
        count += line.size();
    }
    return count;
}

bool ScanData::has_mesh() const{
    return !faces.empty();
}

bool ScanData::empty() const{
    return lines.empty() && faces.empty();
}

void ScanData::clear(){
    lines.clear();
    faces.clear();
}

ScanCloud::Ptr ScanData::cloud() const{
    ScanCloud::Ptr all(new ScanCloud);
    all->reserve(point_count());
    for (const auto& line : lines){
        *all += line.points;
    }
    return all;
}

std::string ScanData::to_string() const{
    return fmt::format("{} lines, {} points, {} faces", lines.size(), point_count(), faces.size());
}

}  // namespace sardauscan

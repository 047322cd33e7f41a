#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <pcl/Vertices.h>
#include <pcl/point_cloud.h>
#include <pcl/point_types.h>

namespace sardauscan {

// Position, normal and colour of a single acquired sample
using ScanPoint = pcl::PointXYZRGBNormal;
using ScanCloud = pcl::PointCloud<ScanPoint>;

ScanPoint make_scan_point(float x, float y, float z,
                          float nx = 0.f, float ny = 0.f, float nz = 0.f,
                          uint8_t r = 255, uint8_t g = 255, uint8_t b = 255);

struct ScanLine {
    int laser_id = 0;
    ScanCloud points;

    ScanLine() = default;
    explicit ScanLine(int laser_id) : laser_id(laser_id) {}

    size_t size() const { return points.size(); }
    void push_back(const ScanPoint& point) { points.push_back(point); }
};

/**
 * @brief Payload exchanged between processing tasks: raw scan lines and, once a mesh has been
 * built, the triangles connecting them.
 *
 * Face indices refer to the concatenation of every line's points, in line order (see cloud()).
 */
class ScanData {
    public:
        const std::vector<ScanLine>& get_lines() const;
        const std::vector<pcl::Vertices>& get_faces() const;

        void add_line(const ScanLine& line);
        void add_line(ScanLine&& line);
        void add_face(uint32_t a, uint32_t b, uint32_t c);

        size_t point_count() const;
        bool has_mesh() const;
        bool empty() const;
        void clear();

        ScanCloud::Ptr cloud() const;
        std::string to_string() const;
    private:
        std::vector<ScanLine> lines;
        std::vector<pcl::Vertices> faces;
};

using ScanDataPtr = std::shared_ptr<ScanData>;

}  // namespace sardauscan

#include "sardauscan/io/format_io.hpp"

#include <stdexcept>
#include <pcl/io/pcd_io.h>

#include "sardauscan/utils/logging.hpp"

namespace sardauscan {

std::string PcdIO::format_name() const {
    return "PCD point cloud files";
}

std::string PcdIO::extension() const {
    return ".pcd";
}

// The whole cloud becomes a single scan line
ScanDataPtr PcdIO::read(const std::string& filename) const {
    ScanLine line;
    if (pcl::io::loadPCDFile<ScanPoint>(filename, line.points) == -1) {
        throw std::runtime_error("Cannot read PCD file: " + filename);
    }
    SDS_INFO("Loaded {} points from {}", line.size(), filename);

    auto data = std::make_shared<ScanData>();
    data->add_line(std::move(line));
    return data;
}

}  // namespace sardauscan

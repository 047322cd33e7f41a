#include "sardauscan/io/format_io.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/ostream.h>

namespace sardauscan {

std::string XyzIO::format_name() const {
    return "XYZ point files";
}

std::string XyzIO::extension() const {
    return ".xyz";
}

void XyzIO::write(const std::string& filename, const ScanData& data) const {
    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    for (const auto& line : data.get_lines()) {
        for (const auto& p : line.points) {
            fmt::print(out_file, "{} {} {}\n", p.x, p.y, p.z);
        }
    }

    if (!out_file.good()) {
        throw std::runtime_error("Error while writing XYZ file: " + filename);
    }
}

}  // namespace sardauscan

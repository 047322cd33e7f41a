#include "sardauscan/io/format_io.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "sardauscan/utils/logging.hpp"

using json = nlohmann::json;

namespace sardauscan {

namespace {

constexpr const char* FORMAT_TAG = "sardauscan";
constexpr int FORMAT_VERSION = 1;

json serialize_point(const ScanPoint& point) {
    return json::array({point.x, point.y, point.z,
                        point.normal_x, point.normal_y, point.normal_z,
                        point.r, point.g, point.b});
}

uint8_t parse_channel(const json& channel_json) {
    const int value = channel_json.get<int>();
    if (value < 0 || value > 255) {
        throw std::out_of_range("Colour channel out of [0, 255]: " + channel_json.dump());
    }
    return static_cast<uint8_t>(value);
}

ScanPoint parse_point(const json& point_json) {
    if (!point_json.is_array() || (point_json.size() != 3 && point_json.size() != 9)) {
        throw std::runtime_error("Scan point must hold 3 or 9 values: " + point_json.dump());
    }
    if (point_json.size() == 3) {
        return make_scan_point(point_json[0], point_json[1], point_json[2]);
    }
    return make_scan_point(point_json[0], point_json[1], point_json[2],
                           point_json[3], point_json[4], point_json[5],
                           parse_channel(point_json[6]), parse_channel(point_json[7]), parse_channel(point_json[8]));
}

}  // namespace

std::string ScanDataFormat::dialog_filter() const {
    return format_name() + " (*" + extension() + ")|*" + extension();
}

std::string ScanDataIO::format_name() const {
    return "Sardauscan scan files";
}

std::string ScanDataIO::extension() const {
    return ".scan";
}

void ScanDataIO::write(const std::string& filename, const ScanData& data) const {
    json scan_json = {};
    scan_json["format"] = FORMAT_TAG;
    scan_json["version"] = FORMAT_VERSION;
    scan_json["lines"] = json::array();
    scan_json["faces"] = json::array();

    for (const auto& line : data.get_lines()) {
        json line_json = {};
        line_json["laser_id"] = line.laser_id;
        line_json["points"] = json::array();
        for (const auto& point : line.points) {
            line_json["points"].push_back(serialize_point(point));
        }
        scan_json["lines"].push_back(line_json);
    }

    for (const auto& face : data.get_faces()) {
        scan_json["faces"].push_back(face.vertices);
    }

    std::ofstream out_file(filename);
    if (!out_file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }
    out_file << scan_json.dump(1);
    out_file.flush();
    if (!out_file.good()) {
        throw std::runtime_error("Error while writing scan file: " + filename);
    }
    out_file.close();
}

ScanDataPtr ScanDataIO::read(const std::string& filename) const {
    std::ifstream in_file(filename);
    if (!in_file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    auto data = std::make_shared<ScanData>();
    try {
        json scan_json = json::parse(in_file);
        if (scan_json.value("format", "") != FORMAT_TAG) {
            throw std::runtime_error("Not a scan file: " + filename);
        }
        if (scan_json.value("version", 0) > FORMAT_VERSION) {
            SDS_WARN("Scan file {} has version {}, newer than {}", filename, scan_json["version"].get<int>(), FORMAT_VERSION);
        }

        for (const auto& line_json : scan_json.at("lines")) {
            ScanLine line(line_json.value("laser_id", 0));
            for (const auto& point_json : line_json.at("points")) {
                line.push_back(parse_point(point_json));
            }
            data->add_line(std::move(line));
        }

        if (scan_json.contains("faces")) {
            for (const auto& face_json : scan_json["faces"]) {
                if (!face_json.is_array() || face_json.size() != 3) {
                    throw std::runtime_error("Face must hold 3 indices: " + face_json.dump());
                }
                data->add_face(face_json[0], face_json[1], face_json[2]);
            }
        }
    } catch (json::exception& e) {
        throw std::runtime_error("Malformed scan file " + filename + ": " + e.what());
    } catch (std::out_of_range& e) {
        throw std::runtime_error("Malformed scan file " + filename + ": " + e.what());
    }

    return data;
}

}  // namespace sardauscan

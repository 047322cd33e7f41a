#include "sardauscan/app_config.hpp"

#include <fstream>
#include <stdexcept>

#include "sardauscan/utils/logging.hpp"

using json = nlohmann::json;

namespace sardauscan {

AppConfig AppConfig::from_json(const json& config_json) {
    AppConfig config;
    try {
        config.settings_directory = config_json.value("settings_directory", config.settings_directory);
        SDS_INFO("settings_directory parameter defined, value: {}", config.settings_directory);

        config.user_data_path = config_json.value("user_data_path", config.user_data_path);
        SDS_INFO("user_data_path parameter defined, value: {}", config.user_data_path);

        config.pipeline_file = config_json.value("pipeline_file", config.pipeline_file);
        SDS_INFO("pipeline_file parameter defined, value: {}", config.pipeline_file);

        config.interactive = config_json.value("interactive", config.interactive);
        SDS_INFO("interactive parameter defined, value: {}", config.interactive);
    } catch (json::type_error& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }
    return config;
}

AppConfig AppConfig::load_from_file(const std::string& filename) {
    std::ifstream config_file(filename);
    if (!config_file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + filename);
    }

    json config_json;
    try {
        config_json = json::parse(config_file);
    } catch (json::parse_error& e) {
        throw std::runtime_error("Cannot parse configuration file " + filename + ": " + e.what());
    }
    return from_json(config_json);
}

json AppConfig::to_json() const {
    json config_json = {};
    config_json["settings_directory"] = settings_directory;
    config_json["user_data_path"] = user_data_path;
    config_json["pipeline_file"] = pipeline_file;
    config_json["interactive"] = interactive;
    return config_json;
}

}  // namespace sardauscan

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace sardauscan {

struct AppConfig {
    std::string settings_directory = "settings";
    std::string user_data_path = ".";
    std::string pipeline_file = "";
    bool interactive = true;

    // Missing keys keep their default value
    static AppConfig from_json(const nlohmann::json& config_json);
    static AppConfig load_from_file(const std::string& filename);
    nlohmann::json to_json() const;
};

}  // namespace sardauscan

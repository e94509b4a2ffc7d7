#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace capflow {

class Config {
public:
    static Config& getInstance();

    // Missing file or keys keep defaults. Returns false only on a parse error.
    bool load(const std::string& config_path);
    void applyJson(const nlohmann::json& j);

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }

    void setEngineConfig(const engine::EngineConfig& config) { engine_config_ = config; }

private:
    Config() = default;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";

    engine::EngineConfig engine_config_;
};

} // namespace capflow

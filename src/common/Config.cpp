#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace capflow {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<VenueWeight> parseWeights(const nlohmann::json& node) {
    std::vector<VenueWeight> weights;
    if (node.is_array()) {
        for (const auto& item : node) {
            weights.push_back(VenueWeight{item.value("venue", std::string()), item.value("weight_bps", 0)});
        }
    }
    return weights;
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

bool Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = path;
        }
    }

    std::cout << "Config path: " << config_path << std::endl;

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults: " << config_path << std::endl;
        return true;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        return true;
    }

    try {
        nlohmann::json j;
        file >> j;
        applyJson(j);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config load error: " << e.what() << std::endl;
        return false;
    }

    std::cout << "Config loaded: venues=" << engine_config_.venues.size()
              << ", assets=" << engine_config_.assets.size() << std::endl;
    return true;
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        log_level_ = toLowerCopy(l.value("level", log_level_));
        log_dir_ = l.value("dir", log_dir_);
    }

    if (j.contains("engine")) {
        const auto& e = j["engine"];
        const std::string mode_str = e.value("mode", std::string("PAPER"));
        engine_config_.mode = (mode_str == "LIVE") ? engine::EngineMode::LIVE : engine::EngineMode::PAPER;
        engine_config_.cycle_interval_seconds = e.value("cycle_interval_seconds", engine_config_.cycle_interval_seconds);
        engine_config_.journal_path = e.value("journal_path", engine_config_.journal_path);
        engine_config_.strategy_store_path = e.value("strategy_store_path", engine_config_.strategy_store_path);
    }

    if (j.contains("detector")) {
        const auto& d = j["detector"];
        auto& cfg = engine_config_.detector;
        cfg.utilization_threshold_bps = d.value("utilization_threshold_bps", cfg.utilization_threshold_bps);
        cfg.idle_threshold = d.value("idle_threshold", cfg.idle_threshold);
        cfg.time_threshold_ms = d.value("time_threshold_ms", cfg.time_threshold_ms);
        cfg.min_reallocation_amount = d.value("min_reallocation_amount", cfg.min_reallocation_amount);
        cfg.legacy_previous_detection_timing = d.value("legacy_previous_detection_timing", cfg.legacy_previous_detection_timing);
        cfg.history_limit = d.value("history_limit", cfg.history_limit);
    }

    if (j.contains("scorer")) {
        const auto& s = j["scorer"];
        auto& cfg = engine_config_.scorer;
        cfg.yield_threshold_bps = s.value("yield_threshold_bps", cfg.yield_threshold_bps);
        cfg.opportunity_ttl_ms = s.value("opportunity_ttl_ms", cfg.opportunity_ttl_ms);
        cfg.opportunity_retention = s.value("opportunity_retention", cfg.opportunity_retention);
        cfg.depth_saturation_multiple = s.value("depth_saturation_multiple", cfg.depth_saturation_multiple);
        cfg.size_fraction_bps = s.value("size_fraction_bps", cfg.size_fraction_bps);
        cfg.default_strategy = toLowerCopy(s.value("default_strategy", cfg.default_strategy));
    }

    if (j.contains("rate_limit")) {
        const auto& r = j["rate_limit"];
        auto& cfg = engine_config_.rate_limit;
        cfg.cooldown_ms = r.value("cooldown_ms", cfg.cooldown_ms);
        cfg.max_reallocation_bps_per_cycle = r.value("max_reallocation_bps_per_cycle", cfg.max_reallocation_bps_per_cycle);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        auto& cfg = engine_config_.strategy;
        cfg.minimum_interval_ms = s.value("minimum_interval_ms", cfg.minimum_interval_ms);
        cfg.default_adaptation_alpha = s.value("default_adaptation_alpha", cfg.default_adaptation_alpha);
    }

    if (j.contains("venues") && j["venues"].is_array()) {
        engine_config_.venues.clear();
        for (const auto& v : j["venues"]) {
            engine::VenueConfig venue;
            venue.id = v.value("id", std::string());
            venue.kind = v.value("kind", venue.kind);
            venue.fixed_execution_cost = v.value("fixed_execution_cost", venue.fixed_execution_cost);
            venue.execution_cost_bps = v.value("execution_cost_bps", venue.execution_cost_bps);
            venue.max_capacity = v.value("max_capacity", venue.max_capacity);
            venue.risk_score = v.value("risk_score", venue.risk_score);
            venue.yield_bps = v.value("yield_bps", venue.yield_bps);
            venue.utilization_bps = v.value("utilization_bps", venue.utilization_bps);
            venue.liquidity_depth = v.value("liquidity_depth", venue.liquidity_depth);
            if (!venue.id.empty()) {
                engine_config_.venues.push_back(std::move(venue));
            }
        }
    }

    if (j.contains("assets") && j["assets"].is_array()) {
        engine_config_.assets.clear();
        for (const auto& a : j["assets"]) {
            engine::AssetConfig asset;
            asset.asset = a.value("asset", std::string());
            asset.price = a.value("price", asset.price);
            asset.initial_deposit = a.value("initial_deposit", asset.initial_deposit);
            if (a.contains("target_weights")) {
                asset.target_weights = parseWeights(a["target_weights"]);
            }
            if (!asset.asset.empty()) {
                engine_config_.assets.push_back(std::move(asset));
            }
        }
    }
}

} // namespace capflow

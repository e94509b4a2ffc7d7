#pragma once

#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace capflow {
namespace engine {

enum class EngineMode {
    LIVE,           // real venue adapters
    PAPER           // simulated venues built from config
};

// Idle-capital detection thresholds.
struct DetectorConfig {
    Bps utilization_threshold_bps = 7000;
    Amount idle_threshold = 50000;
    long long time_threshold_ms = 0;
    Amount min_reallocation_amount = 10000;
    // Compare against the previous detection instead of the first-seen-idle time.
    bool legacy_previous_detection_timing = false;
    std::size_t history_limit = 256;
};

struct ScorerConfig {
    Bps yield_threshold_bps = 50;
    long long opportunity_ttl_ms = 180000;
    std::size_t opportunity_retention = 256;
    double depth_saturation_multiple = 5.0;
    Bps size_fraction_bps = 10000;
    std::string default_strategy = "balanced";
};

struct RateLimitDefaults {
    long long cooldown_ms = 3600000;
    Bps max_reallocation_bps_per_cycle = 10000;
};

struct StrategyDefaults {
    long long minimum_interval_ms = 60000;
    double default_adaptation_alpha = 0.2;
};

// Paper-mode venue description.
struct VenueConfig {
    std::string id;
    std::string kind = "lending";
    Amount fixed_execution_cost = 0;
    Bps execution_cost_bps = 0;
    Amount max_capacity = 0;
    int risk_score = 50;
    Bps yield_bps = 0;
    Bps utilization_bps = 10000;
    Amount liquidity_depth = 0;
};

struct AssetConfig {
    std::string asset;
    std::vector<VenueWeight> target_weights;
    double price = 1.0;
    Amount initial_deposit = 0;
};

struct EngineConfig {
    EngineMode mode = EngineMode::PAPER;
    int cycle_interval_seconds = 60;

    DetectorConfig detector;
    ScorerConfig scorer;
    RateLimitDefaults rate_limit;
    StrategyDefaults strategy;

    std::string journal_path = "logs/capflow_journal.jsonl";
    std::string strategy_store_path = "state/strategies.json";

    std::vector<VenueConfig> venues;
    std::vector<AssetConfig> assets;
};

} // namespace engine
} // namespace capflow

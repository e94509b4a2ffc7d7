#include "core/state/StrategyStoreJson.h"
#include "common/Logger.h"

#include <fstream>
#include <system_error>

namespace capflow {
namespace core {

StrategyStoreJson::StrategyStoreJson(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {}

nlohmann::json StrategyStoreJson::toJson(const ReallocationStrategy& s) {
    nlohmann::json node;
    node["id"] = s.id;
    node["name"] = s.name;
    node["kind"] = strategyKindToString(s.kind);
    node["asset"] = s.asset;
    node["source_venues"] = s.source_venues;
    node["target_venues"] = s.target_venues;
    node["target_weights"] = s.target_weights;
    node["scoring_weights"] = {
        {"yield_bps", s.scoring_weights.yield_bps},
        {"risk_bps", s.scoring_weights.risk_bps},
        {"liquidity_bps", s.scoring_weights.liquidity_bps},
        {"cost_bps", s.scoring_weights.cost_bps}
    };
    node["min_yield_improvement_bps"] = s.min_yield_improvement_bps;
    node["max_risk_increase"] = s.max_risk_increase;
    node["execution_frequency_ms"] = s.execution_frequency_ms;
    node["last_execution_ms"] = s.last_execution_ms;
    node["has_executed"] = s.has_executed;
    node["active"] = s.active;
    node["adaptive"] = s.adaptive;
    node["adaptation_alpha"] = s.adaptation_alpha;
    return node;
}

ReallocationStrategy StrategyStoreJson::strategyFromJson(const nlohmann::json& node) {
    ReallocationStrategy s;
    s.id = node.value("id", std::string());
    s.name = node.value("name", std::string());
    s.kind = strategyKindFromString(node.value("kind", std::string("balanced")));
    s.asset = node.value("asset", std::string());
    s.source_venues = node.value("source_venues", std::vector<VenueId>{});
    s.target_venues = node.value("target_venues", std::vector<VenueId>{});
    s.target_weights = node.value("target_weights", std::vector<Bps>{});
    if (node.contains("scoring_weights") && node["scoring_weights"].is_object()) {
        const auto& w = node["scoring_weights"];
        s.scoring_weights.yield_bps = w.value("yield_bps", s.scoring_weights.yield_bps);
        s.scoring_weights.risk_bps = w.value("risk_bps", s.scoring_weights.risk_bps);
        s.scoring_weights.liquidity_bps = w.value("liquidity_bps", s.scoring_weights.liquidity_bps);
        s.scoring_weights.cost_bps = w.value("cost_bps", s.scoring_weights.cost_bps);
    }
    s.min_yield_improvement_bps = node.value("min_yield_improvement_bps", 0);
    s.max_risk_increase = node.value("max_risk_increase", s.max_risk_increase);
    s.execution_frequency_ms = node.value("execution_frequency_ms", 0LL);
    s.last_execution_ms = node.value("last_execution_ms", 0LL);
    s.has_executed = node.value("has_executed", s.last_execution_ms > 0);
    s.active = node.value("active", false);
    s.adaptive = node.value("adaptive", false);
    s.adaptation_alpha = node.value("adaptation_alpha", s.adaptation_alpha);
    return s;
}

std::optional<StrategyStoreSnapshot> StrategyStoreJson::load() {
    if (!std::filesystem::exists(file_path_)) {
        return std::nullopt;
    }

    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }

    StrategyStoreSnapshot snapshot;
    try {
        nlohmann::json raw;
        in >> raw;
        snapshot.schema_version = raw.value("schema_version", 1);
        snapshot.saved_at_ms = raw.value("saved_at_ms", 0LL);
        for (const auto& node : raw.value("strategies", nlohmann::json::array())) {
            snapshot.strategies.push_back(strategyFromJson(node));
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Strategy store unreadable: {} ({})", file_path_.string(), e.what());
        return std::nullopt;
    }
    return snapshot;
}

bool StrategyStoreJson::save(const StrategyStoreSnapshot& snapshot) {
    nlohmann::json raw;
    raw["schema_version"] = snapshot.schema_version;
    raw["saved_at_ms"] = snapshot.saved_at_ms;
    raw["strategies"] = nlohmann::json::array();
    for (const auto& s : snapshot.strategies) {
        raw["strategies"].push_back(toJson(s));
    }

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            return false;
        }
    }

    auto tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << raw.dump(2);
        if (!out) {
            return false;
        }
    }

    std::filesystem::rename(tmp_path, file_path_, ec);
    if (!ec) {
        return true;
    }

    // rename over an existing file can fail on some filesystems; copy instead.
    ec.clear();
    std::filesystem::copy_file(tmp_path, file_path_, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return false;
    }
    std::filesystem::remove(tmp_path, ec);
    return true;
}

} // namespace core
} // namespace capflow

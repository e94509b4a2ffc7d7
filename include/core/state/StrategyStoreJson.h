#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/contracts/IStrategyStore.h"

namespace capflow {
namespace core {

class StrategyStoreJson : public IStrategyStore {
public:
    explicit StrategyStoreJson(std::filesystem::path file_path);

    std::optional<StrategyStoreSnapshot> load() override;
    bool save(const StrategyStoreSnapshot& snapshot) override;

    static nlohmann::json toJson(const ReallocationStrategy& strategy);
    static ReallocationStrategy strategyFromJson(const nlohmann::json& node);

private:
    std::filesystem::path file_path_;
};

} // namespace core
} // namespace capflow

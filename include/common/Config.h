#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "common/Settings.h"

namespace marketpipe {

class Config {
public:
    static Config& getInstance();
    void load(const std::string& config_path);

    // 테스트/재로드용 기본값 복원
    void reset();

    const StoreSettings& getStoreSettings() const { return store_; }
    const FreshnessSettings& getFreshnessSettings() const { return freshness_; }
    const DownloadSettings& getDownloadSettings() const { return download_; }
    const PipelineSettings& getPipelineSettings() const { return pipeline_; }

    std::string getLogLevel() const { return log_level_; }
    std::string getLogDir() const { return log_dir_; }

private:
    Config() = default;

    void applyJson(const nlohmann::json& j);
    void applyEnvOverrides();

    StoreSettings store_;
    FreshnessSettings freshness_;
    DownloadSettings download_;
    PipelineSettings pipeline_;
    std::string log_level_ = "info";
    std::string log_dir_ = "logs";
};

} // namespace marketpipe

#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace marketpipe {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

std::chrono::milliseconds secondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, seconds) * 1000.0));
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    store_ = StoreSettings{};
    freshness_ = FreshnessSettings{};
    download_ = DownloadSettings{};
    pipeline_ = PipelineSettings{};
    log_level_ = "info";
    log_dir_ = "logs";
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
            std::cout << "기본값을 사용합니다." << std::endl;
        } else {
            std::ifstream file(config_path);
            if (!file.is_open()) {
                std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            } else {
                nlohmann::json j;
                file >> j;
                applyJson(j);
                std::cout << "설정 파일 로드 완료" << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << std::endl;
    }

    applyEnvOverrides();
    std::cout << "Config Loaded: DataRoot=" << store_.data_root
              << ", Workers=" << pipeline_.max_workers << std::endl;
}

void Config::applyJson(const nlohmann::json& j) {
    if (j.contains("storage")) {
        auto& s = j["storage"];
        store_.data_root = s.value("data_root", store_.data_root);
        store_.retention_days = s.value("retention_days", store_.retention_days);
    }

    if (j.contains("freshness")) {
        auto& f = j["freshness"];
        freshness_.open_market_max_age_seconds =
            f.value("open_market_max_age_seconds", freshness_.open_market_max_age_seconds);
        freshness_.min_usable_rows = f.value("min_usable_rows", freshness_.min_usable_rows);
    }

    if (j.contains("download")) {
        auto& d = j["download"];
        download_.lookback_years = d.value("lookback_years", download_.lookback_years);
        download_.primary.max_attempts = d.value("primary_retries", download_.primary.max_attempts);
        download_.primary.delay = secondsToMs(d.value("primary_delay_seconds", download_.primary.delay.count() / 1000.0));
        download_.secondary.max_attempts = d.value("secondary_retries", download_.secondary.max_attempts);
        download_.secondary.delay = secondsToMs(d.value("secondary_delay_seconds", download_.secondary.delay.count() / 1000.0));
        download_.http_timeout_seconds = d.value("http_timeout_seconds", download_.http_timeout_seconds);
        download_.requests_per_second = d.value("requests_per_second", download_.requests_per_second);
    }

    if (j.contains("pipeline")) {
        auto& p = j["pipeline"];
        pipeline_.min_validation_rows = p.value("min_validation_rows", pipeline_.min_validation_rows);
        pipeline_.max_workers = std::max(1, p.value("max_workers", pipeline_.max_workers));
        if (p.contains("active_tickers") && p["active_tickers"].is_array()) {
            pipeline_.active_tickers.clear();
            for (const auto& t : p["active_tickers"]) {
                if (t.is_string()) {
                    pipeline_.active_tickers.push_back(trimCopy(t.get<std::string>()));
                }
            }
        }
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        log_level_ = l.value("level", log_level_);
        log_dir_ = l.value("log_dir", log_dir_);
    }
}

void Config::applyEnvOverrides() {
    const std::string data_root = readEnvVar("MARKETPIPE_DATA_ROOT");
    if (!data_root.empty()) {
        store_.data_root = data_root;
    }
    const std::string level = readEnvVar("MARKETPIPE_LOG_LEVEL");
    if (!level.empty()) {
        log_level_ = level;
    }
}

} // namespace marketpipe

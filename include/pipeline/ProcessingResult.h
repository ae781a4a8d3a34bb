#pragma once

#include "common/Types.h"
#include "market/FreshnessPolicy.h"
#include <map>
#include <optional>
#include <string>

namespace marketpipe {
namespace pipeline {

enum class ProcessingStage {
    NONE,
    PRECHECK,
    STRATEGY,
    DOWNLOAD,
    VALIDATION,
    DAILY_SAVE,
    EXISTING_PROCESS,
    INDICATORS,
    EXCEPTION
};

std::string toString(ProcessingStage stage);

// 종목 1건 처리 결과 (저장하지 않음)
struct ProcessingResult {
    bool success = false;
    bool skipped = false;
    std::string ticker;
    Market market = Market::US;

    std::string daily_path;
    std::string weekly_path;
    std::string monthly_path;
    std::map<Timeframe, std::string> indicator_paths;

    ProcessingStage failed_stage = ProcessingStage::NONE;
    std::string error;

    double elapsed_seconds = 0.0;
    size_t daily_rows = 0;
    size_t indicator_rows = 0;
    int indicators_succeeded = 0;
    int indicators_total = 0;

    std::optional<market::DataStrategy> strategy;
    std::string trace_id;

    // "OK", "SKIPPED", "FAILED(download)" 형태의 한 줄 요약
    std::string summary() const;
};

} // namespace pipeline
} // namespace marketpipe

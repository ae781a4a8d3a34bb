#include "pipeline/ProcessingResult.h"

#include <iomanip>
#include <sstream>

namespace marketpipe {
namespace pipeline {

std::string toString(ProcessingStage stage) {
    switch (stage) {
        case ProcessingStage::PRECHECK: return "precheck";
        case ProcessingStage::STRATEGY: return "strategy";
        case ProcessingStage::DOWNLOAD: return "download";
        case ProcessingStage::VALIDATION: return "validation";
        case ProcessingStage::DAILY_SAVE: return "daily_save";
        case ProcessingStage::EXISTING_PROCESS: return "existing_process";
        case ProcessingStage::INDICATORS: return "indicators";
        case ProcessingStage::EXCEPTION: return "exception";
        case ProcessingStage::NONE: default: return "none";
    }
}

std::string ProcessingResult::summary() const {
    std::ostringstream oss;
    oss << ticker << " (" << toString(market) << ") ";
    if (skipped) {
        oss << "SKIPPED";
    } else if (success) {
        oss << "OK";
        if (strategy) {
            oss << " [" << market::toString(*strategy) << "]";
        }
        oss << " rows=" << daily_rows
            << " indicators=" << indicators_succeeded << "/" << indicators_total;
    } else {
        oss << "FAILED(" << toString(failed_stage) << "): " << error;
    }
    oss << " " << std::fixed << std::setprecision(2) << elapsed_seconds << "s";
    return oss.str();
}

} // namespace pipeline
} // namespace marketpipe

#pragma once

#include "pipeline/PipelineOrchestrator.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace marketpipe {
namespace pipeline {

struct BatchRequest {
    std::string ticker;
    Market market = Market::US;
};

// 여러 종목을 고정 크기 워커 풀로 처리. 결과는 요청 순서 그대로
class BatchRunner {
public:
    BatchRunner(std::shared_ptr<ITickerProcessor> processor, int max_workers = 2);

    std::vector<ProcessingResult> runBatch(const std::vector<BatchRequest>& requests);

    // "005930:KOSPI" -> {005930, KOSPI}. 시장 생략 시 US, 알 수 없는 시장이면 nullopt
    static std::optional<BatchRequest> parseRequest(const std::string& text);

private:
    ProcessingResult runOne(const BatchRequest& request);

    std::shared_ptr<ITickerProcessor> processor_;
    int max_workers_;
};

} // namespace pipeline
} // namespace marketpipe

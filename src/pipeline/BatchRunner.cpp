#include "pipeline/BatchRunner.h"
#include "common/Logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace marketpipe {
namespace pipeline {

BatchRunner::BatchRunner(std::shared_ptr<ITickerProcessor> processor, int max_workers)
    : processor_(std::move(processor))
    , max_workers_(std::max(1, max_workers))
{
}

std::optional<BatchRequest> BatchRunner::parseRequest(const std::string& text) {
    BatchRequest request;
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        request.ticker = text;
        return request;
    }
    const auto market = parseMarket(text.substr(colon + 1));
    if (!market) {
        return std::nullopt;
    }
    request.ticker = text.substr(0, colon);
    request.market = *market;
    return request;
}

ProcessingResult BatchRunner::runOne(const BatchRequest& request) {
    try {
        return processor_->processTicker(request.ticker, request.market);
    } catch (const std::exception& e) {
        // 한 종목의 예외가 배치를 멈추지 않도록 실패 결과로 변환
        LOG_ERROR("[{}] 배치 처리 중 예외: {}", request.ticker, e.what());
        ProcessingResult failed;
        failed.ticker = request.ticker;
        failed.market = request.market;
        failed.failed_stage = ProcessingStage::EXCEPTION;
        failed.error = e.what();
        return failed;
    }
}

std::vector<ProcessingResult> BatchRunner::runBatch(const std::vector<BatchRequest>& requests) {
    std::vector<ProcessingResult> results(requests.size());
    if (requests.empty()) {
        return results;
    }

    const auto started = std::chrono::steady_clock::now();
    const int workers = std::min<int>(max_workers_, static_cast<int>(requests.size()));
    LOG_INFO("배치 시작 - {}개 종목, 워커 {}개", requests.size(), workers);

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        while (true) {
            const size_t index = next.fetch_add(1);
            if (index >= requests.size()) {
                break;
            }
            // 각 워커는 자기 인덱스 슬롯에만 기록
            results[index] = runOne(requests[index]);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    int succeeded = 0;
    int skipped = 0;
    int failed = 0;
    for (const auto& r : results) {
        if (r.skipped) {
            ++skipped;
        } else if (r.success) {
            ++succeeded;
        } else {
            ++failed;
        }
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    LOG_INFO("배치 완료 - total: {}, succeeded: {}, skipped: {}, failed: {} ({:.1f}s)",
             results.size(), succeeded, skipped, failed, elapsed);
    LOG_EVENT("batch.summary", nlohmann::json({
        {"total", results.size()},
        {"succeeded", succeeded},
        {"skipped", skipped},
        {"failed", failed},
        {"elapsed_s", elapsed}
    }));
    return results;
}

} // namespace pipeline
} // namespace marketpipe

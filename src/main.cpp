#include "common/Logger.h"
#include "common/Config.h"
#include "market/FreshnessPolicy.h"
#include "market/SessionClock.h"
#include "network/CurlHttpClient.h"
#include "provider/FinanceDataProvider.h"
#include "provider/ProviderResolver.h"
#include "provider/YahooChartProvider.h"
#include "storage/ArtifactReader.h"
#include "storage/ArtifactStore.h"
#include "storage/CsvCodec.h"
#include "storage/FileArtifactLocator.h"
#include "storage/RetentionSweeper.h"
#include "pipeline/BatchRunner.h"
#include "pipeline/PipelineOrchestrator.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace marketpipe;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cerr
        << "usage:\n"
        << "  marketpipe [--config PATH] run TICKER MARKET\n"
        << "  marketpipe [--config PATH] batch TICKER:MARKET [TICKER:MARKET ...]\n"
        << "  marketpipe [--config PATH] ensure TICKER MARKET\n"
        << "  marketpipe [--config PATH] sweep [DAYS]\n"
        << "  marketpipe [--config PATH] locate TICKER KIND MARKET TIMEFRAME\n"
        << "\n"
        << "  MARKET: US | KOSPI | KOSDAQ, KIND: ohlcv | indicators | crossinfo, TIMEFRAME: d | w | m\n";
}

// 설정값으로 파이프라인 구성요소 조립
struct PipelineComponents {
    std::shared_ptr<market::SessionClock> clock;
    std::shared_ptr<storage::FileArtifactLocator> locator;
    std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator;
};

PipelineComponents buildPipeline(const Config& config) {
    const auto& store_settings = config.getStoreSettings();
    const auto& download = config.getDownloadSettings();
    const auto& pipeline_settings = config.getPipelineSettings();

    PipelineComponents c;
    c.clock = std::make_shared<market::SessionClock>();
    c.locator = std::make_shared<storage::FileArtifactLocator>(store_settings);

    auto limiter = std::make_shared<network::RateLimiter>(download.requests_per_second);
    auto http = std::make_shared<network::CurlHttpClient>(download.http_timeout_seconds, limiter);

    auto resolver = std::make_shared<provider::ProviderResolver>(
        std::make_shared<provider::YahooChartProvider>(http),
        std::make_shared<provider::FinanceDataProvider>(http),
        download);

    auto freshness = std::make_shared<market::FreshnessPolicy>(
        c.locator, c.clock, config.getFreshnessSettings());
    auto store = std::make_shared<storage::ArtifactStore>(store_settings, c.clock);
    auto allow_list = std::make_shared<pipeline::ConfigTickerAllowList>(pipeline_settings.active_tickers);

    c.orchestrator = std::make_shared<pipeline::PipelineOrchestrator>(
        freshness, resolver, store, c.locator, c.clock,
        pipeline_settings, download.lookback_years, allow_list);
    return c;
}

int exitCodeFor(const std::vector<pipeline::ProcessingResult>& results) {
    for (const auto& r : results) {
        if (!r.success) {
            return kExitFailed;
        }
    }
    return kExitOk;
}

int runLocate(const PipelineComponents& c, const std::vector<std::string>& args) {
    if (args.size() != 4) {
        printUsage();
        return kExitUsage;
    }
    const auto kind = parseArtifactKind(args[1]);
    const auto timeframe = parseTimeframe(args[3]);
    if (!kind || !timeframe) {
        printUsage();
        return kExitUsage;
    }
    const auto market = parseMarket(args[2]);
    if (!market) {
        printUsage();
        return kExitUsage;
    }

    auto found = c.locator->locate(args[0], *kind, *market, *timeframe);
    if (!found) {
        std::cout << "not found" << std::endl;
        return kExitFailed;
    }
    std::cout << found->path.string() << std::endl;

    if (*kind == ArtifactKind::OHLCV) {
        if (auto quote = storage::ArtifactReader::readLatestQuote(found->path)) {
            std::cout << "  latest " << storage::CsvCodec::formatTimestamp(quote->timestamp)
                      << " close=" << storage::CsvCodec::formatNumber(quote->close)
                      << " change=" << quote->change_percent << "%" << std::endl;
        }
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                printUsage();
                return kExitUsage;
            }
            config_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        printUsage();
        return kExitUsage;
    }

    try {
        Config::getInstance().load(config_path);
        auto& config = Config::getInstance();
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const std::string command = args.front();
        const std::vector<std::string> rest(args.begin() + 1, args.end());

        if (command == "sweep") {
            int days = 0;
            if (!rest.empty()) {
                try {
                    days = std::stoi(rest[0]);
                } catch (const std::exception&) {
                    printUsage();
                    return kExitUsage;
                }
            }
            storage::RetentionSweeper sweeper(config.getStoreSettings());
            const auto stats = sweeper.sweep(days);
            std::cout << "removed " << stats.removed_files << " files, "
                      << stats.freed_bytes << " bytes freed" << std::endl;
            return kExitOk;
        }

        PipelineComponents components = buildPipeline(config);

        if (command == "locate") {
            return runLocate(components, rest);
        }

        if (command == "run" || command == "ensure") {
            if (rest.size() != 2) {
                printUsage();
                return kExitUsage;
            }
            const auto market = parseMarket(rest[1]);
            if (!market) {
                printUsage();
                return kExitUsage;
            }
            const auto result = (command == "run")
                ? components.orchestrator->processTicker(rest[0], *market)
                : components.orchestrator->ensureIndicators(rest[0], *market);
            std::cout << result.summary() << std::endl;
            return result.success ? kExitOk : kExitFailed;
        }

        if (command == "batch") {
            if (rest.empty()) {
                printUsage();
                return kExitUsage;
            }
            std::vector<pipeline::BatchRequest> requests;
            for (const auto& item : rest) {
                auto request = pipeline::BatchRunner::parseRequest(item);
                if (!request) {
                    std::cerr << "unknown market in '" << item << "'" << std::endl;
                    printUsage();
                    return kExitUsage;
                }
                requests.push_back(*request);
            }
            pipeline::BatchRunner runner(components.orchestrator, config.getPipelineSettings().max_workers);
            const auto results = runner.runBatch(requests);
            for (const auto& r : results) {
                std::cout << r.summary() << std::endl;
            }
            return exitCodeFor(results);
        }

        printUsage();
        return kExitUsage;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "오류가 발생했습니다: " << e.what() << std::endl;
        return kExitFailed;
    }
}

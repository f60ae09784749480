#include "livefeed/LiveTradesPipeline.hpp"
#include "livefeed/config/PipelineConfig.hpp"
#include "Cpp20Utils.hpp"
#include <QCoreApplication>
#include <QTimer>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::string configPath;
    bool        whalesOnly = false;
    std::string csvPath;
    int         seconds = 0;   // 0 = run until interrupted
};

void printUsage() {
    std::cerr << "usage: tidewatch_stream [config.json] [--whales] [--csv out.csv] [--seconds N]\n";
}

std::optional<CliOptions> parseArgs(const QStringList& args) {
    CliOptions opts;
    for (int i = 1; i < args.size(); ++i) {
        const QString& a = args.at(i);
        if (a == "--whales") {
            opts.whalesOnly = true;
        } else if (a == "--csv" && i + 1 < args.size()) {
            opts.csvPath = args.at(++i).toStdString();
        } else if (a == "--seconds" && i + 1 < args.size()) {
            bool ok = false;
            opts.seconds = args.at(++i).toInt(&ok);
            if (!ok || opts.seconds < 0) return std::nullopt;
        } else if (a == "-h" || a == "--help") {
            return std::nullopt;
        } else if (!a.startsWith("--") && opts.configPath.empty()) {
            opts.configPath = a.toStdString();
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    const auto opts = parseArgs(app.arguments());
    if (!opts) {
        printUsage();
        return 2;
    }

    PipelineConfig config;
    try {
        if (!opts->configPath.empty()) {
            config = PipelineConfig::loadFromFile(opts->configPath);
        }
        config.applyEnvironment();
    } catch (const std::exception& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<LiveTradesPipeline> pipeline;
    try {
        pipeline = std::make_unique<LiveTradesPipeline>(config);
    } catch (const std::exception& e) {
        std::cerr << "[startup] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[Tidewatch stream starting...]" << std::endl;

    QObject::connect(pipeline.get(), &LiveTradesPipeline::connectionStateChanged, &app, [](FeedState s) {
        std::cout << "[feed] " << toString(s) << std::endl;
    });
    QObject::connect(pipeline.get(), &LiveTradesPipeline::healthChanged, &app, [](HealthStatus h) {
        std::cout << "[health] " << toString(h) << std::endl;
    });
    QObject::connect(pipeline.get(), &LiveTradesPipeline::errorOccurred, &app, [](const QString& err) {
        std::cerr << "[error] " << err.toStdString() << std::endl;
    });
    QObject::connect(pipeline.get(), &LiveTradesPipeline::whaleAlert, &app, [](const Trade& t) {
        std::cout << "[whale] " << Cpp20Utils::formatTradeLog(t, 0) << " " << t.title << std::endl;
    });
    if (!opts->whalesOnly) {
        auto* p = pipeline.get();
        QObject::connect(p, &LiveTradesPipeline::tradesFlushed, &app, [p](const std::vector<Trade>& batch) {
            const auto logSize = p->recentTrades().size();
            for (const auto& t : batch) {
                std::cout << Cpp20Utils::formatTradeLog(t, logSize) << std::endl;
            }
        });
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &app, [&pipeline, &opts]() {
        if (!opts->csvPath.empty()) {
            FilterState filter;
            filter.whalesOnly = opts->whalesOnly;
            std::ofstream out(opts->csvPath, std::ios::binary);
            if (!out) {
                std::cerr << "[csv] cannot open " << opts->csvPath << std::endl;
            } else {
                const auto rows = pipeline->exportCsv(filter, out);
                std::cout << "[csv] wrote " << rows << " trades to " << opts->csvPath << std::endl;
            }
        }
        const auto s = pipeline->stats();
        std::cout << "[stats] trades=" << s.tradeCount
                  << " volume=" << Cpp20Utils::formatVolume(s.totalVolume)
                  << " buy_pressure=" << s.buyPressure << "%" << std::endl;
        pipeline->stop();
    });

    if (opts->seconds > 0) {
        QTimer::singleShot(opts->seconds * 1000, &app, &QCoreApplication::quit);
    }

    pipeline->start();
    return app.exec();
}

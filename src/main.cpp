#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "engine/DashboardPipeline.h"
#include "engine/DatasetJson.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

using namespace instflow;

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <path>]\n"
              << "  Fetches the latest FII/DII bulk/block deals, scores every traded\n"
              << "  security and prints the dataset as JSON on stdout.\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = (utils::PathUtils::getConfigDir() / "config.json").string();

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    Config& config = Config::getInstance();
    config.load(config_path);

    try {
        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("instflow - FII/DII deal signal snapshot");
    LOG_INFO("========================================");

    try {
        auto pipeline = engine::DashboardPipeline::createDefault(config.getEngineConfig());
        const auto dataset = pipeline->build();

        const nlohmann::json out = dataset;
        std::cout << out.dump(2) << std::endl;

        if (dataset.stocks.empty()) {
            LOG_ERROR("No stocks in dataset");
            return 1;
        }
        LOG_INFO("Done: {} stocks from '{}'", dataset.stocks.size(), dataset.source_label);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}

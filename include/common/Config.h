#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace instflow {

class Config {
public:
    static Config& getInstance();

    // Missing file or parse errors keep the defaults; never throws
    void load(const std::string& config_path);

    // Applies a parsed document on top of the current values
    void apply(const nlohmann::json& j);

    // Restores built-in defaults
    void reset();

    std::string getLogLevel() const { return engine_config_.logging.level; }
    std::string getLogDir() const { return engine_config_.logging.dir; }

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    engine::CalendarConfig getCalendarConfig() const { return engine_config_.calendar; }
    engine::ClassifierConfig getClassifierConfig() const { return engine_config_.classifier; }
    engine::DealSourceConfig getDealSourceConfig() const { return engine_config_.sources; }
    engine::PriceConfig getPriceConfig() const { return engine_config_.prices; }
    engine::IndicatorConfig getIndicatorConfig() const { return engine_config_.indicators; }

private:
    Config() = default;
    void applyEnvironment();

    engine::EngineConfig engine_config_;
};

} // namespace instflow

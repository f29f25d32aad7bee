#include "logging/LogRegistry.hpp"
#include "config/Config.hpp"

#include <stdexcept>

namespace hl::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // help goes to stderr as well, keep log lines on the same stream
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    makeLogger("helpline", cnf.subsystem_levels.helpline);
    makeLogger("render",   cnf.subsystem_levels.render);

    initialized_ = true;
    helpline()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> LogRegistry::tryGet(const std::string& name) {
    if (!initialized_) return nullptr;
    return spdlog::get(name);
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::shutdown() {
    if (!initialized_) return;
    spdlog::drop("helpline");
    spdlog::drop("render");
    console_sink_.reset();
    initialized_ = false;
}

}

#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hl::config {
struct LoggingConfig;
}

namespace hl::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Like get(), but nullptr instead of throwing while the registry is not initialized.
    static std::shared_ptr<spdlog::logger> tryGet(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> helpline()  { return get("helpline"); }
    static std::shared_ptr<spdlog::logger> render()    { return get("render"); }

    [[nodiscard]] static bool isInitialized();

    // Drops every registered logger, used between test environments.
    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
};

}

#include "ctxsys/core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace ctxsys::core {

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    auto level = spdlog::level::from_str(config.log_level);
    if (level == spdlog::level::off && config.log_level != "off") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "Unknown log level",
            config.log_level
        );
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_path.empty()) {
        try {
            if (config.log_path.has_parent_path()) {
                std::error_code ec;
                fs::create_directories(config.log_path.parent_path(), ec);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_path.string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            return Result<void, Error>::err(
                ErrorCode::ConfigWriteFailed,
                std::string("Failed to open log file: ") + e.what(),
                config.log_path.string()
            );
        }
    }

    auto logger = std::make_shared<spdlog::logger>("ctxsys", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    return Result<void, Error>::ok();
}

}  // namespace ctxsys::core

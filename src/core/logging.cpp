#include "ctxpack/core/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace ctxpack::core {

Result<void, Error> init_logging(const ObservabilityConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        if (!config.log_path.empty()) {
            fs::create_directories(config.log_path);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                (config.log_path / "ctxpack.log").string()));
        }

        auto logger = std::make_shared<spdlog::logger>("ctxpack", sinks.begin(), sinks.end());

        auto level = spdlog::level::from_str(config.log_level);
        if (level == spdlog::level::off && config.log_level != "off") {
            level = spdlog::level::info;
        }
        logger->set_level(level);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        spdlog::set_default_logger(std::move(logger));
        return Result<void, Error>::ok();

    } catch (const spdlog::spdlog_ex& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            std::string("Failed to initialize logging: ") + e.what(),
            config.log_path.string()
        );
    } catch (const fs::filesystem_error& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            config.log_path.string()
        );
    }
}

}  // namespace ctxpack::core

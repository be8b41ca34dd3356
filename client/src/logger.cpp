#include "chunkvault/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace chunkvault::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            logger_ = std::make_shared<spdlog::logger>("client", std::make_shared<spdlog::sinks::null_sink_mt>());
            logger_->set_level(spdlog::level::off);
            return;
        }
        // Appends across runs.
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
        logger_ = std::make_shared<spdlog::logger>("client", std::move(sink));
        logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
        logger_->set_level(spdlog::level::info);
        logger_->flush_on(spdlog::level::warn);
    }

} // namespace chunkvault::client

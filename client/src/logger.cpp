#include "tusclient/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace tusclient::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        spdlog::sink_ptr sink;
        if (path)
        {
            try
            {
                sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            }
            catch (const spdlog::spdlog_ex &ex)
            {
                // Reported once on the default logger; uploads continue without a log file.
                spdlog::warn("tusclient: cannot open log file {}: {}", path->string(), ex.what());
            }
        }
        if (!sink)
        {
            sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        }
        logger_ = std::make_shared<spdlog::logger>("tusclient", std::move(sink));
        logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
        logger_->set_level(spdlog::level::info);
    }

} // namespace tusclient::client

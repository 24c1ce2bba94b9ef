#include <jsonease/core/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace jsonease {

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("jsonease");
    if (!logger)
    {
        // Another thread may have registered it in the meantime, in which
        // case stdout_color_mt throws and we just use theirs.
        try
        {
            logger = spdlog::stdout_color_mt("jsonease");
            logger->set_level(spdlog::level::warn);
        }
        catch (spdlog::spdlog_ex&)
        {
            logger = spdlog::get("jsonease");
        }
    }
    return logger;
}

} // namespace jsonease

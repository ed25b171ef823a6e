#include <docpatch/utilities/logging.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace docpatch {

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("docpatch");
    if (!logger)
    {
        // Another thread may have registered it in the meantime, in which
        // case registration throws and we use theirs.
        try
        {
            logger = spdlog::stderr_color_mt("docpatch");
            logger->set_level(spdlog::level::warn);
        }
        catch (spdlog::spdlog_ex&)
        {
            logger = spdlog::get("docpatch");
        }
    }
    return logger;
}

void
initialize_logging(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

} // namespace docpatch

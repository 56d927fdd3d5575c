#include <vitrine/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vitrine/utilities/text.h>

namespace vitrine {

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto logger = spdlog::get("vitrine");
    if (logger)
        return logger;

    static std::mutex creation_mutex;
    std::scoped_lock<std::mutex> lock(creation_mutex);
    // Check again in case another thread just created it.
    logger = spdlog::get("vitrine");
    if (!logger)
        logger = spdlog::stdout_color_mt("vitrine");
    return logger;
}

spdlog::level::level_enum
parse_log_level(string const& name)
{
    auto level = spdlog::level::from_str(name);
    // spdlog maps unrecognized names to "off", so make sure that's really
    // what was requested.
    if (level == spdlog::level::off && name != "off")
    {
        VITRINE_THROW(
            parsing_error()
            << expected_format_info("log level") << parsed_text_info(name));
    }
    return level;
}

} // namespace vitrine

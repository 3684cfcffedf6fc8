/**
 * @file logging.cpp
 * @brief Default and null logger factories.
 */

#include "core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace perfrisk
{

    LoggerPtr default_logger()
    {
        static const std::string NAME = "perfrisk";

        auto existing = spdlog::get(NAME);
        if (existing)
        {
            return existing;
        }
        try
        {
            return spdlog::stderr_color_mt(NAME);
        }
        catch (const spdlog::spdlog_ex &)
        {
            // Another caller registered it between get() and create.
            return spdlog::get(NAME);
        }
    }

    LoggerPtr null_logger()
    {
        return std::make_shared<spdlog::logger>("perfrisk-null");
    }

    LoggerPtr resolve_logger(LoggerPtr logger)
    {
        return logger ? logger : default_logger();
    }

} // namespace perfrisk

/**
 * @file logging.hpp
 * @brief Logger handles injected into each analytics component.
 *
 * Every component receives a LoggerPtr at construction instead of using a
 * process-wide logger, so tests can attach their own sink and assert on
 * what was written.
 */

#ifndef PERFRISK_CORE_LOGGING_HPP
#define PERFRISK_CORE_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace perfrisk
{

    using LoggerPtr = std::shared_ptr<spdlog::logger>;

    /**
     * @brief Shared stderr logger named "perfrisk", created on first use.
     */
    LoggerPtr default_logger();

    /**
     * @brief Logger with no sinks; everything written to it is discarded.
     */
    LoggerPtr null_logger();

    /**
     * @brief Return @p logger, or default_logger() when it is null.
     */
    LoggerPtr resolve_logger(LoggerPtr logger);

} // namespace perfrisk

#endif // PERFRISK_CORE_LOGGING_HPP

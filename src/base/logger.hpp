/**
 * @file       logger.hpp
 * @brief      Tagged spdlog loggers shared by the witness, proof and CLI modules
 * @date       2026-10-17
 */

#ifndef _NIZK_LOGGER_HPP_
#define _NIZK_LOGGER_HPP_

#include <memory>
#include <string>

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace nizk::base
{
    using Logger = std::shared_ptr<spdlog::logger>;

    /**
     * @brief       Provide logger object
     * @param[in]   tag tagging name for identifying logger
     * @param[in]   basepath optional file to log into instead of the colored stdout sink
     * @return      logger object, shared between every caller using the same tag
     */
    Logger createLogger( const std::string &tag, const std::string &basepath = "" );

    /**
     * @brief       Switch every registered logger (and the ones created later) to @p level
     * @param[in]   level spdlog level name: trace, debug, info, warn, err, critical or off
     * @return      false if @p level is not a known level name
     */
    bool setLogLevel( const std::string &level );
}

#endif

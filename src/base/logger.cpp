/**
 * @file       logger.cpp
 * @brief      Tagged spdlog loggers shared by the witness, proof and CLI modules
 * @date       2026-10-17
 */

#include "base/logger.hpp"

#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace
{
    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag,
                                                  bool               debug_mode,
                                                  const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            // stderr keeps stdout free for proof bytes and command output
            logger = spdlog::stderr_color_mt( tag );
        }

        if ( debug_mode )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        return logger;
    }
} // namespace

namespace nizk::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        static std::mutex           mutex;
        std::lock_guard<std::mutex> lock( mutex );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, spdlog::get_level() <= spdlog::level::debug, basepath );
            logger->set_level( spdlog::get_level() );
        }
        return logger;
    }

    bool setLogLevel( const std::string &level )
    {
        auto parsed = spdlog::level::from_str( level );
        if ( parsed == spdlog::level::off && level != "off" )
        {
            return false;
        }
        spdlog::set_level( parsed );
        return true;
    }
} // namespace nizk::base

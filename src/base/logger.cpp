#include "base/logger.hpp"
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace
{
    std::mutex &registryMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    std::string &defaultLogFile()
    {
        static std::string path;
        return path;
    }

    void setGlobalPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S][%l][%n] %v" );
    }

    void setDebugPattern( spdlog::logger &logger )
    {
        logger.set_pattern( "[%Y-%m-%d %H:%M:%S.%F][th:%t][%l][%n] %v" );
    }

    std::shared_ptr<spdlog::logger> createLogger( const std::string &tag, const std::string &basepath )
    {
        std::shared_ptr<spdlog::logger> logger;
        if ( !basepath.empty() )
        {
            logger = spdlog::basic_logger_mt( tag, basepath );
        }
        else
        {
            logger = spdlog::stdout_color_mt( tag );
        }

        if ( spdlog::get_level() <= spdlog::level::debug )
        {
            setDebugPattern( *logger );
        }
        else
        {
            setGlobalPattern( *logger );
        }
        logger->set_level( spdlog::get_level() );
        return logger;
    }
} // namespace

namespace chainrelay::base
{
    Logger createLogger( const std::string &tag, const std::string &basepath )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        auto                        logger = spdlog::get( tag );
        if ( logger == nullptr )
        {
            logger = ::createLogger( tag, basepath.empty() ? defaultLogFile() : basepath );
        }
        return logger;
    }

    void setLogLevel( spdlog::level::level_enum level )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        spdlog::set_level( level );
        spdlog::apply_all(
            [level]( const std::shared_ptr<spdlog::logger> &logger )
            {
                if ( level <= spdlog::level::debug )
                {
                    setDebugPattern( *logger );
                }
                else
                {
                    setGlobalPattern( *logger );
                }
            } );
    }

    void setDefaultLogFile( const std::string &path )
    {
        std::lock_guard<std::mutex> lock( registryMutex() );
        defaultLogFile() = path;
    }
} // namespace chainrelay::base

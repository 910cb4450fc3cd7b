/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_UTILS_DEFAULT_LOGGER_H_
#define OCELOT_UTILS_DEFAULT_LOGGER_H_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#include "Logger.h"

namespace Ocelot::Utils
{
    /**
     * @brief Console logger writing "HH:MM:SS.mmm [LEVEL] file:line:function: message".
     *
     * Error and Critical messages go to std::cerr, everything else to std::cout.
     */
    class DefaultLogger : public Logger {
    private:
        LogLevel currentLevel_ = LogLevel::Info;
        mutable std::mutex logMutex_;
        bool includeTimestamp_ = true;
        bool includeSourceLocation_ = true;

        static constexpr const char* logLevelToString( LogLevel level ) {
            switch ( level ) {
                case LogLevel::Trace:    return "TRACE";
                case LogLevel::Debug:    return "DEBUG";
                case LogLevel::Info:     return "INFO ";
                case LogLevel::Warning:  return "WARN ";
                case LogLevel::Error:    return "ERROR";
                case LogLevel::Critical: return "CRIT ";
                default:                 return "UNKN ";
            }
        }

        std::string getCurrentTimestamp() const {
            if ( !includeTimestamp_ ) return "";

            auto now = std::chrono::system_clock::now();
            auto time_t_now = std::chrono::system_clock::to_time_t( now );
            auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) % 1000;

            std::ostringstream oss;
            std::tm tm_buf{};

        #ifdef _MSC_VER
            localtime_s( &tm_buf, &time_t_now );
        #else
            localtime_r( &time_t_now, &tm_buf );
        #endif

            oss << std::put_time( &tm_buf, "%H:%M:%S" );
            oss << '.' << std::setfill( '0' ) << std::setw( 3 ) << now_ms.count() << " ";
            return oss.str();
        }

        std::string getLocationInfo( const std::source_location& location ) const {
            if ( !includeSourceLocation_ ) return "";

            std::string_view full_path( location.file_name() );
            size_t last_slash = full_path.find_last_of( "/\\" );
            std::string_view filename = (last_slash == std::string_view::npos) ?
                full_path : full_path.substr( last_slash + 1 );

            std::ostringstream oss;
            oss << filename << ":" << location.line() << ":" << shortFunctionName( location.function_name() ) << ": ";
            return oss.str();
        }

        // Reduces "void Ns::Class::method(args) const" to "method".
        static std::string_view shortFunctionName( std::string_view signature ) {
            size_t paren = signature.find( '(' );
            std::string_view name = (paren == std::string_view::npos) ? signature : signature.substr( 0, paren );
            size_t last_colon = name.find_last_of( ':' );
            if ( last_colon != std::string_view::npos ) {
                name = name.substr( last_colon + 1 );
            }
            size_t last_space = name.find_last_of( ' ' );
            return (last_space == std::string_view::npos) ? name : name.substr( last_space + 1 );
        }

        void logImpl( std::string_view message, LogLevel level, const std::source_location& location ) {
            if ( !isEnabled( level ) ) return;

            std::string timestamp = getCurrentTimestamp();
            std::string locationInfo = getLocationInfo( location );
            std::string levelStr = logLevelToString( level );

            std::lock_guard<std::mutex> lock( logMutex_ );

            std::ostream& outStream = (level >= LogLevel::Error) ? std::cerr : std::cout;

            outStream << timestamp << "[" << levelStr << "] " << locationInfo << message << std::endl;
        }

    public:
        DefaultLogger( LogLevel initialLevel = LogLevel::Info )
            : currentLevel_( initialLevel ) {}

        void setLevel( LogLevel level ) override {
            currentLevel_ = level;
        }

        LogLevel getLevel() const override {
            return currentLevel_;
        }

        bool isEnabled( LogLevel level ) const override {
            return level >= currentLevel_;
        }

        void setIncludeTimestamp( bool include ) {
            includeTimestamp_ = include;
        }

        void setIncludeSourceLocation( bool include ) {
            includeSourceLocation_ = include;
        }

        void log_trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Trace, location );
        }

        void log_debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Debug, location );
        }

        void log_info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Info, location );
        }

        void log_warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Warning, location );
        }

        void log_error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Error, location );
        }

        void log_critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, LogLevel::Critical, location );
        }

        void log( std::string_view message, LogLevel level,
            const std::source_location& location = std::source_location::current() ) override {
            logImpl( message, level, location );
        }
    };
}
#endif

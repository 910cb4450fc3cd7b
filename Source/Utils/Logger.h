/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_UTILS_LOGGER_H_
#define OCELOT_UTILS_LOGGER_H_

#include <source_location>
#include <stdexcept>
#include <string_view>

namespace Ocelot::Utils
{
    enum class LogLevel {
        Trace,    // Very detailed information, useful for debugging
        Debug,    // Detailed information on the flow through the system
        Info,     // Informational messages highlighting normal progress
        Warning,  // Potential issues that aren't errors
        Error,    // Error events that might allow the application to continue
        Critical  // Contract violations immediately preceding process termination
    };

    /**
     * @brief Abstract logging sink with a process-wide default instance.
     *
     * The static convenience methods forward to the default logger. Messages
     * issued before a default logger has been installed are dropped, so the
     * compute layer may log from any code path, including destructors.
     */
    class Logger {
    private:
        inline static Logger* defaultLogger_{ nullptr };

    public:
        virtual ~Logger() = default;

        static void setDefaultLogger( Logger* logger ) {
            defaultLogger_ = logger;
        }

        static bool hasDefaultLogger() noexcept {
            return defaultLogger_ != nullptr;
        }

        static Logger& defaultLogger() {
            if ( !defaultLogger_ ) {
                throw std::runtime_error( "No default logger has been set" );
            }
            return *defaultLogger_;
        }

        // Static convenience methods for direct logging
        static void trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_trace( message, location );
        }

        static void debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_debug( message, location );
        }

        static void info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_info( message, location );
        }

        static void warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_warning( message, location );
        }

        static void error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_error( message, location );
        }

        static void critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) {
            if ( defaultLogger_ ) defaultLogger_->log_critical( message, location );
        }

        // Virtual logging methods with log_ prefix to avoid name conflicts with static methods
        virtual void log_trace( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_debug( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_info( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_warning( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_error( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;
        virtual void log_critical( std::string_view message,
            const std::source_location& location = std::source_location::current() ) = 0;

        virtual void log( std::string_view message, LogLevel level,
            const std::source_location& location = std::source_location::current() ) = 0;

        virtual void setLevel( LogLevel level ) = 0;
        virtual LogLevel getLevel() const = 0;
        virtual bool isEnabled( LogLevel level ) const = 0;
    };
}
#endif

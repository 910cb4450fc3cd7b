/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <exception>
#include <iostream>
#include <memory>

#include "Ocelot.h"

namespace Ocelot
{
    namespace detail
    {
        std::shared_ptr<Utils::DefaultLogger> g_defaultLogger;
    }

    Version getAPIVersion()
    {
        return Version{
            OCELOT_VERSION_MAJOR,
            OCELOT_VERSION_MINOR,
            OCELOT_VERSION_PATCH,
            OCELOT_VERSION_PRERELEASE_TAG,
            OCELOT_VERSION_PRERELEASE
        };
    }

    void initializeLogger( Utils::LogLevel level )
    {
        detail::g_defaultLogger = std::make_shared<Utils::DefaultLogger>( level );
        Utils::Logger::setDefaultLogger( detail::g_defaultLogger.get() );
    }

    bool initialize( Utils::LogLevel level )
    {
        try {
            initializeLogger( level );

            Utils::Logger::info( "Ocelot " + getAPIVersion().ToString() + " initialized successfully" );
            return true;
        }
        catch ( const std::exception& e ) {
            // Fall back to std::cerr if logger isn't initialized yet
            std::cerr << "Ocelot initialization failed: " << e.what() << std::endl;
            return false;
        }
    }

    void shutdown()
    {
        Utils::Logger::info( "Shutting down Ocelot" );

        Utils::Logger::setDefaultLogger( nullptr );
        detail::g_defaultLogger.reset();
    }
}

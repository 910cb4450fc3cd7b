/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <sstream>

#include "Context.h"
#include "../ComputeError.h"
#include "../../Utils/Logger.h"

namespace Ocelot::Compute::OpenCL
{
    Context::Context( std::shared_ptr<ClDriver> driver, cl_context context,
        cl_platform_id platform, std::vector<cl_device_id> devices )
        : ClUniqueHandle<cl_context, Context>( std::move( driver ), context ),
        platform_( platform ), devices_( std::move( devices ) )
    {
    }

    Context Context::create( std::shared_ptr<ClDriver> driver,
        const ContextPropertyList& properties, const DeviceSelector& selector )
    {
        ContextPropertyList resolved = properties;

        if ( !resolved.getPlatform() )
        {
            resolved.setPlatform( Platform::first( driver ).getId() );
        }

        Platform platform( driver, *resolved.getPlatform() );
        auto devices = selector.resolve( platform );

        if ( devices.empty() )
        {
            throw ConfigurationError( "Context::create: No devices found for selector " + selector.toString() + "." );
        }

        auto raw = resolved.toRaw();

        cl_int status = CL_SUCCESS;
        cl_context context = driver->createContext( raw.data(), devices, &status );
        clCheckStatus( status, "clCreateContext" );

        Utils::Logger::info( "Created OpenCL context with " + std::to_string( devices.size() ) + " device(s)." );

        return Context( std::move( driver ), context, platform.getId(), std::move( devices ) );
    }

    std::string Context::toString() const
    {
        std::ostringstream oss;
        oss << "Context { Devices: " << devices_.size() << " }";

        return oss.str();
    }

    cl_int Context::DestroyHandle( ClDriver& driver, cl_context context )
    {
        return driver.releaseContext( context );
    }
}

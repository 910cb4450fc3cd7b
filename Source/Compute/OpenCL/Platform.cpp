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

#include "Platform.h"
#include "ClError.h"
#include "ClInfo.h"
#include "../ComputeError.h"

namespace Ocelot::Compute::OpenCL
{
    std::string Device::getInfoString( cl_device_info param ) const
    {
        return Detail::getInfoString( [this, param]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getDeviceInfo( id_, param, size, value, size_ret );
            }, "clGetDeviceInfo" );
    }

    std::string Device::getName() const
    {
        return getInfoString( CL_DEVICE_NAME );
    }

    std::string Device::getVendor() const
    {
        return getInfoString( CL_DEVICE_VENDOR );
    }

    std::string Device::getVersionString() const
    {
        return getInfoString( CL_DEVICE_VERSION );
    }

    cl_device_type Device::getType() const
    {
        return Detail::getInfoValue<cl_device_type>( [this]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getDeviceInfo( id_, CL_DEVICE_TYPE, size, value, size_ret );
            }, "clGetDeviceInfo" );
    }

    std::string Device::toString() const
    {
        std::ostringstream oss;
        oss << getName() << " (" << getVendor() << ", " << getVersionString() << ")";

        return oss.str();
    }

    std::vector<Platform> Platform::list( const std::shared_ptr<ClDriver>& driver )
    {
        std::vector<cl_platform_id> ids;
        clCheckStatus( driver->getPlatformIds( ids ), "clGetPlatformIDs" );

        std::vector<Platform> platforms;
        platforms.reserve( ids.size() );

        for ( cl_platform_id id : ids )
        {
            platforms.emplace_back( driver, id );
        }

        return platforms;
    }

    Platform Platform::first( const std::shared_ptr<ClDriver>& driver )
    {
        auto platforms = list( driver );

        if ( platforms.empty() )
        {
            throw ConfigurationError( "No OpenCL platform found." );
        }

        return platforms.front();
    }

    std::string Platform::getInfoString( cl_platform_info param ) const
    {
        return Detail::getInfoString( [this, param]( size_t size, void* value, size_t* size_ret ) {
            return driver_->getPlatformInfo( id_, param, size, value, size_ret );
            }, "clGetPlatformInfo" );
    }

    std::string Platform::getName() const
    {
        return getInfoString( CL_PLATFORM_NAME );
    }

    std::string Platform::getVendor() const
    {
        return getInfoString( CL_PLATFORM_VENDOR );
    }

    std::string Platform::getProfile() const
    {
        return getInfoString( CL_PLATFORM_PROFILE );
    }

    std::string Platform::getVersionString() const
    {
        return getInfoString( CL_PLATFORM_VERSION );
    }

    std::vector<cl_device_id> Platform::getDeviceIds( DeviceType type ) const
    {
        std::vector<cl_device_id> ids;
        cl_int status = driver_->getDeviceIds( id_, toClDeviceType( type ), ids );

        if ( status == CL_DEVICE_NOT_FOUND )
        {
            return {};
        }

        clCheckStatus( status, "clGetDeviceIDs" );

        return ids;
    }

    std::vector<Device> Platform::getDevices( DeviceType type ) const
    {
        std::vector<Device> devices;

        for ( cl_device_id id : getDeviceIds( type ) )
        {
            devices.emplace_back( driver_, id );
        }

        return devices;
    }
}

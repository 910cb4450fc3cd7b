/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_PLATFORM_H_
#define OCELOT_COMPUTE_OPENCL_PLATFORM_H_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ClDriver.h"
#include "ClHeaders.h"
#include "DeviceType.h"
#include "OpenclVersion.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief A compute device. Root device ids are not reference counted, so Device is a plain value.
     */
    class Device
    {
    public:

        Device( std::shared_ptr<ClDriver> driver, cl_device_id id )
            : driver_( std::move( driver ) ), id_( id )
        {
        }

        cl_device_id getId() const noexcept
        {
            return id_;
        }

        operator cl_device_id() const noexcept
        {
            return id_;
        }

        std::string getName() const;
        std::string getVendor() const;
        std::string getVersionString() const;

        OpenclVersion getVersion() const
        {
            return OpenclVersion::parse( getVersionString() );
        }

        cl_device_type getType() const;

        std::string toString() const;

    private:

        std::string getInfoString( cl_device_info param ) const;

        std::shared_ptr<ClDriver> driver_;
        cl_device_id id_;
    };

    /**
     * @brief An OpenCL platform (one installed ICD).
     */
    class Platform
    {
    public:

        Platform( std::shared_ptr<ClDriver> driver, cl_platform_id id )
            : driver_( std::move( driver ) ), id_( id )
        {
        }

        /// @brief Lists every platform exposed by the driver. Empty when no ICD is installed.
        static std::vector<Platform> list( const std::shared_ptr<ClDriver>& driver );

        /**
         * @brief Returns the first platform.
         *
         * @throws ConfigurationError if the driver exposes no platform.
         */
        static Platform first( const std::shared_ptr<ClDriver>& driver );

        cl_platform_id getId() const noexcept
        {
            return id_;
        }

        operator cl_platform_id() const noexcept
        {
            return id_;
        }

        const std::shared_ptr<ClDriver>& getDriver() const noexcept
        {
            return driver_;
        }

        std::string getName() const;
        std::string getVendor() const;
        std::string getProfile() const;
        std::string getVersionString() const;

        OpenclVersion getVersion() const
        {
            return OpenclVersion::parse( getVersionString() );
        }

        /**
         * @brief Returns the ids of all devices of the given type; empty when none match.
         */
        std::vector<cl_device_id> getDeviceIds( DeviceType type = DeviceType::All ) const;

        std::vector<Device> getDevices( DeviceType type = DeviceType::All ) const;

    private:

        std::string getInfoString( cl_platform_info param ) const;

        std::shared_ptr<ClDriver> driver_;
        cl_platform_id id_;
    };
}
#endif

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_CONTEXT_H_
#define OCELOT_COMPUTE_OPENCL_CONTEXT_H_

#include <memory>
#include <string>
#include <vector>

#include "ClHeaders.h"
#include "ClUniqueHandle.h"
#include "ContextProperties.h"
#include "DeviceSelector.h"
#include "Platform.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief Owned OpenCL context together with the platform and devices it was created for.
     */
    class Context : public ClUniqueHandle<cl_context, Context>
    {
    public:

        Context( std::shared_ptr<ClDriver> driver, cl_context context,
            cl_platform_id platform, std::vector<cl_device_id> devices );

        /**
         * @brief Creates a context on the devices chosen by selector.
         *
         * When properties carries no platform the first platform of the driver is
         * used and added to the property list passed to clCreateContext.
         *
         * @throws ConfigurationError if the selector resolves to no device.
         * @throws ClError if a native call fails.
         */
        static Context create( std::shared_ptr<ClDriver> driver,
            const ContextPropertyList& properties = ContextPropertyList(),
            const DeviceSelector& selector = DeviceSelector::first() );

        Platform getPlatform() const
        {
            return Platform( driver_, platform_ );
        }

        const std::vector<cl_device_id>& getDevices() const noexcept
        {
            return devices_;
        }

        std::string toString() const;

        static cl_int DestroyHandle( ClDriver& driver, cl_context context );

    private:

        cl_platform_id platform_;
        std::vector<cl_device_id> devices_;
    };
}
#endif

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "CommandQueue.h"
#include "Context.h"

namespace Ocelot::Compute::OpenCL
{
    CommandQueue CommandQueue::create( const Context& context, cl_device_id device,
        cl_command_queue_properties properties )
    {
        cl_int status = CL_SUCCESS;
        cl_command_queue queue = context.getDriver().createCommandQueue( context, device, properties, &status );
        clCheckStatus( status, "clCreateCommandQueue" );

        return CommandQueue( context.getSharedDriver(), queue );
    }

    void CommandQueue::finish() const
    {
        clCheckStatus( getDriver().finish( handle_ ), "clFinish" );
    }

    cl_int CommandQueue::DestroyHandle( ClDriver& driver, cl_command_queue queue )
    {
        return driver.releaseCommandQueue( queue );
    }
}

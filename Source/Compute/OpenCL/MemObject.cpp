/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "MemObject.h"
#include "Context.h"

namespace Ocelot::Compute::OpenCL
{
    MemObject MemObject::createBuffer( const Context& context, cl_mem_flags flags, size_t size, void* host_ptr )
    {
        cl_int status = CL_SUCCESS;
        cl_mem buffer = context.getDriver().createBuffer( context, flags, size, host_ptr, &status );
        clCheckStatus( status, "clCreateBuffer" );

        return MemObject( context.getSharedDriver(), buffer );
    }

    cl_int MemObject::DestroyHandle( ClDriver& driver, cl_mem memobj )
    {
        return driver.releaseMemObject( memobj );
    }
}

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include "Event.h"
#include "Context.h"

namespace Ocelot::Compute::OpenCL
{
    Event Event::retain( std::shared_ptr<ClDriver> driver, cl_event event )
    {
        clCheckStatus( driver->retainEvent( event ), "clRetainEvent" );

        return Event( std::move( driver ), event );
    }

    Event Event::clone() const
    {
        return retain( getSharedDriver(), handle_ );
    }

    void Event::wait() const
    {
        const cl_event events[] = { handle_ };
        clCheckStatus( getDriver().waitForEvents( events ), "clWaitForEvents" );
    }

    cl_int Event::DestroyHandle( ClDriver& driver, cl_event event )
    {
        return driver.releaseEvent( event );
    }

    UserEvent UserEvent::create( const Context& context )
    {
        cl_int status = CL_SUCCESS;
        cl_event event = context.getDriver().createUserEvent( context, &status );
        clCheckStatus( status, "clCreateUserEvent" );

        return UserEvent( context.getSharedDriver(), event );
    }

    void UserEvent::setStatus( cl_int execution_status )
    {
        clCheckStatus( getDriver().setUserEventStatus( handle_, execution_status ), "clSetUserEventStatus" );
    }
}

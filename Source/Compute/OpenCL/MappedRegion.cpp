/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#include <memory>
#include <new>
#include <string>

#include "MappedRegion.h"

namespace Ocelot::Compute::OpenCL::Detail
{
    namespace
    {
        struct UnmapTrigger
        {
            std::shared_ptr<ClDriver> driver;
            cl_event completion;
            cl_event unmap;
        };

        void logFailure( const char* function, cl_int status ) noexcept
        {
            try
            {
                Utils::Logger::warning( std::string( "Unmap trigger: " ) + function + " failed with " + statusToString( status ) );
            }
            catch ( const std::bad_alloc& )
            {
                // Nothing can be reported without memory.
            }
        }

        void CL_CALLBACK onUnmapComplete( cl_event, cl_int execution_status, void* user_data )
        {
            std::unique_ptr<UnmapTrigger> trigger( static_cast<UnmapTrigger*>( user_data ) );

            cl_int status = trigger->driver->setUserEventStatus( trigger->completion,
                execution_status < 0 ? execution_status : CL_COMPLETE );
            if ( status != CL_SUCCESS )
            {
                logFailure( "clSetUserEventStatus", status );
            }

            if ( (status = trigger->driver->releaseEvent( trigger->completion )) != CL_SUCCESS )
            {
                logFailure( "clReleaseEvent", status );
            }

            if ( (status = trigger->driver->releaseEvent( trigger->unmap )) != CL_SUCCESS )
            {
                logFailure( "clReleaseEvent", status );
            }
        }
    }

    void registerUnmapTrigger( Event&& unmap_event, const UserEvent& completion )
    {
        ClDriver& driver = unmap_event.getDriver();

        auto trigger = std::make_unique<UnmapTrigger>(
            UnmapTrigger{ unmap_event.getSharedDriver(), completion.get(), unmap_event.get() } );

        clCheckStatus( driver.retainEvent( completion ), "clRetainEvent" );

        cl_int status = driver.setEventCallback( trigger->unmap, CL_COMPLETE, &onUnmapComplete, trigger.get() );

        if ( status != CL_SUCCESS )
        {
            cl_int released = driver.releaseEvent( trigger->completion );
            if ( released != CL_SUCCESS )
            {
                logFailure( "clReleaseEvent", released );
            }

            throw ClError( status, "clSetEventCallback" );
        }

        // The callback owns both references from here on.
        unmap_event.release();
        trigger.release();

        Utils::Logger::debug( "Unmap trigger registered." );
    }
}

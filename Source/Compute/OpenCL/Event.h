/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_EVENT_H_
#define OCELOT_COMPUTE_OPENCL_EVENT_H_

#include <memory>

#include "ClHeaders.h"
#include "ClUniqueHandle.h"

namespace Ocelot::Compute::OpenCL
{
    class Context;

    /**
     * @brief Owned reference to an OpenCL event.
     */
    class Event : public ClUniqueHandle<cl_event, Event>
    {
    public:

        using ClUniqueHandle<cl_event, Event>::ClUniqueHandle;

        /**
         * @brief Takes an additional native reference to event and wraps it.
         */
        static Event retain( std::shared_ptr<ClDriver> driver, cl_event event );

        /// @brief Returns an independently owned reference to the same event.
        Event clone() const;

        /// @brief Blocks until the event has completed.
        void wait() const;

        static cl_int DestroyHandle( ClDriver& driver, cl_event event );
    };

    /**
     * @brief An event whose execution status is set by the host.
     */
    class UserEvent : public Event
    {
    public:

        using Event::Event;

        static UserEvent create( const Context& context );

        void setStatus( cl_int execution_status );

        void setComplete()
        {
            setStatus( CL_COMPLETE );
        }
    };
}
#endif

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_COMMAND_QUEUE_H_
#define OCELOT_COMPUTE_OPENCL_COMMAND_QUEUE_H_

#include <memory>

#include "ClHeaders.h"
#include "ClUniqueHandle.h"

namespace Ocelot::Compute::OpenCL
{
    class Context;

    class CommandQueue : public ClUniqueHandle<cl_command_queue, CommandQueue>
    {
    public:

        using ClUniqueHandle<cl_command_queue, CommandQueue>::ClUniqueHandle;

        static CommandQueue create( const Context& context, cl_device_id device,
            cl_command_queue_properties properties = 0 );

        /// @brief Blocks until every command enqueued on the queue has completed.
        void finish() const;

        static cl_int DestroyHandle( ClDriver& driver, cl_command_queue queue );
    };

    using ManagedCommandQueue = std::shared_ptr<CommandQueue>;
}
#endif

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_MEM_OBJECT_H_
#define OCELOT_COMPUTE_OPENCL_MEM_OBJECT_H_

#include <cstddef>
#include <memory>

#include "ClHeaders.h"
#include "ClUniqueHandle.h"

namespace Ocelot::Compute::OpenCL
{
    class Context;

    /**
     * @brief Owned OpenCL memory object.
     */
    class MemObject : public ClUniqueHandle<cl_mem, MemObject>
    {
    public:

        using ClUniqueHandle<cl_mem, MemObject>::ClUniqueHandle;

        /**
         * @brief Allocates a buffer of size bytes.
         *
         * @throws ClError if clCreateBuffer fails.
         */
        static MemObject createBuffer( const Context& context, cl_mem_flags flags, size_t size,
            void* host_ptr = nullptr );

        static cl_int DestroyHandle( ClDriver& driver, cl_mem memobj );
    };

    using ManagedMemObject = std::shared_ptr<MemObject>;
}
#endif

/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_BUFFER_REGION_H_
#define OCELOT_COMPUTE_OPENCL_BUFFER_REGION_H_

#include <cstddef>

#include "ClHeaders.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief A sub-buffer region expressed in elements of T.
     */
    template <typename T>
    class BufferRegion
    {
    public:

        constexpr BufferRegion( size_t origin, size_t length ) noexcept
            : origin_( origin ), length_( length )
        {
        }

        constexpr size_t getOrigin() const noexcept
        {
            return origin_;
        }

        constexpr size_t getLength() const noexcept
        {
            return length_;
        }

        /// @brief The byte based region expected by clCreateSubBuffer.
        cl_buffer_region toBytes() const noexcept
        {
            return cl_buffer_region{ origin_ * sizeof( T ), length_ * sizeof( T ) };
        }

    private:

        size_t origin_;
        size_t length_;
    };
}
#endif

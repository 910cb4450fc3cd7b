/*
 * Copyright 2021 Todd Thomson, Achilles Software.  All rights reserved.
 *
 * Please refer to the ACHILLES end user license agreement (EULA) associated
 * with this source code for terms and conditions that govern your use of
 * this software. Any use, reproduction, disclosure, or distribution of
 * this software and related documentation outside the terms of the EULA
 * is strictly prohibited.
 */

#ifndef OCELOT_COMPUTE_OPENCL_DRIVER_H_
#define OCELOT_COMPUTE_OPENCL_DRIVER_H_

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "ClHeaders.h"

namespace Ocelot::Compute::OpenCL
{
    /**
     * @brief The native OpenCL entry points used by the compute layer.
     *
     * Every call mirrors its OpenCL C counterpart and reports failure through a
     * cl_int status; nothing here throws. ClRuntimeDriver forwards to the
     * installed ICD loader, test suites substitute a recording double.
     *
     * Wait lists are borrowed for the duration of the call. Handles returned
     * from create* and enqueue* calls carry one reference owned by the caller.
     */
    class ClDriver
    {
    public:

        using EventCallback = void (CL_CALLBACK*)( cl_event event, cl_int status, void* user_data );

        virtual ~ClDriver() = default;

        // Platforms and devices

        virtual cl_int getPlatformIds( std::vector<cl_platform_id>& platforms ) = 0;

        virtual cl_int getPlatformInfo( cl_platform_id platform, cl_platform_info param,
            size_t value_size, void* value, size_t* value_size_ret ) = 0;

        /// Returns CL_DEVICE_NOT_FOUND with an empty list when no device matches.
        virtual cl_int getDeviceIds( cl_platform_id platform, cl_device_type type,
            std::vector<cl_device_id>& devices ) = 0;

        virtual cl_int getDeviceInfo( cl_device_id device, cl_device_info param,
            size_t value_size, void* value, size_t* value_size_ret ) = 0;

        // Contexts

        virtual cl_context createContext( const cl_context_properties* properties,
            const std::vector<cl_device_id>& devices, cl_int* status ) = 0;

        virtual cl_int releaseContext( cl_context context ) = 0;

        // Command queues

        virtual cl_command_queue createCommandQueue( cl_context context, cl_device_id device,
            cl_command_queue_properties properties, cl_int* status ) = 0;

        virtual cl_int finish( cl_command_queue queue ) = 0;

        virtual cl_int releaseCommandQueue( cl_command_queue queue ) = 0;

        // Memory objects

        virtual cl_mem createBuffer( cl_context context, cl_mem_flags flags, size_t size,
            void* host_ptr, cl_int* status ) = 0;

        virtual void* enqueueMapBuffer( cl_command_queue queue, cl_mem buffer, cl_bool blocking,
            cl_map_flags flags, size_t offset, size_t size,
            std::span<const cl_event> wait_list, cl_event* event, cl_int* status ) = 0;

        virtual cl_int enqueueUnmapMemObject( cl_command_queue queue, cl_mem memobj, void* mapped_ptr,
            std::span<const cl_event> wait_list, cl_event* event ) = 0;

        virtual cl_int releaseMemObject( cl_mem memobj ) = 0;

        // Events

        virtual cl_event createUserEvent( cl_context context, cl_int* status ) = 0;

        virtual cl_int setUserEventStatus( cl_event event, cl_int execution_status ) = 0;

        virtual cl_int setEventCallback( cl_event event, cl_int callback_type,
            EventCallback callback, void* user_data ) = 0;

        virtual cl_int waitForEvents( std::span<const cl_event> events ) = 0;

        virtual cl_int retainEvent( cl_event event ) = 0;

        virtual cl_int releaseEvent( cl_event event ) = 0;

        // Programs

        virtual cl_program createProgramWithSource( cl_context context,
            const std::vector<std::string>& sources, cl_int* status ) = 0;

        virtual cl_int buildProgram( cl_program program, const std::vector<cl_device_id>& devices,
            const std::string& options ) = 0;

        virtual cl_int getProgramInfo( cl_program program, cl_program_info param,
            size_t value_size, void* value, size_t* value_size_ret ) = 0;

        virtual cl_int getProgramBuildInfo( cl_program program, cl_device_id device,
            cl_program_build_info param, size_t value_size, void* value, size_t* value_size_ret ) = 0;

        virtual cl_int releaseProgram( cl_program program ) = 0;
    };
}
#endif
